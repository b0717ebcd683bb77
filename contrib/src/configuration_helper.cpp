/**
 * @file configuration_helper.cpp
 * @brief 配置应用：开关 -> 连接串 -> DQE -> Listener
 */

#include "ormsupport/configuration_helper.h"

#include "ormsupport/trace_helper.h"
#include "ormsupport/utils.h"

#include <memory>
#include <vector>

namespace ormsupport {

namespace {

/** 开关值解析为整数；值缺失或不是整数时返回 false */
bool TryParseSwitchLevel(const ConfigurationSection& trace_switch, int32_t& level) {
    auto value = trace_switch.Value();
    return value.has_value() && utils::TryParseInt32(*value, level);
}

/** 按原样比较：只有拼写完全一致的 SqlServerDQE 交给 DQE，其他大小写形式当作普通开关 */
bool IsDqeSwitch(const ConfigurationSection& trace_switch) {
    return trace_switch.Key() == trace::kSqlServerDqeSwitch;
}

}  // namespace

std::string ConfigurationHelper::EnvironmentName() {
    auto name = utils::GetEnv(kEnvironmentVariable);
    if (!name || name->empty()) {
        name = utils::GetEnv(kFallbackEnvironmentVariable);
    }
    if (!name || name->empty()) {
        return kDefaultEnvironmentName;
    }
    return *name;
}

void ConfigurationHelper::ConfigureFromAppSettings(RuntimeConfiguration& runtime) {
    std::string environment_name = EnvironmentName();
    std::string machine_name = utils::GetMachineName();

    ConfigurationBuilder builder;
    builder.SetBasePath(utils::GetCurrentDirectory())
        .AddJsonFile("appsettings.json", true)
        .AddJsonFile("appsettings." + environment_name + ".json", true);
    if (!machine_name.empty()) {
        builder.AddJsonFile("appsettings." + machine_name + ".json", true);
    }
    builder.AddEnvironmentVariables(kEnvOverridePrefix);

    ConfigureFromConfiguration(runtime, builder.Build());
}

void ConfigurationHelper::ConfigureFromJson(RuntimeConfiguration& runtime,
                                            const std::string& config_file_name) {
    ConfigureFromJson(runtime, config_file_name, utils::GetCurrentDirectory());
}

void ConfigurationHelper::ConfigureFromJson(RuntimeConfiguration& runtime,
                                            const std::string& config_file_name,
                                            const std::string& config_directory) {
    Configuration configuration = ConfigurationBuilder()
        .SetBasePath(config_directory)
        .AddJsonFile(config_file_name, true)
        .Build();

    ConfigureFromConfiguration(runtime, configuration);
}

void ConfigurationHelper::ConfigureFromConfiguration(RuntimeConfiguration& runtime,
                                                     const Configuration& configuration) {
    auto llblgen_settings = configuration.GetSection("LLBLGen");
    auto trace_settings = llblgen_settings.GetSection("Tracing");
    auto trace_switches = trace_settings.GetSection("Switches").GetChildren();
    auto trace_listeners = trace_settings.GetSection("Listeners");

    auto connection_strings = configuration.GetSection("ConnectionStrings").GetChildren();
    if (connection_strings.empty()) {
        connection_strings = llblgen_settings.GetSection("ConnectionStrings").GetChildren();
    }

    auto catalog_name_overwrites =
        llblgen_settings.GetSection("SqlServerCatalogNameOverwrites").GetChildren();

    auto& tracer = runtime.Tracing();
    bool is_trace_enabled = false;

    // ========== 1. 跟踪开关 ==========
    for (const auto& trace_switch : trace_switches) {
        if (IsDqeSwitch(trace_switch)) {
            continue;
        }
        int32_t level = 0;
        if (!TryParseSwitchLevel(trace_switch, level)) {
            OrmTraceWarning(tracer, "trace switch '" << trace_switch.Key()
                            << "' has a non-integer level, skipped");
            continue;
        }
        if (level > 0) {
            is_trace_enabled = true;
        }
        tracer.SetTraceLevel(trace_switch.Key(), trace::FromConfigValue(level));
    }

    // ========== 2. 连接串 ==========
    for (const auto& connection : connection_strings) {
        auto value = connection.Value();
        if (!value) {
            OrmTraceWarning(tracer, "connection string '" << connection.Key()
                            << "' has no value, skipped");
            continue;
        }
        runtime.AddConnectionString(connection.Key() + ".ConnectionString", *value);
    }

    // ========== 3. DQE ==========
    runtime.ConfigureDQE([&](SqlServerDQEConfiguration& dqe) {
        dqe.AddDbProviderFactory(SqlServerDQEConfiguration::kDefaultProviderInvariantName)
            .SetDefaultCompatibilityLevel(SqlServerCompatibilityLevel::SqlServer2012);

        for (const auto& trace_switch : trace_switches) {
            if (!IsDqeSwitch(trace_switch)) {
                continue;
            }
            int32_t level = 0;
            if (TryParseSwitchLevel(trace_switch, level)) {
                if (level > 0) {
                    is_trace_enabled = true;
                }
                dqe.SetTraceLevel(trace::FromConfigValue(level));
            }
            break;
        }

        for (const auto& overwrite_section : catalog_name_overwrites) {
            auto catalog_name = overwrite_section.GetSection("CatalogName").Value();
            if (!catalog_name) {
                continue;
            }
            dqe.AddCatalogNameOverwrite(*catalog_name,
                                        overwrite_section.Get("Overwrite", ""));
        }
    });

    runtime.SetTraceEnabled(is_trace_enabled);

    OrmTraceInfo(tracer, "applied " << trace_switches.size() << " trace switches, "
                 << connection_strings.size() << " connection strings, "
                 << catalog_name_overwrites.size() << " catalog name overwrites");

    // ========== 4. Listener ==========
    if (!is_trace_enabled || trace_listeners.GetChildren().empty()) {
        return;
    }

    bool log_to_console = trace_listeners.GetBool("Console", false);
    bool log_to_debug = trace_listeners.GetBool("Debug", false);
    std::string log_file_name = trace_listeners.Get("File", "");

    // 已入队的跟踪先写给旧的 Listener
    tracer.Flush();

    auto& listeners = tracer.Listeners();
    listeners.Clear();

    if (log_to_console) {
        listeners.Add(std::make_shared<asynctrace::ConsoleTraceListener>("Console"));
    }

    if (log_to_debug) {
        listeners.Add(std::make_shared<asynctrace::DebugTraceListener>("Debug", log_file_name));
        return;
    }

    if (!log_file_name.empty()) {
        listeners.Add(std::make_shared<asynctrace::FileTraceListener>(log_file_name, "File"));
    }
}

}  // namespace ormsupport
