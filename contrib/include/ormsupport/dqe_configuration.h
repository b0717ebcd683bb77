#pragma once

/**
 * @file dqe_configuration.h
 * @brief SQL Server DQE（Dynamic Query Engine）配置描述
 *
 * 记录 DQE 生成 SQL 时需要的选项：使用的数据库驱动、默认兼容级别、DQE 自身的跟踪级别、目录名改写。
 * 每次 RuntimeConfiguration::ConfigureDQE 都新建一个实例并整体替换旧实例。
 *
 * @example
 *   runtime.ConfigureDQE([](SqlServerDQEConfiguration& dqe) {
 *       dqe.AddDbProviderFactory(SqlServerDQEConfiguration::kDefaultProviderInvariantName)
 *          .SetDefaultCompatibilityLevel(SqlServerCompatibilityLevel::SqlServer2012)
 *          .AddCatalogNameOverwrite("Northwind_Dev", "Northwind");
 *   });
 */

#include <async_trace/trace_level.h>

#include <map>
#include <string>
#include <vector>

namespace ormsupport {

/**
 * @brief 生成 SQL 时使用的 SQL Server 语法级别
 */
enum class SqlServerCompatibilityLevel {
    SqlServer2000 = 0,
    SqlServer2005,
    SqlServerCE3x,
    SqlServerCE4,
    SqlServer2012,
};

const char* CompatibilityLevelToString(SqlServerCompatibilityLevel level);

class SqlServerDQEConfiguration {
public:
    /** SQL Server 驱动的默认 invariant name */
    static constexpr const char* kDefaultProviderInvariantName = "System.Data.SqlClient";

    SqlServerDQEConfiguration() = default;

    /** 登记一个数据库驱动，重复登记忽略 */
    SqlServerDQEConfiguration& AddDbProviderFactory(const std::string& invariant_name);

    SqlServerDQEConfiguration& SetDefaultCompatibilityLevel(SqlServerCompatibilityLevel level);

    /** DQE 自身的跟踪级别，与 Tracing() 上的通用开关分开配置 */
    SqlServerDQEConfiguration& SetTraceLevel(asynctrace::TraceLevel level);

    /**
     * @brief 目录名改写：生成 SQL 时把 catalog_name 替换为 overwrite
     * overwrite 为空串表示生成的 SQL 不带目录名。同名目录后登记的覆盖先登记的。
     */
    SqlServerDQEConfiguration& AddCatalogNameOverwrite(const std::string& catalog_name,
                                                       const std::string& overwrite);

    const std::vector<std::string>& DbProviderFactories() const { return provider_factories_; }
    SqlServerCompatibilityLevel DefaultCompatibilityLevel() const { return compatibility_level_; }
    asynctrace::TraceLevel GetTraceLevel() const { return trace_level_; }
    const std::map<std::string, std::string>& CatalogNameOverwrites() const { return catalog_overwrites_; }

    /** 应用改写后的目录名，未登记时原样返回 */
    std::string ResolveCatalogName(const std::string& catalog_name) const;

private:
    std::vector<std::string> provider_factories_;
    SqlServerCompatibilityLevel compatibility_level_ = SqlServerCompatibilityLevel::SqlServer2005;
    asynctrace::TraceLevel trace_level_ = asynctrace::TraceLevel::Off;
    std::map<std::string, std::string> catalog_overwrites_;
};

}  // namespace ormsupport
