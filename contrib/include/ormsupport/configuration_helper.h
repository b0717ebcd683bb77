#pragma once

/**
 * @file configuration_helper.h
 * @brief 从 JSON 配置把连接串、跟踪开关、DQE 选项、跟踪 Listener 应用到 RuntimeConfiguration
 *
 * 识别的配置键（大小写不敏感）：
 *   LLBLGen:Tracing:Switches:<name>                        跟踪开关级别（整数，解析失败跳过）
 *   LLBLGen:Tracing:Switches:SqlServerDQE                  DQE 自身的跟踪级别
 *   LLBLGen:Tracing:Listeners:Console / Debug / File       跟踪输出
 *   ConnectionStrings:<name>                               连接串
 *   LLBLGen:ConnectionStrings:<name>                       仅当根节点 ConnectionStrings 为空时使用
 *   LLBLGen:SqlServerCatalogNameOverwrites:<n>:CatalogName / Overwrite
 *
 * @example appsettings.json
 *   {
 *     "ConnectionStrings": { "Northwind": "data source=.;initial catalog=Northwind" },
 *     "LLBLGen": {
 *       "Tracing": {
 *         "Switches": { "SqlServerDQE": "1", "ORMPersistenceExecution": "4" },
 *         "Listeners": { "Console": true, "File": "logs/orm-trace.log" }
 *       },
 *       "SqlServerCatalogNameOverwrites": [ { "CatalogName": "Northwind_Dev", "Overwrite": "Northwind" } ]
 *     }
 *   }
 */

#include "ormsupport/config_loader.h"
#include "ormsupport/runtime_configuration.h"

#include <string>

namespace ormsupport {

class ConfigurationHelper {
public:
    /** 环境名依次取自这两个环境变量，都未设置时为 kDefaultEnvironmentName */
    static constexpr const char* kEnvironmentVariable = "ASPNET_ENV";
    static constexpr const char* kFallbackEnvironmentVariable = "ASPNETCORE_ENVIRONMENT";
    static constexpr const char* kDefaultEnvironmentName = "Production";

    /** 环境变量覆盖的前缀：ORMSUPPORT_ConnectionStrings__Main -> ConnectionStrings:Main */
    static constexpr const char* kEnvOverridePrefix = "ORMSUPPORT_";

    /**
     * @brief 在当前工作目录依次加载（均可缺失，后者覆盖前者）：
     *   appsettings.json、appsettings.{环境名}.json、appsettings.{主机名}.json，再应用环境变量覆盖
     * @throws ConfigurationError 文件存在但 JSON 格式错误
     */
    static void ConfigureFromAppSettings(RuntimeConfiguration& runtime);

    /**
     * @brief 加载当前工作目录下的单个 JSON 文件（可缺失）
     * @throws ConfigurationError 文件存在但 JSON 格式错误
     */
    static void ConfigureFromJson(RuntimeConfiguration& runtime, const std::string& config_file_name);

    /**
     * @brief 加载 config_directory 下的单个 JSON 文件（可缺失）
     * @throws ConfigurationError 文件存在但 JSON 格式错误
     */
    static void ConfigureFromJson(RuntimeConfiguration& runtime,
                                  const std::string& config_file_name,
                                  const std::string& config_directory);

    /**
     * @brief 把已构建好的配置应用到 runtime
     *
     * 重复应用同一份配置结果不变：连接串按名字覆盖，DQE 配置整体替换，Listener 先清空再添加。
     */
    static void ConfigureFromConfiguration(RuntimeConfiguration& runtime,
                                           const Configuration& configuration);

    /** 当前环境名（见 kEnvironmentVariable） */
    static std::string EnvironmentName();
};

}  // namespace ormsupport
