#pragma once

/**
 * @file runtime_configuration.h
 * @brief ORM 运行时配置上下文
 *
 * 持有：跟踪器（开关级别 + Listener）、连接串注册表、DQE 配置描述、是否启用了跟踪。
 * 不是全局单例：同一进程内的两个实例互不影响，由使用方决定生命周期与共享方式。
 * 所有成员函数线程安全。
 */

#include "ormsupport/dqe_configuration.h"

#include <async_trace/async_tracer.h>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ormsupport {

class RuntimeConfiguration {
public:
    explicit RuntimeConfiguration(const asynctrace::TraceConfig& trace_config = asynctrace::TraceConfig{});
    ~RuntimeConfiguration();

    RuntimeConfiguration(const RuntimeConfiguration&) = delete;
    RuntimeConfiguration& operator=(const RuntimeConfiguration&) = delete;

    // ========== 跟踪 ==========

    asynctrace::AsyncTracer& Tracing() { return *tracer_; }
    const asynctrace::AsyncTracer& Tracing() const { return *tracer_; }

    /** 最近一次应用配置时，是否有任一跟踪开关级别 > 0 */
    bool IsTraceEnabled() const;
    void SetTraceEnabled(bool enabled);

    // ========== 连接串 ==========

    /**
     * @brief 登记连接串，同名覆盖
     * @param key 如 "Northwind.ConnectionString"
     */
    void AddConnectionString(const std::string& key, const std::string& connection_string);

    std::optional<std::string> GetConnectionString(const std::string& key) const;

    std::map<std::string, std::string> ConnectionStrings() const;

    // ========== DQE ==========

    /**
     * @brief 新建一个 DQE 配置，交给 configure 填充后替换当前配置
     * configure 抛出异常时当前配置保持不变。
     */
    void ConfigureDQE(const std::function<void(SqlServerDQEConfiguration&)>& configure);

    /** 当前 DQE 配置，未配置过时返回 nullptr */
    std::shared_ptr<const SqlServerDQEConfiguration> DQEConfiguration() const;

private:
    std::unique_ptr<asynctrace::AsyncTracer> tracer_;

    mutable std::mutex mutex_;
    bool trace_enabled_ = false;
    std::map<std::string, std::string> connection_strings_;
    std::shared_ptr<const SqlServerDQEConfiguration> dqe_;
};

}  // namespace ormsupport
