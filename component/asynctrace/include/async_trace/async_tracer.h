#pragma once

#include "trace_level.h"
#include "trace_config.h"
#include "listener_collection.h"

#include <cstdint>
#include <cstring>
#include <map>
#include <memory>
#include <sstream>
#include <string>

namespace asynctrace {

// 前向声明
class AsyncTracerImpl;

// ============================================================================
// AsyncTracer 核心类
// ============================================================================

/**
 * @brief 异步跟踪器
 *
 * - 每个跟踪开关（switch）有独立的级别，未设置的开关视为 Off
 * - 业务线程只负责把条目压入缓冲区，格式化与写 Listener 在后台线程完成
 * - 不是单例：每个运行时上下文持有自己的实例，互不影响
 */
class AsyncTracer {
public:
    explicit AsyncTracer(const TraceConfig& config = TraceConfig{});
    ~AsyncTracer();

    AsyncTracer(const AsyncTracer&) = delete;
    AsyncTracer& operator=(const AsyncTracer&) = delete;

    // === 跟踪开关 ===
    void SetTraceLevel(const std::string& switch_name, TraceLevel level);
    TraceLevel GetTraceLevel(const std::string& switch_name) const;
    bool HasSwitch(const std::string& switch_name) const;
    std::map<std::string, TraceLevel> Switches() const;

    bool ShouldTrace(const std::string& switch_name, TraceLevel level) const;

    // === 输出 ===
    void Write(const std::string& switch_name, TraceLevel level,
               const char* file, int line, const std::string& message);

    /** 把缓冲区中已有的条目全部写出并刷新所有 Listener（同步） */
    void Flush();

    /** 停止后台线程；之后的 Write 被丢弃。析构时自动调用 */
    void Shutdown();
    bool IsRunning() const;

    TraceListenerCollection& Listeners();
    const TraceListenerCollection& Listeners() const;

    /** 因缓冲区满或已停止而丢弃的条目数 */
    uint64_t DroppedEntries() const;

private:
    std::unique_ptr<AsyncTracerImpl> impl_;
};

}  // namespace asynctrace

// ============================================================================
// 跟踪宏实现
// ============================================================================

// 提取文件名（去除路径）
#define ASYNCTRACE_FILENAME \
    (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : \
     (strrchr(__FILE__, '\\') ? strrchr(__FILE__, '\\') + 1 : __FILE__))

#define ASYNCTRACE_WRITE(tracer, switch_name, level, ...) \
    do { \
        auto& asynctrace_tracer_ = (tracer); \
        if (asynctrace_tracer_.ShouldTrace(switch_name, level)) { \
            std::ostringstream oss_; \
            oss_ << __VA_ARGS__; \
            asynctrace_tracer_.Write(switch_name, level, ASYNCTRACE_FILENAME, __LINE__, oss_.str()); \
        } \
    } while(0)

// ============================================================================
// 对外暴露的跟踪接口宏
//
// 用法：TraceInfo(tracer, "EntityFetch", "fetched " << count << " rows");
// 仅当开关级别 >= 宏对应级别时才会格式化消息
// ============================================================================

#define TraceError(tracer, switch_name, ...) \
    ASYNCTRACE_WRITE(tracer, switch_name, asynctrace::TraceLevel::Error, __VA_ARGS__)

#define TraceWarning(tracer, switch_name, ...) \
    ASYNCTRACE_WRITE(tracer, switch_name, asynctrace::TraceLevel::Warning, __VA_ARGS__)

#define TraceInfo(tracer, switch_name, ...) \
    ASYNCTRACE_WRITE(tracer, switch_name, asynctrace::TraceLevel::Info, __VA_ARGS__)

#define TraceVerbose(tracer, switch_name, ...) \
    ASYNCTRACE_WRITE(tracer, switch_name, asynctrace::TraceLevel::Verbose, __VA_ARGS__)
