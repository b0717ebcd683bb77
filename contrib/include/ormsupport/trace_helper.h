#pragma once

/**
 * @file trace_helper.h
 * @brief ormsupport 跟踪封装层
 *
 * 其他模块只引用此文件，不直接依赖 async_trace 的宏名。
 * 跟踪器不是全局单例，宏的第一个参数是要写入的 AsyncTracer（通常来自 RuntimeConfiguration::Tracing()）。
 */

#include <async_trace/async_tracer.h>  // 底层实现，仅此处引用

#include <string>

namespace ormsupport {
namespace trace {

using Level = asynctrace::TraceLevel;
using Tracer = asynctrace::AsyncTracer;

/** 配置应用器自身使用的跟踪开关 */
inline constexpr const char* kSupportClassesSwitch = "ORMSupportClasses";

/** DQE（SQL 生成引擎）跟踪开关名，单独配置到 DQE 配置对象上 */
inline constexpr const char* kSqlServerDqeSwitch = "SqlServerDQE";

/**
 * @brief 把配置中的整数级别转为跟踪级别（越界取最近的有效值）
 */
inline Level FromConfigValue(int value) {
    return asynctrace::ClampTraceLevel(value);
}

}  // namespace trace
}  // namespace ormsupport

// ============================================================================
// 跟踪宏
//
// 用法：
//   OrmTraceInfo(config.Tracing(), "loaded " << count << " connection strings");
// 统一写入 ORMSupportClasses 开关
// ============================================================================

#define OrmTraceError(tracer, ...) \
    TraceError(tracer, ::ormsupport::trace::kSupportClassesSwitch, __VA_ARGS__)
#define OrmTraceWarning(tracer, ...) \
    TraceWarning(tracer, ::ormsupport::trace::kSupportClassesSwitch, __VA_ARGS__)
#define OrmTraceInfo(tracer, ...) \
    TraceInfo(tracer, ::ormsupport::trace::kSupportClassesSwitch, __VA_ARGS__)
#define OrmTraceVerbose(tracer, ...) \
    TraceVerbose(tracer, ::ormsupport::trace::kSupportClassesSwitch, __VA_ARGS__)
