#pragma once

#include <string>

namespace asynctrace {

/**
 * @brief 跟踪级别枚举
 *
 * 数值与配置文件中的整数一一对应（"2" -> Warning），数值越大输出越详细。
 */
enum class TraceLevel {
    Off     = 0,   // 关闭
    Error   = 1,   // 仅错误
    Warning = 2,   // 错误 + 警告
    Info    = 3,   // 一般信息
    Verbose = 4    // 全部输出
};

/**
 * @brief 将跟踪级别转换为字符串
 */
inline const char* TraceLevelToString(TraceLevel level) {
    switch (level) {
        case TraceLevel::Off:     return "OFF";
        case TraceLevel::Error:   return "ERROR";
        case TraceLevel::Warning: return "WARN";
        case TraceLevel::Info:    return "INFO";
        case TraceLevel::Verbose: return "VERBOSE";
        default:                  return "UNKNOWN";
    }
}

/**
 * @brief 将字符串转换为跟踪级别（大小写不敏感的常用写法）
 */
inline TraceLevel StringToTraceLevel(const std::string& str) {
    if (str == "OFF"     || str == "off"     || str == "Off")     return TraceLevel::Off;
    if (str == "ERROR"   || str == "error"   || str == "Error")   return TraceLevel::Error;
    if (str == "WARN"    || str == "warn"    || str == "Warning") return TraceLevel::Warning;
    if (str == "INFO"    || str == "info"    || str == "Info")    return TraceLevel::Info;
    if (str == "VERBOSE" || str == "verbose" || str == "Verbose") return TraceLevel::Verbose;
    return TraceLevel::Off;  // 默认
}

/**
 * @brief 整数 -> 跟踪级别，超出范围的值截断到 [Off, Verbose]
 */
inline TraceLevel ClampTraceLevel(int value) {
    if (value <= static_cast<int>(TraceLevel::Off)) return TraceLevel::Off;
    if (value >= static_cast<int>(TraceLevel::Verbose)) return TraceLevel::Verbose;
    return static_cast<TraceLevel>(value);
}

}  // namespace asynctrace
