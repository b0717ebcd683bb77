#include "async_trace/trace_listener.h"

#include <cstdio>
#include <iostream>

#include <unistd.h>

namespace asynctrace {

namespace {

constexpr const char* kResetColor = "\033[0m";

const char* ColorOf(TraceLevel level) {
    switch (level) {
        case TraceLevel::Error:   return "\033[31m";
        case TraceLevel::Warning: return "\033[33m";
        case TraceLevel::Info:    return "\033[32m";
        case TraceLevel::Verbose: return "\033[36m";
        default:                  return kResetColor;
    }
}

}  // namespace

ConsoleTraceListener::ConsoleTraceListener(std::string name, bool enable_color)
    : TraceListener(std::move(name))
    // 重定向到文件或管道时不输出转义序列
    , enable_color_(enable_color && ::isatty(::fileno(stdout)) == 1) {
}

void ConsoleTraceListener::Write(TraceLevel level, const std::string& formatted_trace) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enable_color_) {
        std::cout << formatted_trace;
        return;
    }
    std::cout << ColorOf(level) << formatted_trace << kResetColor;
}

void ConsoleTraceListener::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
}

}  // namespace asynctrace
