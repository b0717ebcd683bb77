/**
 * @file debug_listener.cpp
 * @brief 调试输出 Listener：stderr + 可选日志文件
 */

#include "async_trace/trace_listener.h"
#include <iostream>

namespace asynctrace {

DebugTraceListener::DebugTraceListener(std::string name, std::string log_file_name)
    : TraceListener(std::move(name))
    , log_file_name_(std::move(log_file_name)) {
    if (!log_file_name_.empty()) {
        file_.open(log_file_name_, std::ios::app);
    }
}

DebugTraceListener::~DebugTraceListener() {
    Close();
}

void DebugTraceListener::Write(TraceLevel /*level*/, const std::string& formatted_trace) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << formatted_trace;
    if (file_.is_open()) {
        file_ << formatted_trace;
    }
}

void DebugTraceListener::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
    if (file_.is_open()) {
        file_.flush();
    }
}

void DebugTraceListener::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

}  // namespace asynctrace
