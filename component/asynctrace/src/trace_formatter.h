#pragma once

#include "trace_queue.h"
#include "../include/async_trace/trace_config.h"

#include <cstdint>
#include <string>

namespace asynctrace {

/**
 * @brief 跟踪格式化
 *
 * [2024-05-01 12:00:00.123] [WARN] [EntityFetch] [adapter.cpp:42] message\n
 * 开关名、文件行号、线程号按 TraceConfig 决定是否输出。
 */
class TraceFormatter {
public:
    explicit TraceFormatter(const TraceConfig& config = TraceConfig{});

    std::string Format(const TraceEntry& entry) const;

    /** 当前时间（微秒） */
    static int64_t GetCurrentTimestamp();

    /** 微秒时间戳 -> 本地时间 "YYYY-mm-dd HH:MM:SS.mmm" */
    static std::string FormatTimestamp(int64_t timestamp_us);

private:
    TraceConfig config_;
};

}  // namespace asynctrace
