#pragma once

#include <cstddef>

namespace asynctrace {

/**
 * @brief 跟踪管线配置
 *
 * 只描述缓冲与格式；输出目标由 TraceListenerCollection 动态管理。
 */
struct TraceConfig {
    // 缓冲区配置
    size_t buffer_entries = 8192;               // 队列条目上限（不小于 1024）
    size_t flush_interval_ms = 100;             // 刷新间隔（毫秒）

    // 格式配置
    bool show_category = true;                  // 显示开关名（category）
    bool show_file_line = true;                 // 显示文件名和行号
    bool show_thread_id = false;                // 显示线程ID
};

}  // namespace asynctrace
