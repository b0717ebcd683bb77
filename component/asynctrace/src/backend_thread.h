#pragma once

#include "trace_queue.h"
#include "trace_formatter.h"
#include "../include/async_trace/listener_collection.h"
#include "../include/async_trace/trace_config.h"

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

namespace asynctrace {

/**
 * @brief 后台写出线程：从 TraceQueue 取条目，格式化后写给当前全部 Listener
 *
 * 后台线程与同步 Flush() 通过 write_mutex_ 串行，保证同一时刻只有一方在写 Listener，
 * 且条目按入队顺序写出。
 */
class BackendThread {
public:
    BackendThread(TraceQueue& queue, TraceListenerCollection& listeners,
                  const TraceConfig& config);
    ~BackendThread();

    BackendThread(const BackendThread&) = delete;
    BackendThread& operator=(const BackendThread&) = delete;

    void Start();

    /** 关闭队列并回收线程，剩余条目写出后返回 */
    void Stop();

    /** 在调用线程写出队列中已有条目，并刷新全部 Listener */
    void Flush();

private:
    void Run();

    /** 调用方需持有 write_mutex_ */
    void WriteOutLocked();

    TraceQueue& queue_;
    TraceListenerCollection& listeners_;
    const int flush_interval_ms_;
    TraceFormatter formatter_;

    std::mutex write_mutex_;
    std::vector<TraceEntry> batch_;

    std::thread thread_;
    std::atomic<bool> running_{false};
};

}  // namespace asynctrace
