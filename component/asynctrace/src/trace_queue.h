#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace asynctrace {

/**
 * @brief 一条待写出的跟踪
 */
struct TraceEntry {
    int64_t timestamp = 0;      // 微秒
    int level = 0;
    int line = 0;
    std::string file;
    std::string category;       // 开关名
    std::string message;
    std::thread::id thread_id;  // 写入方线程
};

/**
 * @brief 有界的跟踪队列（多生产者，单消费者）
 *
 * 业务线程 Push，后台线程 TakeAll 一次取走全部待写条目。
 * 队列满或已关闭时新条目直接丢弃并计数，不阻塞业务线程。
 */
class TraceQueue {
public:
    explicit TraceQueue(size_t capacity);

    TraceQueue(const TraceQueue&) = delete;
    TraceQueue& operator=(const TraceQueue&) = delete;

    /** @return false 表示条目被丢弃 */
    bool Push(TraceEntry&& entry);

    /**
     * @brief 阻塞直到有数据、队列关闭或超时
     * @return 是否有待写条目
     */
    bool WaitForData(int timeout_ms);

    /** 取走全部待写条目（out 原有内容被替换），返回条数 */
    size_t TakeAll(std::vector<TraceEntry>& out);

    /** 关闭后 Push 一律丢弃，等待中的消费者被唤醒 */
    void Close();
    bool IsClosed() const { return closed_.load(); }

    size_t Size() const;
    bool Empty() const { return Size() == 0; }

    /** 因队列满或已关闭而丢弃的条目数 */
    uint64_t Dropped() const { return dropped_.load(); }

private:
    const size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::vector<TraceEntry> pending_;

    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> dropped_{0};
};

}  // namespace asynctrace
