#include "trace_queue.h"

#include <chrono>

namespace asynctrace {

TraceQueue::TraceQueue(size_t capacity)
    : capacity_(capacity) {
    pending_.reserve(capacity_);
}

bool TraceQueue::Push(TraceEntry&& entry) {
    bool wake = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.load() || pending_.size() >= capacity_) {
            dropped_.fetch_add(1);
            return false;
        }
        pending_.push_back(std::move(entry));
        // 攒到一半再唤醒后台线程，其余由定时刷新带走
        wake = pending_.size() >= capacity_ / 2;
    }
    if (wake) {
        not_empty_.notify_one();
    }
    return true;
}

bool TraceQueue::WaitForData(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (timeout_ms > 0) {
        not_empty_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
            return !pending_.empty() || closed_.load();
        });
    }
    return !pending_.empty();
}

size_t TraceQueue::TakeAll(std::vector<TraceEntry>& out) {
    std::vector<TraceEntry> taken;
    taken.reserve(capacity_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        taken.swap(pending_);
    }
    out = std::move(taken);
    return out.size();
}

void TraceQueue::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_.store(true);
    }
    not_empty_.notify_all();
}

size_t TraceQueue::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

}  // namespace asynctrace
