#include "backend_thread.h"

namespace asynctrace {

BackendThread::BackendThread(TraceQueue& queue, TraceListenerCollection& listeners,
                             const TraceConfig& config)
    : queue_(queue)
    , listeners_(listeners)
    , flush_interval_ms_(static_cast<int>(config.flush_interval_ms))
    , formatter_(config) {
}

BackendThread::~BackendThread() {
    Stop();
}

void BackendThread::Start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&BackendThread::Run, this);
}

void BackendThread::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    queue_.Close();
    if (thread_.joinable()) {
        thread_.join();
    }
    Flush();
}

void BackendThread::Flush() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    WriteOutLocked();
}

void BackendThread::Run() {
    while (running_.load()) {
        queue_.WaitForData(flush_interval_ms_);
        // 无论是否有新条目都刷新一次，让 Listener 的缓冲按周期落盘
        std::lock_guard<std::mutex> lock(write_mutex_);
        WriteOutLocked();
    }
}

void BackendThread::WriteOutLocked() {
    auto listeners = listeners_.Snapshot();

    if (queue_.TakeAll(batch_) > 0 && !listeners.empty()) {
        for (const auto& entry : batch_) {
            std::string line = formatter_.Format(entry);
            auto level = static_cast<TraceLevel>(entry.level);
            for (const auto& listener : listeners) {
                listener->Write(level, line);
            }
        }
    }
    batch_.clear();

    for (const auto& listener : listeners) {
        listener->Flush();
    }
}

}  // namespace asynctrace
