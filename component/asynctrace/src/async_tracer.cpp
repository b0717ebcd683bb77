#include "async_trace/async_tracer.h"
#include "backend_thread.h"
#include "trace_formatter.h"
#include "trace_queue.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

namespace asynctrace {

/**
 * @brief AsyncTracer 的内部实现类
 */
class AsyncTracerImpl {
public:
    explicit AsyncTracerImpl(const TraceConfig& config)
        : config_(config) {
        queue_ = std::make_unique<TraceQueue>(std::max<size_t>(config.buffer_entries, 1024));
        backend_ = std::make_unique<BackendThread>(*queue_, listeners_, config_);
        backend_->Start();
        running_.store(true);
    }

    ~AsyncTracerImpl() {
        Shutdown();
    }

    void Shutdown() {
        if (!running_.exchange(false)) {
            return;
        }
        backend_->Stop();
    }

    bool IsRunning() const {
        return running_.load();
    }

    void SetTraceLevel(const std::string& switch_name, TraceLevel level) {
        std::lock_guard<std::mutex> lock(switches_mutex_);
        switches_[switch_name] = level;
    }

    TraceLevel GetTraceLevel(const std::string& switch_name) const {
        std::lock_guard<std::mutex> lock(switches_mutex_);
        auto it = switches_.find(switch_name);
        return it == switches_.end() ? TraceLevel::Off : it->second;
    }

    bool HasSwitch(const std::string& switch_name) const {
        std::lock_guard<std::mutex> lock(switches_mutex_);
        return switches_.find(switch_name) != switches_.end();
    }

    std::map<std::string, TraceLevel> Switches() const {
        std::lock_guard<std::mutex> lock(switches_mutex_);
        return switches_;
    }

    void Write(const std::string& switch_name, TraceLevel level,
               const char* file, int line, const std::string& message) {
        if (!running_.load() || level == TraceLevel::Off) {
            return;
        }

        TraceEntry entry;
        entry.timestamp = TraceFormatter::GetCurrentTimestamp();
        entry.level = static_cast<int>(level);
        entry.file = file ? file : "";
        entry.line = line;
        entry.category = switch_name;
        entry.message = message;
        entry.thread_id = std::this_thread::get_id();

        queue_->Push(std::move(entry));
    }

    void Flush() {
        if (running_.load()) {
            backend_->Flush();
        }
    }

    TraceListenerCollection& Listeners() {
        return listeners_;
    }

    uint64_t DroppedEntries() const {
        return queue_->Dropped();
    }

private:
    TraceConfig config_;
    std::atomic<bool> running_{false};

    mutable std::mutex switches_mutex_;
    std::map<std::string, TraceLevel> switches_;

    TraceListenerCollection listeners_;
    std::unique_ptr<TraceQueue> queue_;
    std::unique_ptr<BackendThread> backend_;
};

// ============================================================================
// AsyncTracer
// ============================================================================

AsyncTracer::AsyncTracer(const TraceConfig& config)
    : impl_(std::make_unique<AsyncTracerImpl>(config)) {
}

AsyncTracer::~AsyncTracer() = default;

void AsyncTracer::SetTraceLevel(const std::string& switch_name, TraceLevel level) {
    impl_->SetTraceLevel(switch_name, level);
}

TraceLevel AsyncTracer::GetTraceLevel(const std::string& switch_name) const {
    return impl_->GetTraceLevel(switch_name);
}

bool AsyncTracer::HasSwitch(const std::string& switch_name) const {
    return impl_->HasSwitch(switch_name);
}

std::map<std::string, TraceLevel> AsyncTracer::Switches() const {
    return impl_->Switches();
}

bool AsyncTracer::ShouldTrace(const std::string& switch_name, TraceLevel level) const {
    if (level == TraceLevel::Off || !impl_->IsRunning()) {
        return false;
    }
    return static_cast<int>(impl_->GetTraceLevel(switch_name)) >= static_cast<int>(level);
}

void AsyncTracer::Write(const std::string& switch_name, TraceLevel level,
                        const char* file, int line, const std::string& message) {
    impl_->Write(switch_name, level, file, line, message);
}

void AsyncTracer::Flush() {
    impl_->Flush();
}

void AsyncTracer::Shutdown() {
    impl_->Shutdown();
}

bool AsyncTracer::IsRunning() const {
    return impl_->IsRunning();
}

TraceListenerCollection& AsyncTracer::Listeners() {
    return impl_->Listeners();
}

const TraceListenerCollection& AsyncTracer::Listeners() const {
    return impl_->Listeners();
}

uint64_t AsyncTracer::DroppedEntries() const {
    return impl_->DroppedEntries();
}

}  // namespace asynctrace
