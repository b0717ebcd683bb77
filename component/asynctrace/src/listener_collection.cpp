#include "async_trace/listener_collection.h"
#include <algorithm>

namespace asynctrace {

void TraceListenerCollection::Add(TraceListenerPtr listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

bool TraceListenerCollection::Remove(const std::string& name) {
    std::vector<TraceListenerPtr> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::stable_partition(listeners_.begin(), listeners_.end(),
                                        [&name](const TraceListenerPtr& l) {
                                            return l->Name() != name;
                                        });
        removed.assign(it, listeners_.end());
        listeners_.erase(it, listeners_.end());
    }
    for (auto& listener : removed) {
        listener->Flush();
    }
    return !removed.empty();
}

void TraceListenerCollection::Clear() {
    std::vector<TraceListenerPtr> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed.swap(listeners_);
    }
    for (auto& listener : removed) {
        listener->Flush();
    }
}

TraceListenerPtr TraceListenerCollection::Find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& listener : listeners_) {
        if (listener->Name() == name) {
            return listener;
        }
    }
    return nullptr;
}

size_t TraceListenerCollection::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

bool TraceListenerCollection::Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.empty();
}

std::vector<std::string> TraceListenerCollection::Names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(listeners_.size());
    for (const auto& listener : listeners_) {
        names.push_back(listener->Name());
    }
    return names;
}

std::vector<TraceListenerPtr> TraceListenerCollection::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_;
}

}  // namespace asynctrace
