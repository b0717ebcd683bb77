/**
 * @file work_executor.cpp
 * @brief 工作执行器实现
 */

#include "ormsupport/work_executor.h"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <thread>

namespace ormsupport::async {

namespace {

size_t ResolveThreadCount(size_t requested) {
    if (requested > 0)
        return requested;
    return std::max<size_t>(1, std::thread::hardware_concurrency());
}

}  // namespace

bool InlineExecutor::Post(std::function<void()> work) {
    if (work) {
        work();
    }
    return true;
}

ThreadPoolExecutor::ThreadPoolExecutor(size_t thread_count)
    : thread_count_(ResolveThreadCount(thread_count))
    , pool_(thread_count_) {}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    Join();
}

bool ThreadPoolExecutor::Post(std::function<void()> work) {
    if (!work)
        return false;

    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (stopped_.load())
            return false;
        id = next_id_++;
        pending_.emplace(id, std::move(work));
    }

    boost::asio::post(pool_, [this, id] {
        auto pending = TakePending(id);
        if (pending) {
            pending();
        }
    });
    return true;
}

std::function<void()> ThreadPoolExecutor::TakePending(uint64_t id) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end())
        return nullptr;
    auto work = std::move(it->second);
    pending_.erase(it);
    return work;
}

void ThreadPoolExecutor::Stop() {
    std::unordered_map<uint64_t, std::function<void()>> abandoned;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        stopped_.store(true);
        abandoned.swap(pending_);
    }
    pool_.stop();
    // 未开始的任务在此销毁，Submit 的 future 随之就绪
    abandoned.clear();
}

void ThreadPoolExecutor::Join() {
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        stopped_.store(true);
    }
    pool_.join();
}

IWorkExecutor& DefaultExecutor() {
    static ThreadPoolExecutor executor;
    return executor;
}

}  // namespace ormsupport::async
