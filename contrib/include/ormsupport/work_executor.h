/**
 * @file work_executor.h
 * @brief 工作执行器：把同步调用交给后台线程执行，调用方拿 future 等结果。
 *
 * - IWorkExecutor：抽象接口，Post 投递无返回值任务，Submit 投递任意可调用对象并返回 future
 * - InlineExecutor：在调用线程直接执行，无队列、无额外线程，供测试或需要同步语义的场景
 * - ThreadPoolExecutor：基于 boost::asio::thread_pool 的固定大小线程池
 * - DefaultExecutor()：进程内共享的线程池，线程数为硬件并发数
 *
 * 任务抛出的异常通过 future 传回调用方；执行器停止后提交的任务不会执行，future 中为 ExecutorStoppedError。
 */

#pragma once

#include "ormsupport/error_code.h"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace ormsupport::async {

/**
 * @brief 执行器已停止，任务被拒绝
 */
class ExecutorStoppedError : public OrmSupportError {
public:
    ExecutorStoppedError()
        : OrmSupportError(ErrorCode::EXECUTOR_STOPPED, "work was rejected") {}
};

/**
 * @brief 工作执行器抽象。
 *
 * 调用方只依赖该接口，不关心任务是同步执行还是进入线程池队列。
 */
class IWorkExecutor {
public:
    virtual ~IWorkExecutor() = default;

    /**
     * @brief 投递无返回值任务，不等待完成。
     * work 不应抛出异常；需要结果或异常传播时使用 Submit。
     * @return true=已接受，false=被拒绝（执行器已停止）
     */
    virtual bool Post(std::function<void()> work) = 0;

    /**
     * @brief 投递任务并返回 future。
     *
     * 典型用法：
     *   auto fut = executor.Submit([] { return LoadRows(); });
     *   auto rows = fut.get();   // 任务中的异常在这里重新抛出
     *
     * func 可以是只能移动的可调用对象。
     */
    template <typename F>
    std::future<std::invoke_result_t<std::decay_t<F>&>> Submit(F&& func);
};

/**
 * @brief 同步实现：Post 时立即在调用线程执行。
 */
class InlineExecutor : public IWorkExecutor {
public:
    bool Post(std::function<void()> work) override;
};

/**
 * @brief 固定大小线程池。析构时先等待已投递的任务执行完，再回收线程。
 */
class ThreadPoolExecutor : public IWorkExecutor {
public:
    /** thread_count 为 0 时取硬件并发数（至少 1） */
    explicit ThreadPoolExecutor(size_t thread_count = 0);
    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    bool Post(std::function<void()> work) override;

    /** 不再接受新任务；尚未开始的任务立即丢弃，其 future 为 ExecutorStoppedError */
    void Stop();

    /** 不再接受新任务，并等待已投递的任务全部完成 */
    void Join();

    bool IsStopped() const { return stopped_.load(); }
    size_t ThreadCount() const { return thread_count_; }

private:
    /** 取走待执行的任务；已被 Stop 丢弃时返回空 */
    std::function<void()> TakePending(uint64_t id);

    size_t thread_count_;
    std::atomic<bool> stopped_{false};

    std::mutex pending_mutex_;
    std::unordered_map<uint64_t, std::function<void()>> pending_;
    uint64_t next_id_ = 0;

    boost::asio::thread_pool pool_;
};

/**
 * @brief 进程内共享的默认线程池（首次使用时创建）
 */
IWorkExecutor& DefaultExecutor();

// ========== IWorkExecutor 模板实现 ==========

namespace detail {

/**
 * @brief Submit 投递的一次性任务：持有可调用对象和 promise
 *
 * 执行前被销毁（执行器拒绝或丢弃）时，promise 中写入 ExecutorStoppedError。
 */
template <typename F, typename R>
class SubmittedWork {
public:
    explicit SubmittedWork(F&& func) : func_(std::forward<F>(func)) {}

    SubmittedWork(const SubmittedWork&) = delete;
    SubmittedWork& operator=(const SubmittedWork&) = delete;

    ~SubmittedWork() {
        if (!finished_) {
            promise_.set_exception(std::make_exception_ptr(ExecutorStoppedError()));
        }
    }

    std::future<R> GetFuture() { return promise_.get_future(); }

    void Run() {
        finished_ = true;
        try {
            if constexpr (std::is_void_v<R>) {
                std::invoke(func_);
                promise_.set_value();
            } else {
                promise_.set_value(std::invoke(func_));
            }
        } catch (...) {
            // 异常交给 future，由调用方在 get() 时处理
            promise_.set_exception(std::current_exception());
        }
    }

private:
    std::decay_t<F> func_;
    std::promise<R> promise_;
    bool finished_ = false;
};

}  // namespace detail

template <typename F>
std::future<std::invoke_result_t<std::decay_t<F>&>> IWorkExecutor::Submit(F&& func) {
    using Result = std::invoke_result_t<std::decay_t<F>&>;

    // 只能移动的任务放进 shared_ptr 以便装入 std::function；
    // 最后一个引用释放时若未执行，future 得到 ExecutorStoppedError
    auto work = std::make_shared<detail::SubmittedWork<F, Result>>(std::forward<F>(func));
    auto fut = work->GetFuture();
    if (!Post([work]() { work->Run(); })) {
        work.reset();
    }
    return fut;
}

}  // namespace ormsupport::async
