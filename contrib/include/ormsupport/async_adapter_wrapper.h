#pragma once

/**
 * @file async_adapter_wrapper.h
 * @brief 把同步数据访问适配器的操作包装成返回 std::future 的异步操作
 *
 * 每次调用：
 *   1. 在调用线程拷贝当前设置（连接串、超时、预取阈值、隔离级别）
 *   2. 投递到执行器，在工作线程上创建一个新的适配器并下发设置
 *   3. 同步执行对应操作，释放适配器，结果或异常写入 future
 *
 * 包装器本身不持有适配器，也不持有事务；调用之间没有顺序保证，也不共享会话。
 * 依赖同一个适配器上连续调用的操作（显式事务、DataReader）不在此列。
 *
 * @example
 *   AsyncAdapterWrapper<DataAccessAdapter> db("Server=.;Database=Northwind");
 *   db.SetCommandTimeOut(30);
 *
 *   CustomerEntity customer("ALFKI");
 *   auto found = db.FetchEntityAsync(customer);     // customer 按引用传入，由适配器填充
 *   if (found.get()) { ... }
 *
 *   auto count = db.GetDbCountAsync(fields, filter);
 *   int rows = count.get();                          // 操作中的异常在这里原样抛出
 */

#include "ormsupport/data_access_adapter.h"
#include "ormsupport/error_code.h"
#include "ormsupport/work_executor.h"

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace ormsupport {

template <typename TAdapter>
class AsyncAdapterWrapper {
    static_assert(std::is_base_of<IDataAccessAdapter, TAdapter>::value,
                  "TAdapter must derive from ormsupport::IDataAccessAdapter");

public:
    using AdapterPtr = std::unique_ptr<TAdapter>;
    using AdapterFactory = std::function<AdapterPtr()>;

    /** 适配器默认构造，使用适配器自身的默认连接串 */
    AsyncAdapterWrapper()
        : AsyncAdapterWrapper(DefaultFactory()) {}

    /** 每个新建的适配器都使用 connection_string */
    explicit AsyncAdapterWrapper(const std::string& connection_string)
        : AsyncAdapterWrapper(DefaultFactory(), connection_string) {}

    /**
     * @param factory 创建适配器的工厂，不能为空
     * @param connection_string 非空时覆盖适配器的连接串
     * @param executor 执行操作的执行器，nullptr 表示进程共享线程池；需比包装器及其 future 活得久
     */
    explicit AsyncAdapterWrapper(AdapterFactory factory,
                                 const std::string& connection_string = "",
                                 async::IWorkExecutor* executor = nullptr)
        : factory_(std::move(factory))
        , connection_string_(connection_string)
        , executor_(executor != nullptr ? executor : &async::DefaultExecutor()) {
        if (!factory_) {
            throw OrmSupportError(ErrorCode::INVALID_PARAM, "adapter factory is empty");
        }
    }

    // ========== 设置 ==========
    // 不做同步：应在发起并发调用之前设置好

    const std::string& AlternativeConnectionString() const { return connection_string_; }

    int CommandTimeOut() const { return command_timeout_; }
    void SetCommandTimeOut(int seconds) { command_timeout_ = seconds; }

    int ParameterisedPrefetchPathThreshold() const { return prefetch_path_threshold_; }
    void SetParameterisedPrefetchPathThreshold(int threshold) { prefetch_path_threshold_ = threshold; }

    IsolationLevel TransactionIsolationLevel() const { return isolation_level_; }
    void SetTransactionIsolationLevel(IsolationLevel level) { isolation_level_ = level; }

    async::IWorkExecutor& Executor() const { return *executor_; }

    /**
     * @brief 按当前设置创建一个适配器
     *
     * 只下发有效设置：连接串非空、超时 > 0、阈值 > 0、隔离级别不是 Unspecified；
     * 其余保持适配器自身的默认值。
     */
    AdapterPtr CreateAdapterInstance() const {
        return CreateAdapter(factory_, CurrentSettings());
    }

    /**
     * @brief 通用异步原语：在工作线程上以 op(adapter, args...) 执行一次操作
     *
     * 左值参数按引用传入（适配器可以填充调用方的对象，调用方需保证其在 future 就绪前有效），
     * 右值参数移动进任务。
     */
    template <typename Op, typename... Args>
    auto RunAsync(Op&& op, Args&&... args)
        -> std::future<std::decay_t<std::invoke_result_t<std::decay_t<Op>&, TAdapter&, Args&&...>>> {
        using Result = std::decay_t<std::invoke_result_t<std::decay_t<Op>&, TAdapter&, Args&&...>>;

        auto task = [factory = factory_,
                     settings = CurrentSettings(),
                     op = std::forward<Op>(op),
                     packed = std::tuple<Args...>(std::forward<Args>(args)...)]() mutable -> Result {
            // 适配器在 lambda 返回（或异常离开）时析构，早于 future 就绪
            AdapterPtr adapter = CreateAdapter(factory, settings);
            return std::apply(
                [&](auto&&... unpacked) -> Result {
                    return std::invoke(op, *adapter, std::forward<decltype(unpacked)>(unpacked)...);
                },
                std::move(packed));
        };
        return executor_->Submit(std::move(task));
    }

    // ========== 删除 ==========

    template <typename... Args>
    auto DeleteEntitiesDirectlyAsync(Args&&... args) {
        return RunAsync([](TAdapter& a, auto&&... p) { return a.DeleteEntitiesDirectly(std::forward<decltype(p)>(p)...); },
                        std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto DeleteEntityAsync(Args&&... args) {
        return RunAsync([](TAdapter& a, auto&&... p) { return a.DeleteEntity(std::forward<decltype(p)>(p)...); },
                        std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto DeleteEntityCollectionAsync(Args&&... args) {
        return RunAsync([](TAdapter& a, auto&&... p) { return a.DeleteEntityCollection(std::forward<decltype(p)>(p)...); },
                        std::forward<Args>(args)...);
    }

    // ========== 读取 ==========

    template <typename... Args>
    auto FetchEntityAsync(Args&&... args) {
        return RunAsync([](TAdapter& a, auto&&... p) { return a.FetchEntity(std::forward<decltype(p)>(p)...); },
                        std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto FetchEntityCollectionAsync(Args&&... args) {
        return RunAsync([](TAdapter& a, auto&&... p) { return a.FetchEntityCollection(std::forward<decltype(p)>(p)...); },
                        std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto FetchEntityUsingUniqueConstraintAsync(Args&&... args) {
        return RunAsync([](TAdapter& a, auto&&... p) { return a.FetchEntityUsingUniqueConstraint(std::forward<decltype(p)>(p)...); },
                        std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto FetchExcludedFieldsAsync(Args&&... args) {
        return RunAsync([](TAdapter& a, auto&&... p) { return a.FetchExcludedFields(std::forward<decltype(p)>(p)...); },
                        std::forward<Args>(args)...);
    }

    // 两种形式靠返回类型互相排除；A 让成员查找推迟到调用时，
    // 没有 FetchNewEntity 的适配器也能实例化包装器

    /** 按实体类型读取单个新实体：FetchNewEntityAsync<CustomerEntity>(filter) */
    template <typename TEntity, typename... Args, typename A = TAdapter>
    auto FetchNewEntityAsync(Args&&... args)
        -> std::future<std::decay_t<decltype(std::declval<A&>().template FetchNewEntity<TEntity>(std::declval<Args&&>()...))>> {
        return RunAsync([](A& a, auto&&... p) { return a.template FetchNewEntity<TEntity>(std::forward<decltype(p)>(p)...); },
                        std::forward<Args>(args)...);
    }

    /** 按实体工厂读取单个新实体：FetchNewEntityAsync(factory, filter) */
    template <typename EntityFactory, typename... Args, typename A = TAdapter>
    auto FetchNewEntityAsync(EntityFactory&& entity_factory, Args&&... args)
        -> std::future<std::decay_t<decltype(std::declval<A&>().FetchNewEntity(std::declval<EntityFactory&&>(), std::declval<Args&&>()...))>> {
        return RunAsync([](A& a, auto&&... p) { return a.FetchNewEntity(std::forward<decltype(p)>(p)...); },
                        std::forward<EntityFactory>(entity_factory), std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto FetchProjectionAsync(Args&&... args) {
        return RunAsync([](TAdapter& a, auto&&... p) { return a.FetchProjection(std::forward<decltype(p)>(p)...); },
                        std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto FetchTypedListAsync(Args&&... args) {
        return RunAsync([](TAdapter& a, auto&&... p) { return a.FetchTypedList(std::forward<decltype(p)>(p)...); },
                        std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto FetchTypedViewAsync(Args&&... args) {
        return RunAsync([](TAdapter& a, auto&&... p) { return a.FetchTypedView(std::forward<decltype(p)>(p)...); },
                        std::forward<Args>(args)...);
    }

    // ========== 聚合 ==========

    template <typename... Args>
    auto GetDbCountAsync(Args&&... args) {
        return RunAsync([](TAdapter& a, auto&&... p) { return a.GetDbCount(std::forward<decltype(p)>(p)...); },
                        std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto GetScalarAsync(Args&&... args) {
        return RunAsync([](TAdapter& a, auto&&... p) { return a.GetScalar(std::forward<decltype(p)>(p)...); },
                        std::forward<Args>(args)...);
    }

    // ========== 保存 / 更新 ==========

    template <typename... Args>
    auto SaveEntityAsync(Args&&... args) {
        return RunAsync([](TAdapter& a, auto&&... p) { return a.SaveEntity(std::forward<decltype(p)>(p)...); },
                        std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto SaveEntityCollectionAsync(Args&&... args) {
        return RunAsync([](TAdapter& a, auto&&... p) { return a.SaveEntityCollection(std::forward<decltype(p)>(p)...); },
                        std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto UpdateEntitiesDirectlyAsync(Args&&... args) {
        return RunAsync([](TAdapter& a, auto&&... p) { return a.UpdateEntitiesDirectly(std::forward<decltype(p)>(p)...); },
                        std::forward<Args>(args)...);
    }

private:
    struct Settings {
        std::string connection_string;
        int command_timeout = 0;
        int prefetch_path_threshold = 0;
        IsolationLevel isolation_level = IsolationLevel::Unspecified;
    };

    static AdapterFactory DefaultFactory() {
        return [] { return std::make_unique<TAdapter>(); };
    }

    Settings CurrentSettings() const {
        return Settings{connection_string_, command_timeout_,
                        prefetch_path_threshold_, isolation_level_};
    }

    static AdapterPtr CreateAdapter(const AdapterFactory& factory, const Settings& settings) {
        AdapterPtr adapter = factory();
        if (!adapter) {
            throw OrmSupportError(ErrorCode::INTERNAL_ERROR, "adapter factory returned null");
        }
        if (!settings.connection_string.empty()) {
            adapter->SetConnectionString(settings.connection_string);
        }
        if (settings.command_timeout > 0) {
            adapter->SetCommandTimeOut(settings.command_timeout);
        }
        if (settings.prefetch_path_threshold > 0) {
            adapter->SetParameterisedPrefetchPathThreshold(settings.prefetch_path_threshold);
        }
        if (settings.isolation_level != IsolationLevel::Unspecified) {
            adapter->SetTransactionIsolationLevel(settings.isolation_level);
        }
        return adapter;
    }

    AdapterFactory factory_;
    std::string connection_string_;
    int command_timeout_ = 0;
    int prefetch_path_threshold_ = 0;
    IsolationLevel isolation_level_ = IsolationLevel::Unspecified;
    async::IWorkExecutor* executor_;
};

}  // namespace ormsupport
