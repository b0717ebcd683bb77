/**
 * @file async_adapter_wrapper_test.cpp
 * @brief AsyncAdapterWrapper 单元测试（使用内存中的假适配器）
 */

#include "ormsupport/async_adapter_wrapper.h"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>
#include <gtest/gtest.h>

namespace ormsupport {

namespace {

struct Entity {
    std::string id;
    std::string name;
};

bool operator==(const Entity& a, const Entity& b) {
    return a.id == b.id && a.name == b.name;
}

struct EntityFactory {
    std::string prefix;
    Entity Create(const std::string& id) const { return Entity{id, prefix + id}; }
};

struct AdapterJournal {
    std::atomic<int> created{0};
    std::atomic<int> live{0};
};

struct AdapterSettings {
    std::string connection_string;
    int command_timeout;
    int prefetch_path_threshold;
    IsolationLevel isolation_level;
    int setter_calls;
};

std::shared_ptr<AdapterJournal> SharedJournal() {
    static auto journal = std::make_shared<AdapterJournal>();
    return journal;
}

/**
 * 内存假适配器：默认值与真实适配器不同的哨兵值，便于判断设置是否被下发
 */
class FakeAdapter : public IDataAccessAdapter {
public:
    explicit FakeAdapter(std::shared_ptr<AdapterJournal> journal = SharedJournal())
        : journal_(std::move(journal)), id_(++journal_->created) {
        journal_->live.fetch_add(1);
    }

    ~FakeAdapter() override { journal_->live.fetch_sub(1); }

    void SetConnectionString(const std::string& connection_string) override {
        connection_string_ = connection_string;
        ++setter_calls_;
    }

    void SetCommandTimeOut(int seconds) override {
        if (seconds > 3600) {
            throw std::out_of_range("command timeout too large");
        }
        command_timeout_ = seconds;
        ++setter_calls_;
    }

    void SetParameterisedPrefetchPathThreshold(int threshold) override {
        prefetch_path_threshold_ = threshold;
        ++setter_calls_;
    }

    void SetTransactionIsolationLevel(IsolationLevel level) override {
        isolation_level_ = level;
        ++setter_calls_;
    }

    int Id() const { return id_; }

    AdapterSettings Settings() const {
        return AdapterSettings{connection_string_, command_timeout_, prefetch_path_threshold_,
                               isolation_level_, setter_calls_};
    }

    // ========== 数据访问操作 ==========

    int DeleteEntitiesDirectly(const std::string& entity_name, const std::string& filter) {
        return static_cast<int>(entity_name.size() + filter.size());
    }

    bool DeleteEntity(Entity& entity) {
        entity.name.clear();
        return !entity.id.empty();
    }

    int DeleteEntityCollection(std::vector<Entity>& entities) {
        int count = static_cast<int>(entities.size());
        entities.clear();
        return count;
    }

    bool FetchEntity(Entity& entity) {
        if (entity.id == "missing") {
            return false;
        }
        entity.name = "fetched-" + entity.id;
        return true;
    }

    bool FetchEntity(Entity& entity, const std::string& prefetch_path) {
        entity.name = "fetched-" + entity.id + "+" + prefetch_path;
        return true;
    }

    void FetchEntityCollection(std::vector<Entity>& collection, int max_items) {
        for (int i = 0; i < max_items; ++i) {
            collection.push_back(Entity{std::to_string(i), "row"});
        }
    }

    bool FetchEntityUsingUniqueConstraint(Entity& entity, const std::string& constraint) {
        entity.name = "unique-" + constraint;
        return true;
    }

    void FetchExcludedFields(std::vector<Entity>& entities, const std::vector<std::string>& fields) {
        for (auto& e : entities) {
            e.name = fields.empty() ? "" : fields.front();
        }
    }

    template <typename TEntity>
    TEntity FetchNewEntity(const std::string& id) {
        return TEntity{id, "new"};
    }

    Entity FetchNewEntity(const EntityFactory& factory, const std::string& id) {
        return factory.Create(id);
    }

    void FetchProjection(std::vector<std::string>& rows, const std::string& projector) {
        rows.push_back("projected:" + projector);
    }

    void FetchTypedList(std::vector<std::string>& rows) {
        rows.push_back("typed-list");
    }

    void FetchTypedView(std::vector<std::string>& rows, int max_items) {
        for (int i = 0; i < max_items; ++i) {
            rows.push_back("typed-view");
        }
    }

    int GetDbCount(const std::string& filter) {
        if (filter == "bad") {
            throw std::runtime_error("invalid filter: bad");
        }
        return static_cast<int>(filter.size());
    }

    double GetScalar(const std::string& field) {
        return field == "Freight" ? 12.5 : 0.0;
    }

    bool SaveEntity(Entity& entity, bool refetch = false) {
        entity.name = refetch ? "saved+refetched" : "saved";
        return true;
    }

    int SaveEntityCollection(std::unique_ptr<std::vector<Entity>> batch) {
        return batch ? static_cast<int>(batch->size()) : 0;
    }

    int UpdateEntitiesDirectly(const Entity& values, const std::string& filter) {
        return values.name.empty() || filter.empty() ? 0 : 3;
    }

private:
    std::shared_ptr<AdapterJournal> journal_;
    int id_;

    std::string connection_string_ = "default-connection";
    int command_timeout_ = 30;
    int prefetch_path_threshold_ = 50;
    IsolationLevel isolation_level_ = IsolationLevel::ReadCommitted;
    int setter_calls_ = 0;
};

/**
 * 只实现一个操作的适配器：包装器只要求被调用到的操作存在
 */
class CountOnlyAdapter : public IDataAccessAdapter {
public:
    void SetConnectionString(const std::string& connection_string) override { connection_string_ = connection_string; }
    void SetCommandTimeOut(int) override {}
    void SetParameterisedPrefetchPathThreshold(int) override {}
    void SetTransactionIsolationLevel(IsolationLevel) override {}

    int GetDbCount() { return connection_string_ == "count-db" ? 12 : 0; }

private:
    std::string connection_string_;
};

/**
 * 手动执行器：任务只入队，由测试决定何时执行
 */
class ManualExecutor : public async::IWorkExecutor {
public:
    bool Post(std::function<void()> work) override {
        queue_.push_back(std::move(work));
        return true;
    }

    void RunAll() {
        auto pending = std::move(queue_);
        queue_.clear();
        for (auto& work : pending) {
            work();
        }
    }

    size_t Pending() const { return queue_.size(); }

private:
    std::vector<std::function<void()>> queue_;
};

}  // namespace

class AsyncAdapterWrapperTest : public ::testing::Test {
protected:
    void SetUp() override {
        journal_ = std::make_shared<AdapterJournal>();
    }

    AsyncAdapterWrapper<FakeAdapter> MakeWrapper(const std::string& connection_string = "",
                                                 async::IWorkExecutor* executor = nullptr) {
        auto journal = journal_;
        return AsyncAdapterWrapper<FakeAdapter>(
            [journal] { return std::make_unique<FakeAdapter>(journal); },
            connection_string,
            executor != nullptr ? executor : &executor_);
    }

    std::shared_ptr<AdapterJournal> journal_;
    async::ThreadPoolExecutor executor_{4};
};

// ============================================================================
// 构造与设置下发
// ============================================================================

TEST_F(AsyncAdapterWrapperTest, Defaults_LeaveAdapterSettingsUntouched) {
    auto wrapper = MakeWrapper();
    EXPECT_EQ(wrapper.CommandTimeOut(), 0);
    EXPECT_EQ(wrapper.ParameterisedPrefetchPathThreshold(), 0);
    EXPECT_EQ(wrapper.TransactionIsolationLevel(), IsolationLevel::Unspecified);
    EXPECT_EQ(wrapper.AlternativeConnectionString(), "");

    auto settings = wrapper.RunAsync([](FakeAdapter& a) { return a.Settings(); }).get();
    EXPECT_EQ(settings.connection_string, "default-connection");
    EXPECT_EQ(settings.command_timeout, 30);
    EXPECT_EQ(settings.prefetch_path_threshold, 50);
    EXPECT_EQ(settings.isolation_level, IsolationLevel::ReadCommitted);
    EXPECT_EQ(settings.setter_calls, 0);
}

TEST_F(AsyncAdapterWrapperTest, NonPositiveValues_LeaveAdapterSettingsUntouched) {
    auto wrapper = MakeWrapper();
    wrapper.SetCommandTimeOut(-5);
    wrapper.SetParameterisedPrefetchPathThreshold(0);
    wrapper.SetTransactionIsolationLevel(IsolationLevel::Unspecified);

    auto settings = wrapper.RunAsync([](FakeAdapter& a) { return a.Settings(); }).get();
    EXPECT_EQ(settings.command_timeout, 30);
    EXPECT_EQ(settings.prefetch_path_threshold, 50);
    EXPECT_EQ(settings.setter_calls, 0);
}

TEST_F(AsyncAdapterWrapperTest, ConfiguredValues_AppliedToEveryAdapter) {
    auto wrapper = MakeWrapper("Server=.;Database=Northwind");
    wrapper.SetCommandTimeOut(60);
    wrapper.SetParameterisedPrefetchPathThreshold(100);
    wrapper.SetTransactionIsolationLevel(IsolationLevel::Serializable);

    for (int i = 0; i < 3; ++i) {
        auto settings = wrapper.RunAsync([](FakeAdapter& a) { return a.Settings(); }).get();
        EXPECT_EQ(settings.connection_string, "Server=.;Database=Northwind");
        EXPECT_EQ(settings.command_timeout, 60);
        EXPECT_EQ(settings.prefetch_path_threshold, 100);
        EXPECT_EQ(settings.isolation_level, IsolationLevel::Serializable);
        EXPECT_EQ(settings.setter_calls, 4);
    }
    EXPECT_EQ(journal_->created.load(), 3);
}

TEST_F(AsyncAdapterWrapperTest, CreateAdapterInstance_AppliesCurrentSettings) {
    auto wrapper = MakeWrapper("conn");
    wrapper.SetTransactionIsolationLevel(IsolationLevel::Snapshot);

    auto adapter = wrapper.CreateAdapterInstance();
    ASSERT_NE(adapter, nullptr);
    EXPECT_EQ(adapter->Settings().connection_string, "conn");
    EXPECT_EQ(adapter->Settings().isolation_level, IsolationLevel::Snapshot);
    EXPECT_EQ(adapter->Settings().command_timeout, 30);
}

TEST_F(AsyncAdapterWrapperTest, SettingsSnapshottedAtDispatch) {
    ManualExecutor manual;
    auto wrapper = MakeWrapper("", &manual);
    wrapper.SetCommandTimeOut(10);

    auto fut = wrapper.RunAsync([](FakeAdapter& a) { return a.Settings(); });
    wrapper.SetCommandTimeOut(20);
    EXPECT_EQ(manual.Pending(), 1u);

    manual.RunAll();
    EXPECT_EQ(fut.get().command_timeout, 10);
}

TEST_F(AsyncAdapterWrapperTest, DefaultConstructor_UsesDefaultConstructedAdapter) {
    AsyncAdapterWrapper<FakeAdapter> wrapper;
    EXPECT_EQ(&wrapper.Executor(), &async::DefaultExecutor());

    auto settings = wrapper.RunAsync([](FakeAdapter& a) { return a.Settings(); }).get();
    EXPECT_EQ(settings.connection_string, "default-connection");
}

TEST_F(AsyncAdapterWrapperTest, ConnectionStringConstructor_OverridesConnectionString) {
    AsyncAdapterWrapper<FakeAdapter> wrapper(std::string("Server=db01"));
    EXPECT_EQ(wrapper.AlternativeConnectionString(), "Server=db01");

    auto settings = wrapper.RunAsync([](FakeAdapter& a) { return a.Settings(); }).get();
    EXPECT_EQ(settings.connection_string, "Server=db01");
}

TEST_F(AsyncAdapterWrapperTest, EmptyFactory_Throws) {
    try {
        AsyncAdapterWrapper<FakeAdapter> wrapper{AsyncAdapterWrapper<FakeAdapter>::AdapterFactory()};
        FAIL() << "expected OrmSupportError";
    } catch (const OrmSupportError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_PARAM);
    }
}

// ============================================================================
// 结果与异常
// ============================================================================

TEST_F(AsyncAdapterWrapperTest, Result_SameAsSynchronousCall) {
    auto wrapper = MakeWrapper();
    auto adapter = wrapper.CreateAdapterInstance();

    EXPECT_EQ(wrapper.GetDbCountAsync(std::string("Country = 'UK'")).get(),
              adapter->GetDbCount("Country = 'UK'"));
    EXPECT_DOUBLE_EQ(wrapper.GetScalarAsync(std::string("Freight")).get(),
                     adapter->GetScalar("Freight"));
}

TEST_F(AsyncAdapterWrapperTest, OperationException_PropagatedUnchanged) {
    auto wrapper = MakeWrapper();
    auto fut = wrapper.GetDbCountAsync(std::string("bad"));
    try {
        fut.get();
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "invalid filter: bad");
    }
    EXPECT_EQ(journal_->live.load(), 0);
}

TEST_F(AsyncAdapterWrapperTest, FactoryException_PropagatedThroughFuture) {
    AsyncAdapterWrapper<FakeAdapter> wrapper(
        []() -> std::unique_ptr<FakeAdapter> { throw std::runtime_error("cannot connect"); },
        "", &executor_);

    auto fut = wrapper.GetDbCountAsync(std::string("x"));
    try {
        fut.get();
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "cannot connect");
    }
}

TEST_F(AsyncAdapterWrapperTest, SetterException_PropagatedAndAdapterReleased) {
    auto wrapper = MakeWrapper();
    wrapper.SetCommandTimeOut(7200);

    auto fut = wrapper.GetDbCountAsync(std::string("x"));
    EXPECT_THROW(fut.get(), std::out_of_range);
    EXPECT_EQ(journal_->created.load(), 1);
    EXPECT_EQ(journal_->live.load(), 0);
}

TEST_F(AsyncAdapterWrapperTest, NullAdapterFromFactory_ReportedThroughFuture) {
    AsyncAdapterWrapper<FakeAdapter> wrapper(
        [] { return std::unique_ptr<FakeAdapter>(); }, "", &executor_);

    auto fut = wrapper.GetDbCountAsync(std::string("x"));
    try {
        fut.get();
        FAIL() << "expected OrmSupportError";
    } catch (const OrmSupportError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INTERNAL_ERROR);
    }
}

TEST_F(AsyncAdapterWrapperTest, AdapterReleasedBeforeFutureReady) {
    auto wrapper = MakeWrapper();
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(wrapper.RunAsync([](FakeAdapter& a) { return a.Id(); }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(journal_->created.load(), 20);
    EXPECT_EQ(journal_->live.load(), 0);
}

// ============================================================================
// 并发
// ============================================================================

TEST_F(AsyncAdapterWrapperTest, ConcurrentCalls_NeverShareAdapter) {
    auto wrapper = MakeWrapper();
    std::mutex mutex;
    std::set<const FakeAdapter*> in_flight_overlap_check;
    std::atomic<bool> shared{false};

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 16; ++i) {
        futures.push_back(wrapper.RunAsync([&](FakeAdapter& a) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (!in_flight_overlap_check.insert(&a).second) {
                    shared.store(true);
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            {
                std::lock_guard<std::mutex> lock(mutex);
                in_flight_overlap_check.erase(&a);
            }
            return a.Id();
        }));
    }

    std::set<int> ids;
    for (auto& f : futures) {
        ids.insert(f.get());
    }
    EXPECT_FALSE(shared.load());
    EXPECT_EQ(ids.size(), 16u);
}

TEST_F(AsyncAdapterWrapperTest, CallerNotBlockedWhileOperationRuns) {
    auto wrapper = MakeWrapper();
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    auto fut = wrapper.RunAsync([gate](FakeAdapter& a) {
        gate.wait();
        return a.Id();
    });

    EXPECT_EQ(fut.wait_for(std::chrono::milliseconds(20)), std::future_status::timeout);
    release.set_value();
    EXPECT_GT(fut.get(), 0);
}

TEST_F(AsyncAdapterWrapperTest, OperationRunsOnWorkerThread) {
    auto wrapper = MakeWrapper();
    auto caller = std::this_thread::get_id();
    auto worker = wrapper.RunAsync([](FakeAdapter&) { return std::this_thread::get_id(); }).get();
    EXPECT_NE(worker, caller);
}

// ============================================================================
// 各操作转发
// ============================================================================

TEST_F(AsyncAdapterWrapperTest, FetchEntityAsync_FillsCallerEntity) {
    auto wrapper = MakeWrapper();
    Entity customer{"ALFKI", ""};
    EXPECT_TRUE(wrapper.FetchEntityAsync(customer).get());
    EXPECT_EQ(customer.name, "fetched-ALFKI");

    Entity missing{"missing", ""};
    EXPECT_FALSE(wrapper.FetchEntityAsync(missing).get());
}

TEST_F(AsyncAdapterWrapperTest, FetchEntityAsync_ForwardsOverloads) {
    auto wrapper = MakeWrapper();
    Entity order{"10248", ""};
    EXPECT_TRUE(wrapper.FetchEntityAsync(order, std::string("OrderDetails")).get());
    EXPECT_EQ(order.name, "fetched-10248+OrderDetails");
}

TEST_F(AsyncAdapterWrapperTest, VoidOperations_ReturnFutureOfVoid) {
    auto wrapper = MakeWrapper();
    std::vector<Entity> collection;
    auto fut = wrapper.FetchEntityCollectionAsync(collection, 3);
    static_assert(std::is_same<decltype(fut), std::future<void>>::value, "void operation");
    fut.get();
    EXPECT_EQ(collection.size(), 3u);

    std::vector<std::string> rows;
    wrapper.FetchProjectionAsync(rows, std::string("Name")).get();
    wrapper.FetchTypedListAsync(rows).get();
    wrapper.FetchTypedViewAsync(rows, 2).get();
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0], "projected:Name");
    EXPECT_EQ(rows[1], "typed-list");
    EXPECT_EQ(rows[3], "typed-view");

    std::vector<Entity> partial{{"1", ""}, {"2", ""}};
    wrapper.FetchExcludedFieldsAsync(partial, std::vector<std::string>{"Photo"}).get();
    EXPECT_EQ(partial[1].name, "Photo");
}

TEST_F(AsyncAdapterWrapperTest, FetchNewEntityAsync_TypedAndFactoryForms) {
    auto wrapper = MakeWrapper();

    auto typed = wrapper.FetchNewEntityAsync<Entity>(std::string("42"));
    static_assert(std::is_same<decltype(typed), std::future<Entity>>::value, "typed fetch");
    EXPECT_EQ(typed.get(), (Entity{"42", "new"}));

    auto by_factory = wrapper.FetchNewEntityAsync(EntityFactory{"customer-"}, std::string("7"));
    EXPECT_EQ(by_factory.get(), (Entity{"7", "customer-7"}));
}

TEST_F(AsyncAdapterWrapperTest, SaveAndUpdateOperations) {
    auto wrapper = MakeWrapper();

    Entity product{"1", ""};
    EXPECT_TRUE(wrapper.SaveEntityAsync(product).get());
    EXPECT_EQ(product.name, "saved");
    EXPECT_TRUE(wrapper.SaveEntityAsync(product, true).get());
    EXPECT_EQ(product.name, "saved+refetched");

    auto batch = std::make_unique<std::vector<Entity>>(std::vector<Entity>{{"1", "a"}, {"2", "b"}});
    EXPECT_EQ(wrapper.SaveEntityCollectionAsync(std::move(batch)).get(), 2);

    EXPECT_EQ(wrapper.UpdateEntitiesDirectlyAsync(Entity{"", "Discontinued"}, std::string("CategoryId = 1")).get(), 3);
}

TEST_F(AsyncAdapterWrapperTest, DeleteOperations) {
    auto wrapper = MakeWrapper();

    Entity entity{"5", "x"};
    EXPECT_TRUE(wrapper.DeleteEntityAsync(entity).get());
    EXPECT_EQ(entity.name, "");

    std::vector<Entity> entities{{"1", ""}, {"2", ""}, {"3", ""}};
    EXPECT_EQ(wrapper.DeleteEntityCollectionAsync(entities).get(), 3);
    EXPECT_TRUE(entities.empty());

    EXPECT_EQ(wrapper.DeleteEntitiesDirectlyAsync(std::string("Order"), std::string("Id")).get(), 7);
}

TEST_F(AsyncAdapterWrapperTest, FetchEntityUsingUniqueConstraintAsync) {
    auto wrapper = MakeWrapper();
    Entity customer{"", ""};
    EXPECT_TRUE(wrapper.FetchEntityUsingUniqueConstraintAsync(customer, std::string("UC_CompanyName")).get());
    EXPECT_EQ(customer.name, "unique-UC_CompanyName");
}

TEST_F(AsyncAdapterWrapperTest, ResultTypes_MatchSynchronousOperations) {
    auto wrapper = MakeWrapper();
    static_assert(std::is_same<decltype(wrapper.GetDbCountAsync(std::string())), std::future<int>>::value,
                  "GetDbCount returns int");
    static_assert(std::is_same<decltype(wrapper.GetScalarAsync(std::string())), std::future<double>>::value,
                  "GetScalar returns double");
    Entity e;
    static_assert(std::is_same<decltype(wrapper.FetchEntityAsync(e)), std::future<bool>>::value,
                  "FetchEntity returns bool");
    SUCCEED();
}

// ============================================================================
// 适配器能力与执行器停止
// ============================================================================

TEST_F(AsyncAdapterWrapperTest, AdapterWithSingleOperation_Usable) {
    AsyncAdapterWrapper<CountOnlyAdapter> wrapper(
        [] { return std::make_unique<CountOnlyAdapter>(); }, "count-db", &executor_);
    EXPECT_EQ(wrapper.GetDbCountAsync().get(), 12);
}

TEST_F(AsyncAdapterWrapperTest, ExecutorStopped_QueuedCallFailsInsteadOfHanging) {
    async::ThreadPoolExecutor single(1);
    auto wrapper = MakeWrapper("", &single);

    std::promise<void> started;
    auto started_future = started.get_future();
    std::promise<void> release;
    std::shared_future<void> release_future = release.get_future().share();
    auto busy = single.Submit([&started, release_future] {
        started.set_value();
        release_future.wait();
    });
    started_future.wait();

    auto queued = wrapper.GetDbCountAsync(std::string("Orders"));
    single.Stop();

    ASSERT_EQ(queued.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_THROW(queued.get(), async::ExecutorStoppedError);
    EXPECT_EQ(journal_->created.load(), 0);

    release.set_value();
    busy.get();
}

}  // namespace ormsupport
