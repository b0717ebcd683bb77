#pragma once

/**
 * @file data_access_adapter.h
 * @brief 同步数据访问适配器的最小能力接口
 *
 * ORM 运行时的适配器（实体读写、过滤、预取路径、SQL 生成等）是外部组件，
 * 这里只约定 AsyncAdapterWrapper 创建实例后需要下发的几项设置。
 * 具体的 FetchEntity / SaveEntity 等操作是 TAdapter 的普通成员函数，参数类型由 ORM 运行时决定。
 */

#include <string>

namespace ormsupport {

/**
 * @brief 事务隔离级别，数值与数据层的定义一致
 */
enum class IsolationLevel : int {
    Unspecified     = -1,
    Chaos           = 16,
    ReadUncommitted = 256,
    ReadCommitted   = 4096,
    RepeatableRead  = 65536,
    Serializable    = 1048576,
    Snapshot        = 16777216,
};

/**
 * @brief 数据访问适配器接口
 *
 * 每个实例对应一次数据库会话，析构即释放会话（连接、未提交的事务）。
 * 实例不跨线程共享。
 */
class IDataAccessAdapter {
public:
    virtual ~IDataAccessAdapter() = default;

    virtual void SetConnectionString(const std::string& connection_string) = 0;

    /** 命令超时（秒） */
    virtual void SetCommandTimeOut(int seconds) = 0;

    /** 预取路径改用 IN 子查询前允许的参数个数 */
    virtual void SetParameterisedPrefetchPathThreshold(int threshold) = 0;

    virtual void SetTransactionIsolationLevel(IsolationLevel level) = 0;
};

}  // namespace ormsupport
