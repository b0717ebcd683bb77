#pragma once

#include "trace_listener.h"

#include <mutex>
#include <string>
#include <vector>

namespace asynctrace {

/**
 * @brief 已注册 Listener 的集合（线程安全）
 *
 * 后台线程通过 Snapshot() 拿到当前列表再逐个写入，
 * 因此 Clear/Add 与正在进行的写入互不阻塞。
 */
class TraceListenerCollection {
public:
    TraceListenerCollection() = default;

    TraceListenerCollection(const TraceListenerCollection&) = delete;
    TraceListenerCollection& operator=(const TraceListenerCollection&) = delete;

    /** 添加 Listener，nullptr 忽略 */
    void Add(TraceListenerPtr listener);

    /** 按名字移除（名字重复时全部移除），返回是否有移除 */
    bool Remove(const std::string& name);

    /** 清空全部 Listener（被移除的 Listener 会先 Flush） */
    void Clear();

    /** 按名字查找第一个匹配项，找不到返回 nullptr */
    TraceListenerPtr Find(const std::string& name) const;

    size_t Count() const;
    bool Empty() const;

    /** 按添加顺序返回名字列表 */
    std::vector<std::string> Names() const;

    /** 当前 Listener 列表的拷贝 */
    std::vector<TraceListenerPtr> Snapshot() const;

private:
    mutable std::mutex mutex_;
    std::vector<TraceListenerPtr> listeners_;
};

}  // namespace asynctrace
