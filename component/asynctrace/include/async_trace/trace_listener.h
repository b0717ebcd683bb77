#pragma once

#include "trace_level.h"

#include <cstddef>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace asynctrace {

/**
 * @brief 跟踪输出接口（Listener 抽象基类）
 *
 * 每个 Listener 带一个名字（"Console" / "Debug" / "File" 或自定义），
 * TraceListenerCollection 按名字查找与移除。
 */
class TraceListener {
public:
    explicit TraceListener(std::string name) : name_(std::move(name)) {}
    virtual ~TraceListener() = default;

    TraceListener(const TraceListener&) = delete;
    TraceListener& operator=(const TraceListener&) = delete;

    const std::string& Name() const { return name_; }

    /** formatted_trace 已格式化并以换行结尾，level 供着色等用途 */
    virtual void Write(TraceLevel level, const std::string& formatted_trace) = 0;
    virtual void Flush() = 0;
    virtual void Close() {}

private:
    std::string name_;
};

using TraceListenerPtr = std::shared_ptr<TraceListener>;

// ============================================================================
// 内置 Listener
// ============================================================================

/**
 * @brief 控制台输出（stdout），终端下按级别着色
 */
class ConsoleTraceListener : public TraceListener {
public:
    explicit ConsoleTraceListener(std::string name = "Console", bool enable_color = true);

    void Write(TraceLevel level, const std::string& formatted_trace) override;
    void Flush() override;

private:
    const bool enable_color_;
    std::mutex mutex_;
};

/**
 * @brief 调试输出（stderr），可同时追加写入 log_file_name
 *
 * log_file_name 为空时只写 stderr。
 */
class DebugTraceListener : public TraceListener {
public:
    explicit DebugTraceListener(std::string name = "Debug", std::string log_file_name = "");
    ~DebugTraceListener() override;

    const std::string& LogFileName() const { return log_file_name_; }

    void Write(TraceLevel level, const std::string& formatted_trace) override;
    void Flush() override;
    void Close() override;

private:
    std::string log_file_name_;
    std::ofstream file_;
    std::mutex mutex_;
};

/**
 * @brief 追加写入文件的 Listener
 *
 * 当前文件超过 max_file_size 后滚动：{file} -> {file}.1 -> {file}.2 ...，
 * 连同当前文件共保留 max_file_count 个。
 */
class FileTraceListener : public TraceListener {
public:
    /**
     * @param file_path 跟踪文件路径
     * @param name Listener 名
     * @param max_file_size 单文件最大大小（字节）
     * @param max_file_count 保留文件数量（含当前文件）
     */
    explicit FileTraceListener(std::string file_path,
                               std::string name = "File",
                               size_t max_file_size = 100 * 1024 * 1024,
                               int max_file_count = 10);
    ~FileTraceListener() override;

    const std::string& FilePath() const { return file_path_; }

    void Write(TraceLevel level, const std::string& formatted_trace) override;
    void Flush() override;
    void Close() override;

private:
    bool OpenFile();
    void RotateFile();

    std::string file_path_;
    size_t max_file_size_;
    int max_file_count_;

    std::ofstream file_;
    size_t current_file_size_ = 0;

    std::mutex mutex_;
};

}  // namespace asynctrace
