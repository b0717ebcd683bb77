#include "async_trace/trace_listener.h"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace asynctrace {

FileTraceListener::FileTraceListener(std::string file_path,
                                     std::string name,
                                     size_t max_file_size,
                                     int max_file_count)
    : TraceListener(std::move(name))
    , file_path_(std::move(file_path))
    , max_file_size_(max_file_size)
    , max_file_count_(max_file_count) {
    OpenFile();
}

FileTraceListener::~FileTraceListener() {
    Close();
}

void FileTraceListener::Write(TraceLevel /*level*/, const std::string& formatted_trace) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!file_.is_open()) {
        if (!OpenFile()) {
            return;
        }
    }

    file_ << formatted_trace;
    current_file_size_ += formatted_trace.size();

    if (current_file_size_ >= max_file_size_) {
        RotateFile();
    }
}

void FileTraceListener::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileTraceListener::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

bool FileTraceListener::OpenFile() {
    if (file_path_.empty()) {
        return false;
    }

    // 确保目录存在
    std::error_code ec;
    fs::path parent = fs::path(file_path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    file_.open(file_path_, std::ios::app);
    if (!file_.is_open()) {
        return false;
    }

    // 获取已有文件大小
    file_.seekp(0, std::ios::end);
    current_file_size_ = static_cast<size_t>(file_.tellp());
    return true;
}

void FileTraceListener::RotateFile() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }

    // {file}.N-1 被删除，其余依次后移：{file}.i -> {file}.i+1，{file} -> {file}.1
    std::error_code ec;
    if (max_file_count_ > 1) {
        fs::remove(file_path_ + "." + std::to_string(max_file_count_ - 1), ec);
        for (int i = max_file_count_ - 2; i >= 1; --i) {
            std::string from = file_path_ + "." + std::to_string(i);
            if (fs::exists(from, ec)) {
                fs::rename(from, file_path_ + "." + std::to_string(i + 1), ec);
            }
        }
        fs::rename(file_path_, file_path_ + ".1", ec);
    } else {
        fs::remove(file_path_, ec);
    }

    OpenFile();
}

}  // namespace asynctrace
