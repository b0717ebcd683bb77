#include "trace_formatter.h"
#include "../include/async_trace/trace_level.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace asynctrace {

TraceFormatter::TraceFormatter(const TraceConfig& config)
    : config_(config) {
}

std::string TraceFormatter::Format(const TraceEntry& entry) const {
    std::ostringstream oss;
    auto field = [&oss](const auto& value) { oss << '[' << value << "] "; };

    field(FormatTimestamp(entry.timestamp));
    field(TraceLevelToString(static_cast<TraceLevel>(entry.level)));

    if (config_.show_thread_id) {
        oss << "[tid:" << entry.thread_id << "] ";
    }
    if (config_.show_category && !entry.category.empty()) {
        field(entry.category);
    }
    if (config_.show_file_line && !entry.file.empty()) {
        oss << '[' << entry.file << ':' << entry.line << "] ";
    }

    oss << entry.message << '\n';
    return oss.str();
}

int64_t TraceFormatter::GetCurrentTimestamp() {
    using namespace std::chrono;
    return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
}

std::string TraceFormatter::FormatTimestamp(int64_t timestamp_us) {
    std::time_t seconds = static_cast<std::time_t>(timestamp_us / 1000000);
    int millis = static_cast<int>((timestamp_us % 1000000) / 1000);

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &seconds);
#else
    localtime_r(&seconds, &tm_buf);
#endif

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);

    char result[48];
    std::snprintf(result, sizeof(result), "%s.%03d", date, millis);
    return result;
}

}  // namespace asynctrace
