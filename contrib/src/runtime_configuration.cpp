#include "ormsupport/runtime_configuration.h"

namespace ormsupport {

RuntimeConfiguration::RuntimeConfiguration(const asynctrace::TraceConfig& trace_config)
    : tracer_(std::make_unique<asynctrace::AsyncTracer>(trace_config)) {}

RuntimeConfiguration::~RuntimeConfiguration() {
    // 先把缓冲中的跟踪写出，再回收后台线程
    tracer_->Shutdown();
}

bool RuntimeConfiguration::IsTraceEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trace_enabled_;
}

void RuntimeConfiguration::SetTraceEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    trace_enabled_ = enabled;
}

void RuntimeConfiguration::AddConnectionString(const std::string& key,
                                               const std::string& connection_string) {
    std::lock_guard<std::mutex> lock(mutex_);
    connection_strings_[key] = connection_string;
}

std::optional<std::string> RuntimeConfiguration::GetConnectionString(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connection_strings_.find(key);
    if (it == connection_strings_.end())
        return std::nullopt;
    return it->second;
}

std::map<std::string, std::string> RuntimeConfiguration::ConnectionStrings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_strings_;
}

void RuntimeConfiguration::ConfigureDQE(
    const std::function<void(SqlServerDQEConfiguration&)>& configure) {
    auto dqe = std::make_shared<SqlServerDQEConfiguration>();
    if (configure) {
        configure(*dqe);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    dqe_ = std::move(dqe);
}

std::shared_ptr<const SqlServerDQEConfiguration> RuntimeConfiguration::DQEConfiguration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dqe_;
}

}  // namespace ormsupport
