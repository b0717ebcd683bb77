#include "ormsupport/dqe_configuration.h"

#include <algorithm>

namespace ormsupport {

const char* CompatibilityLevelToString(SqlServerCompatibilityLevel level) {
    switch (level) {
        case SqlServerCompatibilityLevel::SqlServer2000: return "SqlServer2000";
        case SqlServerCompatibilityLevel::SqlServer2005: return "SqlServer2005";
        case SqlServerCompatibilityLevel::SqlServerCE3x: return "SqlServerCE3x";
        case SqlServerCompatibilityLevel::SqlServerCE4:  return "SqlServerCE4";
        case SqlServerCompatibilityLevel::SqlServer2012: return "SqlServer2012";
        default:                                         return "Unknown";
    }
}

SqlServerDQEConfiguration& SqlServerDQEConfiguration::AddDbProviderFactory(
    const std::string& invariant_name) {
    if (std::find(provider_factories_.begin(), provider_factories_.end(), invariant_name)
        == provider_factories_.end()) {
        provider_factories_.push_back(invariant_name);
    }
    return *this;
}

SqlServerDQEConfiguration& SqlServerDQEConfiguration::SetDefaultCompatibilityLevel(
    SqlServerCompatibilityLevel level) {
    compatibility_level_ = level;
    return *this;
}

SqlServerDQEConfiguration& SqlServerDQEConfiguration::SetTraceLevel(asynctrace::TraceLevel level) {
    trace_level_ = level;
    return *this;
}

SqlServerDQEConfiguration& SqlServerDQEConfiguration::AddCatalogNameOverwrite(
    const std::string& catalog_name, const std::string& overwrite) {
    catalog_overwrites_[catalog_name] = overwrite;
    return *this;
}

std::string SqlServerDQEConfiguration::ResolveCatalogName(const std::string& catalog_name) const {
    auto it = catalog_overwrites_.find(catalog_name);
    return it == catalog_overwrites_.end() ? catalog_name : it->second;
}

}  // namespace ormsupport
