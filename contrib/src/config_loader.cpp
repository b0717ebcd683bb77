#include "ormsupport/config_loader.h"

#include "ormsupport/error_code.h"
#include "ormsupport/utils.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <set>
#include <sstream>

#ifndef _WIN32
#include <unistd.h>  // environ
#endif

namespace ormsupport {

namespace {

using json = nlohmann::json;

std::string LastSegment(const std::string& path) {
    auto pos = path.rfind(Configuration::kKeyDelimiter);
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string CombineKey(const std::string& parent, const std::string& key) {
    if (parent.empty())
        return key;
    if (key.empty())
        return parent;
    return parent + Configuration::kKeyDelimiter + key;
}

// 子键排序：数字段按数值且排在非数字段前，其余大小写不敏感
bool ChildKeyLess(const std::string& a, const std::string& b) {
    int32_t ia = 0;
    int32_t ib = 0;
    bool a_num = utils::TryParseInt32(a, ia);
    bool b_num = utils::TryParseInt32(b, ib);
    if (a_num && b_num)
        return ia < ib;
    if (a_num != b_num)
        return a_num;
    return utils::ToLower(a) < utils::ToLower(b);
}

void Flatten(const json& node, const std::string& path,
             const std::function<void(const std::string&, const std::optional<std::string>&)>& set) {
    switch (node.type()) {
        case json::value_t::object:
            if (node.empty() && !path.empty()) {
                set(path, std::nullopt);
                return;
            }
            for (auto it = node.begin(); it != node.end(); ++it) {
                Flatten(it.value(), CombineKey(path, it.key()), set);
            }
            return;
        case json::value_t::array:
            if (node.empty()) {
                set(path, std::nullopt);
                return;
            }
            for (size_t i = 0; i < node.size(); ++i) {
                Flatten(node[i], CombineKey(path, std::to_string(i)), set);
            }
            return;
        case json::value_t::null:
            set(path, std::nullopt);
            return;
        case json::value_t::string:
            set(path, node.get<std::string>());
            return;
        default:
            // number / boolean
            set(path, node.dump());
            return;
    }
}

}  // namespace

// ============================================================================
// ConfigurationSection
// ============================================================================

ConfigurationSection::ConfigurationSection(const Configuration* config, std::string path)
    : config_(config), path_(std::move(path)), key_(LastSegment(path_)) {}

std::optional<std::string> ConfigurationSection::Value() const {
    return config_->GetValue(path_);
}

bool ConfigurationSection::Exists() const {
    return Value().has_value() || !config_->GetChildPaths(path_).empty();
}

ConfigurationSection ConfigurationSection::GetSection(const std::string& key) const {
    return ConfigurationSection(config_, CombineKey(path_, key));
}

std::vector<ConfigurationSection> ConfigurationSection::GetChildren() const {
    std::vector<ConfigurationSection> children;
    for (auto& child_path : config_->GetChildPaths(path_)) {
        children.emplace_back(config_, child_path);
    }
    return children;
}

std::string ConfigurationSection::Get(const std::string& key,
                                      const std::string& default_val) const {
    return config_->Get(CombineKey(path_, key), default_val);
}

int ConfigurationSection::GetInt(const std::string& key, int default_val) const {
    return config_->GetInt(CombineKey(path_, key), default_val);
}

bool ConfigurationSection::GetBool(const std::string& key, bool default_val) const {
    return config_->GetBool(CombineKey(path_, key), default_val);
}

// ============================================================================
// Configuration
// ============================================================================

std::string Configuration::ToLowerKey(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void Configuration::LoadJsonFile(const std::string& path, bool optional) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        if (optional)
            return;
        throw ConfigurationError(ErrorCode::CONFIG_FILE_NOT_FOUND, path);
    }

    std::ifstream f(path);
    if (!f.is_open())
        throw ConfigurationError(ErrorCode::CONFIG_FILE_UNREADABLE, path);

    std::stringstream ss;
    ss << f.rdbuf();
    LoadJsonString(ss.str(), path);
}

void Configuration::LoadJsonString(const std::string& json_text,
                                   const std::string& source_name) {
    json root;
    try {
        // 与 appsettings.json 一样允许注释
        root = json::parse(json_text, nullptr, true, true);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(ErrorCode::CONFIG_PARSE_FAILED,
                                 source_name + ": " + e.what());
    }

    if (!root.is_object()) {
        throw ConfigurationError(ErrorCode::CONFIG_PARSE_FAILED,
                                 source_name + ": top-level element must be an object");
    }

    Flatten(root, "", [this](const std::string& key, const std::optional<std::string>& value) {
        Set(key, value);
    });
}

void Configuration::ApplyEnvOverrides(const std::string& env_prefix) {
    std::string prefix_upper = utils::ToUpper(env_prefix);
    size_t plen = prefix_upper.size();

#ifndef _WIN32
    for (char** p = environ; *p != nullptr; ++p) {
        std::string env(*p);
        size_t eq = env.find('=');
        if (eq == std::string::npos)
            continue;
        std::string name = env.substr(0, eq);
        std::string value = env.substr(eq + 1);
        if (name.size() <= plen || utils::ToUpper(name).compare(0, plen, prefix_upper) != 0)
            continue;
        std::string key = utils::ReplaceAll(name.substr(plen), "__", kKeyDelimiter);
        Set(key, value);
    }
#endif
}

void Configuration::Set(const std::string& key, const std::optional<std::string>& value) {
    if (key.empty())
        return;
    auto lower = ToLowerKey(key);
    auto it = map_.find(lower);
    if (it == map_.end()) {
        map_.emplace(std::move(lower), Entry{key, value});
    } else {
        it->second.value = value;
    }
}

bool Configuration::Has(const std::string& key) const {
    return map_.find(ToLowerKey(key)) != map_.end();
}

std::optional<std::string> Configuration::GetValue(const std::string& key) const {
    auto it = map_.find(ToLowerKey(key));
    if (it == map_.end())
        return std::nullopt;
    return it->second.value;
}

std::string Configuration::Get(const std::string& key, const std::string& default_val) const {
    auto v = GetValue(key);
    return v ? *v : default_val;
}

int Configuration::GetInt(const std::string& key, int default_val) const {
    auto v = GetValue(key);
    int32_t result = 0;
    if (!v || !utils::TryParseInt32(*v, result))
        return default_val;
    return result;
}

bool Configuration::GetBool(const std::string& key, bool default_val) const {
    auto v = GetValue(key);
    if (!v)
        return default_val;
    return utils::ParseBool(*v).value_or(default_val);
}

ConfigurationSection Configuration::GetSection(const std::string& key) const {
    return ConfigurationSection(this, key);
}

std::vector<ConfigurationSection> Configuration::GetChildren() const {
    return GetSection("").GetChildren();
}

std::vector<std::string> Configuration::GetChildPaths(const std::string& parent_path) const {
    std::string prefix = parent_path.empty()
        ? std::string()
        : ToLowerKey(parent_path) + kKeyDelimiter;

    std::set<std::string> seen;
    std::vector<std::pair<std::string, std::string>> children;  // (段名, 完整路径)

    for (auto it = map_.lower_bound(prefix); it != map_.end(); ++it) {
        const std::string& lower = it->first;
        if (lower.compare(0, prefix.size(), prefix) != 0)
            break;
        size_t end = lower.find(kKeyDelimiter, prefix.size());
        size_t seg_len = (end == std::string::npos ? lower.size() : end) - prefix.size();
        if (!seen.insert(lower.substr(prefix.size(), seg_len)).second)
            continue;
        // 小写转换不改变长度，可以直接在原始键上截取
        const std::string& original = it->second.key;
        children.emplace_back(original.substr(prefix.size(), seg_len),
                              original.substr(0, prefix.size() + seg_len));
    }

    std::stable_sort(children.begin(), children.end(),
                     [](const auto& a, const auto& b) { return ChildKeyLess(a.first, b.first); });

    std::vector<std::string> result;
    result.reserve(children.size());
    for (auto& child : children) {
        result.push_back(std::move(child.second));
    }
    return result;
}

// ============================================================================
// ConfigurationBuilder
// ============================================================================

ConfigurationBuilder& ConfigurationBuilder::SetBasePath(const std::string& base_path) {
    base_path_ = base_path;
    return *this;
}

ConfigurationBuilder& ConfigurationBuilder::AddJsonFile(const std::string& path, bool optional) {
    sources_.push_back(Source{SourceKind::JsonFile, path, optional});
    return *this;
}

ConfigurationBuilder& ConfigurationBuilder::AddJsonString(const std::string& json_text) {
    sources_.push_back(Source{SourceKind::JsonString, json_text, false});
    return *this;
}

ConfigurationBuilder& ConfigurationBuilder::AddEnvironmentVariables(const std::string& env_prefix) {
    sources_.push_back(Source{SourceKind::Environment, env_prefix, true});
    return *this;
}

Configuration ConfigurationBuilder::Build() const {
    std::string base = base_path_.empty() ? utils::GetCurrentDirectory() : base_path_;

    Configuration cfg;
    for (const auto& source : sources_) {
        switch (source.kind) {
            case SourceKind::JsonFile:
                cfg.LoadJsonFile(utils::CombinePath(base, source.text), source.optional);
                break;
            case SourceKind::JsonString:
                cfg.LoadJsonString(source.text);
                break;
            case SourceKind::Environment:
                cfg.ApplyEnvOverrides(source.text);
                break;
        }
    }
    return cfg;
}

Configuration LoadJsonConfiguration(const std::string& path, const std::string& env_prefix) {
    Configuration cfg;
    cfg.LoadJsonFile(path, true);
    cfg.ApplyEnvOverrides(env_prefix);
    return cfg;
}

}  // namespace ormsupport
