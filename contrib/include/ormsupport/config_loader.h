#pragma once

/**
 * @file config_loader.h
 * @brief 分层配置加载：JSON 文件 + 环境变量覆盖，按层合并，后加载的层覆盖先加载的层。
 *
 * JSON 会被展平为以 ':' 分隔的路径，键大小写不敏感（保留首次出现时的原始大小写）：
 *   { "LLBLGen": { "Tracing": { "Switches": { "EntityFetch": "2" } } } }
 *   -> "LLBLGen:Tracing:Switches:EntityFetch" = "2"
 * 数组按下标展开："A": ["x", "y"] -> "A:0" = "x", "A:1" = "y"
 *
 * 用法：
 *   Configuration cfg = ConfigurationBuilder()
 *       .SetBasePath("/etc/app")
 *       .AddJsonFile("appsettings.json")                 // 可选文件，缺失时跳过
 *       .AddJsonFile("appsettings.Production.json")
 *       .AddEnvironmentVariables("ORMSUPPORT_")         // ORMSUPPORT_A__B=1 -> A:B=1
 *       .Build();
 *   auto switches = cfg.GetSection("LLBLGen:Tracing:Switches").GetChildren();
 */

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ormsupport {

class Configuration;

/**
 * 配置的一个子树视图（不拥有数据，生命周期不能超过所属 Configuration）。
 */
class ConfigurationSection {
public:
    ConfigurationSection(const Configuration* config, std::string path);

    /** 路径最后一段，如 "EntityFetch" */
    const std::string& Key() const { return key_; }
    /** 完整路径，如 "LLBLGen:Tracing:Switches:EntityFetch" */
    const std::string& Path() const { return path_; }

    /** 本节点的值；仅有子节点或值为 null 时返回 std::nullopt */
    std::optional<std::string> Value() const;

    /** 有值或有子节点 */
    bool Exists() const;

    ConfigurationSection GetSection(const std::string& key) const;
    std::vector<ConfigurationSection> GetChildren() const;

    std::string Get(const std::string& key, const std::string& default_val) const;
    int GetInt(const std::string& key, int default_val) const;
    bool GetBool(const std::string& key, bool default_val) const;

private:
    const Configuration* config_;
    std::string path_;
    std::string key_;
};

/**
 * 分层键值配置：键统一按小写比较，值来自 JSON 文件与环境变量（后加载覆盖先加载）。
 */
class Configuration {
public:
    /** 路径分隔符 */
    static constexpr const char* kKeyDelimiter = ":";

    Configuration() = default;

    /**
     * 加载 JSON 文件并合并到当前配置。
     * @param optional 为 true 时文件不存在直接返回；为 false 时抛 ConfigurationError
     * @throws ConfigurationError 文件无法读取或 JSON 格式错误
     */
    void LoadJsonFile(const std::string& path, bool optional = true);

    /**
     * 从 JSON 文本加载并合并，source_name 仅用于错误信息。
     * @throws ConfigurationError JSON 格式错误或根节点不是对象
     */
    void LoadJsonString(const std::string& json_text,
                        const std::string& source_name = "<string>");

    /**
     * 用环境变量覆盖：只处理以 env_prefix 开头的变量（前缀大小写不敏感），
     * 去掉前缀后 "__" 视为路径分隔符。
     * 例如 prefix="ORMSUPPORT_" 时，ORMSUPPORT_ConnectionStrings__Main=... -> ConnectionStrings:Main
     */
    void ApplyEnvOverrides(const std::string& env_prefix);

    /** 直接设置一个键，value 为 std::nullopt 表示 null */
    void Set(const std::string& key, const std::optional<std::string>& value);

    /** 键存在（值可能为 null） */
    bool Has(const std::string& key) const;

    std::optional<std::string> GetValue(const std::string& key) const;
    std::string Get(const std::string& key, const std::string& default_val) const;
    int GetInt(const std::string& key, int default_val) const;
    bool GetBool(const std::string& key, bool default_val) const;

    ConfigurationSection GetSection(const std::string& key) const;
    std::vector<ConfigurationSection> GetChildren() const;

    /**
     * parent_path 下一层子节点的路径（原始大小写），按键名排序，数字键按数值排序。
     * parent_path 为空表示根。
     */
    std::vector<std::string> GetChildPaths(const std::string& parent_path) const;

    size_t Size() const { return map_.size(); }

private:
    struct Entry {
        std::string key;                      // 原始大小写的完整路径
        std::optional<std::string> value;
    };

    static std::string ToLowerKey(std::string s);

    // 小写路径 -> 条目
    std::map<std::string, Entry> map_;
};

/**
 * 按添加顺序组装多层配置源，Build() 时依次加载。
 */
class ConfigurationBuilder {
public:
    ConfigurationBuilder() = default;

    /** 相对路径的 JSON 文件以此为基准，默认为 Build() 时的当前工作目录 */
    ConfigurationBuilder& SetBasePath(const std::string& base_path);

    ConfigurationBuilder& AddJsonFile(const std::string& path, bool optional = true);
    ConfigurationBuilder& AddJsonString(const std::string& json_text);
    ConfigurationBuilder& AddEnvironmentVariables(const std::string& env_prefix);

    /**
     * @throws ConfigurationError 任一层加载失败
     */
    Configuration Build() const;

private:
    enum class SourceKind { JsonFile, JsonString, Environment };

    struct Source {
        SourceKind kind;
        std::string text;      // 文件路径 / JSON 文本 / 环境变量前缀
        bool optional = true;
    };

    std::string base_path_;
    std::vector<Source> sources_;
};

/**
 * 加载配置：读 JSON 文件（可选）并应用环境变量覆盖。
 */
Configuration LoadJsonConfiguration(const std::string& path,
                                    const std::string& env_prefix);

}  // namespace ormsupport
