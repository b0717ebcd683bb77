#pragma once

/**
 * @file utils.h
 * @brief 通用工具函数库
 *
 * 提供字符串处理、数值解析、环境信息（环境变量 / 主机名 / 工作目录）等常用功能
 *
 * @example
 *   #include <ormsupport/utils.h>
 *
 *   int level = 0;
 *   if (ormsupport::utils::TryParseInt32("3", level)) { ... }
 *
 *   auto env = ormsupport::utils::GetEnv("ASPNETCORE_ENVIRONMENT");  // std::optional
 */

#include <cstdint>
#include <optional>
#include <string>

namespace ormsupport {
namespace utils {

// ============================================================================
// 字符串处理函数
// ============================================================================

/**
 * @brief 去除首尾空白字符
 * @example
 *   std::string s = Trim("  hello  ");  // "hello"
 */
std::string Trim(const std::string& str);

/**
 * @brief 转换为小写 / 大写（仅 ASCII）
 */
std::string ToLower(const std::string& str);
std::string ToUpper(const std::string& str);

/**
 * @brief 替换所有匹配的字符串
 * @example
 *   std::string s = ReplaceAll("A__B__C", "__", ":");  // "A:B:C"
 */
std::string ReplaceAll(const std::string& str, const std::string& from, const std::string& to);

// ============================================================================
// 数值解析
// ============================================================================

/**
 * @brief 严格解析 32 位整数
 *
 * 允许首尾空白和前导 +/-；其余任何字符、空串、溢出都返回 false，out 不变。
 *
 * @example
 *   int v = 0;
 *   TryParseInt32("2", v);            // true, v == 2
 *   TryParseInt32("notanumber", v);   // false
 *   TryParseInt32("2abc", v);         // false
 */
bool TryParseInt32(const std::string& str, int32_t& out);

/**
 * @brief 解析布尔值：true/false/1/0/yes/no/on/off（大小写不敏感）
 * @return 无法识别时返回 std::nullopt
 */
std::optional<bool> ParseBool(const std::string& str);

// ============================================================================
// 环境信息
// ============================================================================

/**
 * @brief 读取环境变量
 * @return 未设置时返回 std::nullopt（设置为空串时返回空串）
 */
std::optional<std::string> GetEnv(const std::string& name);

/**
 * @brief 本机主机名，获取失败返回空串
 */
std::string GetMachineName();

/**
 * @brief 当前工作目录
 */
std::string GetCurrentDirectory();

/**
 * @brief 拼接路径；file 为绝对路径时直接返回 file
 * @example
 *   CombinePath("/etc/app", "appsettings.json");  // "/etc/app/appsettings.json"
 */
std::string CombinePath(const std::string& directory, const std::string& file);

}  // namespace utils
}  // namespace ormsupport
