/**
 * @file utils.cpp
 * @brief 通用工具函数实现
 */

#include "ormsupport/utils.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <system_error>

#ifdef _WIN32
#include <winsock2.h>
#else
#include <unistd.h>
#endif

namespace ormsupport {
namespace utils {

// ============================================================================
// 字符串处理函数实现
// ============================================================================

std::string Trim(const std::string &str) {
  size_t start = str.find_first_not_of(" \t\n\r\f\v");
  if (start == std::string::npos)
    return "";
  size_t end = str.find_last_not_of(" \t\n\r\f\v");
  return str.substr(start, end - start + 1);
}

std::string ToLower(const std::string &str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

std::string ToUpper(const std::string &str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return result;
}

std::string ReplaceAll(const std::string &str, const std::string &from,
                       const std::string &to) {
  if (from.empty())
    return str;
  std::string result = str;
  size_t pos = 0;
  while ((pos = result.find(from, pos)) != std::string::npos) {
    result.replace(pos, from.size(), to);
    pos += to.size();
  }
  return result;
}

// ============================================================================
// 数值解析实现
// ============================================================================

bool TryParseInt32(const std::string &str, int32_t &out) {
  std::string s = Trim(str);
  if (s.empty())
    return false;

  // from_chars 不接受前导 '+'
  const char *first = s.data();
  const char *last = s.data() + s.size();
  if (*first == '+') {
    ++first;
    if (first == last || *first == '-')
      return false;
  }

  int32_t value = 0;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last)
    return false;

  out = value;
  return true;
}

std::optional<bool> ParseBool(const std::string &str) {
  std::string lower = ToLower(Trim(str));
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on")
    return true;
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off")
    return false;
  return std::nullopt;
}

// ============================================================================
// 环境信息实现
// ============================================================================

std::optional<std::string> GetEnv(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  if (value == nullptr)
    return std::nullopt;
  return std::string(value);
}

std::string GetMachineName() {
  char buf[256] = {0};
  if (gethostname(buf, sizeof(buf) - 1) != 0)
    return "";
  return std::string(buf);
}

std::string GetCurrentDirectory() {
  std::error_code ec;
  auto path = std::filesystem::current_path(ec);
  if (ec)
    return ".";
  return path.string();
}

std::string CombinePath(const std::string &directory, const std::string &file) {
  std::filesystem::path file_path(file);
  if (file_path.is_absolute() || directory.empty())
    return file;
  return (std::filesystem::path(directory) / file_path).string();
}

} // namespace utils
} // namespace ormsupport
