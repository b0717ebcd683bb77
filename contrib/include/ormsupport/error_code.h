#pragma once

/**
 * @file error_code.h
 * @brief ormsupport 错误码与异常类型
 *
 * 编码规则：
 *   0        - 成功
 *   1-99     - 通用错误
 *   100-199  - 配置错误
 *   200-299  - 执行器错误
 *
 * 数据访问操作本身的失败不在此列：适配器抛出的异常原样经 future 传给调用方。
 */

#include <stdexcept>
#include <string>

namespace ormsupport {

// ============================================================================
// 错误码枚举
// ============================================================================

enum class ErrorCode {
    // ========== 成功 ==========
    OK = 0,

    // ========== 通用错误 1-99 ==========
    UNKNOWN = 1,
    INVALID_PARAM = 2,
    INTERNAL_ERROR = 3,

    // ========== 配置错误 100-199 ==========
    CONFIG_FILE_NOT_FOUND = 100,   // 必需的配置文件不存在
    CONFIG_FILE_UNREADABLE = 101,  // 配置文件无法读取
    CONFIG_PARSE_FAILED = 102,     // JSON 格式错误

    // ========== 执行器错误 200-299 ==========
    EXECUTOR_STOPPED = 200,        // 执行器已停止，任务未被执行
};

/**
 * @brief 错误码 -> 描述字符串
 */
inline const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                     return "OK";
        case ErrorCode::UNKNOWN:                return "unknown error";
        case ErrorCode::INVALID_PARAM:          return "invalid parameter";
        case ErrorCode::INTERNAL_ERROR:         return "internal error";
        case ErrorCode::CONFIG_FILE_NOT_FOUND:  return "configuration file not found";
        case ErrorCode::CONFIG_FILE_UNREADABLE: return "configuration file unreadable";
        case ErrorCode::CONFIG_PARSE_FAILED:    return "configuration parse failed";
        case ErrorCode::EXECUTOR_STOPPED:       return "executor stopped";
        default:                                return "unknown error";
    }
}

// ============================================================================
// 异常类型
// ============================================================================

/**
 * @brief 带错误码的异常基类
 */
class OrmSupportError : public std::runtime_error {
public:
    OrmSupportError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(ErrorCodeToString(code)) + ": " + message)
        , code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief 配置源本身的错误（文件不可读、JSON 格式错误）
 *
 * 单个跟踪级别解析失败不会抛出，只是被跳过。
 */
class ConfigurationError : public OrmSupportError {
public:
    using OrmSupportError::OrmSupportError;
};

}  // namespace ormsupport
