/**
 * @file error.h
 * @brief 错误码与返回值类型
 * @details 引擎对外不抛异常, 所有可失败操作返回 Result<T> 或 Status。
 */

#ifndef CORE_ERROR_H
#define CORE_ERROR_H

#include <optional>
#include <string>
#include <utility>

namespace core {

enum class ErrorCode {
    Ok = 0,
    LocationUnavailable,    // 无法获取可用定位
    ZoneMismatch,           // 不在任何有效围栏内
    ProviderUnavailable,    // 验证服务不可达, 不计入次数
    VerificationFailed,     // 验证未通过, 计入次数
    MaxAttemptsExceeded,    // 达到最大次数, 需要重新注册人脸
    MissingReason,
    MissingPhoto,
    AlreadyDecided,
    NotFound,
    SessionAlreadyOpen,
    InvalidTransition,
    InvalidArgument,
    FeatureDisabled,
    TooFarFromWorkplace,
    AlreadyExists,
    StorageError,
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                  return "ok";
        case ErrorCode::LocationUnavailable: return "location_unavailable";
        case ErrorCode::ZoneMismatch:        return "zone_mismatch";
        case ErrorCode::ProviderUnavailable: return "provider_unavailable";
        case ErrorCode::VerificationFailed:  return "verification_failed";
        case ErrorCode::MaxAttemptsExceeded: return "max_attempts_exceeded";
        case ErrorCode::MissingReason:       return "missing_reason";
        case ErrorCode::MissingPhoto:        return "missing_photo";
        case ErrorCode::AlreadyDecided:      return "already_decided";
        case ErrorCode::NotFound:            return "not_found";
        case ErrorCode::SessionAlreadyOpen:  return "session_already_open";
        case ErrorCode::InvalidTransition:   return "invalid_transition";
        case ErrorCode::InvalidArgument:     return "invalid_argument";
        case ErrorCode::FeatureDisabled:     return "feature_disabled";
        case ErrorCode::TooFarFromWorkplace: return "too_far_from_workplace";
        case ErrorCode::AlreadyExists:       return "already_exists";
        case ErrorCode::StorageError:        return "storage_error";
    }
    return "unknown";
}

/**
 * @brief 瞬时错误, 调用方可以直接重试
 */
inline bool is_retryable(ErrorCode code) {
    return code == ErrorCode::LocationUnavailable || code == ErrorCode::ProviderUnavailable;
}

struct Error {
    ErrorCode code = ErrorCode::Ok;
    std::string message;
};

/**
 * @brief 无返回值操作的结果
 */
class Status {
public:
    Status() = default;
    Status(ErrorCode code, std::string message) : error_{code, std::move(message)} {}

    static Status success() { return Status(); }

    bool ok() const { return error_.code == ErrorCode::Ok; }
    explicit operator bool() const { return ok(); }

    ErrorCode code() const { return error_.code; }
    const std::string& message() const { return error_.message; }
    const Error& error() const { return error_; }

private:
    Error error_;
};

/**
 * @brief 值或错误
 * 失败时 value() 不可访问, 调用前先检查 ok()
 */
template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code, std::string message) : error_{code, std::move(message)} {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    T& value() { return *value_; }
    const T& value() const { return *value_; }
    T* operator->() { return &*value_; }
    const T* operator->() const { return &*value_; }

    ErrorCode code() const { return ok() ? ErrorCode::Ok : error_.code; }
    const Error& error() const { return error_; }
    const std::string& message() const { return error_.message; }

private:
    std::optional<T> value_;
    Error error_;
};

} // namespace core

#endif // CORE_ERROR_H
