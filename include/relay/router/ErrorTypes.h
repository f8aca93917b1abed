#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"

namespace relay::router {

/**
 * @brief 统一错误类型
 */
enum class ErrorType {
    QuotaExceeded,     // 提供方报告限额耗尽（429 / quota）
    AuthError,         // 鉴权失败（401/403、密钥无效）
    Transient,         // 瞬时错误（网络、超时、5xx）
    NoModelAvailable,  // 所有候选模型均被封禁或超限
    ConfigError,       // 模型目录配置错误（启动时致命）
    Cancelled,         // 调用方取消
    DeadlineExceeded,  // 超过调用方给定的截止时间
    UnknownError       // 未知错误
};

/**
 * @brief 错误严重程度
 */
enum class ErrorSeverity {
    Critical,
    Warning,
    Info
};

/**
 * @brief 结构化错误信息
 */
struct ErrorInfo {
    ErrorType errorType{ErrorType::UnknownError};
    int errorCode{0}; // HTTP status 或内部错误码（0 表示无/未知）
    std::string message;
    std::optional<nlohmann::json> details;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    std::optional<std::map<std::string, std::string>> context;

    static const char* errorTypeToString(ErrorType t) {
        switch (t) {
            case ErrorType::QuotaExceeded: return "QuotaExceeded";
            case ErrorType::AuthError: return "AuthError";
            case ErrorType::Transient: return "Transient";
            case ErrorType::NoModelAvailable: return "NoModelAvailable";
            case ErrorType::ConfigError: return "ConfigError";
            case ErrorType::Cancelled: return "Cancelled";
            case ErrorType::DeadlineExceeded: return "DeadlineExceeded";
            default: return "UnknownError";
        }
    }

    static const char* severityToString(ErrorSeverity s) {
        switch (s) {
            case ErrorSeverity::Critical: return "Critical";
            case ErrorSeverity::Warning: return "Warning";
            default: return "Info";
        }
    }

    static ErrorSeverity defaultSeverity(ErrorType t) {
        switch (t) {
            case ErrorType::ConfigError:
                return ErrorSeverity::Critical;
            case ErrorType::QuotaExceeded:
            case ErrorType::AuthError:
            case ErrorType::NoModelAvailable:
            case ErrorType::DeadlineExceeded:
                return ErrorSeverity::Warning;
            default:
                return ErrorSeverity::Info;
        }
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["error_type"] = errorTypeToString(errorType);
        j["severity"] = severityToString(defaultSeverity(errorType));
        j["error_code"] = errorCode;
        j["message"] = message;
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
        j["timestamp_ms"] = ms;
        if (details.has_value()) j["details"] = details.value();
        if (context.has_value()) j["context"] = context.value();
        return j;
    }

    std::string toString() const {
        // JSON 作为统一字符串化输出，便于日志/调试
        return toJson().dump();
    }
};

/**
 * @brief 模型目录加载失败（启动期致命错误，不在请求期恢复）
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(ErrorInfo info)
        : std::runtime_error(info.message)
        , m_info(std::move(info)) {}

    const ErrorInfo& info() const { return m_info; }

private:
    ErrorInfo m_info;
};

} // namespace relay::router
