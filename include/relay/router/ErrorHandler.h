#pragma once

#include "relay/router/ErrorTypes.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace relay::router {

class ConfigManager;

class ErrorHandler {
public:
    /**
     * @brief 按失败类型决定封禁时长
     *
     * quota 短封禁（分钟级），auth 长封禁（小时级，不会自愈），transient 不封禁。
     */
    struct BanPolicy {
        std::chrono::seconds quotaBan{300};
        std::chrono::seconds authBan{6 * 3600};
        // quota 错误带 Retry-After 时是否采用提供方给出的更长时长
        bool honorRetryAfter{true};

        static BanPolicy makeDefault();
    };

    enum class LogLevel {
        Error,
        Warning,
        Info,
        Debug
    };

    struct LoggerConfig {
        LogLevel minLevel{LogLevel::Warning};
        bool enabled{true};
    };

    ErrorHandler();
    explicit ErrorHandler(BanPolicy policy);

    /**
     * @brief 从配置读取 router.*_ban_seconds 与 logging.min_level
     */
    static ErrorHandler fromConfig(const ConfigManager& cfg);

    void setBanPolicy(BanPolicy policy);
    const BanPolicy& getBanPolicy() const;

    void setLoggerConfig(LoggerConfig cfg);
    const LoggerConfig& getLoggerConfig() const;

    // ========== 识别/解析 ==========
    // 供传输层实现者把 HTTP 结果映射为失败类型；statusCode==0 表示传输层失败
    static ErrorType classifyHttpFailure(int statusCode, const std::string& text = "");

    // ========== 封禁策略 ==========
    // 返回应封禁的时长；不应封禁（transient 等）返回 nullopt
    std::optional<std::chrono::seconds> banDurationFor(
        ErrorType type,
        const std::optional<uint32_t>& retryAfterSeconds = std::nullopt) const;

    // ========== 日志 ==========
    void log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err = std::nullopt) const;

    static const char* logLevelToString(LogLevel level);
    static std::optional<LogLevel> stringToLogLevel(const std::string& s);

    // Retry-After: seconds 或 HTTP-date。解析成功返回延迟秒数（向上取整），否则 nullopt。
    static std::optional<uint32_t> parseRetryAfterSeconds(const std::string& retryAfterValue);

private:
    BanPolicy m_policy;
    LoggerConfig m_loggerCfg;
};

} // namespace relay::router
