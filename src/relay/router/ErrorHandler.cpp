#include "relay/router/ErrorHandler.h"

#include "relay/router/ConfigManager.h"

#include <algorithm>
#include <chrono>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <locale>
#include <optional>
#include <sstream>
#include <string>

namespace relay::router {

static uint64_t nowEpochMs() {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static std::string trimCopy(std::string s) {
    auto notSpace = [](int ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

static std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

ErrorHandler::BanPolicy ErrorHandler::BanPolicy::makeDefault() {
    BanPolicy p;
    p.quotaBan = std::chrono::seconds(300);
    p.authBan = std::chrono::seconds(6 * 3600);
    p.honorRetryAfter = true;
    return p;
}

ErrorHandler::ErrorHandler()
    : m_policy(BanPolicy::makeDefault())
{
    m_loggerCfg = LoggerConfig{};
}

ErrorHandler::ErrorHandler(BanPolicy policy)
    : m_policy(std::move(policy))
{
    m_loggerCfg = LoggerConfig{};
}

ErrorHandler ErrorHandler::fromConfig(const ConfigManager& cfg) {
    BanPolicy policy = BanPolicy::makeDefault();
    if (auto v = cfg.get("router.quota_ban_seconds"); v.has_value() && v->is_number_integer()) {
        const auto sec = v->get<int64_t>();
        if (sec > 0) policy.quotaBan = std::chrono::seconds(sec);
    }
    if (auto v = cfg.get("router.auth_ban_seconds"); v.has_value() && v->is_number_integer()) {
        const auto sec = v->get<int64_t>();
        if (sec > 0) policy.authBan = std::chrono::seconds(sec);
    }
    if (auto v = cfg.get("router.honor_retry_after"); v.has_value() && v->is_boolean()) {
        policy.honorRetryAfter = v->get<bool>();
    }

    ErrorHandler handler(policy);
    LoggerConfig logCfg;
    if (auto v = cfg.get("logging.min_level"); v.has_value() && v->is_string()) {
        if (auto level = stringToLogLevel(v->get<std::string>()); level.has_value()) {
            logCfg.minLevel = *level;
        }
    }
    if (auto v = cfg.get("logging.enabled"); v.has_value() && v->is_boolean()) {
        logCfg.enabled = v->get<bool>();
    }
    handler.setLoggerConfig(logCfg);
    return handler;
}

void ErrorHandler::setBanPolicy(BanPolicy policy) {
    m_policy = std::move(policy);
}

const ErrorHandler::BanPolicy& ErrorHandler::getBanPolicy() const {
    return m_policy;
}

void ErrorHandler::setLoggerConfig(LoggerConfig cfg) {
    m_loggerCfg = cfg;
}

const ErrorHandler::LoggerConfig& ErrorHandler::getLoggerConfig() const {
    return m_loggerCfg;
}

const char* ErrorHandler::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Info: return "INFO";
        default: return "DEBUG";
    }
}

std::optional<ErrorHandler::LogLevel> ErrorHandler::stringToLogLevel(const std::string& s) {
    const auto low = toLowerCopy(trimCopy(s));
    if (low == "error") return LogLevel::Error;
    if (low == "warning" || low == "warn") return LogLevel::Warning;
    if (low == "info") return LogLevel::Info;
    if (low == "debug") return LogLevel::Debug;
    return std::nullopt;
}

ErrorType ErrorHandler::classifyHttpFailure(int statusCode, const std::string& text) {
    const std::string low = toLowerCopy(text);

    if (statusCode == 429) return ErrorType::QuotaExceeded;
    if (statusCode == 401 || statusCode == 403) return ErrorType::AuthError;

    // 部分提供方用 400/200 + 文案报告限额或密钥问题
    if (low.find("quota") != std::string::npos || low.find("rate limit") != std::string::npos ||
        low.find("resource_exhausted") != std::string::npos || low.find("too many requests") != std::string::npos) {
        return ErrorType::QuotaExceeded;
    }
    if (low.find("api key") != std::string::npos || low.find("api_key") != std::string::npos ||
        low.find("unauthorized") != std::string::npos || low.find("permission denied") != std::string::npos) {
        return ErrorType::AuthError;
    }

    // 网络失败、超时、5xx 以及其他一律视为瞬时错误
    return ErrorType::Transient;
}

std::optional<std::chrono::seconds> ErrorHandler::banDurationFor(
    ErrorType type,
    const std::optional<uint32_t>& retryAfterSeconds) const {
    switch (type) {
        case ErrorType::QuotaExceeded: {
            auto ban = m_policy.quotaBan;
            if (m_policy.honorRetryAfter && retryAfterSeconds.has_value()) {
                ban = std::max(ban, std::chrono::seconds(*retryAfterSeconds));
            }
            return ban;
        }
        case ErrorType::AuthError:
            return m_policy.authBan;
        default:
            return std::nullopt;
    }
}

std::optional<uint32_t> ErrorHandler::parseRetryAfterSeconds(const std::string& retryAfterValue) {
    const auto v = trimCopy(retryAfterValue);
    if (v.empty()) return std::nullopt;

    // 1) integer seconds
    bool allDigits = std::all_of(v.begin(), v.end(), [](unsigned char c){ return std::isdigit(c); });
    if (allDigits) {
        if (v.size() > 9) return std::nullopt;
        return static_cast<uint32_t>(std::stoul(v));
    }

    // 2) HTTP-date: IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
    std::tm tm{};
    std::istringstream iss(v);
    iss.imbue(std::locale::classic());
    iss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    if (!iss.fail()) {
        #if defined(_WIN32)
        const auto when = _mkgmtime(&tm);
        #else
        const auto when = timegm(&tm);
        #endif
        if (when <= 0) return std::nullopt;
        const auto now = std::time(nullptr);
        if (now <= 0) return std::nullopt;
        const auto delta = when - now;
        if (delta <= 0) return static_cast<uint32_t>(0);
        return static_cast<uint32_t>(delta);
    }

    return std::nullopt;
}

void ErrorHandler::log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err) const {
    if (!m_loggerCfg.enabled) return;

    auto levelRank = [](LogLevel l) -> int {
        switch (l) {
            case LogLevel::Error: return 0;
            case LogLevel::Warning: return 1;
            case LogLevel::Info: return 2;
            default: return 3;
        }
    };
    if (levelRank(level) > levelRank(m_loggerCfg.minLevel)) return;

    // 结构化输出到 stderr：timestamp + level + message + optional error json
    std::ostringstream oss;
    oss << "[" << nowEpochMs() << "] "
        << logLevelToString(level) << " "
        << message;
    if (err.has_value()) {
        oss << " " << err->toString();
    }
    oss << "\n";
    const auto line = oss.str();
    std::fwrite(line.c_str(), 1, line.size(), stderr);
    std::fflush(stderr);
}

} // namespace relay::router
