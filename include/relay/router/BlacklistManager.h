#pragma once

#include "relay/router/ErrorTypes.h"
#include "relay/router/utils/Clock.h"

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "nlohmann/json.hpp"

namespace relay::router {

/**
 * @brief 一条临时封禁记录
 */
struct BlacklistEntry {
    std::string modelId;
    utils::Clock::time_point bannedUntil{};
    std::string reason;
    ErrorType cause{ErrorType::UnknownError};
};

/**
 * @brief 模型临时封禁表（TTL 到期自动失效，无需显式解封）
 */
class BlacklistManager {
public:
    explicit BlacklistManager(const utils::Clock& clock = utils::SteadyClock::instance());
    ~BlacklistManager() = default;

    // 禁止拷贝/移动
    BlacklistManager(const BlacklistManager&) = delete;
    BlacklistManager& operator=(const BlacklistManager&) = delete;
    BlacklistManager(BlacklistManager&&) = delete;
    BlacklistManager& operator=(BlacklistManager&&) = delete;

    /**
     * @brief 封禁模型；已有记录直接覆盖（bannedUntil = now + duration）
     */
    void blacklist(const std::string& modelId,
                   std::chrono::seconds duration,
                   const std::string& reason,
                   ErrorType cause = ErrorType::UnknownError);

    // 记录存在且 now < bannedUntil
    bool isBlacklisted(const std::string& modelId) const;

    /**
     * @brief 当前仍在封禁中的模型及剩余秒数
     */
    std::map<std::string, double> status() const;

    // 仅返回仍生效的记录
    std::optional<BlacklistEntry> entry(const std::string& modelId) const;

    bool unban(const std::string& modelId);

    /**
     * @brief 清理已过期记录
     * @return 清理数量
     */
    std::size_t purgeExpired();

    nlohmann::json toJson() const;

private:
    const utils::Clock& m_clock;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, BlacklistEntry> m_entries;
};

} // namespace relay::router
