#include "relay/router/BlacklistManager.h"

namespace relay::router {

BlacklistManager::BlacklistManager(const utils::Clock& clock)
    : m_clock(clock) {
}

void BlacklistManager::blacklist(const std::string& modelId,
                                 std::chrono::seconds duration,
                                 const std::string& reason,
                                 ErrorType cause) {
    const auto now = m_clock.now();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[modelId] = BlacklistEntry{modelId, now + duration, reason, cause};
}

bool BlacklistManager::isBlacklisted(const std::string& modelId) const {
    const auto now = m_clock.now();
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(modelId);
    if (it == m_entries.end()) return false;
    return now < it->second.bannedUntil;
}

std::map<std::string, double> BlacklistManager::status() const {
    const auto now = m_clock.now();
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<std::string, double> result;
    for (const auto& [id, e] : m_entries) {
        if (now < e.bannedUntil) {
            result[id] = std::chrono::duration<double>(e.bannedUntil - now).count();
        }
    }
    return result;
}

std::optional<BlacklistEntry> BlacklistManager::entry(const std::string& modelId) const {
    const auto now = m_clock.now();
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(modelId);
    if (it == m_entries.end() || !(now < it->second.bannedUntil)) {
        return std::nullopt;
    }
    return it->second;
}

bool BlacklistManager::unban(const std::string& modelId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.erase(modelId) > 0;
}

std::size_t BlacklistManager::purgeExpired() {
    const auto now = m_clock.now();
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (!(now < it->second.bannedUntil)) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

nlohmann::json BlacklistManager::toJson() const {
    const auto now = m_clock.now();
    std::lock_guard<std::mutex> lock(m_mutex);
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [id, e] : m_entries) {
        if (!(now < e.bannedUntil)) continue;
        j[id] = {
            {"remaining_seconds", std::chrono::duration<double>(e.bannedUntil - now).count()},
            {"reason", e.reason},
            {"cause", ErrorInfo::errorTypeToString(e.cause)},
        };
    }
    return j;
}

} // namespace relay::router
