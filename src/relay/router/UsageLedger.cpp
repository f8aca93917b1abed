#include "relay/router/UsageLedger.h"

#include "relay/router/BlacklistManager.h"

#include <limits>

namespace relay::router {

namespace {

uint64_t saturatingAdd(uint64_t a, uint64_t b) {
    return a > std::numeric_limits<uint64_t>::max() - b ? std::numeric_limits<uint64_t>::max() : a + b;
}

} // namespace

UsageLedger::UsageLedger(const ModelRegistry& registry, const utils::Clock& clock)
    : m_registry(registry)
    , m_clock(clock) {
}

bool UsageLedger::isStale(utils::Clock::time_point windowStart, utils::Clock::time_point now,
                          std::chrono::seconds windowLength) {
    return now - windowStart >= windowLength;
}

bool UsageLedger::registerUse(const std::string& modelId, uint64_t tokens) {
    auto model = m_registry.getModel(modelId);
    if (!model.has_value()) {
        return false;
    }
    const uint64_t rpmLimit = model->limits.rpm;
    // rpm > 1.5 * limit 等价于 rpm > limit + limit/2（整数计数）
    const uint64_t overrunThreshold = saturatingAdd(rpmLimit, rpmLimit / 2);

    const auto now = m_clock.now();
    BlacklistManager* banTarget = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& c = registerUseInternal(modelId, tokens, now);
        if (c.rpmCount > overrunThreshold) {
            c.rpmViolations += 1;
            if (c.rpmViolations == 1) {
                banTarget = m_blacklist;
            }
        }
    }

    // 封禁表有自己的锁，不在账本锁内调用
    if (banTarget) {
        banTarget->blacklist(modelId, overrunBanDuration(rpmLimit), "rpm overrun", ErrorType::QuotaExceeded);
    }
    return true;
}

void UsageLedger::setBlacklist(BlacklistManager* blacklist) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_blacklist = blacklist;
}

std::chrono::seconds UsageLedger::overrunBanDuration(uint64_t rpmLimit) {
    if (rpmLimit == 0) {
        return kMinuteWindow;
    }
    // 60/rpm 秒，向上取整，至少 1 秒
    const uint64_t window = static_cast<uint64_t>(kMinuteWindow.count());
    if (rpmLimit >= window) {
        return std::chrono::seconds(1);
    }
    return std::chrono::seconds(static_cast<std::chrono::seconds::rep>((window + rpmLimit - 1) / rpmLimit));
}

bool UsageLedger::canUse(const std::string& modelId, uint64_t tokens) const {
    auto model = m_registry.getModel(modelId);
    if (!model.has_value()) {
        return false;
    }
    const auto now = m_clock.now();
    std::lock_guard<std::mutex> lock(m_mutex);
    return canUseInternal(*model, tokens, now);
}

types::UsageCounters UsageLedger::usage(const std::string& modelId) const {
    const auto now = m_clock.now();
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_counters.find(modelId);
    if (it == m_counters.end()) {
        return types::UsageCounters{};
    }
    return snapshotInternal(it->second, now);
}

std::optional<UsageReservation> UsageLedger::tryAcquire(const std::string& modelId, uint64_t tokens) {
    auto model = m_registry.getModel(modelId);
    if (!model.has_value()) {
        return std::nullopt;
    }

    const auto now = m_clock.now();
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!canUseInternal(*model, tokens, now)) {
        return std::nullopt;
    }
    const auto& c = registerUseInternal(modelId, tokens, now);

    UsageReservation r;
    r.modelId = modelId;
    r.tokens = tokens;
    r.rpmWindowStart = c.rpmWindowStart;
    r.tpmWindowStart = c.tpmWindowStart;
    r.rpdWindowStart = c.rpdWindowStart;
    return r;
}

void UsageLedger::release(const UsageReservation& reservation) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_counters.find(reservation.modelId);
    if (it == m_counters.end()) {
        return;
    }
    auto& c = it->second;

    // 窗口起点不同说明已经滚动，旧窗口的计数已不存在
    if (c.rpmWindowStart == reservation.rpmWindowStart && c.rpmCount > 0) {
        c.rpmCount -= 1;
    }
    if (c.tpmWindowStart == reservation.tpmWindowStart) {
        c.tpmCount = c.tpmCount > reservation.tokens ? c.tpmCount - reservation.tokens : 0;
    }
    if (c.rpdWindowStart == reservation.rpdWindowStart && c.rpdCount > 0) {
        c.rpdCount -= 1;
    }
}

void UsageLedger::resetUsage(const std::string& modelId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (modelId.empty()) {
        m_counters.clear();
        return;
    }
    m_counters.erase(modelId);
}

std::map<std::string, types::UsageCounters> UsageLedger::allUsage() const {
    const auto now = m_clock.now();
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<std::string, types::UsageCounters> result;
    for (const auto& [id, c] : m_counters) {
        result.emplace(id, snapshotInternal(c, now));
    }
    return result;
}

bool UsageLedger::canUseInternal(const types::ModelDescriptor& model, uint64_t tokens,
                                 utils::Clock::time_point now) const {
    // 注意：调用此方法时，调用者必须已经持有 m_mutex 锁
    types::UsageCounters current;
    auto it = m_counters.find(model.id);
    if (it != m_counters.end()) {
        current = snapshotInternal(it->second, now);
    }

    const auto& limits = model.limits;
    // 以减法比较，避免极大的 tokens 使加法回绕
    return current.rpmCount < limits.rpm &&
           tokens <= limits.tpm && current.tpmCount <= limits.tpm - tokens &&
           current.rpdCount < limits.rpd;
}

types::UsageCounters& UsageLedger::registerUseInternal(const std::string& modelId, uint64_t tokens,
                                                       utils::Clock::time_point now) {
    // 注意：调用此方法时，调用者必须已经持有 m_mutex 锁
    auto [it, inserted] = m_counters.try_emplace(modelId);
    auto& c = it->second;
    if (inserted) {
        c.rpmWindowStart = now;
        c.tpmWindowStart = now;
        c.rpdWindowStart = now;
    }

    if (isStale(c.rpmWindowStart, now, kMinuteWindow)) {
        c.rpmCount = 0;
        c.rpmViolations = 0;
        c.rpmWindowStart = now;
    }
    if (isStale(c.tpmWindowStart, now, kMinuteWindow)) {
        c.tpmCount = 0;
        c.tpmWindowStart = now;
    }
    if (isStale(c.rpdWindowStart, now, kDayWindow)) {
        c.rpdCount = 0;
        c.rpdWindowStart = now;
    }

    c.rpmCount += 1;
    c.tpmCount = saturatingAdd(c.tpmCount, tokens);
    c.rpdCount += 1;
    return c;
}

types::UsageCounters UsageLedger::snapshotInternal(const types::UsageCounters& c,
                                                   utils::Clock::time_point now) const {
    types::UsageCounters s = c;
    if (isStale(s.rpmWindowStart, now, kMinuteWindow)) {
        s.rpmCount = 0;
        s.rpmViolations = 0;
    }
    if (isStale(s.tpmWindowStart, now, kMinuteWindow)) s.tpmCount = 0;
    if (isStale(s.rpdWindowStart, now, kDayWindow)) s.rpdCount = 0;
    return s;
}

} // namespace relay::router
