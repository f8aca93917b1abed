#pragma once

#include "relay/router/ModelRegistry.h"
#include "relay/router/types/UsageCounters.h"
#include "relay/router/utils/Clock.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace relay::router {

class BlacklistManager;

/**
 * @brief 一次已登记但尚未发送成功的用量预留
 *
 * 记录登记时各窗口的起点，release 时只回滚仍处于同一窗口的计数。
 */
struct UsageReservation {
    std::string modelId;
    uint64_t tokens{0};
    utils::Clock::time_point rpmWindowStart{};
    utils::Clock::time_point tpmWindowStart{};
    utils::Clock::time_point rpdWindowStart{};
};

/**
 * @brief 每个模型的固定窗口用量账本（分钟窗口 60s，日窗口 86400s）
 *
 * 窗口在上一个窗口过期后的首次使用时开启；now - windowStart >= windowLength 即为过期。
 * 所有读写在同一把锁下完成；tryAcquire 是唯一把检查与登记合并的临界区。
 */
class UsageLedger {
public:
    static constexpr std::chrono::seconds kMinuteWindow{60};
    static constexpr std::chrono::seconds kDayWindow{86400};

    explicit UsageLedger(const ModelRegistry& registry,
                         const utils::Clock& clock = utils::SteadyClock::instance());
    ~UsageLedger() = default;

    // 禁止拷贝/移动
    UsageLedger(const UsageLedger&) = delete;
    UsageLedger& operator=(const UsageLedger&) = delete;
    UsageLedger(UsageLedger&&) = delete;
    UsageLedger& operator=(UsageLedger&&) = delete;

    /**
     * @brief 登记一次调用：过期窗口先清零，再 rpm+1、tpm+tokens、rpd+1
     *
     * 绕过 tryAcquire 直接登记时不检查限额；分钟内请求数超过 rpm 的 1.5 倍时，
     * 该窗口的首次超限会把模型软封禁 60/rpm 秒（需先 setBlacklist）。
     * @return 模型未注册时返回 false（不登记）
     */
    bool registerUse(const std::string& modelId, uint64_t tokens);

    /**
     * @brief 设置软封禁目标；nullptr 表示只计数不封禁
     */
    void setBlacklist(BlacklistManager* blacklist);

    /**
     * @brief 只读判断再用一次是否仍在三项限额内；未知模型返回 false
     */
    bool canUse(const std::string& modelId, uint64_t tokens) const;

    /**
     * @brief 用量快照；过期窗口计数报告为 0（不写回）
     */
    types::UsageCounters usage(const std::string& modelId) const;

    /**
     * @brief 原子地检查并登记
     * @return 额度不足或模型未知时返回 nullopt，此时不做任何修改
     */
    std::optional<UsageReservation> tryAcquire(const std::string& modelId, uint64_t tokens);

    /**
     * @brief 回滚一次未实际发送的预留；已滚动的窗口不回滚，计数下限为 0
     */
    void release(const UsageReservation& reservation);

    // modelId 为空时清空全部
    void resetUsage(const std::string& modelId = "");

    std::map<std::string, types::UsageCounters> allUsage() const;

private:
    const ModelRegistry& m_registry;
    const utils::Clock& m_clock;

    mutable std::mutex m_mutex;
    BlacklistManager* m_blacklist{nullptr};
    std::unordered_map<std::string, types::UsageCounters> m_counters;

    static bool isStale(utils::Clock::time_point windowStart, utils::Clock::time_point now,
                        std::chrono::seconds windowLength);

    // 调用者必须已持有 m_mutex
    bool canUseInternal(const types::ModelDescriptor& model, uint64_t tokens, utils::Clock::time_point now) const;
    types::UsageCounters& registerUseInternal(const std::string& modelId, uint64_t tokens, utils::Clock::time_point now);
    static std::chrono::seconds overrunBanDuration(uint64_t rpmLimit);
    types::UsageCounters snapshotInternal(const types::UsageCounters& c, utils::Clock::time_point now) const;
};

} // namespace relay::router
