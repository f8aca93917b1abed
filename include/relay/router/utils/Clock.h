#pragma once

#include <chrono>
#include <mutex>

namespace relay::router::utils {

/**
 * @brief 单调时钟抽象，配额窗口与封禁 TTL 都以它为准
 *
 * 生产代码使用 SteadyClock；测试注入 ManualClock 以精确控制窗口边界。
 */
class Clock {
public:
    using duration = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }

    /**
     * @brief 进程级共享实例
     */
    static SteadyClock& instance() {
        static SteadyClock clock;
        return clock;
    }
};

/**
 * @brief 手动推进的时钟（线程安全）
 */
class ManualClock : public Clock {
public:
    ManualClock() = default;
    explicit ManualClock(time_point start) : m_now(start) {}

    time_point now() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_now;
    }

    void advance(duration d) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_now += d;
    }

    void set(time_point t) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_now = t;
    }

private:
    mutable std::mutex m_mutex;
    // 从非零时刻起步，避免 window_start == time_point{} 的歧义
    time_point m_now{std::chrono::hours(1)};
};

} // namespace relay::router::utils
