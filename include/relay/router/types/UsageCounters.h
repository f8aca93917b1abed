#pragma once

#include "relay/router/utils/Clock.h"

#include <chrono>
#include <cstdint>

#include "nlohmann/json.hpp"

namespace relay::router::types {

/**
 * @brief 单个模型在三个固定窗口内的用量
 */
struct UsageCounters {
    uint64_t rpmCount{0};
    utils::Clock::time_point rpmWindowStart{};
    uint64_t tpmCount{0};
    utils::Clock::time_point tpmWindowStart{};
    uint64_t rpdCount{0};
    utils::Clock::time_point rpdWindowStart{};
    // 当前分钟窗口内超过 1.5 倍 rpm 的次数（随分钟窗口清零）
    uint32_t rpmViolations{0};

    nlohmann::json toJson() const {
        auto ms = [](utils::Clock::time_point t) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
        };
        nlohmann::json j;
        j["rpm_count"] = rpmCount;
        j["rpm_window_start_ms"] = ms(rpmWindowStart);
        j["tpm_count"] = tpmCount;
        j["tpm_window_start_ms"] = ms(tpmWindowStart);
        j["rpd_count"] = rpdCount;
        j["rpd_window_start_ms"] = ms(rpdWindowStart);
        j["rpm_violations"] = rpmViolations;
        return j;
    }
};

} // namespace relay::router::types
