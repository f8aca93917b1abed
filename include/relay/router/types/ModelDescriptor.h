#pragma once

#include "relay/router/types/TaskType.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace relay::router::types {

/**
 * @brief 三个配额维度：每分钟请求数、每分钟 token 数、每日请求数
 */
struct ModelLimits {
    uint64_t rpm{0};
    uint64_t tpm{0};
    uint64_t rpd{0};
};

/**
 * @brief 模型描述（启动时从配置创建，之后不可变）
 *
 * priority 约定：数值越小越先尝试。
 */
struct ModelDescriptor {
    std::string id;
    std::string provider;
    std::string displayName;
    std::vector<TaskType> taskTypes;
    int priority{0};
    ModelLimits limits;
    float baseScore{0.0f};

    /**
     * @brief 从 JSON 记录解析
     * @param j 单条模型记录
     * @param errors 解析/校验失败原因输出（可选）
     * @return 解析成功且通过校验返回描述，否则 nullopt
     */
    static std::optional<ModelDescriptor> fromJson(const nlohmann::json& j,
                                                   std::vector<std::string>* errors = nullptr) {
        auto fail = [&](std::string msg) -> std::optional<ModelDescriptor> {
            if (errors) errors->push_back(std::move(msg));
            return std::nullopt;
        };

        if (!j.is_object()) return fail("model entry is not an object");

        auto getStr = [&](const char* key) -> std::optional<std::string> {
            if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
            return std::nullopt;
        };
        // 限额字段必须是非负整数
        auto getLimit = [&](const char* key) -> std::optional<uint64_t> {
            if (!j.contains(key)) return std::nullopt;
            if (j[key].is_number_unsigned()) return j[key].get<uint64_t>();
            if (j[key].is_number_integer()) {
                auto v = j[key].get<int64_t>();
                if (v < 0) return std::nullopt;
                return static_cast<uint64_t>(v);
            }
            return std::nullopt;
        };

        ModelDescriptor d;

        auto id = getStr("id");
        if (!id.has_value() || id->empty()) return fail("missing or invalid 'id'");
        d.id = *id;

        auto provider = getStr("provider");
        if (!provider.has_value() || provider->empty()) return fail("model " + d.id + ": missing or invalid 'provider'");
        d.provider = *provider;

        if (auto dn = getStr("display_name"); dn.has_value()) d.displayName = *dn;

        // task_types（兼容旧目录中的 "type" 字段）
        const char* tasksKey = j.contains("task_types") ? "task_types" : "type";
        if (!j.contains(tasksKey) || !j[tasksKey].is_array() || j[tasksKey].empty()) {
            return fail("model " + d.id + ": missing or empty 'task_types'");
        }
        for (const auto& item : j[tasksKey]) {
            if (!item.is_string()) return fail("model " + d.id + ": task type must be a string");
            auto t = stringToTaskType(item.get<std::string>());
            if (!t.has_value()) return fail("model " + d.id + ": unknown task type '" + item.get<std::string>() + "'");
            if (!d.supportsTask(*t)) d.taskTypes.push_back(*t);
        }

        if (!j.contains("priority") || !j["priority"].is_number_integer()) {
            return fail("model " + d.id + ": missing or invalid 'priority'");
        }
        {
            // 超出 int 范围的值不能静默截断
            const auto& pj = j["priority"];
            constexpr auto kMin = std::numeric_limits<int>::min();
            constexpr auto kMax = std::numeric_limits<int>::max();
            const bool inRange = pj.is_number_unsigned()
                ? pj.get<uint64_t>() <= static_cast<uint64_t>(kMax)
                : (pj.get<int64_t>() >= kMin && pj.get<int64_t>() <= kMax);
            if (!inRange) return fail("model " + d.id + ": 'priority' out of range");
            d.priority = static_cast<int>(pj.get<int64_t>());
        }

        auto rpm = getLimit("rpm");
        auto tpm = getLimit("tpm");
        auto rpd = getLimit("rpd");
        if (!rpm.has_value()) return fail("model " + d.id + ": missing or invalid 'rpm'");
        if (!tpm.has_value()) return fail("model " + d.id + ": missing or invalid 'tpm'");
        if (!rpd.has_value()) return fail("model " + d.id + ": missing or invalid 'rpd'");
        d.limits = ModelLimits{*rpm, *tpm, *rpd};

        if (j.contains("base_score")) {
            if (!j["base_score"].is_number()) return fail("model " + d.id + ": invalid 'base_score'");
            d.baseScore = j["base_score"].get<float>();
        }

        std::vector<std::string> validationErrors;
        if (!d.isValid(&validationErrors)) {
            for (auto& e : validationErrors) {
                if (errors) errors->push_back("model " + d.id + ": " + e);
            }
            return std::nullopt;
        }
        return d;
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["id"] = id;
        j["provider"] = provider;
        if (!displayName.empty()) j["display_name"] = displayName;
        nlohmann::json tasks = nlohmann::json::array();
        for (auto t : taskTypes) tasks.push_back(taskTypeToString(t));
        j["task_types"] = std::move(tasks);
        j["priority"] = priority;
        j["rpm"] = limits.rpm;
        j["tpm"] = limits.tpm;
        j["rpd"] = limits.rpd;
        j["base_score"] = baseScore;
        return j;
    }

    bool supportsTask(TaskType t) const {
        return std::find(taskTypes.begin(), taskTypes.end(), t) != taskTypes.end();
    }

    bool isValid(std::vector<std::string>* errors = nullptr) const {
        bool ok = true;
        auto push = [&](std::string msg) {
            ok = false;
            if (errors) errors->push_back(std::move(msg));
        };

        if (id.empty()) push("id is empty");
        if (provider.empty()) push("provider is empty");
        if (taskTypes.empty()) push("taskTypes is empty");
        if (baseScore < 0.0f || baseScore > 1.0f) push("baseScore out of range [0,1]");

        return ok;
    }
};

} // namespace relay::router::types
