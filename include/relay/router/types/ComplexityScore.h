#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace relay::router::types {

enum class RequestCategory {
    General,
    Factual,
    Coding,
    MultiFileCode,
    BusinessStrategy,
    Research,
    Creative
};

inline std::string requestCategoryToString(RequestCategory c) {
    switch (c) {
        case RequestCategory::General: return "general";
        case RequestCategory::Factual: return "factual";
        case RequestCategory::Coding: return "coding";
        case RequestCategory::MultiFileCode: return "multi_file_code";
        case RequestCategory::BusinessStrategy: return "business_strategy";
        case RequestCategory::Research: return "research";
        case RequestCategory::Creative: return "creative";
    }
    return "general";
}

// 这些类别本身就是多步骤任务，无论分值多少都交给多智能体
inline bool isInherentlyMultiStep(RequestCategory c) {
    return c == RequestCategory::MultiFileCode || c == RequestCategory::BusinessStrategy;
}

/**
 * @brief 请求复杂度评估结果（按请求计算，不持久化）
 */
struct ComplexityScore {
    int value{1};                 // 1..5
    bool requiresMultiAgent{false};
    RequestCategory category{RequestCategory::General};
    bool ambiguous{false};        // 信号冲突，已按保守路径（多智能体）处理

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"complexity", value},
            {"requires_multi_agent", requiresMultiAgent},
            {"category", requestCategoryToString(category)},
            {"ambiguous", ambiguous},
        };
    }
};

} // namespace relay::router::types
