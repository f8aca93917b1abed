#include "relay/router/utils/TokenEstimator.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace relay::router::utils {

TokenEstimator::TokenEstimator(std::unordered_map<std::string, TokenModelRule> rules) {
    for (auto& [model, rule] : rules) {
        modelRules_[normalizeModel(model)] = rule;
    }
}

std::size_t TokenEstimator::estimateTokens(std::string_view text) const {
    return apply(defaultRule_, text);
}

std::size_t TokenEstimator::estimateTokens(const std::string& modelId, std::string_view text) const {
    return apply(getModelRule(modelId), text);
}

void TokenEstimator::setModelRule(std::string modelId, TokenModelRule rule) {
    modelRules_[normalizeModel(modelId)] = rule;
}

TokenModelRule TokenEstimator::getModelRule(const std::string& modelId) const {
    const auto it = modelRules_.find(normalizeModel(modelId));
    if (it != modelRules_.end()) {
        return it->second;
    }
    return defaultRule_;
}

std::size_t TokenEstimator::apply(const TokenModelRule& rule, std::string_view text) {
    if (text.empty()) {
        return rule.fixedOverhead;
    }
    const double estimated =
        static_cast<double>(text.size()) * rule.tokensPerChar + static_cast<double>(rule.fixedOverhead);
    // 向上取整以避免低估
    return static_cast<std::size_t>(std::ceil(estimated));
}

std::string TokenEstimator::normalizeModel(const std::string& modelId) {
    std::string out = modelId;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace relay::router::utils
