#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

namespace relay::router::utils {

struct TokenModelRule {
    double tokensPerChar = 0.25;   // 约4字符1 token 的默认估算
    std::size_t fixedOverhead = 4; // 模型固定开销
};

/**
 * @brief 字符级 token 估算（请求未携带 token 数时用于配额预检）
 */
class TokenEstimator {
public:
    TokenEstimator() = default;
    explicit TokenEstimator(std::unordered_map<std::string, TokenModelRule> rules);

    /**
     * @brief 按默认规则估算
     */
    std::size_t estimateTokens(std::string_view text) const;

    /**
     * @brief 根据模型ID估算（大小写不敏感，未配置时回退默认规则）
     */
    std::size_t estimateTokens(const std::string& modelId, std::string_view text) const;

    void setModelRule(std::string modelId, TokenModelRule rule);
    TokenModelRule getModelRule(const std::string& modelId) const;

    void setDefaultRule(TokenModelRule rule) { defaultRule_ = rule; }

private:
    TokenModelRule defaultRule_{};
    std::unordered_map<std::string, TokenModelRule> modelRules_;

    static std::size_t apply(const TokenModelRule& rule, std::string_view text);
    static std::string normalizeModel(const std::string& modelId);
};

} // namespace relay::router::utils
