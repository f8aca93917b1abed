#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace relay::router {

class ConfigManager;
class ErrorHandler;

/**
 * @brief 提供方 API Key 查询接口
 *
 * 选择器挂载后，没有密钥的提供方下属模型一律跳过。
 */
class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    /**
     * @brief 获取提供方密钥
     * @param provider 提供方名（大小写不敏感）
     * @return 未配置或为空时返回 nullopt
     */
    virtual std::optional<std::string> getApiKeyForProvider(const std::string& provider) const = 0;

    bool hasCredentials(const std::string& provider) const {
        return getApiKeyForProvider(provider).has_value();
    }
};

/**
 * @brief 从环境变量读取密钥；提供方到变量名的映射来自 providers.<name>.api_key_env
 */
class EnvCredentialStore : public CredentialStore {
public:
    /**
     * @brief 内置映射：gemini -> GEMINI_API_KEY, openrouter -> OPENROUTER_API_KEY
     */
    explicit EnvCredentialStore(const ErrorHandler* logger = nullptr);

    /**
     * @brief 以配置中的 providers 节点覆盖内置映射
     */
    explicit EnvCredentialStore(const ConfigManager& config, const ErrorHandler* logger = nullptr);

    std::optional<std::string> getApiKeyForProvider(const std::string& provider) const override;

    // 当前映射（provider 小写 -> 环境变量名）
    const std::map<std::string, std::string>& getEnvMapping() const { return m_envByProvider; }

    static std::map<std::string, std::string> defaultEnvMapping();

private:
    std::map<std::string, std::string> m_envByProvider;
    const ErrorHandler* m_logger{nullptr};

    // 每个提供方只告警一次
    mutable std::mutex m_warnMutex;
    mutable std::set<std::string> m_warned;

    void warnIfSuspicious(const std::string& provider, const std::string& key) const;
};

} // namespace relay::router
