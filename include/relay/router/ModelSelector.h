#pragma once

#include "relay/router/BlacklistManager.h"
#include "relay/router/CredentialStore.h"
#include "relay/router/ModelRegistry.h"
#include "relay/router/UsageLedger.h"
#include "relay/router/types/TaskType.h"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace relay::router {

/**
 * @brief 候选模型在某一时刻的可选状态（诊断用）
 */
struct CandidateStatus {
    std::string modelId;
    int priority{0};
    bool blacklisted{false};
    bool withinQuota{false};
    bool hasCredentials{true};
    bool selectable{false};
    std::string reason;

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"model_id", modelId},
            {"priority", priority},
            {"blacklisted", blacklisted},
            {"within_quota", withinQuota},
            {"has_credentials", hasCredentials},
            {"selectable", selectable},
            {"reason", reason},
        };
    }
};

/**
 * @brief 模型选择器：按优先级返回第一个未封禁且额度充足的模型
 *
 * 结果完全确定：不引入随机数，也不按负载打散。
 * 选择只是读取，真正的额度占用由调用方通过 UsageLedger::tryAcquire 完成。
 */
class ModelSelector {
public:
    ModelSelector(const ModelRegistry& registry,
                  const UsageLedger& ledger,
                  const BlacklistManager& blacklist,
                  const CredentialStore* credentials = nullptr);
    ~ModelSelector() = default;

    // 禁止拷贝/移动
    ModelSelector(const ModelSelector&) = delete;
    ModelSelector& operator=(const ModelSelector&) = delete;
    ModelSelector(ModelSelector&&) = delete;
    ModelSelector& operator=(ModelSelector&&) = delete;

    /**
     * @brief 选择模型
     * @param taskType 任务类型
     * @param tokens 预估 token 数
     * @return 模型ID；nullopt 表示没有可用模型
     */
    std::optional<std::string> select(types::TaskType taskType, uint64_t tokens) const;

    /**
     * @brief 选择模型，跳过 excluded 中的模型（用于故障切换时取下一个不同的候选）
     */
    std::optional<std::string> selectExcluding(types::TaskType taskType,
                                               uint64_t tokens,
                                               const std::set<std::string>& excluded) const;

    /**
     * @brief 列出所有候选及其当前状态（按尝试顺序）
     */
    std::vector<CandidateStatus> explain(types::TaskType taskType, uint64_t tokens) const;

    // nullptr 表示不检查密钥
    void setCredentialStore(const CredentialStore* credentials) { m_credentials = credentials; }

private:
    const ModelRegistry& m_registry;
    const UsageLedger& m_ledger;
    const BlacklistManager& m_blacklist;
    const CredentialStore* m_credentials{nullptr};

    CandidateStatus evaluate(const types::ModelDescriptor& model, uint64_t tokens) const;
};

} // namespace relay::router
