#include "relay/router/ModelSelector.h"

namespace relay::router {

ModelSelector::ModelSelector(const ModelRegistry& registry,
                             const UsageLedger& ledger,
                             const BlacklistManager& blacklist,
                             const CredentialStore* credentials)
    : m_registry(registry)
    , m_ledger(ledger)
    , m_blacklist(blacklist)
    , m_credentials(credentials) {
}

std::optional<std::string> ModelSelector::select(types::TaskType taskType, uint64_t tokens) const {
    return selectExcluding(taskType, tokens, {});
}

std::optional<std::string> ModelSelector::selectExcluding(types::TaskType taskType,
                                                          uint64_t tokens,
                                                          const std::set<std::string>& excluded) const {
    for (const auto& model : m_registry.modelsForTask(taskType)) {
        if (excluded.count(model.id) > 0) continue;
        if (m_blacklist.isBlacklisted(model.id)) continue;
        if (!m_ledger.canUse(model.id, tokens)) continue;
        if (m_credentials && !m_credentials->hasCredentials(model.provider)) continue;
        return model.id;
    }
    return std::nullopt;
}

std::vector<CandidateStatus> ModelSelector::explain(types::TaskType taskType, uint64_t tokens) const {
    std::vector<CandidateStatus> result;
    for (const auto& model : m_registry.modelsForTask(taskType)) {
        result.push_back(evaluate(model, tokens));
    }
    return result;
}

CandidateStatus ModelSelector::evaluate(const types::ModelDescriptor& model, uint64_t tokens) const {
    CandidateStatus s;
    s.modelId = model.id;
    s.priority = model.priority;
    s.blacklisted = m_blacklist.isBlacklisted(model.id);
    s.withinQuota = m_ledger.canUse(model.id, tokens);
    s.hasCredentials = !m_credentials || m_credentials->hasCredentials(model.provider);
    s.selectable = !s.blacklisted && s.withinQuota && s.hasCredentials;

    if (s.blacklisted) {
        auto e = m_blacklist.entry(model.id);
        s.reason = e.has_value() ? "blacklisted: " + e->reason : "blacklisted";
    } else if (!s.withinQuota) {
        s.reason = "quota exhausted";
    } else if (!s.hasCredentials) {
        s.reason = "missing api key for provider " + model.provider;
    } else {
        s.reason = "ok";
    }
    return s;
}

} // namespace relay::router
