#include "relay/router/ModelRegistry.h"

#include "relay/router/ConfigManager.h"

#include <algorithm>

namespace relay::router {

ModelRegistry::ModelRegistry(const ConfigManager& configManager)
    : m_models(parseModels(modelsNodeFrom(configManager))) {
    buildIndex();
}

ModelRegistry::ModelRegistry(const nlohmann::json& models)
    : m_models(parseModels(models)) {
    buildIndex();
}

ModelRegistry::ModelRegistry(std::vector<types::ModelDescriptor> models)
    : m_models(std::move(models)) {
    for (const auto& m : m_models) {
        std::vector<std::string> errors;
        if (!m.isValid(&errors)) {
            fail("Invalid model descriptor: " + (m.id.empty() ? std::string("<empty id>") : m.id), errors);
        }
    }
    buildIndex();
}

nlohmann::json ModelRegistry::modelsNodeFrom(const ConfigManager& configManager) {
    auto modelsNode = configManager.get("models");
    if (!modelsNode.has_value()) {
        fail("Config 'models' node is missing");
    }
    return *modelsNode;
}

std::vector<types::ModelDescriptor> ModelRegistry::parseModels(const nlohmann::json& models) {
    if (!models.is_array()) {
        fail("Model catalogue must be a JSON array");
    }

    std::vector<types::ModelDescriptor> out;
    out.reserve(models.size());
    for (size_t i = 0; i < models.size(); ++i) {
        std::vector<std::string> errors;
        auto d = types::ModelDescriptor::fromJson(models[i], &errors);
        if (!d.has_value()) {
            fail("Invalid model entry at index " + std::to_string(i), errors);
        }
        out.push_back(std::move(*d));
    }
    return out;
}

void ModelRegistry::buildIndex() {
    if (m_models.empty()) {
        fail("Model catalogue is empty");
    }

    for (size_t i = 0; i < m_models.size(); ++i) {
        const auto& m = m_models[i];
        if (!m_index.emplace(m.id, i).second) {
            fail("Duplicate model id: " + m.id);
        }
        for (auto t : m.taskTypes) {
            m_taskToModels[t].push_back(i);
        }
    }

    // 预先排好序，modelsForTask 只做拷贝
    for (auto& [task, indices] : m_taskToModels) {
        (void)task;
        std::stable_sort(indices.begin(), indices.end(), [this](size_t a, size_t b) {
            const auto& ma = m_models[a];
            const auto& mb = m_models[b];
            if (ma.priority != mb.priority) return ma.priority < mb.priority;
            return ma.baseScore > mb.baseScore;
        });
    }
}

void ModelRegistry::fail(const std::string& message, std::vector<std::string> errors) {
    ErrorInfo info;
    info.errorType = ErrorType::ConfigError;
    info.errorCode = 0;
    info.message = message;
    if (!errors.empty()) {
        info.message += ": " + errors.front();
        info.details = nlohmann::json{{"errors", errors}};
    }
    throw ConfigError(std::move(info));
}

std::vector<types::ModelDescriptor> ModelRegistry::modelsForTask(types::TaskType taskType) const {
    std::vector<types::ModelDescriptor> result;
    auto it = m_taskToModels.find(taskType);
    if (it == m_taskToModels.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (auto idx : it->second) {
        result.push_back(m_models[idx]);
    }
    return result;
}

std::optional<types::ModelDescriptor> ModelRegistry::getModel(const std::string& modelId) const {
    auto it = m_index.find(modelId);
    if (it == m_index.end()) {
        return std::nullopt;
    }
    return m_models[it->second];
}

bool ModelRegistry::hasModel(const std::string& modelId) const {
    return m_index.find(modelId) != m_index.end();
}

std::vector<types::ModelDescriptor> ModelRegistry::getAllModels() const {
    return m_models;
}

} // namespace relay::router
