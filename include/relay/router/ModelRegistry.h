#pragma once

#include "relay/router/ErrorTypes.h"
#include "relay/router/types/ModelDescriptor.h"
#include "relay/router/types/TaskType.h"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "nlohmann/json.hpp"

namespace relay::router {

class ConfigManager;

/**
 * @brief 模型目录：启动时一次性加载，之后只读
 *
 * 构造失败（任一条目非法、ID 重复、目录为空）抛出 ConfigError。
 * 构造完成后不再修改，因此读取无需加锁。
 */
class ModelRegistry {
public:
    /**
     * @brief 从配置的 "models" 节点加载
     * @throws ConfigError
     */
    explicit ModelRegistry(const ConfigManager& configManager);

    /**
     * @brief 从 JSON 数组加载（线格式见 ModelDescriptor::fromJson）
     * @throws ConfigError
     */
    explicit ModelRegistry(const nlohmann::json& models);

    /**
     * @brief 从已构造的描述列表加载
     * @throws ConfigError
     */
    explicit ModelRegistry(std::vector<types::ModelDescriptor> models);

    ~ModelRegistry() = default;

    // 禁止拷贝/移动
    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;
    ModelRegistry(ModelRegistry&&) = delete;
    ModelRegistry& operator=(ModelRegistry&&) = delete;

    /**
     * @brief 支持某任务类型的模型
     * @return 按 priority 升序（越小越先），同优先级按 baseScore 降序，再按加载顺序
     */
    std::vector<types::ModelDescriptor> modelsForTask(types::TaskType taskType) const;

    std::optional<types::ModelDescriptor> getModel(const std::string& modelId) const;
    bool hasModel(const std::string& modelId) const;

    // 按加载顺序返回
    std::vector<types::ModelDescriptor> getAllModels() const;

    std::size_t size() const { return m_models.size(); }

private:
    std::vector<types::ModelDescriptor> m_models;
    std::unordered_map<std::string, std::size_t> m_index;
    std::unordered_map<types::TaskType, std::vector<std::size_t>> m_taskToModels;

    static std::vector<types::ModelDescriptor> parseModels(const nlohmann::json& models);
    static nlohmann::json modelsNodeFrom(const ConfigManager& configManager);
    void buildIndex();

    [[noreturn]] static void fail(const std::string& message, std::vector<std::string> errors = {});
};

} // namespace relay::router
