#pragma once

#include "relay/router/types/ComplexityScore.h"
#include "relay/router/types/TaskType.h"

#include <string>

namespace relay::router {

class ConfigManager;

/**
 * @brief 复杂度分类器：纯启发式，确定性，无 I/O
 *
 * 评分规则（文本先转小写，按空白切词得到词数 w）：
 * 1. 长度基础分：w<=12 -> 1，<=40 -> 2，<=100 -> 3，<=200 -> 4，否则 5
 * 2. 多步骤标记：连接词 / 步骤词 / 列表行，每类 +1，合计最多 +2
 * 3. 逗号与分号合计 >= 3 时 +1
 * 4. 类别关键词；多文件代码与商业策略类额外 +1
 * 5. 简单事实问句（疑问词开头、单句、w<=12）封顶 2 分，类别记为 Factual
 * 6. 截断到 1..5；value >= 阈值或类别本身为多步骤时走多智能体
 *
 * 简单问句同时带有多步骤标记时记为 ambiguous，并保守地走多智能体。
 */
class ComplexityClassifier {
public:
    struct Config {
        int multiAgentThreshold{3};

        /**
         * @brief 读取 classifier.multi_agent_threshold（越界时保留默认值）
         */
        static Config fromConfig(const ConfigManager& cfg);
    };

    ComplexityClassifier() = default;
    explicit ComplexityClassifier(Config config);

    types::ComplexityScore analyze(const std::string& text) const;

    // 请求未指定任务类型时的默认映射：代码类 -> Code，其余 -> Dialog
    static types::TaskType suggestTaskType(const types::ComplexityScore& score);

    const Config& getConfig() const { return m_config; }

private:
    Config m_config;
};

} // namespace relay::router
