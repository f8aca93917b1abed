#pragma once

#include "relay/router/BlacklistManager.h"
#include "relay/router/ComplexityClassifier.h"
#include "relay/router/Dispatch.h"
#include "relay/router/ErrorHandler.h"
#include "relay/router/ErrorTypes.h"
#include "relay/router/ModelRegistry.h"
#include "relay/router/ModelSelector.h"
#include "relay/router/UsageLedger.h"
#include "relay/router/types/ComplexityScore.h"
#include "relay/router/types/TaskType.h"
#include "relay/router/utils/Clock.h"
#include "relay/router/utils/TokenEstimator.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "nlohmann/json.hpp"

namespace relay::router {

class ConfigManager;

/**
 * @brief 路由器参数
 */
struct RouterOptions {
    uint32_t maxModelAttempts{5};  // 单个请求最多尝试的不同模型数
    uint32_t transientRetries{1};  // 瞬时错误时在同一模型上的重试次数
    types::TaskType defaultTaskType{types::TaskType::Dialog};

    /**
     * @brief 读取 router.* 配置（缺失或越界的项保留默认值）
     */
    static RouterOptions fromConfig(const ConfigManager& cfg);
};

/**
 * @brief 单个请求的生命周期状态
 */
enum class RouteState {
    Received,
    Classified,
    Dispatching,
    Retrying,
    Responded,
    Exhausted,
    Cancelled
};

/**
 * @brief 路由终态
 */
enum class RouteStatus {
    Responded,
    NoModelAvailable,   // 选择器返回空
    UpstreamFailure,    // 尝试次数用尽但仍有候选
    Cancelled,
    DeadlineExceeded
};

enum class RoutePath {
    SingleCall,
    MultiAgent
};

const char* routeStateToString(RouteState s);
const char* routeStatusToString(RouteStatus s);
const char* routePathToString(RoutePath p);

/**
 * @brief 路由请求
 */
struct RouteRequest {
    std::string text;
    std::optional<types::TaskType> taskType;     // 未指定时使用默认任务类型（dialog）
    std::optional<uint64_t> estimatedTokens;     // 未指定时按文本估算
    std::optional<std::string> context;
    std::optional<utils::Clock::time_point> deadline;
    CancelToken cancelToken;
};

/**
 * @brief 一次上游尝试的记录
 */
struct AttemptRecord {
    std::string modelId;
    uint32_t attempt{1};
    DispatchStatus status{DispatchStatus::Transient};
    bool sent{true};
    bool banned{false};
    std::string message;

    nlohmann::json toJson() const;
};

/**
 * @brief 路由结果（所有终态都以值返回）
 */
struct RouteResult {
    RouteStatus status{RouteStatus::NoModelAvailable};
    std::string text;
    std::string modelId;
    RoutePath path{RoutePath::SingleCall};
    types::TaskType taskType{types::TaskType::Dialog};
    types::ComplexityScore complexity;
    uint32_t modelsTried{0};
    std::vector<RouteState> trace;
    std::vector<AttemptRecord> attempts;
    std::optional<ErrorInfo> lastError;

    bool ok() const { return status == RouteStatus::Responded; }

    nlohmann::json toJson() const;
};

/**
 * @brief 路由历史记录
 */
struct RoutingHistory {
    std::chrono::system_clock::time_point timestamp;
    types::TaskType taskType;
    std::string selectedModel;
    RouteStatus status;
    RoutePath path;
    int complexity;
    uint32_t modelsTried;
};

/**
 * @brief 请求路由器：分类 -> 选模型 -> 调用 -> 按失败类型封禁并切换
 *
 * 每次调用前先 tryAcquire 原子地占用额度；调用上游时不持有任何锁。
 * 配额/鉴权失败封禁当前模型并换下一个不同的候选；瞬时错误先在同一模型上重试。
 */
class RequestRouter {
public:
    RequestRouter(const ModelRegistry& registry,
                  UsageLedger& ledger,
                  BlacklistManager& blacklist,
                  const ModelSelector& selector,
                  const ComplexityClassifier& classifier,
                  ModelTransport& transport,
                  const ErrorHandler& errorHandler,
                  RouterOptions options = {},
                  const utils::Clock& clock = utils::SteadyClock::instance());
    ~RequestRouter() = default;

    // 禁止拷贝/移动
    RequestRouter(const RequestRouter&) = delete;
    RequestRouter& operator=(const RequestRouter&) = delete;
    RequestRouter(RequestRouter&&) = delete;
    RequestRouter& operator=(RequestRouter&&) = delete;

    /**
     * @brief 设置多智能体执行器；为空时多智能体请求退回单次调用路径
     */
    void setMultiAgentExecutor(MultiAgentExecutor* executor);

    /**
     * @brief 路由一个请求直到终态
     */
    RouteResult route(const RouteRequest& request);

    const RouterOptions& getOptions() const { return m_options; }

    // ========== 路由历史 ==========
    std::vector<RoutingHistory> getRoutingHistory(size_t maxCount = 100) const;
    void clearRoutingHistory();

    /**
     * @brief 获取路由统计信息
     * @return 模型ID到成功响应次数的映射
     */
    std::unordered_map<std::string, uint64_t> getRoutingStatistics() const;

    /**
     * @brief 诊断快照：封禁状态、各模型用量、路由统计
     */
    nlohmann::json diagnostics() const;

private:
    const ModelRegistry& m_registry;
    UsageLedger& m_ledger;
    BlacklistManager& m_blacklist;
    const ModelSelector& m_selector;
    const ComplexityClassifier& m_classifier;
    ModelTransport& m_transport;
    const ErrorHandler& m_errorHandler;
    RouterOptions m_options;
    const utils::Clock& m_clock;
    utils::TokenEstimator m_estimator;

    std::mutex m_executorMutex;
    MultiAgentExecutor* m_executor{nullptr};

    // 路由历史（限制大小）
    mutable std::mutex m_historyMutex;
    std::vector<RoutingHistory> m_routingHistory;
    static constexpr size_t kMaxHistorySize = 1000;

    // 路由统计
    mutable std::mutex m_statsMutex;
    std::unordered_map<std::string, uint64_t> m_routingStats;
    std::unordered_map<std::string, uint64_t> m_statusCounts;

    enum class AttemptVerdict {
        Done,       // 已得到终态
        NextModel,  // 换下一个候选
    };

    types::TaskType resolveTaskType(const RouteRequest& request) const;
    uint64_t resolveTokens(const RouteRequest& request) const;

    // 发送前检查取消与截止时间；命中时返回对应终态
    std::optional<RouteStatus> checkInterrupted(const RouteRequest& request) const;

    /**
     * @brief 在单个模型上执行（含瞬时错误重试）
     */
    AttemptVerdict dispatchToModel(const RouteRequest& request,
                                   const types::ModelDescriptor& model,
                                   uint64_t tokens,
                                   MultiAgentExecutor* executor,
                                   RouteResult& result);

    DispatchOutcome invoke(const RouteRequest& request,
                           const types::ModelDescriptor& model,
                           uint64_t tokens,
                           uint32_t attempt,
                           MultiAgentExecutor* executor,
                           const RouteResult& result);

    void applyBan(const types::ModelDescriptor& model, const DispatchOutcome& outcome, AttemptRecord& record);

    RouteResult finish(RouteResult& result, RouteStatus status);
    void recordRoute(const RouteResult& result);
};

} // namespace relay::router
