#pragma once

#include "relay/router/ErrorTypes.h"
#include "relay/router/types/ComplexityScore.h"
#include "relay/router/types/TaskType.h"
#include "relay/router/utils/Clock.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace relay::router {

class ModelSelector;
class UsageLedger;

/**
 * @brief 取消令牌（可拷贝，拷贝之间共享同一标志）
 */
struct CancelToken {
    std::shared_ptr<std::atomic<bool>> cancelled{std::make_shared<std::atomic<bool>>(false)};

    void cancel() const {
        if (cancelled) cancelled->store(true);
    }
    bool isCancelled() const {
        return cancelled && cancelled->load();
    }
};

/**
 * @brief 单次上游调用的结果类型
 */
enum class DispatchStatus {
    Success,
    QuotaExceeded,
    AuthError,
    Transient,
    Cancelled
};

inline const char* dispatchStatusToString(DispatchStatus s) {
    switch (s) {
        case DispatchStatus::Success: return "Success";
        case DispatchStatus::QuotaExceeded: return "QuotaExceeded";
        case DispatchStatus::AuthError: return "AuthError";
        case DispatchStatus::Transient: return "Transient";
        case DispatchStatus::Cancelled: return "Cancelled";
    }
    return "Transient";
}

inline ErrorType dispatchStatusToErrorType(DispatchStatus s) {
    switch (s) {
        case DispatchStatus::QuotaExceeded: return ErrorType::QuotaExceeded;
        case DispatchStatus::AuthError: return ErrorType::AuthError;
        case DispatchStatus::Transient: return ErrorType::Transient;
        case DispatchStatus::Cancelled: return ErrorType::Cancelled;
        default: return ErrorType::UnknownError;
    }
}

/**
 * @brief 发往单个模型的请求
 */
struct DispatchRequest {
    std::string modelId;
    std::string provider;
    std::string text;
    std::optional<std::string> context;  // RAG/记忆子系统提供的附加上下文
    types::TaskType taskType{types::TaskType::Dialog};
    uint64_t estimatedTokens{0};
    std::optional<utils::Clock::time_point> deadline;
    uint32_t attempt{1};  // 同一模型上的第几次尝试
};

/**
 * @brief 上游调用结果；失败以值返回，不抛异常
 *
 * sent == false 表示请求没有真正发出（例如发送前被取消），路由器会回滚用量登记。
 */
struct DispatchOutcome {
    DispatchStatus status{DispatchStatus::Transient};
    bool sent{true};
    std::string text;
    uint64_t tokensUsed{0};
    std::optional<uint32_t> retryAfterSeconds;
    std::string message;

    bool ok() const { return status == DispatchStatus::Success; }

    static DispatchOutcome success(std::string text, uint64_t tokensUsed = 0) {
        DispatchOutcome o;
        o.status = DispatchStatus::Success;
        o.text = std::move(text);
        o.tokensUsed = tokensUsed;
        return o;
    }

    static DispatchOutcome failure(DispatchStatus status,
                                   std::string message,
                                   bool sent = true,
                                   std::optional<uint32_t> retryAfterSeconds = std::nullopt) {
        DispatchOutcome o;
        o.status = status;
        o.sent = sent;
        o.message = std::move(message);
        o.retryAfterSeconds = retryAfterSeconds;
        return o;
    }
};

/**
 * @brief 交给多智能体执行器的任务
 */
struct AgentTask {
    std::string text;
    std::optional<std::string> context;
    types::ComplexityScore complexity;
    types::TaskType taskType{types::TaskType::Dialog};
    // 分类器给出的任务类型建议，仅供执行器拆分子任务时参考
    types::TaskType suggestedTaskType{types::TaskType::Dialog};
    std::string modelId;  // 路由器为本次交接选定的模型
    uint64_t estimatedTokens{0};
    std::optional<utils::Clock::time_point> deadline;
    // 执行器内部需要再次选模型时使用同一个选择器
    const ModelSelector* selector{nullptr};
    // 内部调用前须经 ledger->tryAcquire 占用额度，调用未发出时 release
    UsageLedger* ledger{nullptr};
};

/**
 * @brief 上游传输层接口（网络实现不在本库范围内）
 */
class ModelTransport {
public:
    virtual ~ModelTransport() = default;

    virtual DispatchOutcome dispatch(const DispatchRequest& request, const CancelToken& cancel) = 0;
};

/**
 * @brief 多智能体执行引擎接口
 */
class MultiAgentExecutor {
public:
    virtual ~MultiAgentExecutor() = default;

    virtual DispatchOutcome execute(const AgentTask& task, const CancelToken& cancel) = 0;
};

} // namespace relay::router
