#include "relay/router/RequestRouter.h"

#include "relay/router/ConfigManager.h"

#include <algorithm>
#include <exception>
#include <map>

namespace relay::router {

const char* routeStateToString(RouteState s) {
    switch (s) {
        case RouteState::Received: return "Received";
        case RouteState::Classified: return "Classified";
        case RouteState::Dispatching: return "Dispatching";
        case RouteState::Retrying: return "Retrying";
        case RouteState::Responded: return "Responded";
        case RouteState::Exhausted: return "Exhausted";
        case RouteState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

const char* routeStatusToString(RouteStatus s) {
    switch (s) {
        case RouteStatus::Responded: return "Responded";
        case RouteStatus::NoModelAvailable: return "NoModelAvailable";
        case RouteStatus::UpstreamFailure: return "UpstreamFailure";
        case RouteStatus::Cancelled: return "Cancelled";
        case RouteStatus::DeadlineExceeded: return "DeadlineExceeded";
    }
    return "Unknown";
}

const char* routePathToString(RoutePath p) {
    return p == RoutePath::MultiAgent ? "multi_agent" : "single_call";
}

nlohmann::json AttemptRecord::toJson() const {
    return nlohmann::json{
        {"model_id", modelId},
        {"attempt", attempt},
        {"status", dispatchStatusToString(status)},
        {"sent", sent},
        {"banned", banned},
        {"message", message},
    };
}

nlohmann::json RouteResult::toJson() const {
    nlohmann::json j;
    j["status"] = routeStatusToString(status);
    j["model_id"] = modelId;
    j["path"] = routePathToString(path);
    j["task_type"] = types::taskTypeToString(taskType);
    j["complexity"] = complexity.toJson();
    j["models_tried"] = modelsTried;
    nlohmann::json states = nlohmann::json::array();
    for (auto s : trace) states.push_back(routeStateToString(s));
    j["trace"] = std::move(states);
    nlohmann::json tries = nlohmann::json::array();
    for (const auto& a : attempts) tries.push_back(a.toJson());
    j["attempts"] = std::move(tries);
    if (lastError.has_value()) j["last_error"] = lastError->toJson();
    return j;
}

RouterOptions RouterOptions::fromConfig(const ConfigManager& cfg) {
    RouterOptions o;
    if (auto v = cfg.get("router.max_model_attempts"); v.has_value() && v->is_number_integer()) {
        const auto n = v->get<int64_t>();
        if (n >= 1 && n <= 64) o.maxModelAttempts = static_cast<uint32_t>(n);
    }
    if (auto v = cfg.get("router.transient_retries"); v.has_value() && v->is_number_integer()) {
        const auto n = v->get<int64_t>();
        if (n >= 0 && n <= 5) o.transientRetries = static_cast<uint32_t>(n);
    }
    if (auto v = cfg.get("router.default_task_type"); v.has_value() && v->is_string()) {
        if (auto t = types::stringToTaskType(v->get<std::string>()); t.has_value()) {
            o.defaultTaskType = *t;
        }
    }
    return o;
}

RequestRouter::RequestRouter(const ModelRegistry& registry,
                             UsageLedger& ledger,
                             BlacklistManager& blacklist,
                             const ModelSelector& selector,
                             const ComplexityClassifier& classifier,
                             ModelTransport& transport,
                             const ErrorHandler& errorHandler,
                             RouterOptions options,
                             const utils::Clock& clock)
    : m_registry(registry)
    , m_ledger(ledger)
    , m_blacklist(blacklist)
    , m_selector(selector)
    , m_classifier(classifier)
    , m_transport(transport)
    , m_errorHandler(errorHandler)
    , m_options(options)
    , m_clock(clock) {
}

void RequestRouter::setMultiAgentExecutor(MultiAgentExecutor* executor) {
    std::lock_guard<std::mutex> lock(m_executorMutex);
    m_executor = executor;
}

RouteResult RequestRouter::route(const RouteRequest& request) {
    RouteResult result;
    result.trace.push_back(RouteState::Received);

    result.complexity = m_classifier.analyze(request.text);
    result.trace.push_back(RouteState::Classified);
    result.taskType = resolveTaskType(request);
    const uint64_t tokens = resolveTokens(request);

    MultiAgentExecutor* executor = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_executorMutex);
        executor = m_executor;
    }
    if (result.complexity.requiresMultiAgent) {
        if (executor) {
            result.path = RoutePath::MultiAgent;
        } else {
            m_errorHandler.log(ErrorHandler::LogLevel::Info,
                               "Multi-agent path requested but no executor attached, using single call");
        }
    }

    m_errorHandler.log(ErrorHandler::LogLevel::Debug,
                       "Routing request: task=" + types::taskTypeToString(result.taskType) +
                       " complexity=" + std::to_string(result.complexity.value) +
                       " path=" + routePathToString(result.path) +
                       " tokens=" + std::to_string(tokens));

    std::set<std::string> excluded;
    bool firstCandidate = true;
    for (;;) {
        if (auto interrupted = checkInterrupted(request); interrupted.has_value()) {
            return finish(result, *interrupted);
        }

        auto next = m_selector.selectExcluding(result.taskType, tokens, excluded);
        if (!next.has_value()) {
            if (!result.lastError.has_value()) {
                ErrorInfo info;
                info.errorType = ErrorType::NoModelAvailable;
                info.message = "No model available for task " + types::taskTypeToString(result.taskType);
                result.lastError = info;
            }
            return finish(result, RouteStatus::NoModelAvailable);
        }
        if (result.modelsTried >= m_options.maxModelAttempts) {
            return finish(result, RouteStatus::UpstreamFailure);
        }

        excluded.insert(*next);
        auto model = m_registry.getModel(*next);
        if (!model.has_value()) {
            continue;
        }

        if (!firstCandidate) result.trace.push_back(RouteState::Retrying);
        firstCandidate = false;
        result.trace.push_back(RouteState::Dispatching);

        if (dispatchToModel(request, *model, tokens, executor, result) == AttemptVerdict::Done) {
            return finish(result, result.status);
        }
    }
}

types::TaskType RequestRouter::resolveTaskType(const RouteRequest& request) const {
    // 未指定时按对话类（默认任务类型）选模型；分类建议只作为提示交给多智能体执行器
    if (request.taskType.has_value()) {
        return *request.taskType;
    }
    return m_options.defaultTaskType;
}

uint64_t RequestRouter::resolveTokens(const RouteRequest& request) const {
    if (request.estimatedTokens.has_value()) {
        return *request.estimatedTokens;
    }
    if (request.context.has_value() && !request.context->empty()) {
        return m_estimator.estimateTokens(request.text + "\n" + *request.context);
    }
    return m_estimator.estimateTokens(request.text);
}

std::optional<RouteStatus> RequestRouter::checkInterrupted(const RouteRequest& request) const {
    if (request.cancelToken.isCancelled()) {
        return RouteStatus::Cancelled;
    }
    if (request.deadline.has_value() && !(m_clock.now() < *request.deadline)) {
        return RouteStatus::DeadlineExceeded;
    }
    return std::nullopt;
}

RequestRouter::AttemptVerdict RequestRouter::dispatchToModel(const RouteRequest& request,
                                                             const types::ModelDescriptor& model,
                                                             uint64_t tokens,
                                                             MultiAgentExecutor* executor,
                                                             RouteResult& result) {
    uint32_t transientLeft = m_options.transientRetries;
    bool counted = false;

    for (uint32_t attempt = 1;; ++attempt) {
        if (auto interrupted = checkInterrupted(request); interrupted.has_value()) {
            result.status = *interrupted;
            return AttemptVerdict::Done;
        }

        // 选择之后可能已有并发请求占满额度，这里以原子方式重新校验
        auto reservation = m_ledger.tryAcquire(model.id, tokens);
        if (!reservation.has_value()) {
            m_errorHandler.log(ErrorHandler::LogLevel::Debug,
                               "Quota re-check rejected model " + model.id + ", moving on");
            return AttemptVerdict::NextModel;
        }
        if (!counted) {
            result.modelsTried++;
            counted = true;
        }

        DispatchOutcome outcome = invoke(request, model, tokens, attempt, executor, result);
        if (!outcome.sent) {
            m_ledger.release(*reservation);
        }

        AttemptRecord record;
        record.modelId = model.id;
        record.attempt = attempt;
        record.status = outcome.status;
        record.sent = outcome.sent;
        record.message = outcome.message;

        switch (outcome.status) {
            case DispatchStatus::Success:
                result.attempts.push_back(record);
                result.text = std::move(outcome.text);
                result.modelId = model.id;
                result.status = RouteStatus::Responded;
                return AttemptVerdict::Done;

            case DispatchStatus::Cancelled:
                result.attempts.push_back(record);
                result.status = RouteStatus::Cancelled;
                return AttemptVerdict::Done;

            case DispatchStatus::QuotaExceeded:
            case DispatchStatus::AuthError:
                applyBan(model, outcome, record);
                result.attempts.push_back(record);
                break;

            case DispatchStatus::Transient:
                result.attempts.push_back(record);
                break;
        }

        ErrorInfo info;
        info.errorType = dispatchStatusToErrorType(outcome.status);
        info.message = outcome.message.empty()
            ? std::string("Provider call failed: ") + dispatchStatusToString(outcome.status)
            : outcome.message;
        info.context = std::map<std::string, std::string>{
            {"model_id", model.id},
            {"provider", model.provider},
            {"attempt", std::to_string(attempt)},
        };
        result.lastError = info;

        if (outcome.status == DispatchStatus::Transient && transientLeft > 0) {
            --transientLeft;
            m_errorHandler.log(ErrorHandler::LogLevel::Info,
                               "Transient failure on model " + model.id + ", retrying same model", info);
            result.trace.push_back(RouteState::Retrying);
            result.trace.push_back(RouteState::Dispatching);
            continue;
        }
        return AttemptVerdict::NextModel;
    }
}

DispatchOutcome RequestRouter::invoke(const RouteRequest& request,
                                      const types::ModelDescriptor& model,
                                      uint64_t tokens,
                                      uint32_t attempt,
                                      MultiAgentExecutor* executor,
                                      const RouteResult& result) {
    try {
        if (result.path == RoutePath::MultiAgent && executor) {
            AgentTask task;
            task.text = request.text;
            task.context = request.context;
            task.complexity = result.complexity;
            task.taskType = result.taskType;
            task.suggestedTaskType = ComplexityClassifier::suggestTaskType(result.complexity);
            task.modelId = model.id;
            task.estimatedTokens = tokens;
            task.deadline = request.deadline;
            task.selector = &m_selector;
            task.ledger = &m_ledger;
            return executor->execute(task, request.cancelToken);
        }

        DispatchRequest req;
        req.modelId = model.id;
        req.provider = model.provider;
        req.text = request.text;
        req.context = request.context;
        req.taskType = result.taskType;
        req.estimatedTokens = tokens;
        req.deadline = request.deadline;
        req.attempt = attempt;
        return m_transport.dispatch(req, request.cancelToken);
    } catch (const std::exception& e) {
        // 协作方不应抛异常；若抛出则按瞬时错误处理，无法确认是否已发送
        ErrorInfo info;
        info.errorType = ErrorType::Transient;
        info.message = std::string("Collaborator threw: ") + e.what();
        m_errorHandler.log(ErrorHandler::LogLevel::Error, "Dispatch to " + model.id + " threw", info);
        return DispatchOutcome::failure(DispatchStatus::Transient, info.message, true);
    } catch (...) {
        ErrorInfo info;
        info.errorType = ErrorType::Transient;
        info.message = "Collaborator threw a non-standard exception";
        m_errorHandler.log(ErrorHandler::LogLevel::Error, "Dispatch to " + model.id + " threw", info);
        return DispatchOutcome::failure(DispatchStatus::Transient, info.message, true);
    }
}

void RequestRouter::applyBan(const types::ModelDescriptor& model,
                             const DispatchOutcome& outcome,
                             AttemptRecord& record) {
    const auto type = dispatchStatusToErrorType(outcome.status);
    const auto duration = m_errorHandler.banDurationFor(type, outcome.retryAfterSeconds);
    if (!duration.has_value()) {
        return;
    }

    const std::string reason = outcome.message.empty() ? ErrorInfo::errorTypeToString(type) : outcome.message;
    m_blacklist.blacklist(model.id, *duration, reason, type);
    record.banned = true;

    ErrorInfo info;
    info.errorType = type;
    info.message = reason;
    info.details = nlohmann::json{{"model_id", model.id}, {"ban_seconds", duration->count()}};
    m_errorHandler.log(ErrorHandler::LogLevel::Warning, "Blacklisted model " + model.id, info);
}

RouteResult RequestRouter::finish(RouteResult& result, RouteStatus status) {
    result.status = status;
    switch (status) {
        case RouteStatus::Responded:
            result.trace.push_back(RouteState::Responded);
            break;
        case RouteStatus::Cancelled:
            result.trace.push_back(RouteState::Cancelled);
            break;
        default:
            result.trace.push_back(RouteState::Exhausted);
            break;
    }

    recordRoute(result);

    if (status == RouteStatus::Responded) {
        m_errorHandler.log(ErrorHandler::LogLevel::Info,
                           "Request routed to " + result.modelId + " via " + routePathToString(result.path));
    } else {
        m_errorHandler.log(ErrorHandler::LogLevel::Warning,
                           std::string("Request ended without response: ") + routeStatusToString(status),
                           result.lastError);
    }
    return std::move(result);
}

void RequestRouter::recordRoute(const RouteResult& result) {
    {
        std::lock_guard<std::mutex> lock(m_historyMutex);

        RoutingHistory history;
        history.timestamp = std::chrono::system_clock::now();
        history.taskType = result.taskType;
        history.selectedModel = result.modelId;
        history.status = result.status;
        history.path = result.path;
        history.complexity = result.complexity.value;
        history.modelsTried = result.modelsTried;
        m_routingHistory.push_back(history);

        // 限制历史记录大小
        if (m_routingHistory.size() > kMaxHistorySize) {
            m_routingHistory.erase(m_routingHistory.begin(),
                                   m_routingHistory.begin() + (m_routingHistory.size() - kMaxHistorySize));
        }
    }

    std::lock_guard<std::mutex> statsLock(m_statsMutex);
    if (result.status == RouteStatus::Responded) {
        m_routingStats[result.modelId]++;
    }
    m_statusCounts[routeStatusToString(result.status)]++;
}

std::vector<RoutingHistory> RequestRouter::getRoutingHistory(size_t maxCount) const {
    std::lock_guard<std::mutex> lock(m_historyMutex);

    size_t startIdx = 0;
    if (m_routingHistory.size() > maxCount) {
        startIdx = m_routingHistory.size() - maxCount;
    }

    return std::vector<RoutingHistory>(
        m_routingHistory.begin() + startIdx,
        m_routingHistory.end()
    );
}

void RequestRouter::clearRoutingHistory() {
    std::lock_guard<std::mutex> lock(m_historyMutex);
    m_routingHistory.clear();
}

std::unordered_map<std::string, uint64_t> RequestRouter::getRoutingStatistics() const {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_routingStats;
}

nlohmann::json RequestRouter::diagnostics() const {
    nlohmann::json j;
    j["blacklist"] = m_blacklist.toJson();

    nlohmann::json usage = nlohmann::json::object();
    for (const auto& model : m_registry.getAllModels()) {
        auto u = m_ledger.usage(model.id).toJson();
        u["limits"] = {{"rpm", model.limits.rpm}, {"tpm", model.limits.tpm}, {"rpd", model.limits.rpd}};
        u["blacklisted"] = m_blacklist.isBlacklisted(model.id);
        usage[model.id] = std::move(u);
    }
    j["usage"] = std::move(usage);

    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        j["routing_statistics"] = nlohmann::json(std::map<std::string, uint64_t>(m_routingStats.begin(), m_routingStats.end()));
        j["status_counts"] = nlohmann::json(std::map<std::string, uint64_t>(m_statusCounts.begin(), m_statusCounts.end()));
    }

    j["options"] = {
        {"max_model_attempts", m_options.maxModelAttempts},
        {"transient_retries", m_options.transientRetries},
        {"default_task_type", types::taskTypeToString(m_options.defaultTaskType)},
    };
    return j;
}

} // namespace relay::router
