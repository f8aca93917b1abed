#include "relay/router/BlacklistManager.h"
#include "relay/router/ComplexityClassifier.h"
#include "relay/router/ConfigManager.h"
#include "relay/router/CredentialStore.h"
#include "relay/router/Dispatch.h"
#include "relay/router/ErrorHandler.h"
#include "relay/router/ModelRegistry.h"
#include "relay/router/ModelSelector.h"
#include "relay/router/RequestRouter.h"
#include "relay/router/UsageLedger.h"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

using namespace relay::router;

namespace {

/**
 * @brief 离线传输层：不访问网络，按 /fail 指令注入失败，否则回显
 */
class DryRunTransport : public ModelTransport {
public:
    DispatchOutcome dispatch(const DispatchRequest& request, const CancelToken& cancel) override {
        if (cancel.isCancelled()) {
            return DispatchOutcome::failure(DispatchStatus::Cancelled, "cancelled before send", false);
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_failures.find(request.modelId);
            if (it != m_failures.end()) {
                const auto status = it->second;
                m_failures.erase(it);
                return DispatchOutcome::failure(status, std::string("simulated ") + dispatchStatusToString(status));
            }
        }
        return DispatchOutcome::success("[" + request.modelId + "] " + request.text, request.estimatedTokens);
    }

    void failNext(const std::string& modelId, DispatchStatus status) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failures[modelId] = status;
    }

private:
    std::mutex m_mutex;
    std::map<std::string, DispatchStatus> m_failures;
};

void printHelp() {
    std::cout
        << "Commands:\n"
        << "  /models                       list catalogue\n"
        << "  /explain <task> [tokens]      candidate status for a task type\n"
        << "  /classify <text>              complexity analysis only\n"
        << "  /fail <model> quota|auth|transient   make the next call to model fail\n"
        << "  /ban <model> <seconds>        blacklist a model\n"
        << "  /unban <model>\n"
        << "  /status                       diagnostics json\n"
        << "  /help, /exit\n"
        << "Any other line is routed as a request.\n";
}

std::optional<DispatchStatus> parseFailure(const std::string& s) {
    if (s == "quota") return DispatchStatus::QuotaExceeded;
    if (s == "auth") return DispatchStatus::AuthError;
    if (s == "transient") return DispatchStatus::Transient;
    return std::nullopt;
}

} // namespace

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "config/relay_router.json";

    ConfigManager cfg;
    ErrorInfo err;
    if (!cfg.loadFromFile(configPath, &err)) {
        std::cerr << "Failed to load config: " << err.toString() << "\n";
        return 1;
    }
    if (!err.message.empty()) {
        std::cerr << "[INFO] " << err.message << "\n";
    }

    const auto issues = cfg.validate();
    for (const auto& s : issues) {
        if (s.rfind("WARN:", 0) == 0) {
            std::cerr << "[WARN] " << s << "\n";
        } else {
            std::cerr << "[ERR ] " << s << "\n";
        }
    }
    if (ConfigManager::hasHardValidationErrors(issues)) {
        return 1;
    }

    const ErrorHandler errorHandler = ErrorHandler::fromConfig(cfg);

    try {
        ModelRegistry registry(cfg);
        UsageLedger ledger(registry);
        BlacklistManager blacklist;
        ledger.setBlacklist(&blacklist);
        EnvCredentialStore credentials(cfg, &errorHandler);

        ModelSelector selector(registry, ledger, blacklist);
        if (auto v = cfg.get("router.require_credentials"); v.has_value() && v->is_boolean() && v->get<bool>()) {
            selector.setCredentialStore(&credentials);
        }

        ComplexityClassifier classifier(ComplexityClassifier::Config::fromConfig(cfg));
        DryRunTransport transport;
        RequestRouter router(registry, ledger, blacklist, selector, classifier, transport, errorHandler,
                             RouterOptions::fromConfig(cfg));

        std::cout << "Loaded " << registry.size() << " models from " << configPath << "\n";
        printHelp();

        std::string line;
        while (true) {
            std::cout << "\nrouter> ";
            if (!std::getline(std::cin, line)) break;
            if (line.empty()) continue;
            if (line == "/exit") break;
            if (line == "/help") {
                printHelp();
                continue;
            }

            std::istringstream iss(line);
            std::string cmd;
            iss >> cmd;

            if (cmd == "/models") {
                for (const auto& m : registry.getAllModels()) {
                    std::cout << m.toJson().dump() << "\n";
                }
            } else if (cmd == "/explain") {
                std::string task;
                uint64_t tokens = 0;
                iss >> task >> tokens;
                auto t = types::stringToTaskType(task);
                if (!t.has_value()) {
                    std::cout << "Unknown task type: " << task << "\n";
                    continue;
                }
                for (const auto& c : selector.explain(*t, tokens)) {
                    std::cout << c.toJson().dump() << "\n";
                }
            } else if (cmd == "/classify") {
                std::string rest;
                std::getline(iss, rest);
                std::cout << classifier.analyze(rest).toJson().dump(2) << "\n";
            } else if (cmd == "/fail") {
                std::string model, kind;
                iss >> model >> kind;
                auto status = parseFailure(kind);
                if (!registry.hasModel(model) || !status.has_value()) {
                    std::cout << "Usage: /fail <model> quota|auth|transient\n";
                    continue;
                }
                transport.failNext(model, *status);
            } else if (cmd == "/ban") {
                std::string model;
                long long seconds = 0;
                iss >> model >> seconds;
                if (!registry.hasModel(model) || seconds <= 0) {
                    std::cout << "Usage: /ban <model> <seconds>\n";
                    continue;
                }
                blacklist.blacklist(model, std::chrono::seconds(seconds), "manual ban", ErrorType::UnknownError);
            } else if (cmd == "/unban") {
                std::string model;
                iss >> model;
                std::cout << (blacklist.unban(model) ? "Unbanned " : "Not banned: ") << model << "\n";
            } else if (cmd == "/status") {
                std::cout << router.diagnostics().dump(2) << "\n";
            } else {
                RouteRequest req;
                req.text = line;
                const auto result = router.route(req);
                std::cout << result.toJson().dump(2) << "\n";
                if (result.ok()) {
                    std::cout << "Reply: " << result.text << "\n";
                }
            }
        }
    } catch (const ConfigError& e) {
        errorHandler.log(ErrorHandler::LogLevel::Error, "Model catalogue rejected", e.info());
        return 2;
    }
    return 0;
}
