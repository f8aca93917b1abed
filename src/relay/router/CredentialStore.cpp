#include "relay/router/CredentialStore.h"

#include "relay/router/ConfigManager.h"
#include "relay/router/ErrorHandler.h"

#include <algorithm>
#include <cctype>

namespace relay::router {

static std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trimCopy(std::string s) {
    auto notSpace = [](int ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

std::map<std::string, std::string> EnvCredentialStore::defaultEnvMapping() {
    return {
        {"gemini", "GEMINI_API_KEY"},
        {"openrouter", "OPENROUTER_API_KEY"},
    };
}

EnvCredentialStore::EnvCredentialStore(const ErrorHandler* logger)
    : m_envByProvider(defaultEnvMapping())
    , m_logger(logger) {
}

EnvCredentialStore::EnvCredentialStore(const ConfigManager& config, const ErrorHandler* logger)
    : m_envByProvider(defaultEnvMapping())
    , m_logger(logger) {
    auto providers = config.get("providers");
    if (!providers.has_value() || !providers->is_object()) {
        return;
    }
    for (auto it = providers->begin(); it != providers->end(); ++it) {
        const auto& p = it.value();
        if (!p.is_object() || !p.contains("api_key_env") || !p["api_key_env"].is_string()) continue;
        const auto envName = p["api_key_env"].get<std::string>();
        if (envName.empty()) continue;
        m_envByProvider[toLowerCopy(it.key())] = envName;
    }
}

std::optional<std::string> EnvCredentialStore::getApiKeyForProvider(const std::string& provider) const {
    auto it = m_envByProvider.find(toLowerCopy(provider));
    if (it == m_envByProvider.end()) {
        return std::nullopt;
    }
    auto raw = ConfigManager::getEnv(it->second);
    if (!raw.has_value()) {
        return std::nullopt;
    }
    auto key = trimCopy(*raw);
    if (key.empty()) {
        return std::nullopt;
    }
    warnIfSuspicious(provider, key);
    return key;
}

void EnvCredentialStore::warnIfSuspicious(const std::string& provider, const std::string& key) const {
    if (!m_logger) return;
    const bool tooShort = key.size() < 20;
    const bool hasSpace = key.find(' ') != std::string::npos;
    if (!tooShort && !hasSpace) return;

    {
        std::lock_guard<std::mutex> lock(m_warnMutex);
        if (!m_warned.insert(toLowerCopy(provider)).second) return;
    }
    if (tooShort) {
        m_logger->log(ErrorHandler::LogLevel::Warning, "API key for " + provider + " appears to be too short");
    }
    if (hasSpace) {
        m_logger->log(ErrorHandler::LogLevel::Warning, "API key for " + provider + " contains spaces");
    }
}

} // namespace relay::router
