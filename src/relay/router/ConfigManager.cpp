#include "relay/router/ConfigManager.h"

#include "relay/router/types/ModelDescriptor.h"
#include "relay/router/types/TaskType.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace relay::router {

static std::string trimCopy(std::string s) {
    auto notSpace = [](int ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

ConfigManager::ConfigManager()
    : m_cfg(makeDefaultConfig())
{}

bool ConfigManager::loadFromFile(const std::string& path, ErrorInfo* err) {
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        // 1) 回退默认配置（内存）
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_cfg = makeDefaultConfig();
            applyEnvMappingOverrides(m_cfg);
            replaceEnvPlaceholdersRecursive(m_cfg);
        }

        // 2) 自动生成配置文件（落盘的是未替换 env 的模板）
        ErrorInfo saveErr;
        const bool saved = saveToFile(path, &saveErr);

        if (err) {
            err->errorType = ErrorType::UnknownError;
            err->errorCode = 0;
            err->message = "Config file not found, using default config and auto-created template: " + path;
            err->details = nlohmann::json{
                {"path", path},
                {"fallback", "default_config"},
                {"auto_created", saved}
            };
            if (!saved) (*err->details)["auto_create_failed"] = saveErr.toJson();
        }
        return true;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return loadFromString(buffer.str(), err);
}

bool ConfigManager::loadFromString(const std::string& jsonText, ErrorInfo* err) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(jsonText);
    } catch (const std::exception& e) {
        if (err) {
            err->errorType = ErrorType::ConfigError;
            err->errorCode = 0;
            err->message = std::string("Config JSON parse failed: ") + e.what();
            err->details = nlohmann::json{{"snippet", jsonText.substr(0, 256)}};
        }
        return false;
    }

    if (!parsed.is_object()) {
        if (err) {
            err->errorType = ErrorType::ConfigError;
            err->errorCode = 0;
            err->message = "Config root must be a JSON object";
        }
        return false;
    }

    // 在锁外处理 env 逻辑，避免长期占用
    applyEnvMappingOverrides(parsed);
    replaceEnvPlaceholdersRecursive(parsed);

    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_cfg = std::move(parsed);
    }
    return true;
}

nlohmann::json ConfigManager::getRaw() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_cfg;
}

bool ConfigManager::saveToFile(const std::string& path, ErrorInfo* err) const {
    try {
        const std::filesystem::path p(path);
        const auto parent = p.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec && !std::filesystem::exists(parent)) {
                if (err) {
                    err->errorType = ErrorType::UnknownError;
                    err->errorCode = 1;
                    err->message = "Failed to create config directory: " + parent.string();
                    err->details = nlohmann::json{{"path", path}, {"ec", ec.value()}, {"what", ec.message()}};
                }
                return false;
            }
        }

        std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            if (err) {
                err->errorType = ErrorType::UnknownError;
                err->errorCode = 2;
                err->message = "Failed to open config file for write: " + path;
                err->details = nlohmann::json{{"path", path}};
            }
            return false;
        }

        // 写盘时避免写入 env 替换后的敏感信息：始终以默认模板为准
        const auto tmpl = makeDefaultConfig();
        ofs << tmpl.dump(2) << "\n";
        ofs.flush();
        return true;
    } catch (const std::exception& e) {
        if (err) {
            err->errorType = ErrorType::UnknownError;
            err->errorCode = 3;
            err->message = std::string("Failed to save config file: ") + e.what();
            err->details = nlohmann::json{{"path", path}};
        }
        return false;
    }
}

std::optional<nlohmann::json> ConfigManager::get(const std::string& keyPath) const {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lk(m_mu);
    const nlohmann::json* p = getPtrByPath(m_cfg, parts);
    if (!p) return std::nullopt;
    return std::optional<nlohmann::json>{*p};
}

bool ConfigManager::set(const std::string& keyPath, const nlohmann::json& v, ErrorInfo* err) {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) {
        if (err) {
            err->errorType = ErrorType::ConfigError;
            err->errorCode = 0;
            err->message = "Empty keyPath";
        }
        return false;
    }

    std::lock_guard<std::mutex> lk(m_mu);
    nlohmann::json* p = getOrCreatePtrByPath(m_cfg, parts);
    if (!p) {
        if (err) {
            err->errorType = ErrorType::ConfigError;
            err->errorCode = 0;
            err->message = "Failed to create keyPath: " + keyPath;
        }
        return false;
    }
    *p = v;
    return true;
}

void ConfigManager::applyEnvironmentOverrides() {
    std::lock_guard<std::mutex> lk(m_mu);
    applyEnvMappingOverrides(m_cfg);
    replaceEnvPlaceholdersRecursive(m_cfg);
}

std::vector<std::string> ConfigManager::validate() const {
    return validateJson(getRaw());
}

nlohmann::json ConfigManager::makeDefaultConfig() {
    nlohmann::json j;
    j["_comment"] = "relay router config template (auto-generated). JSON has no comments; use _comment fields.";
    j["providers"] = {
        {"_comment", "provider -> environment variable holding its API key"},
        {"gemini", {{"api_key_env", "GEMINI_API_KEY"}}},
        {"openrouter", {{"api_key_env", "OPENROUTER_API_KEY"}}}
    };
    j["models"] = nlohmann::json::array({
        {
            {"id", "gemini/gemini-1.5-flash"},
            {"display_name", "Gemini 1.5 Flash"},
            {"provider", "gemini"},
            {"task_types", nlohmann::json::array({"simple", "dialog", "code", "summarize"})},
            {"priority", 3},
            {"rpm", 15},
            {"tpm", 2500000},
            {"rpd", 50},
            {"base_score", 0.5}
        },
        {
            {"id", "gemini/gemini-2.0-flash-lite"},
            {"display_name", "Gemini 2.0 Flash-Lite"},
            {"provider", "gemini"},
            {"task_types", nlohmann::json::array({"simple", "dialog", "code", "summarize"})},
            {"priority", 4},
            {"rpm", 30},
            {"tpm", 10000000},
            {"rpd", 200},
            {"base_score", 0.5}
        },
        {
            {"id", "openrouter/google-gemma-2b-it"},
            {"display_name", "Gemma 2B-it (OpenRouter)"},
            {"provider", "openrouter"},
            {"task_types", nlohmann::json::array({"simple", "code"})},
            {"priority", 2},
            {"rpm", 20},
            {"tpm", 2000000},
            {"rpd", 100},
            {"base_score", 0.4}
        },
        {
            {"id", "openrouter/mistralai-mistral-7b-instruct"},
            {"display_name", "Mistral-7B-instruct (OpenRouter)"},
            {"provider", "openrouter"},
            {"task_types", nlohmann::json::array({"dialog", "summarize", "code"})},
            {"priority", 3},
            {"rpm", 10},
            {"tpm", 4000000},
            {"rpd", 100},
            {"base_score", 0.3}
        }
    });
    j["router"] = {
        {"_comment", "priority: lower value is tried first. Ban durations in seconds."},
        {"max_model_attempts", 5},
        {"transient_retries", 1},
        {"quota_ban_seconds", 300},
        {"auth_ban_seconds", 21600},
        {"honor_retry_after", true},
        {"default_task_type", "dialog"},
        {"require_credentials", false}
    };
    j["classifier"] = {
        {"multi_agent_threshold", 3}
    };
    j["logging"] = {
        {"min_level", "warning"},
        {"enabled", true}
    };
    return j;
}

std::string ConfigManager::redactSensitive(const std::string& keyPath, const std::string& value) {
    if (!isSensitiveKeyPath(keyPath)) return value;
    const auto v = trimCopy(value);
    if (v.size() <= 8) return "******";
    return v.substr(0, 2) + "******" + v.substr(v.size() - 2);
}

std::optional<std::string> ConfigManager::getEnv(const std::string& name) {
    if (name.empty()) return std::nullopt;
#if defined(_WIN32)
    // MSVC: getenv 会触发 C4996，改用 _dupenv_s
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name.c_str()) != 0 || !buf) return std::nullopt;
    std::string s = buf;
    std::free(buf);
#else
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    std::string s = v;
#endif
    if (s.empty()) return std::nullopt;
    return s;
}

bool ConfigManager::isSensitiveKeyPath(const std::string& keyPath) {
    std::string low = keyPath;
    std::transform(low.begin(), low.end(), low.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    // api_key_env 只是变量名，不算敏感
    if (low.size() >= 4 && low.compare(low.size() - 4, 4, "_env") == 0) return false;
    return low.find("api_key") != std::string::npos || low.find("apikey") != std::string::npos || low.find("secret") != std::string::npos;
}

std::vector<std::string> ConfigManager::splitKeyPath(const std::string& keyPath) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : keyPath) {
        if (c == '.') {
            if (!cur.empty()) parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

const nlohmann::json* ConfigManager::getPtrByPath(const nlohmann::json& root, const std::vector<std::string>& parts) {
    const nlohmann::json* p = &root;
    for (const auto& k : parts) {
        if (!p->is_object()) return nullptr;
        if (!p->contains(k)) return nullptr;
        p = &((*p)[k]);
    }
    return p;
}

nlohmann::json* ConfigManager::getOrCreatePtrByPath(nlohmann::json& root, const std::vector<std::string>& parts) {
    nlohmann::json* p = &root;
    for (size_t i = 0; i < parts.size(); ++i) {
        const auto& k = parts[i];
        if (!p->is_object()) {
            *p = nlohmann::json::object();
        }
        if (i == parts.size() - 1) {
            return &((*p)[k]);
        }
        p = &((*p)[k]);
    }
    return p;
}

void ConfigManager::applyEnvMappingOverrides(nlohmann::json& root) {
    // 固定映射：env -> keyPath
    struct MapItem {
        const char* env;
        const char* keyPath;
        bool integer;
    };
    const MapItem mapping[] = {
        {"RELAY_LOG_LEVEL", "logging.min_level", false},
        {"RELAY_DEFAULT_TASK_TYPE", "router.default_task_type", false},
        {"RELAY_MAX_MODEL_ATTEMPTS", "router.max_model_attempts", true},
        {"RELAY_TRANSIENT_RETRIES", "router.transient_retries", true},
        {"RELAY_QUOTA_BAN_SECONDS", "router.quota_ban_seconds", true},
        {"RELAY_AUTH_BAN_SECONDS", "router.auth_ban_seconds", true},
        {"RELAY_MULTI_AGENT_THRESHOLD", "classifier.multi_agent_threshold", true},
    };

    for (const auto& m : mapping) {
        auto v = getEnv(m.env);
        if (!v.has_value()) continue;
        // 空字符串视为“未提供”
        const auto val = trimCopy(v.value());
        if (val.empty()) continue;
        const auto parts = splitKeyPath(m.keyPath);
        nlohmann::json* p = getOrCreatePtrByPath(root, parts);
        if (!p) continue;
        if (m.integer) {
            try {
                const long long t = std::stoll(val);
                *p = t;
            } catch (const std::exception&) {
                // 保留字符串，validate() 会报告类型错误
                *p = val;
            }
        } else {
            *p = val;
        }
    }
}

void ConfigManager::replaceEnvPlaceholdersRecursive(nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            replaceEnvPlaceholdersRecursive(it.value());
        }
        return;
    }
    if (node.is_array()) {
        for (auto& v : node) {
            replaceEnvPlaceholdersRecursive(v);
        }
        return;
    }
    if (node.is_string()) {
        node = replaceEnvPlaceholdersInString(node.get<std::string>());
    }
}

std::string ConfigManager::replaceEnvPlaceholdersInString(const std::string& s) {
    // 替换 ${ENV_NAME} 形式的占位符；未找到 env 时保留原样
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        if (i + 2 < s.size() && s[i] == '$' && s[i + 1] == '{') {
            const auto end = s.find('}', i + 2);
            if (end != std::string::npos) {
                const auto name = s.substr(i + 2, end - (i + 2));
                auto v = getEnv(name);
                if (v.has_value()) {
                    out += v.value();
                } else {
                    out += s.substr(i, end - i + 1);
                }
                i = end + 1;
                continue;
            }
        }
        out.push_back(s[i]);
        i++;
    }
    return out;
}

std::vector<std::string> ConfigManager::validateJson(const nlohmann::json& cfgCopy) {
    std::vector<std::string> out;

    // providers
    std::set<std::string> providerNames;
    if (cfgCopy.contains("providers")) {
        if (!cfgCopy["providers"].is_object()) {
            out.push_back("Invalid 'providers' (object required)");
        } else {
            for (auto it = cfgCopy["providers"].begin(); it != cfgCopy["providers"].end(); ++it) {
                if (startsWith(it.key(), "_")) continue;
                providerNames.insert(it.key());
                const auto& p = it.value();
                if (!p.is_object() || !p.contains("api_key_env") || !p["api_key_env"].is_string()) {
                    out.push_back("Invalid 'providers." + it.key() + ".api_key_env' (string required)");
                }
            }
        }
    }

    // models
    std::set<std::string> modelIds;
    if (!cfgCopy.contains("models") || !cfgCopy["models"].is_array()) {
        out.push_back("Missing or invalid 'models' (array required)");
    } else if (cfgCopy["models"].empty()) {
        out.push_back("Invalid 'models' (at least one model required)");
    } else {
        for (size_t i = 0; i < cfgCopy["models"].size(); ++i) {
            std::vector<std::string> errors;
            auto d = types::ModelDescriptor::fromJson(cfgCopy["models"][i], &errors);
            if (!d.has_value()) {
                for (const auto& e : errors) {
                    out.push_back("Invalid 'models[" + std::to_string(i) + "]': " + e);
                }
                continue;
            }
            if (!modelIds.insert(d->id).second) {
                out.push_back("Duplicate model id: " + d->id);
            }
            if (!providerNames.empty() && providerNames.find(d->provider) == providerNames.end()) {
                out.push_back("WARN: model " + d->id + " refers to unknown provider: " + d->provider);
            }
        }
    }

    // router
    if (cfgCopy.contains("router")) {
        const auto& r = cfgCopy["router"];
        if (!r.is_object()) {
            out.push_back("Invalid 'router' (object required)");
        } else {
            auto checkRange = [&](const char* key, long long lo, long long hi) {
                if (!r.contains(key)) return;
                if (!r[key].is_number_integer()) {
                    out.push_back(std::string("Invalid 'router.") + key + "' (integer required)");
                    return;
                }
                const auto v = r[key].get<long long>();
                if (v < lo || v > hi) {
                    out.push_back(std::string("Invalid 'router.") + key + "' (range " + std::to_string(lo) + ".." +
                                  std::to_string(hi) + ")");
                }
            };
            checkRange("max_model_attempts", 1, 64);
            checkRange("transient_retries", 0, 5);
            checkRange("quota_ban_seconds", 1, 7 * 86400);
            checkRange("auth_ban_seconds", 1, 30 * 86400);

            if (r.contains("default_task_type")) {
                if (!r["default_task_type"].is_string() ||
                    !types::stringToTaskType(r["default_task_type"].get<std::string>()).has_value()) {
                    out.push_back("Invalid 'router.default_task_type' (known task type required)");
                }
            }
        }
    }

    // classifier
    if (cfgCopy.contains("classifier") && cfgCopy["classifier"].is_object() &&
        cfgCopy["classifier"].contains("multi_agent_threshold")) {
        const auto& t = cfgCopy["classifier"]["multi_agent_threshold"];
        if (!t.is_number_integer() || t.get<int>() < 1 || t.get<int>() > 5) {
            out.push_back("Invalid 'classifier.multi_agent_threshold' (range 1..5)");
        }
    }

    return out;
}

bool ConfigManager::hasHardValidationErrors(const std::vector<std::string>& issues) {
    for (const auto& s : issues) {
        if (!startsWith(s, "WARN:")) return true;
    }
    return false;
}

bool ConfigManager::startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace relay::router
