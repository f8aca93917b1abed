#include "relay/router/ConfigManager.h"
#include "relay/router/CredentialStore.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace relay::router;

// 轻量自测断言工具
namespace mini_test {

inline std::string toString(const std::string& v) { return v; }
inline std::string toString(const char* v) { return v ? std::string(v) : "null"; }
inline std::string toString(bool v) { return v ? "true" : "false"; }

template <typename T>
std::string toString(const T& v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

class AssertionFailed : public std::runtime_error {
public:
    explicit AssertionFailed(const std::string& msg) : std::runtime_error(msg) {}
};

#define CHECK_TRUE(cond)                                                                          \
    do {                                                                                          \
        if (!(cond))                                                                              \
            throw mini_test::AssertionFailed(std::string("CHECK_TRUE failed: ") + #cond);         \
    } while (0)

#define CHECK_FALSE(cond) CHECK_TRUE(!(cond))

#define CHECK_EQ(a, b)                                                                            \
    do {                                                                                          \
        const auto _va = (a);                                                                     \
        const auto _vb = (b);                                                                     \
        if (!(_va == _vb)) {                                                                      \
            throw mini_test::AssertionFailed(std::string("CHECK_EQ failed: ") + #a " vs " #b +    \
                                             " (" + mini_test::toString(_va) + " vs " +           \
                                             mini_test::toString(_vb) + ")");                     \
        }                                                                                         \
    } while (0)

struct TestCase {
    std::string name;
    std::function<void()> fn;
};

inline int run(const std::vector<TestCase>& tests) {
    int failed = 0;
    for (const auto& t : tests) {
        try {
            t.fn();
            std::cout << "[  OK  ] " << t.name << "\n";
        } catch (const AssertionFailed& e) {
            failed++;
            std::cout << "[ FAIL ] " << t.name << " :: " << e.what() << "\n";
        } catch (const std::exception& e) {
            failed++;
            std::cout << "[ EXC  ] " << t.name << " :: " << e.what() << "\n";
        } catch (...) {
            failed++;
            std::cout << "[ EXC  ] " << t.name << " :: unknown exception\n";
        }
    }
    std::cout << "Executed " << tests.size() << " cases, failed " << failed << ".\n";
    return failed == 0 ? 0 : 1;
}

} // namespace mini_test

static bool containsAny(const std::vector<std::string>& xs, const std::string& needle) {
    for (const auto& x : xs) {
        if (x.find(needle) != std::string::npos) return true;
    }
    return false;
}

static void setEnvVar(const std::string& k, const std::string& v) {
#if defined(_WIN32)
    _putenv_s(k.c_str(), v.c_str());
#else
    setenv(k.c_str(), v.c_str(), 1);
#endif
}

static void unsetEnvVar(const std::string& k) {
#if defined(_WIN32)
    _putenv_s(k.c_str(), "");
#else
    unsetenv(k.c_str());
#endif
}

static std::string oneModel(const std::string& id, const std::string& extra = "") {
    return R"({"id":")" + id + R"(","provider":"gemini","task_types":["dialog"],"priority":1,"rpm":1,"tpm":100,"rpd":10)" +
           extra + "}";
}

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    tests.push_back({"load_from_string_and_get_set", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({"router":{"max_model_attempts":4},"models":[]})", &err));

        auto v = cm.get("router.max_model_attempts");
        CHECK_TRUE(v.has_value());
        CHECK_TRUE(v->is_number_integer());
        CHECK_EQ(v->get<int>(), 4);

        CHECK_TRUE(cm.set("router.transient_retries", 2, &err));
        auto t = cm.get("router.transient_retries");
        CHECK_TRUE(t.has_value());
        CHECK_EQ(t->get<int>(), 2);

        CHECK_FALSE(cm.get("router.missing.key").has_value());
        CHECK_FALSE(cm.set("", 1, &err));
    }});

    tests.push_back({"parse_error_does_not_overwrite_old_config", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({"router":{"max_model_attempts":2}})", &err));

        const auto before = cm.getRaw().dump();
        CHECK_FALSE(cm.loadFromString(R"({"router":)", &err));
        CHECK_TRUE(err.errorType == ErrorType::ConfigError);
        CHECK_EQ(before, cm.getRaw().dump());

        CHECK_FALSE(cm.loadFromString("[1,2,3]", &err));
        CHECK_EQ(before, cm.getRaw().dump());
    }});

    tests.push_back({"load_missing_file_falls_back_and_writes_template", []() {
        ConfigManager cm;
        ErrorInfo err;
        const std::string path = "relay_router_missing_config_test/relay_router.json";
        std::error_code ec;
        std::filesystem::remove_all("relay_router_missing_config_test", ec);

        CHECK_TRUE(cm.loadFromFile(path, &err));
        CHECK_TRUE(!err.message.empty());
        auto models = cm.get("models");
        CHECK_TRUE(models.has_value());
        CHECK_TRUE(models->is_array());
        CHECK_EQ(models->size(), static_cast<size_t>(4));

        CHECK_TRUE(std::filesystem::exists(path));
        std::ifstream ifs(path, std::ios::in | std::ios::binary);
        CHECK_TRUE(ifs.is_open());
        std::stringstream buf;
        buf << ifs.rdbuf();
        const auto j = nlohmann::json::parse(buf.str());
        CHECK_EQ(j["providers"]["gemini"]["api_key_env"].get<std::string>(), "GEMINI_API_KEY");
        CHECK_EQ(j["providers"]["openrouter"]["api_key_env"].get<std::string>(), "OPENROUTER_API_KEY");

        ifs.close();
        std::filesystem::remove_all("relay_router_missing_config_test", ec);
    }});

    tests.push_back({"default_config_passes_validation", []() {
        ConfigManager cm;
        const auto issues = cm.validate();
        CHECK_FALSE(ConfigManager::hasHardValidationErrors(issues));
        CHECK_TRUE(issues.empty());
    }});

    tests.push_back({"validate_reports_duplicate_model_id", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString("{\"models\":[" + oneModel("a") + "," + oneModel("a") + "]}", &err));
        const auto issues = cm.validate();
        CHECK_TRUE(containsAny(issues, "Duplicate model id: a"));
        CHECK_TRUE(ConfigManager::hasHardValidationErrors(issues));
    }});

    tests.push_back({"validate_reports_negative_limit_and_unknown_task", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(
            R"({"models":[{"id":"a","provider":"gemini","task_types":["dialog"],"priority":1,"rpm":-1,"tpm":1,"rpd":1},)"
            R"({"id":"b","provider":"gemini","task_types":["teleport"],"priority":1,"rpm":1,"tpm":1,"rpd":1}]})",
            &err));
        const auto issues = cm.validate();
        CHECK_TRUE(containsAny(issues, "'rpm'"));
        CHECK_TRUE(containsAny(issues, "unknown task type 'teleport'"));
    }});

    tests.push_back({"validate_reports_router_ranges", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(
            "{\"models\":[" + oneModel("a") + "],"
            R"("router":{"max_model_attempts":0,"transient_retries":"x","default_task_type":"nope"},)"
            R"("classifier":{"multi_agent_threshold":9}})",
            &err));
        const auto issues = cm.validate();
        CHECK_TRUE(containsAny(issues, "router.max_model_attempts"));
        CHECK_TRUE(containsAny(issues, "router.transient_retries"));
        CHECK_TRUE(containsAny(issues, "router.default_task_type"));
        CHECK_TRUE(containsAny(issues, "classifier.multi_agent_threshold"));
    }});

    tests.push_back({"validate_warns_on_unknown_provider", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(
            R"({"providers":{"openrouter":{"api_key_env":"OPENROUTER_API_KEY"}},"models":[)" + oneModel("a") + "]}",
            &err));
        const auto issues = cm.validate();
        CHECK_TRUE(containsAny(issues, "WARN: model a refers to unknown provider: gemini"));
        CHECK_FALSE(ConfigManager::hasHardValidationErrors(issues));
    }});

    tests.push_back({"validate_rejects_empty_catalogue", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({"models":[]})", &err));
        CHECK_TRUE(containsAny(cm.validate(), "at least one model"));
    }});

    tests.push_back({"env_mapping_overrides_router_settings", []() {
        setEnvVar("RELAY_LOG_LEVEL", "debug");
        setEnvVar("RELAY_MAX_MODEL_ATTEMPTS", "3");

        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({"router":{"max_model_attempts":5},"logging":{"min_level":"error"}})", &err));
        auto level = cm.get("logging.min_level");
        CHECK_TRUE(level.has_value());
        CHECK_EQ(level->get<std::string>(), "debug");
        auto attempts = cm.get("router.max_model_attempts");
        CHECK_TRUE(attempts.has_value());
        CHECK_TRUE(attempts->is_number_integer());
        CHECK_EQ(attempts->get<int>(), 3);

        unsetEnvVar("RELAY_LOG_LEVEL");
        unsetEnvVar("RELAY_MAX_MODEL_ATTEMPTS");
    }});

    tests.push_back({"env_placeholder_replacement", []() {
        unsetEnvVar("RELAY_TEST_PLACEHOLDER");
        setEnvVar("RELAY_TEST_PLACEHOLDER", "abc123");

        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({"x":{"token":"${RELAY_TEST_PLACEHOLDER}","keep":"${RELAY_NOT_SET_ANYWHERE}"}})", &err));
        CHECK_EQ(cm.get("x.token")->get<std::string>(), "abc123");
        CHECK_EQ(cm.get("x.keep")->get<std::string>(), "${RELAY_NOT_SET_ANYWHERE}");

        unsetEnvVar("RELAY_TEST_PLACEHOLDER");
    }});

    tests.push_back({"apply_environment_overrides_after_set", []() {
        unsetEnvVar("RELAY_TRANSIENT_RETRIES");
        unsetEnvVar("RELAY_TEST_LATE_VALUE");

        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({"router":{"transient_retries":1}})", &err));
        CHECK_TRUE(cm.set("x.late", "${RELAY_TEST_LATE_VALUE}", &err));
        CHECK_EQ(cm.get("x.late")->get<std::string>(), "${RELAY_TEST_LATE_VALUE}");

        // 加载之后才设置的环境变量，需要显式重新应用
        setEnvVar("RELAY_TRANSIENT_RETRIES", "2");
        setEnvVar("RELAY_TEST_LATE_VALUE", "resolved");
        CHECK_EQ(cm.get("router.transient_retries")->get<int>(), 1);
        cm.applyEnvironmentOverrides();
        CHECK_EQ(cm.get("router.transient_retries")->get<int>(), 2);
        CHECK_EQ(cm.get("x.late")->get<std::string>(), "resolved");

        unsetEnvVar("RELAY_TRANSIENT_RETRIES");
        unsetEnvVar("RELAY_TEST_LATE_VALUE");
    }});

    tests.push_back({"credential_store_mapping_from_providers", []() {
        EnvCredentialStore builtin;
        CHECK_EQ(builtin.getEnvMapping().size(), static_cast<size_t>(2));
        CHECK_EQ(builtin.getEnvMapping().at("gemini"), "GEMINI_API_KEY");

        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(
            R"({"providers":{"Mistral":{"api_key_env":"RELAY_TEST_MISTRAL_KEY"},)"
            R"("gemini":{"api_key_env":"RELAY_TEST_GEMINI_KEY"},"broken":{"api_key_env":""}}})", &err));
        EnvCredentialStore store(cm);
        const auto& mapping = store.getEnvMapping();
        CHECK_EQ(mapping.at("mistral"), "RELAY_TEST_MISTRAL_KEY");
        CHECK_EQ(mapping.at("gemini"), "RELAY_TEST_GEMINI_KEY");
        CHECK_EQ(mapping.at("openrouter"), "OPENROUTER_API_KEY");
        CHECK_TRUE(mapping.count("broken") == 0);

        unsetEnvVar("RELAY_TEST_MISTRAL_KEY");
        CHECK_FALSE(store.hasCredentials("MISTRAL"));
        setEnvVar("RELAY_TEST_MISTRAL_KEY", "  mk-0123456789abcdefghij  ");
        auto key = store.getApiKeyForProvider("MISTRAL");
        CHECK_TRUE(key.has_value());
        CHECK_EQ(*key, "mk-0123456789abcdefghij");
        CHECK_FALSE(store.hasCredentials("unknown-provider"));
        unsetEnvVar("RELAY_TEST_MISTRAL_KEY");
    }});

    tests.push_back({"redact_sensitive_values", []() {
        CHECK_EQ(ConfigManager::redactSensitive("providers.gemini.api_key", "abcdefghijkl"), "ab******kl");
        CHECK_EQ(ConfigManager::redactSensitive("providers.gemini.api_key", "short"), "******");
        CHECK_EQ(ConfigManager::redactSensitive("providers.gemini.api_key_env", "GEMINI_API_KEY"), "GEMINI_API_KEY");
        CHECK_EQ(ConfigManager::redactSensitive("router.default_task_type", "dialog"), "dialog");
    }});

    return mini_test::run(tests);
}
