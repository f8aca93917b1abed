#include "relay/router/ConfigManager.h"
#include "relay/router/ModelRegistry.h"

#include <functional>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace relay::router;
using namespace relay::router::types;

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

static nlohmann::json model(const std::string& id, int priority, const std::vector<std::string>& tasks,
                            uint64_t rpm = 10, uint64_t tpm = 1000, uint64_t rpd = 100) {
    return nlohmann::json{
        {"id", id},
        {"provider", "gemini"},
        {"task_types", tasks},
        {"priority", priority},
        {"rpm", rpm},
        {"tpm", tpm},
        {"rpd", rpd},
    };
}

static bool throwsConfigError(const nlohmann::json& models, const std::string& needle) {
    try {
        ModelRegistry r(models);
        return false;
    } catch (const ConfigError& e) {
        if (e.info().errorType != ErrorType::ConfigError) return false;
        return std::string(e.what()).find(needle) != std::string::npos;
    }
}

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    tests.push_back({"loads_default_catalogue_from_config", []() {
        ConfigManager cm;
        ModelRegistry r(cm);
        CHECK_EQ(r.size(), static_cast<size_t>(4));
        CHECK_TRUE(r.hasModel("gemini/gemini-1.5-flash"));
        auto m = r.getModel("gemini/gemini-2.0-flash-lite");
        CHECK_TRUE(m.has_value());
        CHECK_EQ(m->limits.rpm, 30U);
        CHECK_EQ(m->limits.rpd, 200U);
        CHECK_EQ(m->priority, 4);
    }});

    tests.push_back({"models_for_task_lower_priority_first", []() {
        nlohmann::json arr = nlohmann::json::array();
        arr.push_back(model("late", 3, {"dialog"}));
        arr.push_back(model("early", 1, {"dialog", "code"}));
        arr.push_back(model("middle", 2, {"dialog"}));
        arr.push_back(model("coder", 5, {"code"}));
        ModelRegistry r(arr);

        const auto dialog = r.modelsForTask(TaskType::Dialog);
        CHECK_EQ(dialog.size(), static_cast<size_t>(3));
        CHECK_EQ(dialog[0].id, "early");
        CHECK_EQ(dialog[1].id, "middle");
        CHECK_EQ(dialog[2].id, "late");

        const auto code = r.modelsForTask(TaskType::Code);
        CHECK_EQ(code.size(), static_cast<size_t>(2));
        CHECK_EQ(code[0].id, "early");
        CHECK_EQ(code[1].id, "coder");

        CHECK_TRUE(r.modelsForTask(TaskType::Vision).empty());
    }});

    tests.push_back({"ties_broken_by_base_score_then_load_order", []() {
        nlohmann::json arr = nlohmann::json::array();
        auto a = model("a", 1, {"dialog"});
        a["base_score"] = 0.2;
        auto b = model("b", 1, {"dialog"});
        b["base_score"] = 0.9;
        auto c = model("c", 1, {"dialog"});
        c["base_score"] = 0.2;
        arr.push_back(a);
        arr.push_back(b);
        arr.push_back(c);
        ModelRegistry r(arr);

        const auto dialog = r.modelsForTask(TaskType::Dialog);
        CHECK_EQ(dialog[0].id, "b");
        CHECK_EQ(dialog[1].id, "a");
        CHECK_EQ(dialog[2].id, "c");
    }});

    tests.push_back({"legacy_type_key_and_aliases_accepted", []() {
        nlohmann::json arr = nlohmann::json::array();
        auto m = model("legacy", 1, {});
        m.erase("task_types");
        m["type"] = nlohmann::json::array({"Chat", "coding", "dialog"});
        arr.push_back(m);
        ModelRegistry r(arr);
        auto d = r.getModel("legacy");
        CHECK_TRUE(d.has_value());
        // "Chat" 与 "dialog" 合并为同一类型
        CHECK_EQ(d->taskTypes.size(), static_cast<size_t>(2));
        CHECK_TRUE(d->supportsTask(TaskType::Dialog));
        CHECK_TRUE(d->supportsTask(TaskType::Code));
    }});

    tests.push_back({"zero_limit_is_legal", []() {
        nlohmann::json arr = nlohmann::json::array();
        arr.push_back(model("zero", 1, {"dialog"}, 30, 1440000, 0));
        ModelRegistry r(arr);
        CHECK_EQ(r.getModel("zero")->limits.rpd, 0U);
    }});

    tests.push_back({"malformed_entries_throw_config_error", []() {
        auto missingProvider = model("x", 1, {"dialog"});
        missingProvider.erase("provider");
        CHECK_TRUE(throwsConfigError(nlohmann::json::array({missingProvider}), "provider"));

        CHECK_TRUE(throwsConfigError(nlohmann::json::array({model("x", 1, {"dialog"}, 10, 10, 10),
                                                            nlohmann::json{{"id", "y"}, {"provider", "p"},
                                                                           {"task_types", nlohmann::json::array({"dialog"})},
                                                                           {"priority", 1},
                                                                           {"rpm", -5}, {"tpm", 1}, {"rpd", 1}}}),
                                     "rpm"));

        CHECK_TRUE(throwsConfigError(nlohmann::json::array({model("x", 1, {"hologram"})}), "unknown task type"));

        auto badPriority = model("x", 1, {"dialog"});
        badPriority["priority"] = "high";
        CHECK_TRUE(throwsConfigError(nlohmann::json::array({badPriority}), "priority"));

        CHECK_TRUE(throwsConfigError(nlohmann::json::array({"not an object"}), "index 0"));
    }});

    tests.push_back({"priority_outside_int_range_is_rejected", []() {
        auto huge = model("x", 1, {"dialog"});
        huge["priority"] = static_cast<int64_t>(1LL << 40);
        CHECK_TRUE(throwsConfigError(nlohmann::json::array({huge}), "'priority' out of range"));

        auto tooLow = model("x", 1, {"dialog"});
        tooLow["priority"] = -(static_cast<int64_t>(1LL << 40));
        CHECK_TRUE(throwsConfigError(nlohmann::json::array({tooLow}), "'priority' out of range"));

        // 从文本解析出的大正数是无符号整数
        const auto parsed = nlohmann::json::parse(
            R"([{"id":"x","provider":"gemini","task_types":["dialog"],"priority":18446744073709551615,)"
            R"("rpm":1,"tpm":1,"rpd":1}])");
        CHECK_TRUE(throwsConfigError(parsed, "'priority' out of range"));

        auto edge = model("edge", std::numeric_limits<int>::max(), {"dialog"});
        ModelRegistry ok(nlohmann::json::array({edge}));
        CHECK_EQ(ok.getModel("edge")->priority, std::numeric_limits<int>::max());
    }});

    tests.push_back({"duplicate_and_empty_catalogue_throw", []() {
        CHECK_TRUE(throwsConfigError(nlohmann::json::array({model("dup", 1, {"dialog"}), model("dup", 2, {"code"})}),
                                     "Duplicate model id: dup"));
        CHECK_TRUE(throwsConfigError(nlohmann::json::array(), "empty"));
        CHECK_TRUE(throwsConfigError(nlohmann::json::object(), "array"));
    }});

    tests.push_back({"missing_models_node_in_config_throws", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({"router":{}})", &err));
        bool thrown = false;
        try {
            ModelRegistry r(cm);
        } catch (const ConfigError& e) {
            thrown = std::string(e.what()).find("models") != std::string::npos;
        }
        CHECK_TRUE(thrown);
    }});

    tests.push_back({"vector_constructor_validates", []() {
        ModelDescriptor ok;
        ok.id = "ok";
        ok.provider = "p";
        ok.taskTypes = {TaskType::Simple};
        ok.priority = 1;
        ok.limits = ModelLimits{1, 1, 1};

        ModelDescriptor bad = ok;
        bad.id = "bad";
        bad.baseScore = 2.0f;

        bool thrown = false;
        try {
            ModelRegistry r(std::vector<ModelDescriptor>{ok, bad});
        } catch (const ConfigError&) {
            thrown = true;
        }
        CHECK_TRUE(thrown);

        ModelRegistry r(std::vector<ModelDescriptor>{ok});
        CHECK_EQ(r.getAllModels().size(), static_cast<size_t>(1));
        CHECK_FALSE(r.hasModel("bad"));
        CHECK_FALSE(r.getModel("bad").has_value());
    }});

    return mini_test::run(tests);
}
