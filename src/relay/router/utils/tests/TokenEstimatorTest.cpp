#include "relay/router/utils/TokenEstimator.h"

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace relay::router::utils;

// 轻量断言工具（与其他 utils 测试保持一致风格）
namespace mini_test {

class AssertionFailed : public std::runtime_error {
public:
    explicit AssertionFailed(const std::string& msg) : std::runtime_error(msg) {}
};

#define CHECK_TRUE(cond)                                                                          \
    do {                                                                                          \
        if (!(cond))                                                                              \
            throw mini_test::AssertionFailed(std::string("CHECK_TRUE failed: ") + #cond);         \
    } while (0)

#define CHECK_EQ(a, b)                                                                            \
    do {                                                                                          \
        const auto _va = (a);                                                                     \
        const auto _vb = (b);                                                                     \
        if (!(_va == _vb)) {                                                                      \
            throw mini_test::AssertionFailed(std::string("CHECK_EQ failed: ") + #a " vs " #b);    \
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

static void testDefaultRule() {
    TokenEstimator estimator;
    CHECK_EQ(estimator.estimateTokens("abcdefgh"), static_cast<std::size_t>(6)); // 8*0.25 + 4
    CHECK_EQ(estimator.estimateTokens("abc"), static_cast<std::size_t>(5));      // 0.75 + 4 向上取整
}

static void testEmptyTextReturnsOverhead() {
    TokenEstimator estimator;
    CHECK_EQ(estimator.estimateTokens(""), static_cast<std::size_t>(4));
    CHECK_EQ(estimator.estimateTokens("any-model", ""), static_cast<std::size_t>(4));
}

static void testCustomModelRule() {
    TokenEstimator estimator;
    estimator.setModelRule("Custom-Model", TokenModelRule{0.5, 2});
    // 模型ID大小写不敏感
    CHECK_EQ(estimator.estimateTokens("custom-model", "abcd"), static_cast<std::size_t>(4));
    CHECK_EQ(estimator.getModelRule("CUSTOM-MODEL").fixedOverhead, static_cast<std::size_t>(2));
    // 未配置的模型回退默认规则
    CHECK_EQ(estimator.estimateTokens("other", "abcd"), static_cast<std::size_t>(5));
}

static void testDefaultRuleOverride() {
    TokenEstimator estimator({{"m", TokenModelRule{1.0, 0}}});
    estimator.setDefaultRule(TokenModelRule{0.5, 1});
    CHECK_EQ(estimator.estimateTokens("abcd"), static_cast<std::size_t>(3));
    CHECK_EQ(estimator.estimateTokens("M", "abcd"), static_cast<std::size_t>(4));
}

static void testEstimateGrowsWithText() {
    TokenEstimator estimator;
    const std::string shortText(40, 'x');
    const std::string longText(4000, 'x');
    CHECK_TRUE(estimator.estimateTokens(longText) > estimator.estimateTokens(shortText));
    CHECK_EQ(estimator.estimateTokens(longText), static_cast<std::size_t>(1004));
}

int main() {
    std::vector<mini_test::TestCase> cases{
        {"Default rule", testDefaultRule},
        {"Empty text returns overhead", testEmptyTextReturnsOverhead},
        {"Custom model rule", testCustomModelRule},
        {"Default rule override", testDefaultRuleOverride},
        {"Estimate grows with text", testEstimateGrowsWithText},
    };
    return mini_test::run(cases);
}
