#include "relay/router/ComplexityClassifier.h"

#include "relay/router/ConfigManager.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <initializer_list>
#include <sstream>
#include <vector>

namespace relay::router {

namespace {

constexpr int kMaxMarkerBonus = 2;
constexpr std::size_t kSimpleMaxWords = 12;

const std::initializer_list<const char*> kConnectives = {
    "and then", ", then", " then ", "after that", "afterwards", "finally"};
const std::initializer_list<const char*> kStepMarkers = {
    "step 1", "step 2", "step 3", "first,", "second,"};

const std::initializer_list<const char*> kCodeKeywords = {
    "code", "function", "class", "bug", "debug", "refactor", "compile", "script",
    "python", "c++", "javascript", "typescript", "api", "implement", "unit test"};
const std::initializer_list<const char*> kMultiFileKeywords = {
    "files", "multiple files", "multi-file", "modules", "across the codebase",
    "codebase", "repository", "project structure"};
const std::initializer_list<const char*> kBusinessKeywords = {
    "strategy", "marketing", "business plan", "budget", "revenue", "go-to-market",
    "market analysis", "pricing", "audience segmentation"};
const std::initializer_list<const char*> kResearchKeywords = {
    "research", "analyze", "analyse", "analysis", "compare", "investigate", "survey", "literature"};
const std::initializer_list<const char*> kCreativeKeywords = {
    "poem", "story", "lyrics", "novel", "slogan", "creative", "fiction"};

const std::initializer_list<const char*> kQuestionWords = {
    "what", "who", "when", "where", "which", "is", "are", "does", "do"};

std::string toLowerCopy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> splitWords(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream iss(s);
    std::string w;
    while (iss >> w) words.push_back(w);
    return words;
}

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// 关键词两侧必须是非字母数字，避免 "class" 命中 "classic"
bool containsKeyword(const std::string& text, const std::string& kw) {
    std::size_t pos = text.find(kw);
    while (pos != std::string::npos) {
        const bool leftOk = pos == 0 || !isWordChar(text[pos - 1]) || !isWordChar(kw.front());
        const std::size_t end = pos + kw.size();
        const bool rightOk = end >= text.size() || !isWordChar(text[end]) || !isWordChar(kw.back());
        if (leftOk && rightOk) return true;
        pos = text.find(kw, pos + 1);
    }
    return false;
}

bool containsAny(const std::string& text, std::initializer_list<const char*> keywords) {
    for (const char* kw : keywords) {
        if (containsKeyword(text, kw)) return true;
    }
    return false;
}

bool containsAnySubstring(const std::string& text, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (text.find(n) != std::string::npos) return true;
    }
    return false;
}

// 以 "N."、"N)"、"- "、"* " 开头的行数
int countListLines(const std::string& text) {
    int count = 0;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        std::size_t i = 0;
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        if (i >= line.size()) continue;

        if (line[i] == '-' || line[i] == '*') {
            if (i + 1 < line.size() && std::isspace(static_cast<unsigned char>(line[i + 1]))) ++count;
            continue;
        }
        std::size_t j = i;
        while (j < line.size() && std::isdigit(static_cast<unsigned char>(line[j]))) ++j;
        if (j > i && j < line.size() && (line[j] == '.' || line[j] == ')')) ++count;
    }
    return count;
}

// 句末标点后仍有文字即视为多句
bool isSingleSentence(const std::string& text) {
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c != '.' && c != '!' && c != '?') continue;
        if (i + 1 >= text.size() || !std::isspace(static_cast<unsigned char>(text[i + 1]))) continue;
        for (std::size_t k = i + 1; k < text.size(); ++k) {
            if (!std::isspace(static_cast<unsigned char>(text[k]))) return false;
        }
    }
    return true;
}

std::string stripPunct(const std::string& w) {
    std::string out;
    for (char c : w) {
        if (isWordChar(c)) out.push_back(c);
    }
    return out;
}

bool startsWithQuestionWord(const std::vector<std::string>& words) {
    if (words.empty()) return false;
    const auto first = stripPunct(words[0]);
    if (first == "how" && words.size() >= 2) {
        const auto second = stripPunct(words[1]);
        return second == "many" || second == "much";
    }
    for (const char* q : kQuestionWords) {
        if (first == q) return true;
    }
    return false;
}

int baseFromWordCount(std::size_t w) {
    if (w <= 12) return 1;
    if (w <= 40) return 2;
    if (w <= 100) return 3;
    if (w <= 200) return 4;
    return 5;
}

types::RequestCategory detectCategory(const std::string& low) {
    using types::RequestCategory;
    const bool code = containsAny(low, kCodeKeywords);
    if (code && containsAny(low, kMultiFileKeywords)) return RequestCategory::MultiFileCode;
    if (code) return RequestCategory::Coding;
    if (containsAny(low, kBusinessKeywords)) return RequestCategory::BusinessStrategy;
    if (containsAny(low, kResearchKeywords)) return RequestCategory::Research;
    if (containsAny(low, kCreativeKeywords)) return RequestCategory::Creative;
    return RequestCategory::General;
}

} // namespace

ComplexityClassifier::Config ComplexityClassifier::Config::fromConfig(const ConfigManager& cfg) {
    Config c;
    if (auto v = cfg.get("classifier.multi_agent_threshold"); v.has_value() && v->is_number_integer()) {
        const int t = v->get<int>();
        if (t >= 1 && t <= 5) c.multiAgentThreshold = t;
    }
    return c;
}

ComplexityClassifier::ComplexityClassifier(Config config)
    : m_config(config) {
}

types::ComplexityScore ComplexityClassifier::analyze(const std::string& text) const {
    const std::string low = toLowerCopy(text);
    const auto words = splitWords(low);

    int value = baseFromWordCount(words.size());

    // 多步骤标记（每类最多计一次）
    int markerFamilies = 0;
    if (containsAnySubstring(low, kConnectives)) ++markerFamilies;
    if (containsAnySubstring(low, kStepMarkers)) ++markerFamilies;
    if (countListLines(text) >= 2) ++markerFamilies;
    value += std::min(markerFamilies, kMaxMarkerBonus);

    // 枚举
    const auto separators = std::count_if(low.begin(), low.end(), [](char c) { return c == ',' || c == ';'; });
    if (separators >= 3) ++value;

    types::ComplexityScore score;
    score.category = detectCategory(low);
    if (types::isInherentlyMultiStep(score.category)) ++value;

    const bool simple = words.size() <= kSimpleMaxWords &&
                        startsWithQuestionWord(words) &&
                        isSingleSentence(text);
    if (simple) {
        value = std::min(value, 2);
        score.category = types::RequestCategory::Factual;
    }

    score.value = std::clamp(value, 1, 5);
    score.requiresMultiAgent = score.value >= m_config.multiAgentThreshold ||
                               types::isInherentlyMultiStep(score.category);

    if (simple && markerFamilies > 0) {
        score.ambiguous = true;
        score.requiresMultiAgent = true;
    }
    return score;
}

types::TaskType ComplexityClassifier::suggestTaskType(const types::ComplexityScore& score) {
    switch (score.category) {
        case types::RequestCategory::Coding:
        case types::RequestCategory::MultiFileCode:
            return types::TaskType::Code;
        default:
            return types::TaskType::Dialog;
    }
}

} // namespace relay::router
