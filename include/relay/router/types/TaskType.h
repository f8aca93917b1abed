#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace relay::router::types {

// Task types a model can be registered for (wire strings are lower snake case)
enum class TaskType {
    Simple,
    Dialog,
    Code,
    Summarize,
    Lookup,
    ShortAnswer,
    Vision
};

inline std::string taskTypeToString(TaskType v) {
    switch (v) {
        case TaskType::Simple: return "simple";
        case TaskType::Dialog: return "dialog";
        case TaskType::Code: return "code";
        case TaskType::Summarize: return "summarize";
        case TaskType::Lookup: return "lookup";
        case TaskType::ShortAnswer: return "short_answer";
        case TaskType::Vision: return "vision";
    }
    return "unknown";
}

namespace task_type_detail {
inline char asciiLower(char c) {
    if (c >= 'A' && c <= 'Z') return static_cast<char>(c - 'A' + 'a');
    return c;
}
inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (asciiLower(a[i]) != asciiLower(b[i])) return false;
    }
    return true;
}
} // namespace task_type_detail

// String to enum (case-insensitive). Accepts "coding" and "chat" as aliases.
inline std::optional<TaskType> stringToTaskType(std::string_view s) {
    using task_type_detail::iequals;
    if (iequals(s, "simple")) return TaskType::Simple;
    if (iequals(s, "dialog") || iequals(s, "chat")) return TaskType::Dialog;
    if (iequals(s, "code") || iequals(s, "coding")) return TaskType::Code;
    if (iequals(s, "summarize")) return TaskType::Summarize;
    if (iequals(s, "lookup")) return TaskType::Lookup;
    if (iequals(s, "short_answer") || iequals(s, "shortanswer")) return TaskType::ShortAnswer;
    if (iequals(s, "vision")) return TaskType::Vision;
    return std::nullopt;
}

} // namespace relay::router::types
