#include "task.hpp"
#include <algorithm>
#include <cctype>

const char* to_string(TaskPriority p) {
    switch (p) {
        case TaskPriority::Low: return "LOW";
        case TaskPriority::Medium: return "MEDIUM";
        case TaskPriority::High: return "HIGH";
        case TaskPriority::Critical: return "CRITICAL";
    }
    return "MEDIUM";
}

const char* to_string(TaskStatus s) {
    switch (s) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Assigned: return "assigned";
        case TaskStatus::InProgress: return "in_progress";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
    }
    return "pending";
}

std::optional<TaskPriority> parse_priority(const std::string& s) {
    std::string n = s;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (n == "low" || n == "1") return TaskPriority::Low;
    if (n == "medium" || n == "2") return TaskPriority::Medium;
    if (n == "high" || n == "3") return TaskPriority::High;
    if (n == "critical" || n == "4") return TaskPriority::Critical;
    return std::nullopt;
}

bool is_terminal(TaskStatus s) {
    return s == TaskStatus::Completed || s == TaskStatus::Failed;
}

bool is_allowed_transition(TaskStatus from, TaskStatus to) {
    switch (from) {
        case TaskStatus::Pending:
            // assigned by a tick, failed by cancellation
            return to == TaskStatus::Assigned || to == TaskStatus::Failed;
        case TaskStatus::Assigned:
            return to == TaskStatus::InProgress || to == TaskStatus::Completed ||
                   to == TaskStatus::Failed || to == TaskStatus::Pending;
        case TaskStatus::InProgress:
            return to == TaskStatus::Completed || to == TaskStatus::Failed ||
                   to == TaskStatus::Pending;
        case TaskStatus::Completed:
        case TaskStatus::Failed:
            return false;
    }
    return false;
}
