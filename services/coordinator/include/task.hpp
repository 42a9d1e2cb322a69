#pragma once
#include "util.hpp"
#include <cstdint>
#include <optional>
#include <set>
#include <string>

enum class TaskPriority { Low = 1, Medium = 2, High = 3, Critical = 4 };

enum class TaskStatus { Pending, Assigned, InProgress, Completed, Failed };

struct Task {
    std::string id;          // uuid, generated at creation
    std::string title;
    std::string description;
    TaskPriority priority{TaskPriority::Medium};
    TaskStatus status{TaskStatus::Pending};
    std::optional<std::string> assigned_agent; // only while assigned/in_progress
    std::set<std::string> dependencies;
    std::set<std::string> required_capabilities;
    TimePoint created_at{};
    std::optional<TimePoint> started_at;   // first assignment
    std::optional<SteadyTime> assigned_at; // current attempt, for timeouts
    std::optional<TimePoint> completed_at;
    std::optional<std::string> result;
    std::optional<std::string> error;
    int retry_count{0};
    std::uint64_t sequence{0}; // creation order
    bool cancel_requested{false};
};

const char* to_string(TaskPriority p);
const char* to_string(TaskStatus s);

// Accepts "low".."critical" (any case) or "1".."4".
std::optional<TaskPriority> parse_priority(const std::string& s);

bool is_terminal(TaskStatus s);
bool is_allowed_transition(TaskStatus from, TaskStatus to);
