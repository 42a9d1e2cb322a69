#pragma once
#include "util.hpp"
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class AgentStatus { Idle, Working, Waiting, Error, Completed };

// What a template provider hands back for a role + instance id.
struct AgentSpec {
    std::string id;
    std::string name;
    std::string role;
    std::vector<std::string> capabilities;
    std::string project_path{"."};
    int max_concurrent_tasks{1}; // reserved; agents run one task at a time
    std::string prompt;          // opaque to the coordinator
};

struct Agent {
    std::string id;
    std::string name;
    std::string role;
    std::set<std::string> capabilities;
    AgentStatus status{AgentStatus::Idle};
    std::optional<std::string> current_task; // set iff status == Working
    std::optional<std::string> blocked_task; // parked while Waiting
    std::string project_path{"."};
    int max_concurrent_tasks{1};
    std::string prompt;
    TimePoint last_activity{};
    std::uint64_t registered_sequence{0};
};

Agent agent_from_spec(const AgentSpec& spec);

const char* to_string(AgentStatus s);
std::optional<AgentStatus> parse_agent_status(const std::string& s);
bool is_allowed_transition(AgentStatus from, AgentStatus to);
