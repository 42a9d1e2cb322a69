#include "agent.hpp"

Agent agent_from_spec(const AgentSpec& spec) {
    Agent a;
    a.id = spec.id;
    a.name = spec.name;
    a.role = spec.role;
    a.capabilities.insert(spec.capabilities.begin(), spec.capabilities.end());
    a.project_path = spec.project_path.empty() ? std::string(".") : spec.project_path;
    a.max_concurrent_tasks = spec.max_concurrent_tasks;
    a.prompt = spec.prompt;
    return a;
}

const char* to_string(AgentStatus s) {
    switch (s) {
        case AgentStatus::Idle: return "idle";
        case AgentStatus::Working: return "working";
        case AgentStatus::Waiting: return "waiting";
        case AgentStatus::Error: return "error";
        case AgentStatus::Completed: return "completed";
    }
    return "idle";
}

std::optional<AgentStatus> parse_agent_status(const std::string& s) {
    for (auto st : {AgentStatus::Idle, AgentStatus::Working, AgentStatus::Waiting,
                    AgentStatus::Error, AgentStatus::Completed}) {
        if (s == to_string(st)) return st;
    }
    return std::nullopt;
}

bool is_allowed_transition(AgentStatus from, AgentStatus to) {
    switch (from) {
        case AgentStatus::Idle:
            return to == AgentStatus::Working;
        case AgentStatus::Working:
            return to == AgentStatus::Waiting || to == AgentStatus::Completed ||
                   to == AgentStatus::Error;
        case AgentStatus::Waiting:
            return to == AgentStatus::Working;
        case AgentStatus::Error:
        case AgentStatus::Completed:
            return to == AgentStatus::Idle;
    }
    return false;
}
