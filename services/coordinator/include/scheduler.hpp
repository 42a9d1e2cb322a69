#pragma once
#include "agent_registry.hpp"
#include "task_store.hpp"
#include <cstddef>
#include <string>
#include <vector>

struct Assignment {
    std::string task_id;
    std::string agent_id;
};

// One scheduling pass over the current tasks and agents. The caller holds
// whatever lock guards both, so every match lands as a unit.
class Scheduler {
public:
    // max_working_agents == 0 means no cap.
    explicit Scheduler(std::size_t max_working_agents = 0) : max_working_(max_working_agents) {}

    std::vector<Assignment> tick(TaskStore& tasks, AgentRegistry& agents, TimePoint now,
                                 SteadyTime at = SteadyClock::now()) const;

private:
    std::size_t max_working_;
};
