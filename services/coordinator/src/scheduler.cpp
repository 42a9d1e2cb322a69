#include "scheduler.hpp"

std::vector<Assignment> Scheduler::tick(TaskStore& tasks, AgentRegistry& agents, TimePoint now,
                                        SteadyTime at) const {
    std::vector<Assignment> out;
    std::size_t working = agents.count(AgentStatus::Working) + agents.count(AgentStatus::Waiting);

    for (const auto& task : tasks.ready_tasks()) {
        if (max_working_ && working >= max_working_) break;
        auto idle = agents.find_idle_with_capabilities(task.required_capabilities);
        if (idle.empty()) continue; // retried next tick
        const std::string& agent_id = idle.front().id;

        // Agent first: it is the only step that can refuse, and the task is
        // known pending, so nothing is half-applied.
        agents.transition(agent_id, AgentStatus::Working, task.id, now);
        tasks.mark_assigned(task.id, agent_id, now, at);
        ++working;
        out.push_back(Assignment{task.id, agent_id});
    }
    return out;
}
