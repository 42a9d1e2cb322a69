#include "agent_registry.hpp"
#include "errors.hpp"
#include <algorithm>
#include <utility>

const Agent& AgentRegistry::add(Agent agent, TimePoint now) {
    if (agent.id.empty()) throw InvalidArgument("agent id must not be empty");
    if (agent.max_concurrent_tasks < 1) {
        throw InvalidArgument("agent " + agent.id + ": max_concurrent_tasks must be >= 1");
    }
    if (agents_.count(agent.id)) throw DuplicateAgent(agent.id);

    agent.status = AgentStatus::Idle;
    agent.current_task.reset();
    agent.blocked_task.reset();
    agent.last_activity = now;
    agent.registered_sequence = next_sequence_++;

    std::string key = agent.id;
    auto it = agents_.emplace(key, std::move(agent)).first;
    order_.push_back(key);
    for (const auto& cap : it->second.capabilities) {
        capability_index_[cap].insert(it->first);
    }
    return it->second;
}

const Agent* AgentRegistry::find(const std::string& id) const {
    auto it = agents_.find(id);
    return it == agents_.end() ? nullptr : &it->second;
}

const Agent& AgentRegistry::get(const std::string& id) const {
    auto it = agents_.find(id);
    if (it == agents_.end()) throw UnknownAgent(id);
    return it->second;
}

std::vector<Agent> AgentRegistry::find_idle_with_capabilities(const std::set<std::string>& required) const {
    std::vector<const Agent*> candidates;
    if (required.empty()) {
        for (const auto& id : order_) candidates.push_back(&agents_.at(id));
    } else {
        // Walk the smallest index set and check the rest against each agent.
        const std::set<std::string>* smallest = nullptr;
        for (const auto& cap : required) {
            auto it = capability_index_.find(cap);
            if (it == capability_index_.end()) return {};
            if (!smallest || it->second.size() < smallest->size()) smallest = &it->second;
        }
        for (const auto& id : *smallest) {
            const Agent& a = agents_.at(id);
            if (std::includes(a.capabilities.begin(), a.capabilities.end(),
                              required.begin(), required.end())) {
                candidates.push_back(&a);
            }
        }
    }

    std::vector<Agent> out;
    for (const Agent* a : candidates) {
        if (a->status == AgentStatus::Idle) out.push_back(*a);
    }
    std::sort(out.begin(), out.end(), [](const Agent& x, const Agent& y) {
        if (x.last_activity != y.last_activity) return x.last_activity < y.last_activity;
        return x.registered_sequence < y.registered_sequence;
    });
    return out;
}

const Agent& AgentRegistry::transition(const std::string& agent_id, AgentStatus to,
                                       std::optional<std::string> task, TimePoint now) {
    auto it = agents_.find(agent_id);
    if (it == agents_.end()) throw UnknownAgent(agent_id);
    Agent& a = it->second;

    if (!is_allowed_transition(a.status, to)) {
        throw InvalidTransition("agent " + agent_id + ": " + to_string(a.status) + " -> " + to_string(to));
    }
    if (to == AgentStatus::Working) {
        if (!task && a.status == AgentStatus::Waiting) task = a.blocked_task;
        if (!task || task->empty()) {
            throw InvalidTransition("agent " + agent_id + ": working requires a task");
        }
        a.current_task = std::move(task);
        a.blocked_task.reset();
    } else if (to == AgentStatus::Waiting) {
        a.blocked_task = a.current_task;
        a.current_task.reset();
    } else {
        a.current_task.reset();
        a.blocked_task.reset();
    }
    a.status = to;
    a.last_activity = now;
    return a;
}

std::vector<Agent> AgentRegistry::all() const {
    std::vector<Agent> out;
    out.reserve(order_.size());
    for (const auto& id : order_) out.push_back(agents_.at(id));
    return out;
}

std::size_t AgentRegistry::count(AgentStatus status) const {
    return static_cast<std::size_t>(std::count_if(agents_.begin(), agents_.end(),
        [&](const std::pair<const std::string, Agent>& kv){ return kv.second.status == status; }));
}
