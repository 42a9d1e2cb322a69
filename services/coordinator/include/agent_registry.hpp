#pragma once
#include "agent.hpp"
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

// Owns agent records and the capability -> agent id index.
// Not synchronized; the Coordinator serializes access.
class AgentRegistry {
public:
    const Agent& add(Agent agent, TimePoint now);

    const Agent* find(const std::string& id) const;
    const Agent& get(const std::string& id) const;

    // Idle agents holding every tag in `required`, longest idle first.
    std::vector<Agent> find_idle_with_capabilities(const std::set<std::string>& required) const;

    // Moves an agent along one edge of the status table. Entering Working needs a
    // task, either passed in or the one parked when the agent went Waiting.
    const Agent& transition(const std::string& agent_id, AgentStatus to,
                            std::optional<std::string> task, TimePoint now);

    std::vector<Agent> all() const; // registration order
    std::size_t count(AgentStatus status) const;
    std::size_t size() const { return order_.size(); }

private:
    std::unordered_map<std::string, Agent> agents_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, std::set<std::string>> capability_index_;
    std::uint64_t next_sequence_{0};
};
