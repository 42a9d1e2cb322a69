#pragma once
#include "agent.hpp"
#include <string>

// Source of agent definitions by role. The role catalog itself lives outside
// the coordinator; implementations throw UnknownRole for roles they lack.
class AgentTemplateProvider {
public:
    virtual ~AgentTemplateProvider() = default;
    virtual AgentSpec create_agent(const std::string& role, const std::string& instance_id,
                                   const std::string& project_path) const = 0;
};
