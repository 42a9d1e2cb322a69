#pragma once
#include "agent.hpp"
#include "coordinator.hpp"
#include "message.hpp"
#include "task.hpp"
#include "task_store.hpp"
#include <nlohmann/json.hpp>
#include <set>
#include <string>

// Wire shapes shared by the HTTP service and the observability payloads.
// Timestamps are milliseconds since epoch, absent optionals are null.

nlohmann::json task_to_json(const Task& t);
nlohmann::json agent_to_json(const Agent& a);
nlohmann::json message_to_json(const Message& m);
nlohmann::json blocked_to_json(const BlockedTask& b);
nlohmann::json status_to_json(const StatusSnapshot& s);

// Throw InvalidArgument on missing or mistyped fields.
AgentSpec agent_spec_from_json(const nlohmann::json& j);
Message message_from_json(const nlohmann::json& j);
std::set<std::string> string_set_from_json(const nlohmann::json& j, const char* key);
TaskPriority priority_from_json(const nlohmann::json& j, const char* key);
