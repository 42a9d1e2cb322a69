#pragma once
#include <string>
#include <optional>
#include <vector>

struct AgentRegistration {
    std::string id;
    std::string name;
    std::string role;
    std::vector<std::string> capabilities;
    std::string project_path{"."};
};

struct TaskAssignment {
    std::string task_id;
    std::string title;
    std::string description;
    std::string status; // assigned | in_progress
    bool cancel_requested{false};
};

// Worker-side access to the coordinator HTTP API. Calls return false / nullopt
// on transport errors or non-2xx replies instead of throwing.
class CoordinatorClient {
public:
    explicit CoordinatorClient(std::string base_url);
    bool register_agent(const AgentRegistration& reg);
    std::optional<TaskAssignment> current_assignment(const std::string& agent_id);
    bool start(const std::string& task_id);
    bool complete(const std::string& task_id, const std::string& result);
    bool fail(const std::string& task_id, const std::string& error);
    bool post_message(const std::string& from, const std::string& to, const std::string& type,
                      const std::string& content);

private:
    bool post(const std::string& path, const std::string& body);

    std::string base_;
};
