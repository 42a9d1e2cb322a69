#include "../include/coordinator_client.hpp"
#include "http.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

CoordinatorClient::CoordinatorClient(std::string base_url) : base_(std::move(base_url)) {
    if (!base_.empty() && base_.back() == '/') base_.pop_back();
}

bool CoordinatorClient::post(const std::string& path, const std::string& body) {
    try {
        auto resp = http_post_json(base_ + path, body, 10000);
        if (!resp.ok()) {
            std::cerr << "[agent_sdk] POST " << path << " -> " << resp.status << " " << resp.body << std::endl;
        }
        return resp.ok();
    } catch (const std::exception& e) {
        std::cerr << "[agent_sdk] POST " << path << " failed: " << e.what() << std::endl;
        return false;
    }
}

bool CoordinatorClient::register_agent(const AgentRegistration& reg) {
    json j = {
        {"id", reg.id},
        {"name", reg.name.empty() ? reg.id : reg.name},
        {"role", reg.role},
        {"capabilities", reg.capabilities},
        {"project_path", reg.project_path}
    };
    return post("/agents", j.dump());
}

std::optional<TaskAssignment> CoordinatorClient::current_assignment(const std::string& agent_id) {
    try {
        auto agent = http_get(base_ + "/agents/" + url_escape(agent_id), 10000);
        if (!agent.ok()) return std::nullopt;
        auto a = json::parse(agent.body);
        auto cur = a.value("current_task", json());
        if (!cur.is_string()) return std::nullopt;

        auto task = http_get(base_ + "/tasks/" + url_escape(cur.get<std::string>()), 10000);
        if (!task.ok()) return std::nullopt;
        auto t = json::parse(task.body);
        TaskAssignment out;
        out.task_id = t.at("id").get<std::string>();
        out.title = t.value("title", std::string());
        out.description = t.value("description", std::string());
        out.status = t.value("status", std::string());
        out.cancel_requested = t.value("cancel_requested", false);
        return out;
    } catch (const std::exception& e) {
        std::cerr << "[agent_sdk] poll failed: " << e.what() << std::endl;
        return std::nullopt;
    }
}

bool CoordinatorClient::start(const std::string& task_id) {
    return post("/tasks/" + url_escape(task_id) + "/start", "{}");
}

bool CoordinatorClient::complete(const std::string& task_id, const std::string& result) {
    return post("/tasks/" + url_escape(task_id) + "/complete", json({{"result", result}}).dump());
}

bool CoordinatorClient::fail(const std::string& task_id, const std::string& error) {
    return post("/tasks/" + url_escape(task_id) + "/fail", json({{"error", error}}).dump());
}

bool CoordinatorClient::post_message(const std::string& from, const std::string& to, const std::string& type,
                                     const std::string& content) {
    json j = {{"from_agent", from}, {"to_agent", to}, {"message_type", type}, {"content", content}};
    return post("/messages", j.dump());
}
