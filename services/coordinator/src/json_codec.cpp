#include "json_codec.hpp"
#include "errors.hpp"

using json = nlohmann::json;

namespace {
json opt(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

json opt(const std::optional<TimePoint>& v) {
    return v ? json(to_epoch_ms(*v)) : json(nullptr);
}

json string_array(const std::set<std::string>& s) {
    json arr = json::array();
    for (const auto& v : s) arr.push_back(v);
    return arr;
}

std::string required_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw InvalidArgument(std::string(key) + " must be a string");
    }
    return it->get<std::string>();
}

std::string optional_string(const json& j, const char* key, const std::string& def = {}) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    if (!it->is_string()) throw InvalidArgument(std::string(key) + " must be a string");
    return it->get<std::string>();
}
}

json task_to_json(const Task& t) {
    return json{
        {"id", t.id},
        {"title", t.title},
        {"description", t.description},
        {"priority", static_cast<int>(t.priority)},
        {"priority_name", to_string(t.priority)},
        {"status", to_string(t.status)},
        {"assigned_agent", opt(t.assigned_agent)},
        {"dependencies", string_array(t.dependencies)},
        {"required_capabilities", string_array(t.required_capabilities)},
        {"created_at", to_epoch_ms(t.created_at)},
        {"started_at", opt(t.started_at)},
        {"completed_at", opt(t.completed_at)},
        {"result", opt(t.result)},
        {"error", opt(t.error)},
        {"retry_count", t.retry_count},
        {"cancel_requested", t.cancel_requested}
    };
}

json agent_to_json(const Agent& a) {
    return json{
        {"id", a.id},
        {"name", a.name},
        {"role", a.role},
        {"capabilities", string_array(a.capabilities)},
        {"status", to_string(a.status)},
        {"current_task", opt(a.current_task)},
        {"blocked_task", opt(a.blocked_task)},
        {"project_path", a.project_path},
        {"max_concurrent_tasks", a.max_concurrent_tasks},
        {"last_activity", to_epoch_ms(a.last_activity)}
    };
}

json message_to_json(const Message& m) {
    return json{
        {"id", m.id},
        {"from_agent", m.from_agent},
        {"to_agent", m.to_agent},
        {"message_type", m.message_type},
        {"content", m.content},
        {"timestamp", to_epoch_ms(m.timestamp)},
        {"task_id", opt(m.task_id)}
    };
}

json blocked_to_json(const BlockedTask& b) {
    json unmet = json::array();
    for (const auto& u : b.unmet) {
        unmet.push_back(json{{"task_id", u.task_id}, {"state", to_string(u.state)}});
    }
    return json{{"task_id", b.task_id}, {"unmet", unmet}, {"satisfiable", b.satisfiable}};
}

json status_to_json(const StatusSnapshot& s) {
    json agents = json::object();
    for (const auto& a : s.agents) agents[a.id] = agent_to_json(a);
    json tasks = json::object();
    for (const auto& t : s.tasks) tasks[t.id] = task_to_json(t);
    return json{
        {"agents", agents},
        {"tasks", tasks},
        {"queue_size", s.queue_size},
        {"message_count", s.message_count},
        {"running", s.running}
    };
}

AgentSpec agent_spec_from_json(const json& j) {
    if (!j.is_object()) throw InvalidArgument("agent must be an object");
    AgentSpec spec;
    spec.id = required_string(j, "id");
    spec.name = optional_string(j, "name", spec.id);
    spec.role = optional_string(j, "role");
    for (const auto& c : string_set_from_json(j, "capabilities")) spec.capabilities.push_back(c);
    spec.project_path = optional_string(j, "project_path", ".");
    spec.prompt = optional_string(j, "prompt");
    auto it = j.find("max_concurrent_tasks");
    if (it != j.end() && !it->is_null()) {
        if (!it->is_number_integer()) throw InvalidArgument("max_concurrent_tasks must be an integer");
        spec.max_concurrent_tasks = it->get<int>();
    }
    return spec;
}

Message message_from_json(const json& j) {
    if (!j.is_object()) throw InvalidArgument("message must be an object");
    Message m;
    m.from_agent = required_string(j, "from_agent");
    m.to_agent = required_string(j, "to_agent");
    m.message_type = optional_string(j, "message_type", "info");
    m.content = optional_string(j, "content");
    std::string task_id = optional_string(j, "task_id");
    if (!task_id.empty()) m.task_id = task_id;
    return m;
}

std::set<std::string> string_set_from_json(const json& j, const char* key) {
    std::set<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return out;
    if (!it->is_array()) throw InvalidArgument(std::string(key) + " must be an array of strings");
    for (const auto& v : *it) {
        if (!v.is_string()) throw InvalidArgument(std::string(key) + " must be an array of strings");
        out.insert(v.get<std::string>());
    }
    return out;
}

TaskPriority priority_from_json(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return TaskPriority::Medium;
    std::optional<TaskPriority> p;
    if (it->is_number_integer()) p = parse_priority(std::to_string(it->get<int>()));
    else if (it->is_string()) p = parse_priority(it->get<std::string>());
    if (!p) throw InvalidArgument(std::string(key) + " must be low|medium|high|critical or 1-4");
    return *p;
}
