#include "coordinator.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include "log.hpp"
#include <utility>

using json = nlohmann::json;

Coordinator::Coordinator(CoordinatorConfig config, std::shared_ptr<Notifier> notifier)
    : config_(std::move(config)),
      notifier_(notifier ? std::move(notifier) : std::make_shared<NullNotifier>()),
      scheduler_(static_cast<std::size_t>(config_.max_concurrent_agents)),
      bus_(config_.message_retention()) {
    validate_config(config_);
}

Coordinator::~Coordinator() {
    stop();
}

Agent Coordinator::register_agent(Agent agent) {
    Events events;
    Agent out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        TimePoint now = Clock::now();
        out = agents_.add(std::move(agent), now);
        json caps = json::array();
        for (const auto& c : out.capabilities) caps.push_back(c);
        events.push_back({"agent_registered", {
            {"agent_id", out.id},
            {"agent_name", out.name},
            {"role", out.role},
            {"capabilities", caps}
        }});
        maybe_tick_locked(now, events);
    }
    log_info("Registered agent: " + out.name + " (" + out.role + ")");
    dispatch(events);
    return out;
}

Agent Coordinator::register_from_template(const AgentTemplateProvider& provider, const std::string& role,
                                          const std::string& instance_id, const std::string& project_path) {
    AgentSpec spec = provider.create_agent(role, instance_id, project_path);
    return register_agent(agent_from_spec(spec));
}

Agent Coordinator::transition_agent(const std::string& agent_id, AgentStatus to) {
    Events events;
    Agent out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        TimePoint now = Clock::now();
        const Agent& a = agents_.get(agent_id);
        if (a.status == AgentStatus::Working && a.current_task &&
            (to == AgentStatus::Completed || to == AgentStatus::Error)) {
            std::string task_id = *a.current_task;
            if (to == AgentStatus::Completed) complete_locked(task_id, std::string(), now, events);
            else fail_locked(task_id, "agent reported error", now, events);
        } else {
            AgentStatus from = a.status;
            agents_.transition(agent_id, to, std::nullopt, now);
            events.push_back({"agent_status_changed", {
                {"agent_id", agent_id}, {"from", to_string(from)}, {"to", to_string(to)}
            }});
        }
        maybe_tick_locked(now, events);
        out = agents_.get(agent_id);
    }
    dispatch(events);
    return out;
}

std::optional<Agent> Coordinator::find_agent(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const Agent* a = agents_.find(id);
    if (!a) return std::nullopt;
    return *a;
}

std::string Coordinator::create_task(const std::string& title, const std::string& description,
                                     TaskPriority priority, const std::set<std::string>& dependencies,
                                     const std::set<std::string>& required_capabilities,
                                     const std::string& id) {
    Events events;
    std::string created;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        TimePoint now = Clock::now();
        const Task& t = tasks_.create(title, description, priority, dependencies, required_capabilities, now, id);
        created = t.id;
        events.push_back({"task_created", task_to_json(t)});
        maybe_tick_locked(now, events);
    }
    log_info("Created task: " + title + " (Priority: " + to_string(priority) + ")");
    dispatch(events);
    return created;
}

std::optional<Task> Coordinator::find_task(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const Task* t = tasks_.find(id);
    if (!t) return std::nullopt;
    return *t;
}

std::size_t Coordinator::schedule_tick() {
    Events events;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        tick_locked(Clock::now(), events);
    }
    dispatch(events);
    std::size_t assigned = 0;
    for (const auto& e : events) {
        if (e.type == "task_assigned") ++assigned;
    }
    return assigned;
}

void Coordinator::start_task(const std::string& task_id) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        tasks_.mark_in_progress(task_id);
        const Task& t = tasks_.get(task_id);
        events.push_back({"task_started", {{"task_id", task_id}, {"agent_id", t.assigned_agent.value_or("")}}});
    }
    dispatch(events);
}

void Coordinator::complete_task(const std::string& task_id, const std::string& result) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        TimePoint now = Clock::now();
        complete_locked(task_id, result, now, events);
        maybe_tick_locked(now, events);
    }
    dispatch(events);
}

void Coordinator::fail_task(const std::string& task_id, const std::string& error) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        TimePoint now = Clock::now();
        fail_locked(task_id, error, now, events);
        maybe_tick_locked(now, events);
    }
    dispatch(events);
}

void Coordinator::cancel_task(const std::string& task_id) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        const Task& t = tasks_.get(task_id);
        if (is_terminal(t.status)) {
            throw InvalidTransition("task " + task_id + " is already " + to_string(t.status));
        }
        if (t.status == TaskStatus::Pending) {
            tasks_.cancel_pending(task_id, Clock::now());
            events.push_back({"task_cancelled", {{"task_id", task_id}, {"cancel_requested", false}}});
        } else {
            // Running attempts are only flagged; the worker reports back.
            tasks_.request_cancel(task_id);
            events.push_back({"task_cancelled", {
                {"task_id", task_id}, {"cancel_requested", true}, {"agent_id", t.assigned_agent.value_or("")}
            }});
        }
    }
    dispatch(events);
}

std::size_t Coordinator::check_timeouts(SteadyTime steady_now) {
    if (config_.task_timeout_minutes <= 0) return 0;
    Events events;
    std::size_t expired = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        TimePoint now = Clock::now();
        for (const auto& id : tasks_.timed_out(steady_now, config_.task_timeout())) {
            const Task& t = tasks_.get(id);
            events.push_back({"task_timeout", {{"task_id", id}, {"agent_id", t.assigned_agent.value_or("")}}});
            fail_locked(id, "timed out", now, events);
            ++expired;
        }
        if (expired) maybe_tick_locked(now, events);
    }
    if (expired) log_warn(std::to_string(expired) + " task(s) timed out");
    dispatch(events);
    return expired;
}

std::vector<BlockedTask> Coordinator::blocked_tasks() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return tasks_.blocked_tasks();
}

Message Coordinator::post_message(Message msg) {
    Message stored = bus_.post(std::move(msg));
    Events events;
    events.push_back(Event{"message_posted", message_to_json(stored)});
    dispatch(events);
    return stored;
}

MessageRange Coordinator::messages_since(const std::string& agent_id, TimePoint from) const {
    return bus_.since(agent_id, from);
}

StatusSnapshot Coordinator::status() const {
    StatusSnapshot s;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        s.agents = agents_.all();
        s.tasks = tasks_.all();
        s.queue_size = tasks_.pending_count();
    }
    s.message_count = bus_.size();
    s.running = running_.load();
    return s;
}

void Coordinator::start() {
    if (running_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(loop_mtx_);
        stopping_ = false;
    }
    loop_thread_ = std::thread([this]{ loop(); });
    log_info("Coordination loop started");
}

void Coordinator::stop() {
    {
        std::lock_guard<std::mutex> lock(loop_mtx_);
        stopping_ = true;
    }
    loop_cv_.notify_all();
    if (loop_thread_.joinable()) {
        loop_thread_.join();
        log_info("Coordination loop stopped");
    }
    running_.store(false);
}

void Coordinator::loop() {
    std::unique_lock<std::mutex> lock(loop_mtx_);
    while (!stopping_) {
        if (loop_cv_.wait_for(lock, config_.health_check_period(), [this]{ return stopping_; })) break;
        lock.unlock();
        try {
            check_timeouts();
            std::size_t purged = bus_.purge_expired(Clock::now());
            if (purged) log_debug("purged " + std::to_string(purged) + " expired messages");
            if (config_.auto_assign_tasks) schedule_tick();
        } catch (const std::exception& e) {
            log_error(std::string("coordination pass failed: ") + e.what());
        }
        lock.lock();
    }
}

void Coordinator::tick_locked(TimePoint now, Events& events) {
    for (const auto& a : scheduler_.tick(tasks_, agents_, now, SteadyClock::now())) {
        const Task& t = tasks_.get(a.task_id);
        events.push_back({"task_assigned", {
            {"task_id", a.task_id},
            {"agent_id", a.agent_id},
            {"title", t.title},
            {"priority", static_cast<int>(t.priority)}
        }});
        log_info("Assigned task " + t.title + " to agent " + a.agent_id);
    }
}

void Coordinator::maybe_tick_locked(TimePoint now, Events& events) {
    if (config_.auto_assign_tasks) tick_locked(now, events);
}

void Coordinator::complete_locked(const std::string& task_id, const std::string& result, TimePoint now,
                                  Events& events) {
    std::optional<std::string> agent_id = tasks_.get(task_id).assigned_agent;
    tasks_.mark_completed(task_id, result, now);
    release_agent_locked(agent_id, task_id, AgentStatus::Completed, now, events);
    events.push_back({"task_completed", {
        {"task_id", task_id}, {"agent_id", agent_id.value_or("")}, {"result", result}
    }});
}

void Coordinator::fail_locked(const std::string& task_id, const std::string& error, TimePoint now,
                              Events& events) {
    const Task& before = tasks_.get(task_id);
    std::optional<std::string> agent_id = before.assigned_agent;
    bool cancelled = before.cancel_requested;
    bool requeued = tasks_.record_failure(task_id, error, config_.max_task_retries, now);
    release_agent_locked(agent_id, task_id, AgentStatus::Error, now, events);
    const Task& t = tasks_.get(task_id);
    events.push_back({requeued ? "task_retry" : "task_failed", {
        {"task_id", task_id},
        {"agent_id", agent_id.value_or("")},
        {"error", error},
        {"retry_count", t.retry_count},
        {"cancelled", cancelled}
    }});
    if (!requeued) log_warn("Task " + t.title + " failed permanently: " + error);
}

// Walks the agent bound to task_id back to idle through `via` (completed or error).
void Coordinator::release_agent_locked(const std::optional<std::string>& agent_id, const std::string& task_id,
                                       AgentStatus via, TimePoint now, Events& events) {
    if (!agent_id) return;
    const Agent* a = agents_.find(*agent_id);
    if (!a) return;
    AgentStatus from = a->status;
    if (a->status == AgentStatus::Waiting && a->blocked_task == task_id) {
        agents_.transition(*agent_id, AgentStatus::Working, std::nullopt, now);
    }
    if (a->status != AgentStatus::Working || a->current_task != task_id) return;
    agents_.transition(*agent_id, via, std::nullopt, now);
    agents_.transition(*agent_id, AgentStatus::Idle, std::nullopt, now);
    events.push_back({"agent_status_changed", {
        {"agent_id", *agent_id}, {"from", to_string(from)}, {"via", to_string(via)}, {"to", "idle"}
    }});
}

void Coordinator::dispatch(const Events& events) {
    for (const auto& e : events) {
        try {
            notifier_->notify(e.type, e.payload);
        } catch (const std::exception& ex) {
            log_warn("notifier rejected " + e.type + ": " + ex.what());
        }
    }
}
