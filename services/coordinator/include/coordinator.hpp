#pragma once
#include "agent_registry.hpp"
#include "agent_template.hpp"
#include "config.hpp"
#include "message_bus.hpp"
#include "notifier.hpp"
#include "scheduler.hpp"
#include "task_store.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

struct StatusSnapshot {
    std::vector<Agent> agents;
    std::vector<Task> tasks;
    std::size_t queue_size{0}; // pending tasks
    std::size_t message_count{0};
    bool running{false};
};

// Single coordinating authority over tasks, agents and messages.
//
// Every mutating call takes one mutex covering the task store and the agent
// registry, so a task is never observed assigned to an agent that is not
// working on it. Events raised by a call are handed to the notifier only after
// that mutex is released. With auto_assign_tasks set, each mutation that can
// free an agent or ready a task runs a scheduling tick inside the same
// critical section.
class Coordinator {
public:
    Coordinator(CoordinatorConfig config, std::shared_ptr<Notifier> notifier);
    ~Coordinator();
    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    const CoordinatorConfig& config() const { return config_; }

    Agent register_agent(Agent agent);
    Agent register_from_template(const AgentTemplateProvider& provider, const std::string& role,
                                 const std::string& instance_id, const std::string& project_path = ".");
    // Agent-reported status change. working -> completed / error close out the
    // agent's current task as complete_task / fail_task would.
    Agent transition_agent(const std::string& agent_id, AgentStatus to);
    std::optional<Agent> find_agent(const std::string& id) const;

    std::string create_task(const std::string& title, const std::string& description,
                            TaskPriority priority, const std::set<std::string>& dependencies = {},
                            const std::set<std::string>& required_capabilities = {},
                            const std::string& id = {});
    std::optional<Task> find_task(const std::string& id) const;

    // Returns the number of tasks assigned.
    std::size_t schedule_tick();

    void start_task(const std::string& task_id);
    void complete_task(const std::string& task_id, const std::string& result);
    void fail_task(const std::string& task_id, const std::string& error);
    void cancel_task(const std::string& task_id);
    // Fails every attempt older than the task timeout, measured on the steady
    // clock. Returns how many.
    std::size_t check_timeouts(SteadyTime now = SteadyClock::now());

    std::vector<BlockedTask> blocked_tasks() const;

    Message post_message(Message msg);
    MessageRange messages_since(const std::string& agent_id, TimePoint from) const;

    StatusSnapshot status() const;

    // Background loop: timeouts, message purge, and (with auto-assign) a tick
    // every health_check_interval seconds.
    void start();
    void stop();
    bool running() const { return running_.load(); }

private:
    struct Event {
        std::string type;
        nlohmann::json payload;
    };
    using Events = std::vector<Event>;

    void tick_locked(TimePoint now, Events& events);
    void maybe_tick_locked(TimePoint now, Events& events);
    void fail_locked(const std::string& task_id, const std::string& error, TimePoint now, Events& events);
    void complete_locked(const std::string& task_id, const std::string& result, TimePoint now, Events& events);
    void release_agent_locked(const std::optional<std::string>& agent_id, const std::string& task_id,
                              AgentStatus via, TimePoint now, Events& events);
    void dispatch(const Events& events);
    void loop();

    CoordinatorConfig config_;
    std::shared_ptr<Notifier> notifier_;

    mutable std::mutex mtx_; // guards tasks_ and agents_
    TaskStore tasks_;
    AgentRegistry agents_;
    Scheduler scheduler_;
    MessageBus bus_;

    std::atomic<bool> running_{false};
    std::mutex loop_mtx_;
    std::condition_variable loop_cv_;
    bool stopping_{false};
    std::thread loop_thread_;
};
