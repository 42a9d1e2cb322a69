#pragma once
#include "task.hpp"
#include <chrono>
#include <cstddef>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

// Why a dependency is still unmet.
enum class DependencyState {
    Pending, // exists and may still complete
    Missing, // no task with that id
    Failed,  // permanently failed
    Cycle    // depends (transitively) on the waiting task itself
};

const char* to_string(DependencyState s);

struct UnmetDependency {
    std::string task_id;
    DependencyState state{DependencyState::Pending};
};

struct BlockedTask {
    std::string task_id;
    std::vector<UnmetDependency> unmet;
    bool satisfiable{true}; // false if no chain of completions can ever unblock it
};

// Pending queue position: priority descending, then insertion sequence.
struct QueueKey {
    TaskPriority priority;
    std::uint64_t sequence;
    std::string id;
};

struct QueueOrder {
    bool operator()(const QueueKey& a, const QueueKey& b) const;
};

// Owns task records. Not synchronized; the Coordinator serializes access.
class TaskStore {
public:
    // An empty id gets a generated one; a taken id throws InvalidArgument.
    const Task& create(std::string title, std::string description, TaskPriority priority,
                       std::set<std::string> dependencies,
                       std::set<std::string> required_capabilities, TimePoint now,
                       std::string id = {});

    const Task* find(const std::string& id) const;
    const Task& get(const std::string& id) const;

    // Pending tasks whose dependencies are all completed, in queue order.
    std::vector<Task> ready_tasks() const;
    // Pending tasks with at least one unmet dependency.
    std::vector<BlockedTask> blocked_tasks() const;
    // Assigned/in-progress tasks whose current attempt started before now - timeout.
    std::vector<std::string> timed_out(SteadyTime now, std::chrono::milliseconds timeout) const;

    std::vector<Task> all() const; // creation order
    std::size_t pending_count() const { return queue_.size(); }
    std::size_t size() const { return order_.size(); }

    void mark_assigned(const std::string& id, const std::string& agent_id, TimePoint now,
                       SteadyTime at = SteadyClock::now());
    void mark_in_progress(const std::string& id);
    void mark_completed(const std::string& id, std::string result, TimePoint now);
    // Counts the failure; returns true if the task went back to pending.
    // A task with cancel_requested set always fails for good.
    bool record_failure(const std::string& id, std::string error, int max_retries, TimePoint now);
    void cancel_pending(const std::string& id, TimePoint now);
    void request_cancel(const std::string& id);

private:
    Task& get_mutable(const std::string& id);
    void set_status(Task& t, TaskStatus to);
    void enqueue(const Task& t);
    void dequeue(const Task& t);
    bool dependencies_met(const Task& t) const;
    bool can_complete(const std::string& id, std::unordered_map<std::string, int>& marks) const;
    bool reaches(const std::string& from, const std::string& target) const;

    std::unordered_map<std::string, Task> tasks_;
    std::vector<std::string> order_;
    std::set<QueueKey, QueueOrder> queue_;
    std::uint64_t next_sequence_{0};
};
