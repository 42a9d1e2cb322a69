#include "task_store.hpp"
#include "errors.hpp"
#include <utility>
#include <unordered_set>

const char* to_string(DependencyState s) {
    switch (s) {
        case DependencyState::Pending: return "pending";
        case DependencyState::Missing: return "missing";
        case DependencyState::Failed: return "failed";
        case DependencyState::Cycle: return "cycle";
    }
    return "pending";
}

bool QueueOrder::operator()(const QueueKey& a, const QueueKey& b) const {
    if (a.priority != b.priority) return static_cast<int>(a.priority) > static_cast<int>(b.priority);
    return a.sequence < b.sequence;
}

const Task& TaskStore::create(std::string title, std::string description, TaskPriority priority,
                              std::set<std::string> dependencies,
                              std::set<std::string> required_capabilities, TimePoint now,
                              std::string id) {
    if (title.empty()) throw InvalidArgument("task title must not be empty");
    if (!id.empty() && tasks_.count(id)) throw InvalidArgument("task id already exists: " + id);
    Task t;
    t.id = std::move(id);
    while (t.id.empty() || tasks_.count(t.id)) t.id = gen_id();
    t.title = std::move(title);
    t.description = std::move(description);
    t.priority = priority;
    t.dependencies = std::move(dependencies);
    t.required_capabilities = std::move(required_capabilities);
    t.created_at = now;
    t.sequence = next_sequence_++;
    std::string key = t.id;
    auto it = tasks_.emplace(key, std::move(t)).first;
    order_.push_back(key);
    enqueue(it->second);
    return it->second;
}

const Task* TaskStore::find(const std::string& id) const {
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

const Task& TaskStore::get(const std::string& id) const {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) throw UnknownTask(id);
    return it->second;
}

Task& TaskStore::get_mutable(const std::string& id) {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) throw UnknownTask(id);
    return it->second;
}

void TaskStore::set_status(Task& t, TaskStatus to) {
    if (!is_allowed_transition(t.status, to)) {
        throw InvalidTransition("task " + t.id + ": " + to_string(t.status) + " -> " + to_string(to));
    }
    if (t.status == TaskStatus::Pending) dequeue(t);
    t.status = to;
    if (to == TaskStatus::Pending) enqueue(t);
}

void TaskStore::enqueue(const Task& t) {
    queue_.insert(QueueKey{t.priority, t.sequence, t.id});
}

void TaskStore::dequeue(const Task& t) {
    queue_.erase(QueueKey{t.priority, t.sequence, t.id});
}

bool TaskStore::dependencies_met(const Task& t) const {
    for (const auto& dep : t.dependencies) {
        const Task* d = find(dep);
        if (!d || d->status != TaskStatus::Completed) return false;
    }
    return true;
}

std::vector<Task> TaskStore::ready_tasks() const {
    std::vector<Task> out;
    for (const auto& key : queue_) {
        const Task& t = tasks_.at(key.id);
        if (dependencies_met(t)) out.push_back(t);
    }
    return out;
}

// marks: 1 = on the current path, 2 = can complete, 3 = cannot
bool TaskStore::can_complete(const std::string& id, std::unordered_map<std::string, int>& marks) const {
    const Task* t = find(id);
    if (!t || t->status == TaskStatus::Failed) return false;
    if (t->status != TaskStatus::Pending) return true;
    auto it = marks.find(id);
    if (it != marks.end()) return it->second == 2;
    marks[id] = 1;
    bool ok = true;
    for (const auto& dep : t->dependencies) {
        if (!can_complete(dep, marks)) { ok = false; break; }
    }
    marks[id] = ok ? 2 : 3;
    return ok;
}

bool TaskStore::reaches(const std::string& from, const std::string& target) const {
    std::vector<std::string> stack{from};
    std::unordered_set<std::string> seen;
    while (!stack.empty()) {
        std::string cur = stack.back();
        stack.pop_back();
        if (cur == target) return true;
        if (!seen.insert(cur).second) continue;
        const Task* t = find(cur);
        if (!t || t->status != TaskStatus::Pending) continue;
        for (const auto& dep : t->dependencies) stack.push_back(dep);
    }
    return false;
}

std::vector<BlockedTask> TaskStore::blocked_tasks() const {
    std::vector<BlockedTask> out;
    std::unordered_map<std::string, int> marks;
    for (const auto& key : queue_) {
        const Task& t = tasks_.at(key.id);
        BlockedTask b;
        b.task_id = t.id;
        for (const auto& dep : t.dependencies) {
            const Task* d = find(dep);
            if (d && d->status == TaskStatus::Completed) continue;
            UnmetDependency u{dep, DependencyState::Pending};
            if (!d) u.state = DependencyState::Missing;
            else if (d->status == TaskStatus::Failed) u.state = DependencyState::Failed;
            else if (reaches(dep, t.id)) u.state = DependencyState::Cycle;
            b.unmet.push_back(std::move(u));
        }
        if (b.unmet.empty()) continue;
        b.satisfiable = can_complete(t.id, marks);
        out.push_back(std::move(b));
    }
    return out;
}

std::vector<std::string> TaskStore::timed_out(SteadyTime now, std::chrono::milliseconds timeout) const {
    std::vector<std::string> out;
    for (const auto& id : order_) {
        const Task& t = tasks_.at(id);
        if (t.status != TaskStatus::Assigned && t.status != TaskStatus::InProgress) continue;
        if (t.assigned_at && now - *t.assigned_at > timeout) out.push_back(id);
    }
    return out;
}

std::vector<Task> TaskStore::all() const {
    std::vector<Task> out;
    out.reserve(order_.size());
    for (const auto& id : order_) out.push_back(tasks_.at(id));
    return out;
}

void TaskStore::mark_assigned(const std::string& id, const std::string& agent_id, TimePoint now,
                              SteadyTime at) {
    Task& t = get_mutable(id);
    set_status(t, TaskStatus::Assigned);
    t.assigned_agent = agent_id;
    if (!t.started_at) t.started_at = now;
    t.assigned_at = at;
    t.cancel_requested = false;
}

void TaskStore::mark_in_progress(const std::string& id) {
    Task& t = get_mutable(id);
    set_status(t, TaskStatus::InProgress);
}

void TaskStore::mark_completed(const std::string& id, std::string result, TimePoint now) {
    Task& t = get_mutable(id);
    set_status(t, TaskStatus::Completed);
    t.assigned_agent.reset();
    t.assigned_at.reset();
    t.completed_at = now;
    t.result = std::move(result);
    t.error.reset();
}

bool TaskStore::record_failure(const std::string& id, std::string error, int max_retries, TimePoint now) {
    Task& t = get_mutable(id);
    if (t.status != TaskStatus::Assigned && t.status != TaskStatus::InProgress) {
        throw InvalidTransition("task " + id + " is " + to_string(t.status) + ", not running");
    }
    bool requeue = !t.cancel_requested && t.retry_count + 1 < max_retries;
    set_status(t, requeue ? TaskStatus::Pending : TaskStatus::Failed);
    ++t.retry_count;
    t.assigned_agent.reset();
    t.assigned_at.reset();
    t.result.reset();
    t.error = std::move(error);
    t.cancel_requested = false;
    if (!requeue) t.completed_at = now;
    return requeue;
}

void TaskStore::cancel_pending(const std::string& id, TimePoint now) {
    Task& t = get_mutable(id);
    if (t.status != TaskStatus::Pending) {
        throw InvalidTransition("task " + id + " is " + to_string(t.status) + ", not pending");
    }
    set_status(t, TaskStatus::Failed);
    t.error = std::string("cancelled");
    t.completed_at = now;
}

void TaskStore::request_cancel(const std::string& id) {
    Task& t = get_mutable(id);
    if (t.status != TaskStatus::Assigned && t.status != TaskStatus::InProgress) {
        throw InvalidTransition("task " + id + " is " + to_string(t.status) + ", not running");
    }
    t.cancel_requested = true;
}
