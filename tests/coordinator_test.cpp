#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include "coordinator.hpp"
#include "errors.hpp"
#include "log.hpp"

using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {
class RecordingNotifier : public Notifier {
public:
    void notify(const std::string& type, const json& payload) override {
        if (on_event) on_event(type);
        std::lock_guard<std::mutex> lock(mtx);
        events.emplace_back(type, payload);
    }

    std::vector<std::string> types() const {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<std::string> out;
        for (const auto& e : events) out.push_back(e.first);
        return out;
    }

    std::size_t count(const std::string& type) const {
        auto t = types();
        return static_cast<std::size_t>(std::count(t.begin(), t.end(), type));
    }

    std::function<void(const std::string&)> on_event;
    mutable std::mutex mtx;
    std::vector<std::pair<std::string, json>> events;
};

class FakeTemplates : public AgentTemplateProvider {
public:
    AgentSpec create_agent(const std::string& role, const std::string& instance_id,
                           const std::string& project_path) const override {
        if (role != "backend_developer") throw UnknownRole(role);
        AgentSpec spec;
        spec.id = role + "-" + instance_id;
        spec.name = "Backend Developer " + instance_id;
        spec.role = role;
        spec.capabilities = {"python", "api", "database"};
        spec.project_path = project_path;
        spec.prompt = "You build server code.";
        return spec;
    }
};

Agent make_agent(const std::string& id, std::set<std::string> caps = {}) {
    Agent a;
    a.id = id;
    a.name = id;
    a.role = "generalist";
    a.capabilities = std::move(caps);
    return a;
}

std::ptrdiff_t position(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) - v.begin();
}
}

class CoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_level(LogLevel::Off);
        notifier = std::make_shared<RecordingNotifier>();
    }

    std::unique_ptr<Coordinator> make(CoordinatorConfig cfg = {}) {
        return std::make_unique<Coordinator>(cfg, notifier);
    }

    std::shared_ptr<RecordingNotifier> notifier;
};

TEST_F(CoordinatorTest, DependentTaskFollowsItsDependency) {
    auto c = make();
    c->register_agent(make_agent("backend", {"python"}));
    std::string a = c->create_task("A", "", TaskPriority::High, {}, {"python"});
    std::string b = c->create_task("B", "", TaskPriority::Critical, {a}, {"python"});

    EXPECT_EQ(c->find_task(a)->status, TaskStatus::Assigned);
    EXPECT_EQ(c->find_task(b)->status, TaskStatus::Pending);

    c->start_task(a);
    c->complete_task(a, "schema ready");

    auto task_b = c->find_task(b);
    EXPECT_EQ(task_b->status, TaskStatus::Assigned);
    EXPECT_EQ(*task_b->assigned_agent, "backend");
    EXPECT_EQ(*c->find_agent("backend")->current_task, b);
    EXPECT_EQ(*c->find_task(a)->result, "schema ready");
}

TEST_F(CoordinatorTest, CapabilityMismatchLeavesAgentIdle) {
    auto c = make();
    c->register_agent(make_agent("py", {"python"}));
    std::string t = c->create_task("compile", "", TaskPriority::Critical, {}, {"go"});

    EXPECT_EQ(c->schedule_tick(), 0u);
    EXPECT_EQ(c->find_task(t)->status, TaskStatus::Pending);
    EXPECT_EQ(c->find_agent("py")->status, AgentStatus::Idle);
}

TEST_F(CoordinatorTest, FailuresRetryThenFailPermanently) {
    CoordinatorConfig cfg;
    cfg.max_task_retries = 3;
    auto c = make(cfg);
    c->register_agent(make_agent("w"));
    std::string t = c->create_task("flaky", "", TaskPriority::Medium);

    for (int i = 1; i <= 3; ++i) {
        ASSERT_EQ(c->find_task(t)->status, TaskStatus::Assigned) << "attempt " << i;
        c->fail_task(t, "attempt " + std::to_string(i));
    }

    auto task = c->find_task(t);
    EXPECT_EQ(task->status, TaskStatus::Failed);
    EXPECT_EQ(task->retry_count, 3);
    EXPECT_EQ(*task->error, "attempt 3");
    EXPECT_EQ(c->find_agent("w")->status, AgentStatus::Idle);
    EXPECT_EQ(notifier->count("task_retry"), 2u);
    EXPECT_EQ(notifier->count("task_failed"), 1u);
    EXPECT_THROW(c->fail_task(t, "again"), InvalidTransition);
}

TEST_F(CoordinatorTest, CompletingTwiceIsRejected) {
    auto c = make();
    c->register_agent(make_agent("w"));
    std::string t = c->create_task("once", "", TaskPriority::Medium);
    c->complete_task(t, "first");
    EXPECT_THROW(c->complete_task(t, "second"), InvalidTransition);
    EXPECT_EQ(*c->find_task(t)->result, "first");
    EXPECT_EQ(notifier->count("task_completed"), 1u);
}

TEST_F(CoordinatorTest, UnknownIdsAreReported) {
    auto c = make();
    EXPECT_THROW(c->complete_task("nope", ""), UnknownTask);
    EXPECT_THROW(c->cancel_task("nope"), UnknownTask);
    EXPECT_THROW(c->transition_agent("ghost", AgentStatus::Working), UnknownAgent);
    EXPECT_FALSE(c->find_task("nope").has_value());
    EXPECT_FALSE(c->find_agent("ghost").has_value());
}

TEST_F(CoordinatorTest, DuplicateRegistrationKeepsFirst) {
    auto c = make();
    c->register_agent(make_agent("dup", {"python"}));
    EXPECT_THROW(c->register_agent(make_agent("dup", {"go"})), DuplicateAgent);
    EXPECT_EQ(c->find_agent("dup")->capabilities, std::set<std::string>{"python"});
    EXPECT_EQ(notifier->count("agent_registered"), 1u);
}

TEST_F(CoordinatorTest, RegistrationPicksUpWaitingWork) {
    auto c = make();
    std::string t = c->create_task("queued", "", TaskPriority::Low);
    EXPECT_EQ(c->find_task(t)->status, TaskStatus::Pending);
    c->register_agent(make_agent("late"));
    EXPECT_EQ(*c->find_task(t)->assigned_agent, "late");
}

TEST_F(CoordinatorTest, ManualModeAssignsOnlyOnTick) {
    CoordinatorConfig cfg;
    cfg.auto_assign_tasks = false;
    auto c = make(cfg);
    c->register_agent(make_agent("w"));
    std::string t = c->create_task("t", "", TaskPriority::High);

    StatusSnapshot s = c->status();
    EXPECT_EQ(s.queue_size, 1u);
    EXPECT_EQ(c->find_task(t)->status, TaskStatus::Pending);

    EXPECT_EQ(c->schedule_tick(), 1u);
    EXPECT_EQ(c->find_task(t)->status, TaskStatus::Assigned);
    EXPECT_EQ(c->status().queue_size, 0u);
}

TEST_F(CoordinatorTest, TimedOutAttemptIsRetried) {
    CoordinatorConfig cfg;
    cfg.task_timeout_minutes = 1;
    cfg.auto_assign_tasks = false;
    auto c = make(cfg);
    c->register_agent(make_agent("slow"));
    std::string t = c->create_task("t", "", TaskPriority::Medium);
    c->schedule_tick();
    c->start_task(t);

    EXPECT_EQ(c->check_timeouts(SteadyClock::now()), 0u);
    EXPECT_EQ(c->check_timeouts(SteadyClock::now() + 2min), 1u);

    auto task = c->find_task(t);
    EXPECT_EQ(task->status, TaskStatus::Pending);
    EXPECT_EQ(task->retry_count, 1);
    EXPECT_EQ(*task->error, "timed out");
    EXPECT_EQ(c->find_agent("slow")->status, AgentStatus::Idle);
    EXPECT_EQ(notifier->count("task_timeout"), 1u);
    EXPECT_EQ(notifier->count("task_retry"), 1u);
}

TEST_F(CoordinatorTest, ZeroTimeoutNeverExpires) {
    CoordinatorConfig cfg;
    cfg.task_timeout_minutes = 0;
    auto c = make(cfg);
    c->register_agent(make_agent("w"));
    std::string t = c->create_task("t", "", TaskPriority::Medium);
    EXPECT_EQ(c->check_timeouts(SteadyClock::now() + 24h * 30), 0u);
    EXPECT_EQ(c->find_task(t)->status, TaskStatus::Assigned);
}

TEST_F(CoordinatorTest, CancelPendingFailsTask) {
    auto c = make();
    std::string t = c->create_task("t", "", TaskPriority::Medium);
    c->cancel_task(t);
    auto task = c->find_task(t);
    EXPECT_EQ(task->status, TaskStatus::Failed);
    EXPECT_EQ(*task->error, "cancelled");
    EXPECT_THROW(c->cancel_task(t), InvalidTransition);

    c->register_agent(make_agent("w"));
    EXPECT_EQ(c->find_agent("w")->status, AgentStatus::Idle);
}

TEST_F(CoordinatorTest, CancelRunningOnlyFlags) {
    auto c = make();
    c->register_agent(make_agent("w"));
    std::string t = c->create_task("t", "", TaskPriority::Medium);
    c->start_task(t);
    c->cancel_task(t);

    auto task = c->find_task(t);
    EXPECT_EQ(task->status, TaskStatus::InProgress);
    EXPECT_TRUE(task->cancel_requested);
    EXPECT_EQ(c->find_agent("w")->status, AgentStatus::Working);
    EXPECT_EQ(notifier->count("task_cancelled"), 1u);
}

TEST_F(CoordinatorTest, CancelledRunningTaskIsNotRetried) {
    CoordinatorConfig cfg;
    cfg.max_task_retries = 3;
    auto c = make(cfg);
    c->register_agent(make_agent("w"));
    std::string t = c->create_task("t", "", TaskPriority::Medium);
    c->start_task(t);
    c->cancel_task(t);

    // The worker sees the flag and reports failure.
    c->fail_task(t, "cancelled");

    auto task = c->find_task(t);
    EXPECT_EQ(task->status, TaskStatus::Failed);
    EXPECT_EQ(*task->error, "cancelled");
    EXPECT_FALSE(task->assigned_agent.has_value());
    EXPECT_EQ(c->find_agent("w")->status, AgentStatus::Idle);
    EXPECT_EQ(c->status().queue_size, 0u);
    EXPECT_EQ(notifier->count("task_retry"), 0u);
    EXPECT_EQ(notifier->count("task_failed"), 1u);
}

TEST_F(CoordinatorTest, TimeoutOfCancelledTaskIsFinal) {
    CoordinatorConfig cfg;
    cfg.task_timeout_minutes = 1;
    auto c = make(cfg);
    c->register_agent(make_agent("w"));
    std::string t = c->create_task("t", "", TaskPriority::Medium);
    c->cancel_task(t);

    EXPECT_EQ(c->check_timeouts(SteadyClock::now() + 2min), 1u);
    EXPECT_EQ(c->find_task(t)->status, TaskStatus::Failed);
    EXPECT_EQ(notifier->count("task_retry"), 0u);
}

TEST_F(CoordinatorTest, AgentReportedCompletionClosesTask) {
    auto c = make();
    c->register_agent(make_agent("w"));
    std::string t = c->create_task("t", "", TaskPriority::Medium);

    Agent a = c->transition_agent("w", AgentStatus::Completed);
    EXPECT_EQ(a.status, AgentStatus::Idle);
    EXPECT_EQ(c->find_task(t)->status, TaskStatus::Completed);
}

TEST_F(CoordinatorTest, AgentReportedErrorCountsAsFailure) {
    auto c = make();
    c->register_agent(make_agent("w"));
    std::string t = c->create_task("t", "", TaskPriority::Medium);

    c->transition_agent("w", AgentStatus::Error);
    auto task = c->find_task(t);
    EXPECT_EQ(task->retry_count, 1);
    EXPECT_EQ(*task->error, "agent reported error");
    // Requeued and handed straight back to the only agent.
    EXPECT_EQ(task->status, TaskStatus::Assigned);
}

TEST_F(CoordinatorTest, WaitingAgentResumesAndFinishes) {
    auto c = make();
    c->register_agent(make_agent("w"));
    std::string t = c->create_task("t", "", TaskPriority::Medium);

    Agent waiting = c->transition_agent("w", AgentStatus::Waiting);
    EXPECT_EQ(waiting.status, AgentStatus::Waiting);
    EXPECT_FALSE(waiting.current_task.has_value());
    EXPECT_EQ(c->find_task(t)->status, TaskStatus::Assigned);

    c->complete_task(t, "done while waiting");
    EXPECT_EQ(c->find_agent("w")->status, AgentStatus::Idle);
    EXPECT_FALSE(c->find_agent("w")->blocked_task.has_value());

    std::lock_guard<std::mutex> lock(notifier->mtx);
    const json* release = nullptr;
    for (const auto& e : notifier->events) {
        if (e.first == "agent_status_changed" && e.second.contains("via")) release = &e.second;
    }
    ASSERT_NE(release, nullptr);
    EXPECT_EQ((*release)["from"], "waiting");
    EXPECT_EQ((*release)["via"], "completed");
    EXPECT_EQ((*release)["to"], "idle");
}

TEST_F(CoordinatorTest, IllegalAgentTransitionRejected) {
    auto c = make();
    c->register_agent(make_agent("w"));
    EXPECT_THROW(c->transition_agent("w", AgentStatus::Waiting), InvalidTransition);
    EXPECT_THROW(c->transition_agent("w", AgentStatus::Working), InvalidTransition);
    EXPECT_EQ(c->find_agent("w")->status, AgentStatus::Idle);
}

TEST_F(CoordinatorTest, EventsArriveInCausalOrder) {
    auto c = make();
    c->register_agent(make_agent("w"));
    std::string t = c->create_task("t", "", TaskPriority::Medium);
    c->start_task(t);
    c->complete_task(t, "ok");

    auto types = notifier->types();
    EXPECT_LT(position(types, "agent_registered"), position(types, "task_created"));
    EXPECT_LT(position(types, "task_created"), position(types, "task_assigned"));
    EXPECT_LT(position(types, "task_assigned"), position(types, "task_started"));
    EXPECT_LT(position(types, "task_started"), position(types, "task_completed"));
    EXPECT_LT(position(types, "task_completed"), static_cast<std::ptrdiff_t>(types.size()));
}

TEST_F(CoordinatorTest, NotifierMayCallBackIn) {
    auto c = make();
    std::atomic<int> seen{0};
    Coordinator* raw = c.get();
    notifier->on_event = [&](const std::string&) {
        StatusSnapshot s = raw->status();
        seen += static_cast<int>(s.agents.size());
    };
    c->register_agent(make_agent("w"));
    c->create_task("t", "", TaskPriority::Medium);
    EXPECT_GT(seen.load(), 0);
    notifier->on_event = nullptr;
}

TEST_F(CoordinatorTest, ThrowingNotifierDoesNotBreakOperation) {
    auto c = make();
    notifier->on_event = [](const std::string&) { throw std::runtime_error("sink down"); };
    c->register_agent(make_agent("w"));
    EXPECT_TRUE(c->find_agent("w").has_value());
    notifier->on_event = nullptr;
}

TEST_F(CoordinatorTest, WorkingCapIsHonored) {
    CoordinatorConfig cfg;
    cfg.max_concurrent_agents = 1;
    auto c = make(cfg);
    c->register_agent(make_agent("a"));
    c->register_agent(make_agent("b"));
    c->create_task("t1", "", TaskPriority::Medium);
    c->create_task("t2", "", TaskPriority::Medium);

    StatusSnapshot s = c->status();
    EXPECT_EQ(s.queue_size, 1u);
    std::size_t working = std::count_if(s.agents.begin(), s.agents.end(),
        [](const Agent& a) { return a.status == AgentStatus::Working; });
    EXPECT_EQ(working, 1u);
}

TEST_F(CoordinatorTest, TemplateRegistration) {
    auto c = make();
    FakeTemplates templates;
    Agent a = c->register_from_template(templates, "backend_developer", "1", "/srv/app");
    EXPECT_EQ(a.id, "backend_developer-1");
    EXPECT_EQ(a.project_path, "/srv/app");
    EXPECT_EQ(a.capabilities.count("python"), 1u);
    EXPECT_EQ(a.status, AgentStatus::Idle);

    EXPECT_THROW(c->register_from_template(templates, "astronaut", "1"), UnknownRole);
    EXPECT_EQ(c->status().agents.size(), 1u);
}

TEST_F(CoordinatorTest, BlockedTasksAreReported) {
    auto c = make();
    std::string t = c->create_task("t", "", TaskPriority::Medium, {"ghost"});
    auto blocked = c->blocked_tasks();
    ASSERT_EQ(blocked.size(), 1u);
    EXPECT_EQ(blocked[0].task_id, t);
    EXPECT_EQ(blocked[0].unmet.at(0).state, DependencyState::Missing);
    EXPECT_FALSE(blocked[0].satisfiable);
}

TEST_F(CoordinatorTest, MessagesRoundTrip) {
    auto c = make();
    TimePoint before = Clock::now();
    Message m;
    m.from_agent = "lead";
    m.to_agent = "w";
    m.message_type = "request";
    m.content = "please review";
    Message stored = c->post_message(m);
    EXPECT_GT(stored.id, 0u);

    auto inbox = c->messages_since("w", before).to_vector();
    ASSERT_EQ(inbox.size(), 1u);
    EXPECT_EQ(inbox[0].content, "please review");
    EXPECT_EQ(c->status().message_count, 1u);
    EXPECT_EQ(notifier->count("message_posted"), 1u);
}

TEST_F(CoordinatorTest, StartStopTogglesRunning) {
    CoordinatorConfig cfg;
    cfg.health_check_interval = 1;
    auto c = make(cfg);
    EXPECT_FALSE(c->running());
    c->start();
    c->start();
    EXPECT_TRUE(c->running());
    EXPECT_TRUE(c->status().running);
    c->stop();
    EXPECT_FALSE(c->running());
    c->stop();
}

TEST_F(CoordinatorTest, InvalidConfigRejected) {
    CoordinatorConfig cfg;
    cfg.max_task_retries = 0;
    EXPECT_THROW(make(cfg), ConfigError);
}

TEST_F(CoordinatorTest, ConcurrentCallersKeepBindingsConsistent) {
    auto c = make();
    const int agents = 4;
    const int producers = 4;
    const int per_producer = 10;
    const std::size_t total = producers * per_producer;

    for (int i = 0; i < agents; ++i) c->register_agent(make_agent("agent-" + std::to_string(i)));

    std::atomic<bool> consistent{true};
    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&, p] {
            for (int i = 0; i < per_producer; ++i) {
                c->create_task("p" + std::to_string(p) + "-" + std::to_string(i), "", TaskPriority::Medium);
            }
        });
    }

    auto deadline = Clock::now() + 10s;
    auto completed = [&] {
        StatusSnapshot s = c->status();
        return static_cast<std::size_t>(std::count_if(s.tasks.begin(), s.tasks.end(),
            [](const Task& t) { return t.status == TaskStatus::Completed; }));
    };
    for (int i = 0; i < agents; ++i) {
        threads.emplace_back([&, i] {
            std::string id = "agent-" + std::to_string(i);
            while (completed() < total && Clock::now() < deadline) {
                auto a = c->find_agent(id);
                if (a && a->status == AgentStatus::Working) {
                    c->complete_task(*a->current_task, "ok");
                } else {
                    std::this_thread::yield();
                }
            }
        });
    }
    threads.emplace_back([&] {
        while (completed() < total && Clock::now() < deadline) {
            StatusSnapshot s = c->status();
            for (const auto& a : s.agents) {
                if (a.current_task.has_value() != (a.status == AgentStatus::Working)) consistent = false;
                if (!a.current_task) continue;
                auto it = std::find_if(s.tasks.begin(), s.tasks.end(),
                    [&](const Task& t) { return t.id == *a.current_task; });
                if (it == s.tasks.end() || it->assigned_agent != a.id) consistent = false;
            }
        }
    });
    for (auto& t : threads) t.join();

    EXPECT_TRUE(consistent.load());
    EXPECT_EQ(completed(), total);
    StatusSnapshot s = c->status();
    EXPECT_EQ(s.queue_size, 0u);
    for (const auto& a : s.agents) EXPECT_EQ(a.status, AgentStatus::Idle);
}
