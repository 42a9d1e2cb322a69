#pragma once
#include "notifier.hpp"
#include "util.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

struct HttpNotifierOptions {
    std::string server{"http://localhost:4000"}; // events go to <server>/events
    std::string session_id{"coordinator"};
    std::string source_app{"multi-agent-coordinator"};
    long timeout_ms{5000};
    std::size_t max_pending{1024};
};

// Posts events to the observability server from a background thread.
// notify() only enqueues; a full queue drops its oldest event.
class HttpNotifier : public Notifier {
public:
    explicit HttpNotifier(HttpNotifierOptions opts);
    ~HttpNotifier() override;
    HttpNotifier(const HttpNotifier&) = delete;
    HttpNotifier& operator=(const HttpNotifier&) = delete;

    void notify(const std::string& event_type, const nlohmann::json& payload) override;

    std::size_t dropped() const;

    static nlohmann::json make_event(const HttpNotifierOptions& opts, const std::string& event_type,
                                     const nlohmann::json& payload, TimePoint at);

private:
    void run();
    void deliver(const nlohmann::json& event);

    HttpNotifierOptions opts_;
    std::string url_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<nlohmann::json> queue_;
    std::size_t dropped_{0};
    bool stopping_{false};
    std::thread worker_;
};
