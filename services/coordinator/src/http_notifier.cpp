#include "http_notifier.hpp"
#include "http.hpp"
#include "log.hpp"
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

HttpNotifier::HttpNotifier(HttpNotifierOptions opts) : opts_(std::move(opts)) {
    url_ = opts_.server;
    if (!url_.empty() && url_.back() == '/') url_.pop_back();
    url_ += "/events";
    worker_ = std::thread([this]{ run(); });
}

HttpNotifier::~HttpNotifier() {
    std::size_t left = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopping_ = true;
        left = queue_.size();
        queue_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
    if (left) log_warn("dropped " + std::to_string(left) + " undelivered events on shutdown");
}

json HttpNotifier::make_event(const HttpNotifierOptions& opts, const std::string& event_type,
                              const json& payload, TimePoint at) {
    return json{
        {"source_app", opts.source_app},
        {"session_id", opts.session_id},
        {"hook_event_type", event_type},
        {"payload", payload},
        {"timestamp", to_epoch_ms(at)}
    };
}

void HttpNotifier::notify(const std::string& event_type, const json& payload) {
    json event = make_event(opts_, event_type, payload, Clock::now());
    bool overflow = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_) return;
        if (opts_.max_pending && queue_.size() >= opts_.max_pending) {
            queue_.pop_front();
            ++dropped_;
            overflow = true;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
    if (overflow) log_warn("observability queue full, dropped oldest event");
}

std::size_t HttpNotifier::dropped() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return dropped_;
}

void HttpNotifier::run() {
    for (;;) {
        json event;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this]{ return stopping_ || !queue_.empty(); });
            if (stopping_) return;
            event = std::move(queue_.front());
            queue_.pop_front();
        }
        deliver(event);
    }
}

void HttpNotifier::deliver(const json& event) {
    try {
        auto resp = http_post_json(url_, event.dump(), opts_.timeout_ms);
        if (!resp.ok()) {
            log_warn("Failed to send event to observability server: " + std::to_string(resp.status));
        }
    } catch (const std::exception& e) {
        log_warn(std::string("Could not send event to observability server: ") + e.what());
    }
}
