#include "message_bus.hpp"
#include <algorithm>

std::vector<Message> MessageRange::to_vector() const {
    std::vector<Message> out;
    for (const auto& m : *this) out.push_back(m);
    return out;
}

std::optional<Message> MessageRange::next_after(std::uint64_t id) const {
    std::lock_guard<std::mutex> lock(log_->mtx);
    const auto& entries = log_->entries;
    auto it = std::upper_bound(entries.begin(), entries.end(), id,
        [](std::uint64_t v, const Message& m){ return v < m.id; });
    for (; it != entries.end() && it->id <= last_id_; ++it) {
        if (it->to_agent == agent_id_ && it->timestamp >= from_) return *it;
    }
    return std::nullopt;
}

MessageBus::MessageBus(std::chrono::milliseconds retention)
    : log_(std::make_shared<MessageLog>()), retention_(retention) {}

Message MessageBus::post(Message msg, TimePoint now) {
    std::lock_guard<std::mutex> lock(log_->mtx);
    msg.id = log_->next_id++;
    msg.timestamp = now;
    log_->entries.push_back(msg);
    purge_locked(now);
    return msg;
}

MessageRange MessageBus::since(const std::string& agent_id, TimePoint from) const {
    std::uint64_t last_id = 0;
    {
        std::lock_guard<std::mutex> lock(log_->mtx);
        last_id = log_->next_id - 1;
    }
    return MessageRange(log_, agent_id, from, last_id);
}

std::size_t MessageBus::purge_expired(TimePoint now) {
    std::lock_guard<std::mutex> lock(log_->mtx);
    return purge_locked(now);
}

std::size_t MessageBus::purge_locked(TimePoint now) {
    if (retention_.count() <= 0) return 0;
    std::size_t removed = 0;
    auto& entries = log_->entries;
    // Appends carry the bus clock, so expired entries form a prefix.
    while (!entries.empty() && now - entries.front().timestamp > retention_) {
        entries.pop_front();
        ++removed;
    }
    return removed;
}

std::size_t MessageBus::size() const {
    std::lock_guard<std::mutex> lock(log_->mtx);
    return log_->entries.size();
}
