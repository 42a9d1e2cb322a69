#pragma once
#include "message.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct MessageLog {
    mutable std::mutex mtx;
    std::deque<Message> entries; // ascending id
    std::uint64_t next_id{1};
};

// Messages for one agent at or after a timestamp, pulled from the log one at a
// time. Bounded by the newest id present when the range was made; iterating it
// again starts over.
class MessageRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Message;
        using difference_type = std::ptrdiff_t;
        using pointer = const Message*;
        using reference = const Message&;

        iterator() = default;
        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++() { advance(); return *this; }
        bool operator==(const iterator& o) const {
            if (!current_ || !o.current_) return !current_ && !o.current_;
            return current_->id == o.current_->id;
        }
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        friend class MessageRange;
        explicit iterator(const MessageRange* range) : range_(range) { advance(); }
        void advance() { current_ = range_->next_after(current_ ? current_->id : 0); }

        const MessageRange* range_{nullptr};
        std::optional<Message> current_;
    };

    iterator begin() const { return iterator(this); }
    iterator end() const { return iterator(); }
    std::vector<Message> to_vector() const;

private:
    friend class MessageBus;
    MessageRange(std::shared_ptr<const MessageLog> log, std::string agent_id, TimePoint from,
                 std::uint64_t last_id)
        : log_(std::move(log)), agent_id_(std::move(agent_id)), from_(from), last_id_(last_id) {}

    std::optional<Message> next_after(std::uint64_t id) const;

    std::shared_ptr<const MessageLog> log_;
    std::string agent_id_;
    TimePoint from_;
    std::uint64_t last_id_;
};

class MessageBus {
public:
    // A zero retention window keeps every message.
    explicit MessageBus(std::chrono::milliseconds retention);

    Message post(Message msg, TimePoint now = Clock::now());
    MessageRange since(const std::string& agent_id, TimePoint from) const;
    std::size_t purge_expired(TimePoint now);
    std::size_t size() const;

private:
    std::size_t purge_locked(TimePoint now);

    std::shared_ptr<MessageLog> log_;
    std::chrono::milliseconds retention_;
};
