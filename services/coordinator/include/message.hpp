#pragma once
#include "util.hpp"
#include <cstdint>
#include <optional>
#include <string>

struct Message {
    std::uint64_t id{0}; // assigned by the bus, strictly increasing
    std::string from_agent;
    std::string to_agent;
    std::string message_type;
    std::string content;
    TimePoint timestamp{};
    std::optional<std::string> task_id;
};
