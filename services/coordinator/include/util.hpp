#pragma once
#include <chrono>
#include <cstdint>
#include <string>

// Wall time stamps records and the wire format. Durations (timeouts) are
// measured on the steady clock, which never steps.
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;

// Random UUID v4 in canonical 8-4-4-4-12 form.
std::string gen_id();

std::int64_t to_epoch_ms(TimePoint t);
TimePoint from_epoch_ms(std::int64_t ms);
