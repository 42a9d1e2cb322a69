#include "util.hpp"
#include <cstdio>
#include <mutex>
#include <random>

std::string gen_id() {
    static std::mutex mtx;
    static std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    std::uint64_t a, b;
    {
        std::lock_guard<std::mutex> lock(mtx);
        a = dist(rng);
        b = dist(rng);
    }
    // version 4, variant 10xx
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  (unsigned long long)(a >> 32),
                  (unsigned long long)((a >> 16) & 0xFFFF),
                  (unsigned long long)(a & 0xFFFF),
                  (unsigned long long)(b >> 48),
                  (unsigned long long)(b & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

std::int64_t to_epoch_ms(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

TimePoint from_epoch_ms(std::int64_t ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}
