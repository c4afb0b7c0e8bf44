#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

// Sliding-window limit on connection attempts per source address.
class ConnectionRateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    ConnectionRateLimiter(size_t maxAttempts, double windowSeconds);

    // Records an admitted attempt and returns true, or returns false (without
    // recording) when `source` already made maxAttempts within the window.
    bool allow(const std::string& source, Clock::time_point now);

    // Drops sources with no attempt inside the window.
    void prune(Clock::time_point now);

    size_t trackedSources() const;

private:
    void expire(std::deque<Clock::time_point>& attempts, Clock::time_point now) const;

    const size_t m_maxAttempts;
    const Clock::duration m_window;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::deque<Clock::time_point>> m_attempts;
};
