#include "ConnectionRateLimiter.hpp"

ConnectionRateLimiter::ConnectionRateLimiter(size_t maxAttempts, double windowSeconds)
    : m_maxAttempts(maxAttempts),
    m_window(std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(windowSeconds)))
{
}

void ConnectionRateLimiter::expire(std::deque<Clock::time_point>& attempts, Clock::time_point now) const {
    while (!attempts.empty() && now - attempts.front() >= m_window) {
        attempts.pop_front();
    }
}

bool ConnectionRateLimiter::allow(const std::string& source, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto& attempts = m_attempts[source];
    expire(attempts, now);
    if (attempts.size() >= m_maxAttempts) {
        return false;
    }
    attempts.push_back(now);
    return true;
}

void ConnectionRateLimiter::prune(Clock::time_point now) {
    std::lock_guard<std::mutex> lk(m_mutex);
    for (auto it = m_attempts.begin(); it != m_attempts.end();) {
        expire(it->second, now);
        if (it->second.empty()) {
            it = m_attempts.erase(it);
        }
        else {
            ++it;
        }
    }
}

size_t ConnectionRateLimiter::trackedSources() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_attempts.size();
}
