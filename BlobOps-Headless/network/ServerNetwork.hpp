#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "TcpSocket.hpp"
#include "ClientSession.hpp"
#include "ConnectionRateLimiter.hpp"
#include "SnapshotPacket.hpp"
#include "../config/ServerConfig.hpp"
#include "../game/GameManager.hpp"


class ServerNetwork {
public:
    // Builds the simulation core; throws ConfigError for an invalid config.
    explicit ServerNetwork(const ServerConfig& config);
    ~ServerNetwork();

    // non-copyable
    ServerNetwork(const ServerNetwork&) = delete;
    ServerNetwork& operator=(const ServerNetwork&) = delete;

    // Listen on network.host:network.port and spawn the accept and tick
    // threads. Returns false if the socket cannot be bound.
    bool Start();

    // Stop accepting, close every session, join all threads. Idempotent.
    void Stop();

    [[nodiscard]] bool IsRunning() const noexcept { return m_started.load(std::memory_order_acquire) && !m_quit.load(std::memory_order_acquire); }

    // Port actually bound; 0 before Start.
    [[nodiscard]] uint16_t Port() const;

    // Hands the same encoded frame to every Active session.
    void Broadcast(const FramePtr& frame);

    // Deregisters and closes a session and drops its player. false if unknown.
    bool RemoveClient(SessionId id);

    [[nodiscard]] size_t SessionCount() const;

    GameManager& Game() noexcept { return m_game; }

private:
    struct SessionEntry {
        std::shared_ptr<ClientSession> session;
        std::thread thread;
    };

    void AcceptLoop();
    void TickLoop();
    void RejectConnection(TcpSocket& socket, const std::string& remote, const std::string& message);
    void OnSessionFinished(SessionId id);
    void ReapFinishedSessions();
    void ShutdownNetworking();
    void LogStatus();

    // ticks the loop may fall behind before the schedule is re-anchored
    static constexpr int kMaxTickLag = 5;

    const ServerConfig m_config;
    GameManager m_game;
    ConnectionRateLimiter m_rateLimiter;

    std::atomic<bool> m_quit{ false };
    std::atomic<bool> m_started{ false };
    std::mutex m_shutdownMutex;
    bool m_shutdownComplete = false;

    TcpSocket m_listenSock;
    std::thread m_acceptThread;
    std::thread m_tickThread;
    std::mutex m_tickMutex;
    std::condition_variable m_tickCv;

    // session id -> session; ids double as player ids
    mutable std::mutex m_mutex;
    std::unordered_map<SessionId, SessionEntry> m_sessions;
    // deregistered, thread not yet joined
    std::vector<SessionEntry> m_closing;
    std::atomic<SessionId> m_nextSessionId{ 1 };
};
