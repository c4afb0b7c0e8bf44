#pragma once
#include "TcpSocket.hpp"
#include "SnapshotPacket.hpp"
#include "../config/ServerConfig.hpp"
#include "../game/GameManager.hpp"
#include "../../Shared/network/Packets.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

using SessionId = uint64_t;

enum class SessionState : uint8_t {
    Connecting = 0,
    Authenticating,
    Active,
    Disconnecting,
    Closed,
};

// Why a session ended. None for a shutdown requested by the server.
enum class SessionError : uint8_t {
    None = 0,
    Connection,
    Timeout,
    Protocol,
    Validation,
};

const char* sessionStateName(SessionState s) noexcept;
const char* sessionErrorName(SessionError e) noexcept;

// One TCP client. Run() is the blocking reader loop and owns the session's
// lifetime from handshake to teardown; a private writer thread drains the
// outbound queue so reads never wait on writes. The player id equals the
// session id.
class ClientSession {
public:
    using FinishedCallback = std::function<void(SessionId)>;

    ClientSession(SessionId id, TcpSocket socket, std::string remoteAddress,
        GameManager& game, const ServerConfig& config, FinishedCallback onFinished);
    ~ClientSession();

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    // Reader loop. Returns once the session is Closed and the owner was notified.
    void Run();

    // Broadcast path: queues the shared frame if the session is Active.
    // An unsent snapshot already queued is replaced by this one. Never blocks;
    // a full queue closes the session.
    bool EnqueueSnapshot(const FramePtr& frame);

    // Direct reply, queued behind anything already pending.
    bool Send(const Packet& packet);

    // Unblocks the reader from any thread; the reader then tears down.
    void RequestStop() noexcept;

    [[nodiscard]] SessionId Id() const noexcept { return m_id; }
    [[nodiscard]] SessionState State() const noexcept { return m_state.load(std::memory_order_acquire); }
    [[nodiscard]] SessionError CloseReason() const noexcept { return m_error.load(std::memory_order_acquire); }
    [[nodiscard]] bool IsActive() const noexcept { return State() == SessionState::Active; }
    [[nodiscard]] const std::string& RemoteAddress() const noexcept { return m_remoteAddress; }
    [[nodiscard]] size_t QueuedFrames() const;

private:
    struct Outbound {
        FramePtr frame;
        bool snapshot = false;
    };

    std::optional<Packet> ReadPacket();
    void OnReadFailure(IoResult result, const char* what);
    void Dispatch(const Packet& packet);

    void HandleConnect(const ConnectPacket& pkt);
    void HandleMove(const MovePacket& pkt);
    void HandleSkill(const SkillPacket& pkt);
    void HandleGetGameState(const GetGameStatePacket& pkt);
    void HandlePing(const PingPacket& pkt);

    bool EnqueueFrame(const FramePtr& frame, bool snapshot);
    void Fail(SessionError error, const std::string& detail);
    void SetState(SessionState s);

    void StartWriter();
    void StopWriter();
    void WriterLoop();
    void Teardown();

    const SessionId m_id;
    TcpSocket m_socket;
    std::mutex m_socketMutex;
    const std::string m_remoteAddress;
    GameManager& m_game;
    const ServerConfig& m_config;
    FinishedCallback m_onFinished;

    std::atomic<SessionState> m_state{ SessionState::Connecting };
    std::atomic<SessionError> m_error{ SessionError::None };
    std::atomic<bool> m_stopRequested{ false };

    std::string m_name;
    bool m_joined = false;
    bool m_nameRetryUsed = false;

    mutable std::mutex m_queueMutex;
    std::condition_variable m_queueCv;
    std::deque<Outbound> m_queue;
    bool m_writerQuit = false;
    bool m_queueOverflowed = false;
    std::thread m_writerThread;
};
