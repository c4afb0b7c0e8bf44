#include "ServerNetwork.hpp"
#include "../../Shared/network/Framing.hpp"

#include <iostream>
#include <stdexcept>


ServerNetwork::ServerNetwork(const ServerConfig& config)
    : m_config(config),
    m_game(m_config),
    m_rateLimiter(config.network.rateLimit.maxAttempts, config.network.rateLimit.window)
{
}

ServerNetwork::~ServerNetwork()
{
    Stop();
}

bool ServerNetwork::Start()
{
    if (m_started.load(std::memory_order_acquire)) {
        std::cerr << "[net] ServerNetwork already started\n";
        return false;
    }

    {
        std::lock_guard<std::mutex> shutdownLock(m_shutdownMutex);
        m_shutdownComplete = false;
    }

    const NetworkConfig& net = m_config.network;
    try {
        m_listenSock = TcpSocket::Listen(net.host, net.port, static_cast<int>(net.maxConnections));
    }
    catch (const std::runtime_error& e) {
        std::cerr << "[net] " << e.what() << "\n";
        return false;
    }

    std::cout << "[net] listening on " << net.host << ":" << m_listenSock.LocalPort()
        << " max_connections=" << net.maxConnections
        << " tick_rate=" << m_config.game.tickRate << " (Ctrl+C to quit)\n";

    m_quit.store(false, std::memory_order_release);
    m_started.store(true, std::memory_order_release);
    m_acceptThread = std::thread([this]() { AcceptLoop(); });
    m_tickThread = std::thread([this]() { TickLoop(); });
    return true;
}

void ServerNetwork::Stop()
{
    m_quit.store(true, std::memory_order_release);
    ShutdownNetworking();
}

uint16_t ServerNetwork::Port() const
{
    return m_listenSock.IsValid() ? m_listenSock.LocalPort() : 0;
}

void ServerNetwork::ShutdownNetworking()
{
    std::lock_guard<std::mutex> shutdownLock(m_shutdownMutex);
    if (m_shutdownComplete || !m_started.load(std::memory_order_acquire)) {
        return;
    }
    m_shutdownComplete = true;

    {
        // pairs with the wait in TickLoop so the wakeup cannot be missed
        std::lock_guard<std::mutex> lk(m_tickMutex);
    }
    m_tickCv.notify_all();

    // unblocks accept()
    m_listenSock.Shutdown();
    if (m_acceptThread.joinable()) m_acceptThread.join();
    m_listenSock.Close();
    if (m_tickThread.joinable()) m_tickThread.join();

    std::vector<SessionEntry> sessions;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        sessions.reserve(m_sessions.size() + m_closing.size());
        for (auto& kv : m_sessions) {
            sessions.push_back(std::move(kv.second));
        }
        m_sessions.clear();
        for (auto& entry : m_closing) {
            sessions.push_back(std::move(entry));
        }
        m_closing.clear();
    }

    for (auto& entry : sessions) {
        entry.session->RequestStop();
    }
    for (auto& entry : sessions) {
        if (entry.thread.joinable()) entry.thread.join();
        m_game.removePlayer(entry.session->Id());
    }

    m_started.store(false, std::memory_order_release);
    std::cout << "[net] shutdown complete, closed " << sessions.size() << " session(s)\n";
}

void ServerNetwork::AcceptLoop()
{
    const NetworkConfig& net = m_config.network;

    while (!m_quit.load(std::memory_order_acquire)) {
        std::string ip;
        uint16_t port = 0;
        TcpSocket client = m_listenSock.Accept(ip, port);
        if (!client.IsValid()) {
            if (m_quit.load(std::memory_order_acquire)) break;
            std::cerr << "[net] accept failed\n";
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        const std::string remote = ip + ":" + std::to_string(port);

        if (!m_rateLimiter.allow(ip, ConnectionRateLimiter::Clock::now())) {
            std::cerr << "[net] rate limit exceeded for " << ip << "\n";
            RejectConnection(client, remote, net.rateLimitedMessage);
            continue;
        }
        if (SessionCount() >= net.maxConnections) {
            std::cerr << "[net] max connections (" << net.maxConnections << ") reached, rejecting " << remote << "\n";
            RejectConnection(client, remote, net.serverFullMessage);
            continue;
        }
        if (!client.SetNoDelay(true)) {
            std::cerr << "[net] TCP_NODELAY failed for " << remote << "\n";
        }

        const SessionId id = m_nextSessionId.fetch_add(1, std::memory_order_relaxed);
        auto session = std::make_shared<ClientSession>(
            id, std::move(client), remote, m_game, m_config,
            [this](SessionId finished) { OnSessionFinished(finished); });

        // registered before its thread starts so broadcasts and shutdown see it
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            SessionEntry& entry = m_sessions[id];
            entry.session = session;
            entry.thread = std::thread([session]() { session->Run(); });
        }
        std::cout << "[net] accepted " << remote << " session=" << id << "\n";
    }
}

void ServerNetwork::RejectConnection(TcpSocket& socket, const std::string& remote, const std::string& message)
{
    ServerFullPacket reply;
    reply.message = message;
    reply.maxPlayers = static_cast<uint32_t>(m_config.game.maxPlayers);
    const std::vector<uint8_t> frame = encodeFrame(encodePacket(reply));

    // never block the accept thread on a peer that is not reading
    const IoResult r = socket.TrySend(frame.data(), frame.size());
    if (r != IoResult::Ok) {
        std::cerr << "[net] could not send server_full to " << remote << ": " << ioResultName(r) << "\n";
    }
    socket.Shutdown();
    socket.Close();
}

void ServerNetwork::TickLoop()
{
    using Clock = std::chrono::steady_clock;
    const double periodSeconds = 1.0 / static_cast<double>(m_config.game.tickRate);
    const auto period = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(periodSeconds));
    const float dt = static_cast<float>(periodSeconds);
    const auto statusInterval = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(m_config.network.statusLogInterval));

    auto next = Clock::now();
    auto lastStatus = next;

    while (!m_quit.load(std::memory_order_acquire)) {
        next += period;

        const SnapshotPtr snapshot = m_game.tick(dt, Clock::now());
        if (snapshot) {
            Broadcast(encodeSnapshotFrame(*snapshot));
        }
        ReapFinishedSessions();

        const auto now = Clock::now();
        if (statusInterval.count() > 0 && now - lastStatus >= statusInterval) {
            lastStatus = now;
            LogStatus();
            m_rateLimiter.prune(now);
        }

        if (now - next > period * kMaxTickLag) {
            const auto behind = (now - next) / period;
            std::cerr << "[tick] running " << behind << " ticks behind, re-anchoring schedule\n";
            // skipped ticks are dropped; the next step still advances by the fixed dt
            next = now;
        }

        std::unique_lock<std::mutex> lk(m_tickMutex);
        m_tickCv.wait_until(lk, next, [this]() { return m_quit.load(std::memory_order_acquire); });
    }
}

void ServerNetwork::LogStatus()
{
    std::cout << "[tick] tick=" << m_game.currentTick()
        << " players=" << m_game.playerCount()
        << " alive=" << m_game.alivePlayerCount()
        << " food=" << m_game.foodCount()
        << " sessions=" << SessionCount() << "\n";
}

void ServerNetwork::Broadcast(const FramePtr& frame)
{
    std::vector<std::shared_ptr<ClientSession>> recipients;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        recipients.reserve(m_sessions.size());
        for (const auto& kv : m_sessions) {
            if (kv.second.session->IsActive()) {
                recipients.push_back(kv.second.session);
            }
        }
    }
    for (const auto& session : recipients) {
        session->EnqueueSnapshot(frame);
    }
}

bool ServerNetwork::RemoveClient(SessionId id)
{
    std::shared_ptr<ClientSession> session;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        auto it = m_sessions.find(id);
        if (it == m_sessions.end()) return false;
        session = it->second.session;
        m_closing.push_back(std::move(it->second));
        m_sessions.erase(it);
    }
    session->RequestStop();
    m_game.removePlayer(id);
    std::cout << "[net] removed session=" << id << "\n";
    return true;
}

size_t ServerNetwork::SessionCount() const
{
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_sessions.size();
}

void ServerNetwork::OnSessionFinished(SessionId id)
{
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_sessions.find(id);
    if (it == m_sessions.end()) return;
    m_closing.push_back(std::move(it->second));
    m_sessions.erase(it);
}

void ServerNetwork::ReapFinishedSessions()
{
    std::vector<SessionEntry> done;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (auto it = m_closing.begin(); it != m_closing.end();) {
            if (it->session->State() == SessionState::Closed) {
                done.push_back(std::move(*it));
                it = m_closing.erase(it);
            }
            else {
                ++it;
            }
        }
    }
    for (auto& entry : done) {
        if (entry.thread.joinable()) entry.thread.join();
    }
}
