#include "ClientSession.hpp"
#include "../../Shared/network/Framing.hpp"

#include <chrono>
#include <iostream>

namespace {
    double wallClockSeconds() {
        return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
    }
}

const char* sessionStateName(SessionState s) noexcept {
    switch (s) {
    case SessionState::Connecting: return "connecting";
    case SessionState::Authenticating: return "authenticating";
    case SessionState::Active: return "active";
    case SessionState::Disconnecting: return "disconnecting";
    case SessionState::Closed: return "closed";
    }
    return "unknown";
}

const char* sessionErrorName(SessionError e) noexcept {
    switch (e) {
    case SessionError::None: return "none";
    case SessionError::Connection: return "connection";
    case SessionError::Timeout: return "timeout";
    case SessionError::Protocol: return "protocol";
    case SessionError::Validation: return "validation";
    }
    return "unknown";
}

ClientSession::ClientSession(SessionId id, TcpSocket socket, std::string remoteAddress,
    GameManager& game, const ServerConfig& config, FinishedCallback onFinished)
    : m_id(id),
    m_socket(std::move(socket)),
    m_remoteAddress(std::move(remoteAddress)),
    m_game(game),
    m_config(config),
    m_onFinished(std::move(onFinished))
{
}

ClientSession::~ClientSession()
{
    StopWriter();
}

void ClientSession::Run()
{
    const NetworkConfig& net = m_config.network;
    if (!m_socket.SetReceiveTimeout(net.handshakeTimeout) || !m_socket.SetSendTimeout(net.clientTimeout)) {
        std::cerr << "[session " << m_id << "] failed to set socket timeouts\n";
    }
    StartWriter();
    std::cout << "[session " << m_id << "] connected from " << m_remoteAddress << "\n";

    while (!m_stopRequested.load(std::memory_order_acquire)) {
        std::optional<Packet> packet = ReadPacket();
        if (!packet) break;
        Dispatch(*packet);
    }

    Teardown();
}

std::optional<Packet> ClientSession::ReadPacket()
{
    uint8_t header[kFrameHeaderSize];
    IoResult r = m_socket.ReadExact(header, sizeof(header));
    if (r != IoResult::Ok) {
        OnReadFailure(r, "header");
        return std::nullopt;
    }

    // reject before touching the payload
    const uint32_t length = readFrameHeader(header);
    if (length == 0 || length > m_config.network.maxMessageSize) {
        Fail(SessionError::Protocol, "invalid frame length " + std::to_string(length));
        return std::nullopt;
    }

    std::string payload(length, '\0');
    r = m_socket.ReadExact(payload.data(), payload.size());
    if (r != IoResult::Ok) {
        OnReadFailure(r, "payload");
        return std::nullopt;
    }

    std::optional<Packet> packet = decodePacket(payload);
    if (!packet) {
        Fail(SessionError::Protocol, "malformed packet (" + std::to_string(length) + " bytes)");
    }
    return packet;
}

void ClientSession::OnReadFailure(IoResult result, const char* what)
{
    if (m_stopRequested.load(std::memory_order_acquire)) return;
    switch (result) {
    case IoResult::Timeout:
        Fail(SessionError::Timeout, State() == SessionState::Active ? "keepalive expired" : "handshake timed out");
        break;
    case IoResult::Closed:
        Fail(SessionError::Connection, std::string("peer closed during ") + what);
        break;
    default:
        Fail(SessionError::Connection, std::string("read error during ") + what);
        break;
    }
}

void ClientSession::Dispatch(const Packet& packet)
{
    const PacketType type = packetTypeOf(packet);
    const SessionState state = State();

    if (type == PacketType::Ping) {
        HandlePing(std::get<PingPacket>(packet));
    }
    else if (type == PacketType::Pong) {
        // client answering a server ping; nothing to do
    }
    else if (type == PacketType::Connect) {
        if (state == SessionState::Connecting || state == SessionState::Authenticating) {
            HandleConnect(std::get<ConnectPacket>(packet));
        }
        else {
            std::cout << "[session " << m_id << "] dropping connect in state " << sessionStateName(state) << "\n";
        }
    }
    else if (type == PacketType::Move || type == PacketType::Skill || type == PacketType::GetGameState) {
        if (state != SessionState::Active) {
            std::cout << "[session " << m_id << "] dropping " << packetTypeName(type)
                << " before handshake (state=" << sessionStateName(state) << ")\n";
            return;
        }
        if (type == PacketType::Move) HandleMove(std::get<MovePacket>(packet));
        else if (type == PacketType::Skill) HandleSkill(std::get<SkillPacket>(packet));
        else HandleGetGameState(std::get<GetGameStatePacket>(packet));
    }
    else {
        Fail(SessionError::Protocol, std::string("unexpected packet type ") + packetTypeName(type));
    }
}

void ClientSession::HandleConnect(const ConnectPacket& pkt)
{
    SetState(SessionState::Authenticating);

    if (pkt.version != m_config.network.protocolVersion) {
        std::cout << "[session " << m_id << "] client version=" << pkt.version
            << " server version=" << m_config.network.protocolVersion << "\n";
    }

    if (!isValidPlayerName(pkt.name)) {
        Fail(SessionError::Validation, "invalid name '" + pkt.name + "'");
        return;
    }

    const JoinOutcome outcome = m_game.addPlayer(m_id, pkt.name);
    switch (outcome.result) {
    case JoinResult::Joined: {
        m_name = pkt.name;
        m_joined = true;
        if (!m_socket.SetReceiveTimeout(m_config.network.clientTimeout)) {
            std::cerr << "[session " << m_id << "] failed to set keepalive timeout\n";
        }

        // queued before going Active so no snapshot can overtake it
        PlayerIdPacket reply;
        reply.playerId = m_id;
        reply.spawnPosition = WirePosition{ outcome.spawnPosition.x, outcome.spawnPosition.y };
        reply.serverTickRate = m_config.game.tickRate;
        Send(reply);
        SetState(SessionState::Active);

        std::cout << "[session " << m_id << "] registered name=" << m_name
            << " spawn=(" << outcome.spawnPosition.x << "," << outcome.spawnPosition.y << ")\n";
        break;
    }
    case JoinResult::ServerFull: {
        ServerFullPacket reply;
        reply.message = m_config.network.serverFullMessage;
        reply.maxPlayers = static_cast<uint32_t>(m_config.game.maxPlayers);
        Send(reply);
        Fail(SessionError::Validation, "server full");
        break;
    }
    case JoinResult::NameTaken: {
        if (m_nameRetryUsed) {
            Fail(SessionError::Validation, "name '" + pkt.name + "' taken again");
            return;
        }
        m_nameRetryUsed = true;
        UsernameTakenPacket reply;
        reply.message = m_config.network.usernameTakenMessage;
        reply.suggestions = m_game.suggestNames(pkt.name);
        Send(reply);
        std::cout << "[session " << m_id << "] name taken: " << pkt.name << "\n";
        break;
    }
    case JoinResult::InvalidName:
        Fail(SessionError::Validation, "invalid name '" + pkt.name + "'");
        break;
    }
}

void ClientSession::HandleMove(const MovePacket& pkt)
{
    // stale or dead: dropped silently
    m_game.recordMoveIntent(m_id, pkt.dx, pkt.dy, pkt.sequence);
}

void ClientSession::HandleSkill(const SkillPacket& pkt)
{
    if (!skillKindFromName(pkt.skillName)) {
        std::cout << "[session " << m_id << "] unknown skill '" << pkt.skillName << "'\n";
        return;
    }
    if (m_game.activateSkill(m_id, pkt.skillName, Clock::now())) {
        std::cout << "[session " << m_id << "] skill " << pkt.skillName << " activated\n";
    }
}

void ClientSession::HandleGetGameState(const GetGameStatePacket&)
{
    const SnapshotPtr snapshot = m_game.latestSnapshot();
    if (!snapshot) return;
    EnqueueFrame(encodeSnapshotFrame(*snapshot), true);
}

void ClientSession::HandlePing(const PingPacket& pkt)
{
    PongPacket reply;
    reply.timestamp = pkt.timestamp;
    reply.sequence = pkt.sequence;
    reply.serverTime = wallClockSeconds();
    Send(reply);
}

bool ClientSession::EnqueueSnapshot(const FramePtr& frame)
{
    if (!IsActive()) return false;
    return EnqueueFrame(frame, true);
}

bool ClientSession::Send(const Packet& packet)
{
    return EnqueueFrame(makeFrame(packet), false);
}

bool ClientSession::EnqueueFrame(const FramePtr& frame, bool snapshot)
{
    if (!frame) return false;
    bool overflow = false;
    {
        std::lock_guard<std::mutex> lk(m_queueMutex);
        if (m_writerQuit || m_queueOverflowed) return false;

        bool replaced = false;
        if (snapshot) {
            for (Outbound& o : m_queue) {
                if (o.snapshot) {
                    o.frame = frame;
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            if (m_queue.size() >= m_config.network.maxOutboundFrames) {
                m_queueOverflowed = true;
                m_queue.clear();
                overflow = true;
            }
            else {
                m_queue.push_back(Outbound{ frame, snapshot });
            }
        }
    }

    if (overflow) {
        Fail(SessionError::Connection, "outbound queue overflow (slow consumer)");
        RequestStop();
        return false;
    }
    m_queueCv.notify_one();
    return true;
}

size_t ClientSession::QueuedFrames() const
{
    std::lock_guard<std::mutex> lk(m_queueMutex);
    return m_queue.size();
}

void ClientSession::Fail(SessionError error, const std::string& detail)
{
    SessionError expected = SessionError::None;
    if (m_error.compare_exchange_strong(expected, error, std::memory_order_acq_rel)) {
        std::cerr << "[session " << m_id << "] closing reason=" << sessionErrorName(error)
            << " detail=" << detail << "\n";
    }
    m_stopRequested.store(true, std::memory_order_release);
}

void ClientSession::RequestStop() noexcept
{
    m_stopRequested.store(true, std::memory_order_release);
    std::lock_guard<std::mutex> lk(m_socketMutex);
    m_socket.Shutdown();
}

void ClientSession::SetState(SessionState s)
{
    m_state.store(s, std::memory_order_release);
}

void ClientSession::StartWriter()
{
    std::lock_guard<std::mutex> lk(m_queueMutex);
    m_writerQuit = false;
    if (!m_writerThread.joinable()) {
        m_writerThread = std::thread([this]() { WriterLoop(); });
    }
}

void ClientSession::StopWriter()
{
    {
        std::lock_guard<std::mutex> lk(m_queueMutex);
        m_writerQuit = true;
    }
    m_queueCv.notify_all();
    if (m_writerThread.joinable()) {
        m_writerThread.join();
    }
}

// Drains the queue; once asked to quit it flushes what is left, then exits.
void ClientSession::WriterLoop()
{
    while (true) {
        FramePtr frame;
        {
            std::unique_lock<std::mutex> lk(m_queueMutex);
            m_queueCv.wait(lk, [this]() { return m_writerQuit || !m_queue.empty(); });
            if (m_queue.empty()) {
                return;
            }
            frame = std::move(m_queue.front().frame);
            m_queue.pop_front();
        }

        const IoResult r = m_socket.WriteAll(frame->data(), frame->size());
        if (r != IoResult::Ok) {
            Fail(r == IoResult::Timeout ? SessionError::Timeout : SessionError::Connection,
                std::string("write failed: ") + ioResultName(r));
            {
                std::lock_guard<std::mutex> lk(m_queueMutex);
                m_queue.clear();
                m_writerQuit = true;
            }
            RequestStop();
            return;
        }
    }
}

void ClientSession::Teardown()
{
    SetState(SessionState::Disconnecting);

    // leave the world before the writer drains; a peer that stops reading can hold it for clientTimeout
    if (m_joined) {
        m_game.removePlayer(m_id);
        m_joined = false;
    }

    // only a rejected join gets its reply flushed
    if (CloseReason() != SessionError::Validation) {
        std::lock_guard<std::mutex> lk(m_socketMutex);
        m_socket.Shutdown();
    }
    StopWriter();

    {
        std::lock_guard<std::mutex> lk(m_socketMutex);
        m_socket.Shutdown();
        m_socket.Close();
    }
    SetState(SessionState::Closed);

    std::cout << "[session " << m_id << "] closed"
        << (m_name.empty() ? std::string() : " name=" + m_name)
        << " reason=" << sessionErrorName(CloseReason()) << "\n";

    if (m_onFinished) {
        m_onFinished(m_id);
    }
}
