#include <doctest/doctest.h>
#include "network/ClientSession.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <sys/socket.h>
#include <unistd.h>

namespace {

    // One ClientSession over a socketpair; the test drives the client end.
    struct SessionHarness {
        ServerConfig cfg;
        GameManager game;
        int clientFd = -1;
        std::shared_ptr<ClientSession> session;
        std::thread thread;
        std::atomic<int> finishedCalls{ 0 };
        std::atomic<SessionId> finishedId{ 0 };

        explicit SessionHarness(ServerConfig config = makeTestConfig())
            : cfg(std::move(config)),
            game(cfg)
        {
            int fds[2];
            REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
            clientFd = fds[0];
            REQUIRE(setClientTimeout(clientFd, 5));
            session = std::make_shared<ClientSession>(7, TcpSocket(fds[1]), "test-peer", game, cfg,
                [this](SessionId id) {
                    finishedId = id;
                    ++finishedCalls;
                });
            std::shared_ptr<ClientSession> s = session;
            thread = std::thread([s]() { s->Run(); });
        }

        ~SessionHarness() {
            session->RequestStop();
            join();
            if (clientFd >= 0) ::close(clientFd);
        }

        void join() {
            if (thread.joinable()) thread.join();
        }

        bool connect(const std::string& name) {
            ConnectPacket c;
            c.name = name;
            c.version = 1;
            return sendPacket(clientFd, c);
        }

        // round trip through the reader thread; everything sent before is handled
        bool sync(uint64_t sequence = 1000) {
            PingPacket ping;
            ping.sequence = sequence;
            if (!sendPacket(clientFd, ping)) return false;
            std::optional<Packet> p = readUntil(clientFd, PacketType::Pong);
            return p && std::get<PongPacket>(*p).sequence == sequence;
        }
    };

    // Far larger than any socket buffer: the writer stays inside send() until the client reads.
    FramePtr makeBlockerFrame() {
        return std::make_shared<const std::vector<uint8_t>>(encodeFrame(std::string(16u << 20, ' ')));
    }

    FramePtr makeTickFrame(uint64_t tick) {
        GameStatePacket gs;
        gs.serverTick = tick;
        return makeFrame(gs);
    }

    // Parks the writer on a frame the client is not reading.
    void stallWriter(SessionHarness& h) {
        REQUIRE(h.session->EnqueueSnapshot(makeBlockerFrame()));
        REQUIRE(eventually([&]() { return h.session->QueuedFrames() == 0; }));
    }

    PlayerIdPacket expectPlayerId(int fd) {
        std::optional<Packet> p = readPacket(fd);
        REQUIRE(p.has_value());
        REQUIRE(packetTypeOf(*p) == PacketType::PlayerId);
        return std::get<PlayerIdPacket>(*p);
    }
}

TEST_SUITE("session") {

TEST_CASE("connect registers the player and replies with its id") {
    SessionHarness h;
    REQUIRE(h.connect("alice"));
    const PlayerIdPacket reply = expectPlayerId(h.clientFd);
    CHECK(reply.playerId == 7);
    CHECK(reply.serverTickRate == doctest::Approx(h.cfg.game.tickRate));

    std::optional<ServerPlayer> p = h.game.getPlayerCopy(7);
    REQUIRE(p.has_value());
    CHECK(p->name == "alice");
    CHECK(reply.spawnPosition.x == doctest::Approx(p->position.x));

    REQUIRE(h.sync());
    CHECK(h.session->State() == SessionState::Active);
    CHECK(h.session->IsActive());
}

TEST_CASE("ping is answered in any state") {
    SessionHarness h;
    PingPacket ping;
    ping.timestamp = 123.5;
    ping.sequence = 7;
    REQUIRE(sendPacket(h.clientFd, ping));

    std::optional<Packet> p = readPacket(h.clientFd);
    REQUIRE(p.has_value());
    REQUIRE(packetTypeOf(*p) == PacketType::Pong);
    const PongPacket& pong = std::get<PongPacket>(*p);
    CHECK(pong.sequence == 7);
    CHECK(pong.timestamp == doctest::Approx(123.5));
    CHECK(pong.serverTime > 0.0);
    CHECK(h.session->State() == SessionState::Connecting);
}

TEST_CASE("gameplay packets before the handshake are dropped") {
    SessionHarness h;
    MovePacket m;
    m.dx = 1.0f;
    m.sequence = 1;
    REQUIRE(sendPacket(h.clientFd, m));
    SkillPacket s;
    s.skillName = "push";
    REQUIRE(sendPacket(h.clientFd, s));
    REQUIRE(sendPacket(h.clientFd, GetGameStatePacket{}));

    PingPacket ping;
    ping.sequence = 55;
    REQUIRE(sendPacket(h.clientFd, ping));
    // the pong is the first thing back: nothing was answered or queued
    std::optional<Packet> first = readPacket(h.clientFd);
    REQUIRE(first.has_value());
    REQUIRE(packetTypeOf(*first) == PacketType::Pong);
    CHECK(std::get<PongPacket>(*first).sequence == 55);
    CHECK(h.game.playerCount() == 0);
    CHECK(h.session->CloseReason() == SessionError::None);
    CHECK_FALSE(h.session->EnqueueSnapshot(std::make_shared<const std::vector<uint8_t>>(encodeFrame("x"))));
}

TEST_CASE("name collision offers suggestions and allows one retry") {
    SessionHarness h;
    REQUIRE(h.game.addPlayer(99, "alice").result == JoinResult::Joined);

    REQUIRE(h.connect("alice"));
    std::optional<Packet> p = readPacket(h.clientFd);
    REQUIRE(p.has_value());
    REQUIRE(packetTypeOf(*p) == PacketType::UsernameTaken);
    const UsernameTakenPacket& taken = std::get<UsernameTakenPacket>(*p);
    CHECK(taken.message == h.cfg.network.usernameTakenMessage);
    REQUIRE_FALSE(taken.suggestions.empty());

    REQUIRE(h.connect(taken.suggestions.front()));
    const PlayerIdPacket reply = expectPlayerId(h.clientFd);
    CHECK(reply.playerId == 7);
    CHECK(h.game.getPlayerCopy(7)->name == taken.suggestions.front());
}

TEST_CASE("second name collision closes the session") {
    SessionHarness h;
    REQUIRE(h.game.addPlayer(99, "alice").result == JoinResult::Joined);

    REQUIRE(h.connect("alice"));
    REQUIRE(readUntil(h.clientFd, PacketType::UsernameTaken).has_value());
    REQUIRE(h.connect("alice"));
    CHECK(waitForClose(h.clientFd));
    h.join();
    CHECK(h.session->CloseReason() == SessionError::Validation);
    CHECK(h.session->State() == SessionState::Closed);
    CHECK(h.finishedCalls.load() == 1);
    CHECK(h.game.playerCount() == 1);
}

TEST_CASE("invalid name closes the session") {
    SessionHarness h;
    REQUIRE(h.connect("no spaces allowed"));
    CHECK(waitForClose(h.clientFd));
    h.join();
    CHECK(h.session->CloseReason() == SessionError::Validation);
    CHECK(h.game.playerCount() == 0);
}

TEST_CASE("full server refuses the join") {
    ServerConfig cfg = makeTestConfig();
    cfg.game.maxPlayers = 1;
    SessionHarness h(cfg);
    REQUIRE(h.game.addPlayer(50, "zed").result == JoinResult::Joined);

    REQUIRE(h.connect("alice"));
    std::optional<Packet> p = readPacket(h.clientFd);
    REQUIRE(p.has_value());
    REQUIRE(packetTypeOf(*p) == PacketType::ServerFull);
    CHECK(std::get<ServerFullPacket>(*p).maxPlayers == 1);
    CHECK(waitForClose(h.clientFd));
    h.join();
    CHECK(h.session->CloseReason() == SessionError::Validation);
}

TEST_CASE("oversized frame is a protocol error") {
    SessionHarness h;
    uint8_t header[kFrameHeaderSize];
    writeFrameHeader(header, h.cfg.network.maxMessageSize + 1);
    REQUIRE(writeRaw(h.clientFd, header, sizeof(header)));
    CHECK(waitForClose(h.clientFd));
    h.join();
    CHECK(h.session->CloseReason() == SessionError::Protocol);
}

TEST_CASE("malformed payload is a protocol error") {
    SessionHarness h;
    const std::vector<uint8_t> frame = encodeFrame("{\"type\":\"move\",\"dx\":");
    REQUIRE(writeRaw(h.clientFd, frame.data(), frame.size()));
    CHECK(waitForClose(h.clientFd));
    h.join();
    CHECK(h.session->CloseReason() == SessionError::Protocol);
}

TEST_CASE("server-only packet from a client is a protocol error") {
    SessionHarness h;
    PlayerIdPacket bogus;
    bogus.playerId = 1;
    REQUIRE(sendPacket(h.clientFd, bogus));
    CHECK(waitForClose(h.clientFd));
    h.join();
    CHECK(h.session->CloseReason() == SessionError::Protocol);
}

TEST_CASE("silent client hits the handshake timeout") {
    ServerConfig cfg = makeTestConfig();
    cfg.network.handshakeTimeout = 0.2f;
    SessionHarness h(cfg);
    CHECK(waitForClose(h.clientFd));
    h.join();
    CHECK(h.session->CloseReason() == SessionError::Timeout);
}

TEST_CASE("move and skill reach the game once active") {
    SessionHarness h;
    REQUIRE(h.connect("alice"));
    expectPlayerId(h.clientFd);

    MovePacket m;
    m.dx = 0.0f;
    m.dy = 1.0f;
    m.sequence = 3;
    REQUIRE(sendPacket(h.clientFd, m));
    SkillPacket s;
    s.skillName = "pull";
    REQUIRE(sendPacket(h.clientFd, s));
    REQUIRE(h.sync());

    const ServerPlayer p = *h.game.getPlayerCopy(7);
    CHECK(p.hasMoved);
    CHECK(p.lastMoveSequence == 3);
    CHECK(p.pendingIntent.y == doctest::Approx(1.0f));
    CHECK(p.pull.isActive());
    CHECK_FALSE(p.push.isActive());
}

TEST_CASE("get_game_state returns the latest snapshot") {
    SessionHarness h;
    REQUIRE(h.connect("alice"));
    expectPlayerId(h.clientFd);
    h.game.tick(0.1f, Clock::now());

    REQUIRE(sendPacket(h.clientFd, GetGameStatePacket{}));
    std::optional<Packet> p = readUntil(h.clientFd, PacketType::GameState);
    REQUIRE(p.has_value());
    const GameStatePacket& gs = std::get<GameStatePacket>(*p);
    CHECK(gs.serverTick == 1);
    REQUIRE(gs.players.count(7) == 1);
    CHECK(gs.players.at(7).name == "alice");
}

TEST_CASE("queued snapshots are coalesced") {
    SessionHarness h;
    REQUIRE(h.connect("alice"));
    expectPlayerId(h.clientFd);
    REQUIRE(h.sync());

    stallWriter(h);
    for (uint64_t tick = 2; tick <= 5; ++tick) {
        CHECK(h.session->EnqueueSnapshot(makeTickFrame(tick)));
        CHECK(h.session->QueuedFrames() == 1);
    }

    REQUIRE(skipFrame(h.clientFd));
    PingPacket ping;
    ping.sequence = 42;
    REQUIRE(sendPacket(h.clientFd, ping));

    // only the newest snapshot survives, and it goes out before the later pong
    std::optional<Packet> p = readPacket(h.clientFd);
    REQUIRE(p.has_value());
    REQUIRE(packetTypeOf(*p) == PacketType::GameState);
    CHECK(std::get<GameStatePacket>(*p).serverTick == 5);
    p = readPacket(h.clientFd);
    REQUIRE(p.has_value());
    REQUIRE(packetTypeOf(*p) == PacketType::Pong);
    CHECK(std::get<PongPacket>(*p).sequence == 42);
}

TEST_CASE("outbound queue overflow closes a slow consumer") {
    ServerConfig cfg = makeTestConfig();
    cfg.network.maxOutboundFrames = 2;
    SessionHarness h(cfg);
    REQUIRE(h.connect("alice"));
    expectPlayerId(h.clientFd);
    REQUIRE(h.sync());

    stallWriter(h);
    PongPacket pong;
    CHECK(h.session->Send(pong));
    CHECK(h.session->Send(pong));
    CHECK_FALSE(h.session->Send(pong));
    CHECK_FALSE(h.session->EnqueueSnapshot(makeTickFrame(9)));

    h.join();
    CHECK(h.session->CloseReason() == SessionError::Connection);
    CHECK(h.session->State() == SessionState::Closed);
    CHECK(h.game.playerCount() == 0);
    CHECK(h.finishedCalls.load() == 1);
}

TEST_CASE("idle active client hits the keepalive timeout") {
    ServerConfig cfg = makeTestConfig();
    cfg.network.clientTimeout = 0.3f;
    SessionHarness h(cfg);
    REQUIRE(h.connect("alice"));
    expectPlayerId(h.clientFd);
    REQUIRE(h.game.playerCount() == 1);

    CHECK(waitForClose(h.clientFd));
    h.join();
    CHECK(h.session->CloseReason() == SessionError::Timeout);
    CHECK(h.game.playerCount() == 0);
    CHECK(h.finishedCalls.load() == 1);
}

TEST_CASE("protocol error removes the player while the client is not reading") {
    ServerConfig cfg = makeTestConfig();
    cfg.network.clientTimeout = 30.0f;
    SessionHarness h(cfg);
    REQUIRE(h.connect("alice"));
    expectPlayerId(h.clientFd);
    REQUIRE(h.sync());

    stallWriter(h);
    const auto start = std::chrono::steady_clock::now();
    uint8_t header[kFrameHeaderSize];
    writeFrameHeader(header, h.cfg.network.maxMessageSize + 1);
    REQUIRE(writeRaw(h.clientFd, header, sizeof(header)));

    REQUIRE(eventually([&]() { return h.game.playerCount() == 0; }));
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));

    h.join();
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
    CHECK(h.session->CloseReason() == SessionError::Protocol);
    CHECK(h.finishedCalls.load() == 1);
}

TEST_CASE("client disconnect removes the player") {
    SessionHarness h;
    REQUIRE(h.connect("alice"));
    expectPlayerId(h.clientFd);
    REQUIRE(h.game.playerCount() == 1);

    ::close(h.clientFd);
    h.clientFd = -1;
    h.join();
    CHECK(h.game.playerCount() == 0);
    CHECK(h.session->CloseReason() == SessionError::Connection);
    CHECK(h.finishedCalls.load() == 1);
    CHECK(h.finishedId.load() == 7);
}

TEST_CASE("server-side stop closes without an error") {
    SessionHarness h;
    REQUIRE(h.connect("alice"));
    expectPlayerId(h.clientFd);

    h.session->RequestStop();
    CHECK(waitForClose(h.clientFd));
    h.join();
    CHECK(h.session->CloseReason() == SessionError::None);
    CHECK(h.session->State() == SessionState::Closed);
    CHECK(h.game.playerCount() == 0);
}

} // TEST_SUITE("session")
