#pragma once
#include "PacketType.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/// Shared network packet definitions used by client and server.
/// A payload is a UTF-8 JSON object whose "type" field names the packet
/// (see packetTypeName). Length-prefix framing lives in Framing.hpp.
/// deserialize() never throws: missing or mistyped fields yield nullopt,
/// unknown extra fields are ignored, optional fields may be absent or null.

struct WirePosition {
    float x = 0.f;
    float y = 0.f;
};

// -------------------- client -> server --------------------

struct ConnectPacket {
    static constexpr PacketType kType = PacketType::Connect;

    std::string name;
    uint32_t version = 0;
    std::optional<std::string> clientId;

    std::string serialize() const;
    static std::optional<ConnectPacket> deserialize(const nlohmann::json& j);
};

struct MovePacket {
    static constexpr PacketType kType = PacketType::Move;

    float dx = 0.f;
    float dy = 0.f;
    uint64_t sequence = 0;
    double timestamp = 0.0;

    std::string serialize() const;
    static std::optional<MovePacket> deserialize(const nlohmann::json& j);
};

struct SkillPacket {
    static constexpr PacketType kType = PacketType::Skill;

    std::string skillName;
    float targetX = 0.f;
    float targetY = 0.f;
    std::optional<float> direction;

    std::string serialize() const;
    static std::optional<SkillPacket> deserialize(const nlohmann::json& j);
};

struct GetGameStatePacket {
    static constexpr PacketType kType = PacketType::GetGameState;

    bool fullUpdate = true;
    uint64_t lastAck = 0;

    std::string serialize() const;
    static std::optional<GetGameStatePacket> deserialize(const nlohmann::json& j);
};

// -------------------- both directions --------------------

struct PingPacket {
    static constexpr PacketType kType = PacketType::Ping;

    double timestamp = 0.0;
    uint64_t sequence = 0;

    std::string serialize() const;
    static std::optional<PingPacket> deserialize(const nlohmann::json& j);
};

struct PongPacket {
    static constexpr PacketType kType = PacketType::Pong;

    double timestamp = 0.0;
    uint64_t sequence = 0;
    double serverTime = 0.0;

    std::string serialize() const;
    static std::optional<PongPacket> deserialize(const nlohmann::json& j);
};

// -------------------- server -> client --------------------

struct PlayerIdPacket {
    static constexpr PacketType kType = PacketType::PlayerId;

    uint64_t playerId = 0;
    WirePosition spawnPosition;
    float serverTickRate = 0.f;

    std::string serialize() const;
    static std::optional<PlayerIdPacket> deserialize(const nlohmann::json& j);
};

struct SkillEntry {
    bool active = false;
    float radius = 0.f; // effective radius while active, 0 otherwise
};

struct PlayerStateEntry {
    WirePosition position;
    float radius = 0.f;
    uint64_t score = 0;
    std::optional<float> health;
    std::string name;
    std::array<uint8_t, 3> color{ 255, 255, 255 };
    SkillEntry push;
    SkillEntry pull;
};

struct FoodEntry {
    uint64_t id = 0;
    WirePosition position;
    std::string type = "food";
    uint32_t value = 0;
    float radius = 0.f;
    std::array<uint8_t, 3> color{ 255, 255, 255 };
};

struct GameStatePacket {
    static constexpr PacketType kType = PacketType::GameState;

    // keyed by player id; serialized as a JSON object with decimal string keys
    std::map<uint64_t, PlayerStateEntry> players;
    std::vector<FoodEntry> food;
    uint64_t serverTick = 0;
    double timestamp = 0.0;

    std::string serialize() const;
    static std::optional<GameStatePacket> deserialize(const nlohmann::json& j);
};

struct UsernameTakenPacket {
    static constexpr PacketType kType = PacketType::UsernameTaken;

    std::string message;
    std::vector<std::string> suggestions;

    std::string serialize() const;
    static std::optional<UsernameTakenPacket> deserialize(const nlohmann::json& j);
};

struct ServerFullPacket {
    static constexpr PacketType kType = PacketType::ServerFull;

    std::string message;
    uint32_t maxPlayers = 0;
    std::optional<uint32_t> queuePosition;

    std::string serialize() const;
    static std::optional<ServerFullPacket> deserialize(const nlohmann::json& j);
};

using Packet = std::variant<
    ConnectPacket,
    MovePacket,
    SkillPacket,
    GetGameStatePacket,
    PingPacket,
    PongPacket,
    PlayerIdPacket,
    GameStatePacket,
    UsernameTakenPacket,
    ServerFullPacket>;

PacketType packetTypeOf(const Packet& packet) noexcept;

// JSON text of the packet (no framing).
std::string encodePacket(const Packet& packet);

// Parses a payload and dispatches on its "type" field. Returns nullopt for
// invalid JSON, a non-object, an unknown type or a malformed body.
std::optional<Packet> decodePacket(std::string_view payload);
