#pragma once
#include <cstdint>
#include <optional>
#include <string_view>


// Wire discriminator. The JSON payload carries the name from packetTypeName()
// in its "type" field; the numeric value is only used inside the process.
enum class PacketType : uint8_t {
    Connect = 0,       // client -> server: name, version, client_id?
    Move = 1,          // client -> server: dx, dy, sequence, timestamp
    Skill = 2,         // client -> server: skill_name, target_x, target_y, direction?
    GetGameState = 3,  // client -> server: full_update, last_ack
    Ping = 4,          // both directions
    Pong = 5,          // both directions

    PlayerId = 10,       // server -> client: handshake accepted
    GameState = 11,      // server -> client: per-tick snapshot
    UsernameTaken = 12,  // server -> client: handshake name collision
    ServerFull = 13      // server -> client: capacity / rate limit refusal
};

const char* packetTypeName(PacketType type) noexcept;
std::optional<PacketType> packetTypeFromName(std::string_view name) noexcept;
