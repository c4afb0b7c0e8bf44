#include "Packets.hpp"
#include <charconv>
#include <cmath>
#include <limits>
#include <type_traits>
#include <unordered_map>

using nlohmann::json;

namespace {

    constexpr const char* kTypeKey = "type";

    // Invalid UTF-8 in a string is replaced rather than thrown on.
    inline std::string dump_json(const json& j) {
        return j.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    inline json begin_packet(PacketType type) {
        json j = json::object();
        j[kTypeKey] = packetTypeName(type);
        return j;
    }

    inline json write_position(const WirePosition& p) {
        json j = json::object();
        j["x"] = p.x;
        j["y"] = p.y;
        return j;
    }

    inline json write_color(const std::array<uint8_t, 3>& c) {
        return json::array({ static_cast<int>(c[0]), static_cast<int>(c[1]), static_cast<int>(c[2]) });
    }

    // field readers: false when the key is missing or has the wrong type
    inline bool check_type(const json& j, PacketType expected) {
        if (!j.is_object()) return false;
        auto it = j.find(kTypeKey);
        if (it == j.end() || !it->is_string()) return false;
        return it->get_ref<const std::string&>() == packetTypeName(expected);
    }

    inline bool read_string(const json& j, const char* key, std::string& out) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) return false;
        out = it->get<std::string>();
        return true;
    }

    // finite and representable as float, or the field is malformed
    inline bool as_f32(const json& v, float& out) {
        if (!v.is_number()) return false;
        const double d = v.get<double>();
        if (!std::isfinite(d) || std::abs(d) > std::numeric_limits<float>::max()) return false;
        out = static_cast<float>(d);
        return true;
    }

    inline bool read_f32(const json& j, const char* key, float& out) {
        auto it = j.find(key);
        return it != j.end() && as_f32(*it, out);
    }

    inline bool read_f64(const json& j, const char* key, double& out) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_number()) return false;
        out = it->get<double>();
        return true;
    }

    inline bool read_bool(const json& j, const char* key, bool& out) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_boolean()) return false;
        out = it->get<bool>();
        return true;
    }

    inline bool as_u64(const json& v, uint64_t& out) {
        if (v.is_number_unsigned()) {
            out = v.get<uint64_t>();
            return true;
        }
        if (v.is_number_integer()) {
            const int64_t s = v.get<int64_t>();
            if (s < 0) return false;
            out = static_cast<uint64_t>(s);
            return true;
        }
        return false;
    }

    inline bool read_u64(const json& j, const char* key, uint64_t& out) {
        auto it = j.find(key);
        if (it == j.end()) return false;
        return as_u64(*it, out);
    }

    inline bool read_u32(const json& j, const char* key, uint32_t& out) {
        uint64_t wide = 0;
        if (!read_u64(j, key, wide)) return false;
        if (wide > std::numeric_limits<uint32_t>::max()) return false;
        out = static_cast<uint32_t>(wide);
        return true;
    }

    // optional readers: absent or null -> nullopt (success), wrong type -> failure
    inline bool read_opt_string(const json& j, const char* key, std::optional<std::string>& out) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) { out.reset(); return true; }
        if (!it->is_string()) return false;
        out = it->get<std::string>();
        return true;
    }

    inline bool read_opt_f32(const json& j, const char* key, std::optional<float>& out) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) { out.reset(); return true; }
        float value = 0.0f;
        if (!as_f32(*it, value)) return false;
        out = value;
        return true;
    }

    inline bool read_opt_u32(const json& j, const char* key, std::optional<uint32_t>& out) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) { out.reset(); return true; }
        uint64_t wide = 0;
        if (!as_u64(*it, wide) || wide > std::numeric_limits<uint32_t>::max()) return false;
        out = static_cast<uint32_t>(wide);
        return true;
    }

    inline bool read_position(const json& j, const char* key, WirePosition& out) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_object()) return false;
        return read_f32(*it, "x", out.x) && read_f32(*it, "y", out.y);
    }

    // missing color keeps the default; present-but-malformed is an error
    inline bool read_color(const json& j, const char* key, std::array<uint8_t, 3>& out) {
        auto it = j.find(key);
        if (it == j.end()) return true;
        if (!it->is_array() || it->size() != 3) return false;
        for (size_t i = 0; i < 3; ++i) {
            uint64_t c = 0;
            if (!as_u64((*it)[i], c) || c > 255) return false;
            out[i] = static_cast<uint8_t>(c);
        }
        return true;
    }

    inline bool read_skill_entry(const json& skills, const char* key, SkillEntry& out) {
        auto it = skills.find(key);
        if (it == skills.end()) return true;
        if (!it->is_object()) return false;
        return read_bool(*it, "active", out.active) && read_f32(*it, "radius", out.radius);
    }

    inline bool parse_id_key(const std::string& key, uint64_t& out) {
        if (key.empty()) return false;
        const char* first = key.data();
        const char* last = key.data() + key.size();
        auto [ptr, ec] = std::from_chars(first, last, out);
        return ec == std::errc() && ptr == last;
    }

} // namespace (internal helpers)


const char* packetTypeName(PacketType type) noexcept {
    switch (type) {
    case PacketType::Connect:       return "connect";
    case PacketType::Move:          return "move";
    case PacketType::Skill:         return "skill";
    case PacketType::GetGameState:  return "get_game_state";
    case PacketType::Ping:          return "ping";
    case PacketType::Pong:          return "pong";
    case PacketType::PlayerId:      return "player_id";
    case PacketType::GameState:     return "game_state";
    case PacketType::UsernameTaken: return "username_taken";
    case PacketType::ServerFull:    return "server_full";
    }
    return "unknown";
}

std::optional<PacketType> packetTypeFromName(std::string_view name) noexcept {
    static constexpr PacketType kAll[] = {
        PacketType::Connect, PacketType::Move, PacketType::Skill, PacketType::GetGameState,
        PacketType::Ping, PacketType::Pong, PacketType::PlayerId, PacketType::GameState,
        PacketType::UsernameTaken, PacketType::ServerFull
    };
    for (PacketType t : kAll) {
        if (name == packetTypeName(t)) return t;
    }
    return std::nullopt;
}

// -------------------- ConnectPacket --------------------
std::string ConnectPacket::serialize() const {
    json j = begin_packet(kType);
    j["name"] = name;
    j["version"] = version;
    if (clientId) j["client_id"] = *clientId;
    return dump_json(j);
}

std::optional<ConnectPacket> ConnectPacket::deserialize(const json& j) {
    if (!check_type(j, kType)) return std::nullopt;
    ConnectPacket p;
    if (!read_string(j, "name", p.name)) return std::nullopt;
    if (!read_u32(j, "version", p.version)) return std::nullopt;
    if (!read_opt_string(j, "client_id", p.clientId)) return std::nullopt;
    return p;
}

// -------------------- MovePacket --------------------
std::string MovePacket::serialize() const {
    json j = begin_packet(kType);
    j["dx"] = dx;
    j["dy"] = dy;
    j["sequence"] = sequence;
    j["timestamp"] = timestamp;
    return dump_json(j);
}

std::optional<MovePacket> MovePacket::deserialize(const json& j) {
    if (!check_type(j, kType)) return std::nullopt;
    MovePacket p;
    if (!read_f32(j, "dx", p.dx)) return std::nullopt;
    if (!read_f32(j, "dy", p.dy)) return std::nullopt;
    if (!read_u64(j, "sequence", p.sequence)) return std::nullopt;
    if (!read_f64(j, "timestamp", p.timestamp)) return std::nullopt;
    return p;
}

// -------------------- SkillPacket --------------------
std::string SkillPacket::serialize() const {
    json j = begin_packet(kType);
    j["skill_name"] = skillName;
    j["target_x"] = targetX;
    j["target_y"] = targetY;
    if (direction) j["direction"] = *direction;
    return dump_json(j);
}

std::optional<SkillPacket> SkillPacket::deserialize(const json& j) {
    if (!check_type(j, kType)) return std::nullopt;
    SkillPacket p;
    if (!read_string(j, "skill_name", p.skillName)) return std::nullopt;
    if (!read_f32(j, "target_x", p.targetX)) return std::nullopt;
    if (!read_f32(j, "target_y", p.targetY)) return std::nullopt;
    if (!read_opt_f32(j, "direction", p.direction)) return std::nullopt;
    return p;
}

// -------------------- GetGameStatePacket --------------------
std::string GetGameStatePacket::serialize() const {
    json j = begin_packet(kType);
    j["full_update"] = fullUpdate;
    j["last_ack"] = lastAck;
    return dump_json(j);
}

std::optional<GetGameStatePacket> GetGameStatePacket::deserialize(const json& j) {
    if (!check_type(j, kType)) return std::nullopt;
    GetGameStatePacket p;
    if (!read_bool(j, "full_update", p.fullUpdate)) return std::nullopt;
    if (!read_u64(j, "last_ack", p.lastAck)) return std::nullopt;
    return p;
}

// -------------------- PingPacket / PongPacket --------------------
std::string PingPacket::serialize() const {
    json j = begin_packet(kType);
    j["timestamp"] = timestamp;
    j["sequence"] = sequence;
    return dump_json(j);
}

std::optional<PingPacket> PingPacket::deserialize(const json& j) {
    if (!check_type(j, kType)) return std::nullopt;
    PingPacket p;
    if (!read_f64(j, "timestamp", p.timestamp)) return std::nullopt;
    if (!read_u64(j, "sequence", p.sequence)) return std::nullopt;
    return p;
}

std::string PongPacket::serialize() const {
    json j = begin_packet(kType);
    j["timestamp"] = timestamp;
    j["sequence"] = sequence;
    j["server_time"] = serverTime;
    return dump_json(j);
}

std::optional<PongPacket> PongPacket::deserialize(const json& j) {
    if (!check_type(j, kType)) return std::nullopt;
    PongPacket p;
    if (!read_f64(j, "timestamp", p.timestamp)) return std::nullopt;
    if (!read_u64(j, "sequence", p.sequence)) return std::nullopt;
    if (!read_f64(j, "server_time", p.serverTime)) return std::nullopt;
    return p;
}

// -------------------- PlayerIdPacket --------------------
std::string PlayerIdPacket::serialize() const {
    json j = begin_packet(kType);
    j["player_id"] = playerId;
    j["spawn_position"] = write_position(spawnPosition);
    j["server_tick_rate"] = serverTickRate;
    return dump_json(j);
}

std::optional<PlayerIdPacket> PlayerIdPacket::deserialize(const json& j) {
    if (!check_type(j, kType)) return std::nullopt;
    PlayerIdPacket p;
    if (!read_u64(j, "player_id", p.playerId)) return std::nullopt;
    if (!read_position(j, "spawn_position", p.spawnPosition)) return std::nullopt;
    if (!read_f32(j, "server_tick_rate", p.serverTickRate)) return std::nullopt;
    return p;
}

// -------------------- GameStatePacket --------------------
std::string GameStatePacket::serialize() const {
    json j = begin_packet(kType);

    json playersJson = json::object();
    for (const auto& [id, entry] : players) {
        json pj = json::object();
        pj["position"] = write_position(entry.position);
        pj["radius"] = entry.radius;
        pj["score"] = entry.score;
        if (entry.health) pj["health"] = *entry.health;
        pj["name"] = entry.name;
        pj["color"] = write_color(entry.color);
        json skills = json::object();
        skills["push"] = { { "active", entry.push.active }, { "radius", entry.push.radius } };
        skills["pull"] = { { "active", entry.pull.active }, { "radius", entry.pull.radius } };
        pj["skills"] = std::move(skills);
        playersJson[std::to_string(id)] = std::move(pj);
    }
    j["players"] = std::move(playersJson);

    json foodJson = json::array();
    for (const FoodEntry& f : food) {
        json fj = json::object();
        fj["id"] = f.id;
        fj["position"] = write_position(f.position);
        fj["type"] = f.type;
        fj["value"] = f.value;
        fj["radius"] = f.radius;
        fj["color"] = write_color(f.color);
        foodJson.push_back(std::move(fj));
    }
    j["food"] = std::move(foodJson);

    j["server_tick"] = serverTick;
    j["timestamp"] = timestamp;
    return dump_json(j);
}

std::optional<GameStatePacket> GameStatePacket::deserialize(const json& j) {
    if (!check_type(j, kType)) return std::nullopt;
    GameStatePacket p;

    auto playersIt = j.find("players");
    if (playersIt == j.end() || !playersIt->is_object()) return std::nullopt;
    for (auto it = playersIt->begin(); it != playersIt->end(); ++it) {
        uint64_t id = 0;
        if (!parse_id_key(it.key(), id)) return std::nullopt;
        const json& pj = it.value();
        if (!pj.is_object()) return std::nullopt;

        PlayerStateEntry entry;
        if (!read_position(pj, "position", entry.position)) return std::nullopt;
        if (!read_f32(pj, "radius", entry.radius)) return std::nullopt;
        if (!read_u64(pj, "score", entry.score)) return std::nullopt;
        if (!read_opt_f32(pj, "health", entry.health)) return std::nullopt;
        if (pj.contains("name") && !read_string(pj, "name", entry.name)) return std::nullopt;
        if (!read_color(pj, "color", entry.color)) return std::nullopt;
        auto skillsIt = pj.find("skills");
        if (skillsIt != pj.end()) {
            if (!skillsIt->is_object()) return std::nullopt;
            if (!read_skill_entry(*skillsIt, "push", entry.push)) return std::nullopt;
            if (!read_skill_entry(*skillsIt, "pull", entry.pull)) return std::nullopt;
        }
        p.players.emplace(id, std::move(entry));
    }

    auto foodIt = j.find("food");
    if (foodIt == j.end() || !foodIt->is_array()) return std::nullopt;
    p.food.reserve(foodIt->size());
    for (const json& fj : *foodIt) {
        if (!fj.is_object()) return std::nullopt;
        FoodEntry f;
        if (!read_u64(fj, "id", f.id)) return std::nullopt;
        if (!read_position(fj, "position", f.position)) return std::nullopt;
        if (!read_string(fj, "type", f.type)) return std::nullopt;
        if (!read_u32(fj, "value", f.value)) return std::nullopt;
        if (fj.contains("radius") && !read_f32(fj, "radius", f.radius)) return std::nullopt;
        if (!read_color(fj, "color", f.color)) return std::nullopt;
        p.food.push_back(std::move(f));
    }

    if (!read_u64(j, "server_tick", p.serverTick)) return std::nullopt;
    if (!read_f64(j, "timestamp", p.timestamp)) return std::nullopt;
    return p;
}

// -------------------- UsernameTakenPacket --------------------
std::string UsernameTakenPacket::serialize() const {
    json j = begin_packet(kType);
    j["message"] = message;
    j["suggestions"] = suggestions;
    return dump_json(j);
}

std::optional<UsernameTakenPacket> UsernameTakenPacket::deserialize(const json& j) {
    if (!check_type(j, kType)) return std::nullopt;
    UsernameTakenPacket p;
    if (!read_string(j, "message", p.message)) return std::nullopt;
    auto it = j.find("suggestions");
    if (it == j.end() || !it->is_array()) return std::nullopt;
    for (const json& s : *it) {
        if (!s.is_string()) return std::nullopt;
        p.suggestions.push_back(s.get<std::string>());
    }
    return p;
}

// -------------------- ServerFullPacket --------------------
std::string ServerFullPacket::serialize() const {
    json j = begin_packet(kType);
    j["message"] = message;
    j["max_players"] = maxPlayers;
    if (queuePosition) j["queue_position"] = *queuePosition;
    return dump_json(j);
}

std::optional<ServerFullPacket> ServerFullPacket::deserialize(const json& j) {
    if (!check_type(j, kType)) return std::nullopt;
    ServerFullPacket p;
    if (!read_string(j, "message", p.message)) return std::nullopt;
    if (!read_u32(j, "max_players", p.maxPlayers)) return std::nullopt;
    if (!read_opt_u32(j, "queue_position", p.queuePosition)) return std::nullopt;
    return p;
}

// -------------------- variant codec --------------------
namespace {

    using Decoder = std::optional<Packet> (*)(const json&);

    template <typename T>
    std::optional<Packet> decodeAs(const json& j) {
        std::optional<T> p = T::deserialize(j);
        if (!p) return std::nullopt;
        return Packet{ std::move(*p) };
    }

    const std::unordered_map<PacketType, Decoder>& decoderTable() {
        static const std::unordered_map<PacketType, Decoder> table = {
            { PacketType::Connect,       &decodeAs<ConnectPacket> },
            { PacketType::Move,          &decodeAs<MovePacket> },
            { PacketType::Skill,         &decodeAs<SkillPacket> },
            { PacketType::GetGameState,  &decodeAs<GetGameStatePacket> },
            { PacketType::Ping,          &decodeAs<PingPacket> },
            { PacketType::Pong,          &decodeAs<PongPacket> },
            { PacketType::PlayerId,      &decodeAs<PlayerIdPacket> },
            { PacketType::GameState,     &decodeAs<GameStatePacket> },
            { PacketType::UsernameTaken, &decodeAs<UsernameTakenPacket> },
            { PacketType::ServerFull,    &decodeAs<ServerFullPacket> },
        };
        return table;
    }

} // namespace

PacketType packetTypeOf(const Packet& packet) noexcept {
    return std::visit([](const auto& p) { return std::decay_t<decltype(p)>::kType; }, packet);
}

std::string encodePacket(const Packet& packet) {
    return std::visit([](const auto& p) { return p.serialize(); }, packet);
}

std::optional<Packet> decodePacket(std::string_view payload) {
    const json j = json::parse(payload.begin(), payload.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    auto typeIt = j.find(kTypeKey);
    if (typeIt == j.end() || !typeIt->is_string()) return std::nullopt;

    const std::optional<PacketType> type = packetTypeFromName(typeIt->get_ref<const std::string&>());
    if (!type) return std::nullopt;

    const auto& table = decoderTable();
    auto decoderIt = table.find(*type);
    if (decoderIt == table.end()) return std::nullopt;
    return decoderIt->second(j);
}
