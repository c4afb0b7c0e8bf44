#include "SnapshotPacket.hpp"
#include "../../Shared/network/Framing.hpp"

FramePtr makeFrame(const Packet& packet) {
    return std::make_shared<const std::vector<uint8_t>>(encodeFrame(encodePacket(packet)));
}

GameStatePacket buildGameStatePacket(const GameStateSnapshot& snapshot) {
    GameStatePacket pkt;
    pkt.serverTick = snapshot.tick;
    pkt.timestamp = snapshot.timestamp;

    for (const PlayerView& p : snapshot.players) {
        PlayerStateEntry e;
        e.position = WirePosition{ p.position.x, p.position.y };
        e.radius = p.radius;
        e.score = p.score;
        e.health = p.health;
        e.name = p.name;
        e.color = p.color;
        e.push = SkillEntry{ p.push.active, p.push.radius };
        e.pull = SkillEntry{ p.pull.active, p.pull.radius };
        pkt.players.emplace(p.id, std::move(e));
    }

    pkt.food.reserve(snapshot.food.size());
    for (const FoodView& f : snapshot.food) {
        FoodEntry e;
        e.id = f.id;
        e.position = WirePosition{ f.position.x, f.position.y };
        e.value = f.value;
        e.radius = f.radius;
        e.color = f.color;
        pkt.food.push_back(std::move(e));
    }
    return pkt;
}

FramePtr encodeSnapshotFrame(const GameStateSnapshot& snapshot) {
    return makeFrame(Packet{ buildGameStatePacket(snapshot) });
}
