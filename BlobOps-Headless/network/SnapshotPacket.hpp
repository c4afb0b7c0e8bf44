#pragma once
#include "../../Shared/network/Packets.hpp"
#include "../game/GameState.hpp"
#include <cstdint>
#include <memory>
#include <vector>

// One length-prefixed packet, shared between every queue it is posted to.
using FramePtr = std::shared_ptr<const std::vector<uint8_t>>;

FramePtr makeFrame(const Packet& packet);

GameStatePacket buildGameStatePacket(const GameStateSnapshot& snapshot);

// serialized once per tick and handed to every session
FramePtr encodeSnapshotFrame(const GameStateSnapshot& snapshot);
