#pragma once
#include "Entity.hpp"

using FoodID = uint64_t;

struct Food : Entity {
    FoodID id = 0;
    uint32_t value = 1; // score granted on consumption

    Food() { kind = EntityKind::Food; }
};
