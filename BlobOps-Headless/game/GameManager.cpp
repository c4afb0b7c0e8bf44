#include "GameManager.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <glm/geometric.hpp>

namespace {

    const ServerConfig& validated(const ServerConfig& config) {
        validateServerConfig(config);
        return config;
    }

    bool isNameChar(char c) noexcept {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
    }

    // unit vector from `from` towards `to`; +x when they coincide
    glm::vec2 directionBetween(glm::vec2 from, glm::vec2 to, float dist) {
        if (dist <= 1e-6f) return { 1.0f, 0.0f };
        return (to - from) / dist;
    }

    Clock::duration secondsToDuration(float seconds) {
        return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<float>(seconds));
    }

    double wallClockSeconds() {
        return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
    }

} // namespace

bool isValidPlayerName(std::string_view name) noexcept {
    if (name.size() < kMinNameLength || name.size() > kMaxNameLength) return false;
    return std::all_of(name.begin(), name.end(), isNameChar);
}

GameManager::GameManager(const ServerConfig& config)
    : m_config(validated(config)),
    m_bounds(worldBounds(config.world)),
    m_foodGrid(config.world.width, config.world.height, config.food.gridCellSize)
{
    if (m_config.game.randomSeed != 0) {
        m_rng.seed(m_config.game.randomSeed);
    }
    else {
        std::random_device rd;
        m_rng.seed((static_cast<uint64_t>(rd()) << 32) ^ rd());
    }

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_food.reserve(m_config.food.maxCount);
    while (m_food.size() < m_config.food.minCount) {
        spawnFoodLocked(randomFoodPosition(), m_config.food.value);
    }
    publishSnapshot();
    std::cout << "[game] world " << m_bounds.width << "x" << m_bounds.height
        << " food=" << m_food.size() << " tick_rate=" << m_config.game.tickRate << "\n";
}

JoinOutcome GameManager::addPlayer(PlayerID id, const std::string& name) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    JoinOutcome out;

    if (!isValidPlayerName(name)) {
        out.result = JoinResult::InvalidName;
        return out;
    }
    if (m_players.size() >= m_config.game.maxPlayers) {
        out.result = JoinResult::ServerFull;
        return out;
    }
    if (nameInUse(name)) {
        out.result = JoinResult::NameTaken;
        return out;
    }
    if (m_players.count(id) != 0) {
        std::cerr << "[game] duplicate player id=" << id << "\n";
        out.result = JoinResult::NameTaken;
        return out;
    }

    ServerPlayer p;
    p.id = id;
    p.name = name;
    p.radius = radiusForScore(0);
    p.position = findSpawnPoint();
    p.color = pick(m_config.player.colors);
    p.push = SkillState(SkillKind::Push, m_config.skills.push);
    p.pull = SkillState(SkillKind::Pull, m_config.skills.pull);

    out.result = JoinResult::Joined;
    out.spawnPosition = p.position;
    m_players.emplace(id, std::move(p));
    std::cout << "[game] player joined id=" << id << " name=" << name
        << " pos=(" << out.spawnPosition.x << "," << out.spawnPosition.y << ")\n";
    return out;
}

bool GameManager::removePlayer(PlayerID id) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto it = m_players.find(id);
    if (it == m_players.end()) return false;
    std::cout << "[game] player left id=" << id << " name=" << it->second.name
        << " score=" << it->second.score << "\n";
    m_players.erase(it);
    return true;
}

bool GameManager::recordMoveIntent(PlayerID id, float dx, float dy, uint64_t sequence) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto it = m_players.find(id);
    if (it == m_players.end()) return false;
    ServerPlayer& p = it->second;
    if (p.hasMoved && sequence <= p.lastMoveSequence) return false;

    p.lastMoveSequence = sequence;
    p.hasMoved = true;
    if (!p.alive) return false;

    glm::vec2 intent{ 0.0f };
    if (std::isfinite(dx) && std::isfinite(dy)) {
        const float len = std::sqrt(dx * dx + dy * dy);
        if (len > 1e-6f && std::isfinite(len)) {
            intent = glm::vec2(dx, dy) / len;
        }
    }
    p.pendingIntent = intent;
    return true;
}

bool GameManager::activateSkill(PlayerID id, std::string_view skillName, Clock::time_point now) {
    const std::optional<SkillKind> kind = skillKindFromName(skillName);
    if (!kind) return false;

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto it = m_players.find(id);
    if (it == m_players.end() || !it->second.alive) return false;
    return it->second.skill(*kind).activate(now);
}

SnapshotPtr GameManager::tick(float dt, Clock::time_point now) {
    if (!std::isfinite(dt) || dt < 0.0f) dt = 0.0f;

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    applyIntents(dt);
    resolveSkills(dt, now);
    resolveFoodCollisions();
    std::vector<PlayerID> eaten;
    resolvePlayerCollisions(eaten);
    handleDeathsAndRespawns(eaten, now);
    replenishFood(dt);
    runPlayerHooks(dt);
    ++m_tick;
    return publishSnapshot();
}

void GameManager::applyIntents(float dt) {
    for (auto& [id, p] : m_players) {
        if (!p.alive) continue;
        const glm::vec2 intent = p.pendingIntent;
        p.pendingIntent = glm::vec2(0.0f);
        p.moving = intent.x != 0.0f || intent.y != 0.0f;
        if (p.moving) {
            p.position += intent * speedForRadius(p.radius) * dt;
        }
        p.position = m_bounds.clamp(p.position, p.radius);
    }
}

void GameManager::resolveSkills(float dt, Clock::time_point now) {
    for (auto& [id, p] : m_players) {
        if (!p.alive) continue;
        for (SkillKind k : { SkillKind::Push, SkillKind::Pull }) {
            SkillState& skill = p.skill(k);
            skill.update(now);
            if (skill.isActive()) {
                applySkill(p, skill, dt);
            }
        }
    }
}

void GameManager::applySkill(ServerPlayer& caster, const SkillState& skill, float dt) {
    const float eff = skill.effectiveRadius(caster.radius);
    const bool isPush = skill.kind() == SkillKind::Push;

    // an inverted push moves the caster instead of the target
    auto affect = [&](Entity& target) {
        const float dist = distance(caster, target);
        if (!(dist <= eff)) return;
        const float amount = skill.proximityDisplacement(dist, caster.radius, dt);
        if (amount <= 0.0f) return;
        const glm::vec2 away = directionBetween(caster.position, target.position, dist);
        const bool tooLarge = skill.exceedsSizeThreshold(target.radius, caster.radius);

        if (isPush) {
            if (tooLarge) {
                caster.position = m_bounds.clamp(caster.position - away * amount, caster.radius);
            }
            else {
                target.position = m_bounds.clamp(target.position + away * amount, target.radius);
            }
        }
        else if (!tooLarge) {
            // never drag the target past the caster's centre
            const float step = std::min(amount, dist);
            target.position = m_bounds.clamp(target.position - away * step, target.radius);
        }
    };

    for (auto& [otherId, other] : m_players) {
        if (otherId == caster.id || !other.alive) continue;
        affect(other);
    }
    for (Food& f : m_food) {
        affect(f);
    }
}

void GameManager::rebuildFoodGrid() {
    m_foodGrid.clear();
    for (size_t i = 0; i < m_food.size(); ++i) {
        m_foodGrid.insert(i, m_food[i].position, m_food[i].radius);
    }
}

void GameManager::resolveFoodCollisions() {
    if (m_food.empty()) return;
    rebuildFoodGrid();

    std::vector<bool> consumed(m_food.size(), false);
    size_t consumedCount = 0;
    for (auto& [id, p] : m_players) {
        if (!p.alive) continue;
        uint64_t gained = 0;
        m_foodGrid.queryOverlapping(p.position, p.radius, [&](const SpatialGrid::Entry& e) {
            if (consumed[e.id]) return;
            consumed[e.id] = true;
            ++consumedCount;
            gained += m_food[e.id].value;
        });
        if (gained > 0) {
            p.score += gained;
            p.radius = radiusForScore(p.score);
            p.position = m_bounds.clamp(p.position, p.radius);
        }
    }
    if (consumedCount == 0) return;

    size_t write = 0;
    for (size_t read = 0; read < m_food.size(); ++read) {
        if (consumed[read]) continue;
        if (write != read) m_food[write] = std::move(m_food[read]);
        ++write;
    }
    m_food.resize(write);
}

void GameManager::resolvePlayerCollisions(std::vector<PlayerID>& eaten) {
    std::vector<ServerPlayer*> alive;
    alive.reserve(m_players.size());
    for (auto& [id, p] : m_players) {
        if (p.alive) alive.push_back(&p);
    }
    if (alive.size() < 2) return;

    std::sort(alive.begin(), alive.end(), [](const ServerPlayer* a, const ServerPlayer* b) {
        if (a->radius != b->radius) return a->radius < b->radius;
        return a->id < b->id;
    });

    auto isEaten = [&](PlayerID id) {
        return std::find(eaten.begin(), eaten.end(), id) != eaten.end();
    };

    const float ratio = m_config.game.eatRatio;
    for (ServerPlayer* victim : alive) {
        if (isEaten(victim->id)) continue;

        ServerPlayer* eater = nullptr;
        for (ServerPlayer* cand : alive) {
            if (cand == victim || isEaten(cand->id)) continue;
            if (cand->radius < victim->radius * ratio) continue;
            if (!overlaps(*cand, *victim)) continue;
            if (!eater || cand->radius > eater->radius
                || (cand->radius == eater->radius && cand->id < eater->id)) {
                eater = cand;
            }
        }
        if (!eater) continue;

        const double scaled = std::round(static_cast<double>(victim->score) * m_config.game.eatRewardFraction);
        const uint64_t reward = std::max<uint64_t>(m_config.game.eatRewardMinimum, static_cast<uint64_t>(scaled));
        eater->score += reward;
        eater->radius = radiusForScore(eater->score);
        eater->position = m_bounds.clamp(eater->position, eater->radius);
        victim->alive = false;
        eaten.push_back(victim->id);

        std::cout << "[game] " << eater->name << " (id=" << eater->id << ") ate "
            << victim->name << " (id=" << victim->id << ") reward=" << reward << "\n";
    }
}

void GameManager::resetForRespawn(ServerPlayer& p) {
    p.score = 0;
    p.radius = radiusForScore(0);
    p.pendingIntent = glm::vec2(0.0f);
    p.moving = false;
    p.push.reset();
    p.pull.reset();
}

void GameManager::handleDeathsAndRespawns(const std::vector<PlayerID>& eaten, Clock::time_point now) {
    const Clock::duration cooldown = secondsToDuration(m_config.game.respawnCooldown);
    for (PlayerID id : eaten) {
        auto it = m_players.find(id);
        if (it == m_players.end()) continue;
        it->second.respawnAt = now + cooldown;
        resetForRespawn(it->second);
    }

    for (auto& [id, p] : m_players) {
        if (p.alive || p.respawnAt > now) continue;
        resetForRespawn(p);
        p.position = findSpawnPoint();
        p.alive = true;
        std::cout << "[game] respawn id=" << id << " pos=(" << p.position.x << "," << p.position.y << ")\n";
    }
}

void GameManager::replenishFood(float dt) {
    const FoodConfig& fc = m_config.food;
    while (m_food.size() < fc.minCount) {
        spawnFoodLocked(randomFoodPosition(), fc.value);
    }

    m_foodSpawnCredit += fc.spawnRate * dt;
    while (m_foodSpawnCredit >= 1.0f && m_food.size() < fc.maxCount) {
        spawnFoodLocked(randomFoodPosition(), fc.value);
        m_foodSpawnCredit -= 1.0f;
    }
    if (m_food.size() >= fc.maxCount) {
        // no backlog while full
        m_foodSpawnCredit = std::min(m_foodSpawnCredit, 1.0f);
    }
}

void GameManager::runPlayerHooks(float dt) {
    if (!m_playerTickHook) return;
    for (auto& [id, p] : m_players) {
        if (p.alive) m_playerTickHook(p, dt);
    }
}

SnapshotPtr GameManager::publishSnapshot() {
    auto snap = std::make_shared<GameStateSnapshot>();
    snap->tick = m_tick;
    snap->timestamp = wallClockSeconds();

    snap->players.reserve(m_players.size());
    for (const auto& [id, p] : m_players) {
        if (!p.alive) continue;
        PlayerView v;
        v.id = id;
        v.name = p.name;
        v.position = p.position;
        v.radius = p.radius;
        v.score = p.score;
        v.color = p.color;
        v.push = SkillView{ p.push.isActive(), p.push.isActive() ? p.push.effectiveRadius(p.radius) : 0.0f };
        v.pull = SkillView{ p.pull.isActive(), p.pull.isActive() ? p.pull.effectiveRadius(p.radius) : 0.0f };
        if (p.survival) v.health = p.survival->health;
        snap->players.push_back(std::move(v));
    }

    snap->food.reserve(m_food.size());
    for (const Food& f : m_food) {
        snap->food.push_back(FoodView{ f.id, f.position, f.radius, f.value, f.color });
    }

    SnapshotPtr published = std::move(snap);
    {
        std::lock_guard<std::mutex> lk(m_snapshotMutex);
        m_snapshot = published;
    }
    return published;
}

SnapshotPtr GameManager::latestSnapshot() const {
    std::lock_guard<std::mutex> lk(m_snapshotMutex);
    return m_snapshot;
}

std::vector<std::string> GameManager::suggestNames(const std::string& name, size_t count) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    std::vector<std::string> out;

    std::string base;
    for (char c : name) {
        if (isNameChar(c)) base.push_back(c);
    }
    if (base.empty()) base = "player";

    for (uint32_t n = 1; out.size() < count && n < 10000; ++n) {
        const std::string suffix = std::to_string(n);
        std::string candidate = base.substr(0, kMaxNameLength - std::min(kMaxNameLength, suffix.size())) + suffix;
        while (candidate.size() < kMinNameLength) candidate.insert(0, "_");
        if (!isValidPlayerName(candidate) || nameInUse(candidate)) continue;
        if (std::find(out.begin(), out.end(), candidate) != out.end()) continue;
        out.push_back(std::move(candidate));
    }
    return out;
}

size_t GameManager::playerCount() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_players.size();
}

size_t GameManager::alivePlayerCount() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_players.begin(), m_players.end(),
        [](const auto& kv) { return kv.second.alive; }));
}

size_t GameManager::foodCount() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_food.size();
}

uint64_t GameManager::currentTick() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_tick;
}

std::optional<ServerPlayer> GameManager::getPlayerCopy(PlayerID id) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto it = m_players.find(id);
    if (it == m_players.end()) return std::nullopt;
    return it->second;
}

std::vector<Food> GameManager::getFoodCopy() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_food;
}

bool GameManager::applyAuthoritativeState(PlayerID id, glm::vec2 position, std::optional<uint64_t> score) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto it = m_players.find(id);
    if (it == m_players.end()) return false;

    ServerPlayer& p = it->second;
    if (score) {
        p.score = *score;
        p.radius = radiusForScore(p.score);
    }
    p.position = m_bounds.clamp(position, p.radius);
    return true;
}

FoodID GameManager::spawnFoodAt(glm::vec2 position, std::optional<uint32_t> value) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return spawnFoodLocked(position, value.value_or(m_config.food.value)).id;
}

void GameManager::clearFood() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_food.clear();
    m_foodSpawnCredit = 0.0f;
}

void GameManager::setPlayerTickHook(PlayerTickHook hook) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_playerTickHook = std::move(hook);
}

float GameManager::radiusForScore(uint64_t score) const noexcept {
    const PlayerConfig& pc = m_config.player;
    const double grown = std::pow(static_cast<double>(score) * pc.growthFactor, static_cast<double>(pc.growthExponent));
    const double r = static_cast<double>(pc.startRadius) + (std::isfinite(grown) ? grown : static_cast<double>(pc.maxRadius));
    return static_cast<float>(std::clamp(r, static_cast<double>(pc.startRadius), static_cast<double>(pc.maxRadius)));
}

float GameManager::speedForRadius(float radius) const noexcept {
    const PlayerConfig& pc = m_config.player;
    if (!(radius > 0.0f)) return pc.baseSpeed;
    const float scaled = pc.baseSpeed * std::pow(pc.startRadius / radius, pc.speedFalloff);
    return std::max(pc.minSpeed, scaled);
}

glm::vec2 GameManager::randomPoint(float radius) {
    auto axis = [&](float dim) {
        if (2.0f * radius >= dim) return dim * 0.5f;
        std::uniform_real_distribution<float> dist(radius, dim - radius);
        return dist(m_rng);
    };
    const float x = axis(m_bounds.width);
    const float y = axis(m_bounds.height);
    return { x, y };
}

float GameManager::nearestAlivePlayerDistance(glm::vec2 p) const {
    float best = std::numeric_limits<float>::infinity();
    for (const auto& [id, other] : m_players) {
        if (!other.alive) continue;
        best = std::min(best, glm::distance(p, other.position));
    }
    return best;
}

glm::vec2 GameManager::findSpawnPoint() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const float r = m_config.player.startRadius;
    const float minDist = m_config.game.minSpawnDistance;

    glm::vec2 best = m_bounds.clamp(m_bounds.center(), r);
    float bestNearest = -1.0f;
    for (uint32_t attempt = 0; attempt < m_config.game.spawnAttempts; ++attempt) {
        const glm::vec2 candidate = randomPoint(r);
        const float nearest = nearestAlivePlayerDistance(candidate);
        if (nearest >= minDist) return candidate;
        if (nearest > bestNearest) {
            bestNearest = nearest;
            best = candidate;
        }
    }
    return best;
}

glm::vec2 GameManager::randomFoodPosition() {
    const float r = m_config.food.radius;
    const float keepAway = m_config.food.minPlayerDistance;
    glm::vec2 candidate = randomPoint(r);
    if (keepAway <= 0.0f) return candidate;

    for (uint32_t attempt = 1; attempt < m_config.game.spawnAttempts; ++attempt) {
        bool clear = true;
        for (const auto& [id, p] : m_players) {
            if (p.alive && glm::distance(candidate, p.position) < p.radius + keepAway) {
                clear = false;
                break;
            }
        }
        if (clear) break;
        candidate = randomPoint(r);
    }
    return candidate;
}

Food& GameManager::spawnFoodLocked(glm::vec2 position, uint32_t value) {
    Food f;
    f.id = m_nextFoodId++;
    f.radius = m_config.food.radius;
    f.value = value;
    f.color = pick(m_config.food.colors);
    f.position = m_bounds.clamp(position, f.radius);
    m_food.push_back(f);
    return m_food.back();
}

bool GameManager::nameInUse(std::string_view name) const {
    for (const auto& [id, p] : m_players) {
        if (p.name == name) return true;
    }
    return false;
}
