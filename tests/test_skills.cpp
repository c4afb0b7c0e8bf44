#include <doctest/doctest.h>
#include "player/SkillState.hpp"

using namespace std::chrono_literals;

namespace {
    SkillConfig pushConfig() {
        SkillConfig c;
        c.level = 1;
        c.baseRadius = 60.0f;
        c.radiusPerLevel = 10.0f;
        c.force = 600.0f;
        c.duration = 0.5f;
        c.cooldown = 5.0f;
        c.sizeThresholdMultiplier = 1.5f;
        return c;
    }
}

TEST_SUITE("skills") {

TEST_CASE("names") {
    CHECK(skillKindFromName("push") == SkillKind::Push);
    CHECK(skillKindFromName("pull") == SkillKind::Pull);
    CHECK_FALSE(skillKindFromName("dash").has_value());
    CHECK_FALSE(skillKindFromName("PUSH").has_value());
    CHECK(std::string(skillKindName(SkillKind::Pull)) == "pull");
}

TEST_CASE("cooldown gates activation from the previous use") {
    SkillState s(SkillKind::Push, pushConfig());
    const Clock::time_point t0 = Clock::now();

    CHECK(s.phase(t0) == SkillPhase::Ready);
    CHECK(s.activate(t0));
    CHECK(s.isActive());
    CHECK(s.phase(t0) == SkillPhase::Active);

    CHECK_FALSE(s.activate(t0 + 1s));
    CHECK_FALSE(s.activate(t0 + 4900ms));
    CHECK(s.activate(t0 + 5s));
    REQUIRE(s.lastUsed().has_value());
    CHECK(*s.lastUsed() == t0 + 5s);
}

TEST_CASE("active skill expires after its duration") {
    SkillState s(SkillKind::Push, pushConfig());
    const Clock::time_point t0 = Clock::now();
    REQUIRE(s.activate(t0));

    CHECK_FALSE(s.update(t0 + 200ms));
    CHECK(s.isActive());
    CHECK(s.update(t0 + 500ms));
    CHECK_FALSE(s.isActive());
    CHECK(s.phase(t0 + 1s) == SkillPhase::Cooldown);
    CHECK(s.phase(t0 + 5s) == SkillPhase::Ready);
    // already expired
    CHECK_FALSE(s.update(t0 + 6s));
}

TEST_CASE("reset makes the skill ready at once") {
    SkillState s(SkillKind::Pull, pushConfig());
    const Clock::time_point t0 = Clock::now();
    REQUIRE(s.activate(t0));
    s.reset();
    CHECK_FALSE(s.isActive());
    CHECK_FALSE(s.lastUsed().has_value());
    CHECK(s.activate(t0 + 10ms));
}

TEST_CASE("effective radius grows with level and caster size") {
    SkillState s(SkillKind::Push, pushConfig());
    CHECK(s.effectiveRadius(20.0f) == doctest::Approx(90.0f));
    s.setLevel(3);
    CHECK(s.level() == 3);
    CHECK(s.effectiveRadius(20.0f) == doctest::Approx(110.0f));
    CHECK(s.effectiveRadius(-5.0f) == doctest::Approx(90.0f));
}

TEST_CASE("displacement falls off linearly with distance") {
    SkillState s(SkillKind::Push, pushConfig());
    // effective radius 90 for a caster of radius 20
    CHECK(s.proximityDisplacement(45.0f, 20.0f, 0.1f) == doctest::Approx(30.0f));
    CHECK(s.proximityDisplacement(0.0f, 20.0f, 0.1f) == doctest::Approx(600.0f * (1.0f - 1.0f / 90.0f) * 0.1f));
    CHECK(s.proximityDisplacement(90.0f, 20.0f, 0.1f) == doctest::Approx(0.0f));
    CHECK(s.proximityDisplacement(91.0f, 20.0f, 0.1f) == 0.0f);
}

TEST_CASE("size threshold is strict") {
    SkillState s(SkillKind::Push, pushConfig());
    CHECK_FALSE(s.exceedsSizeThreshold(30.0f, 20.0f));
    CHECK(s.exceedsSizeThreshold(30.5f, 20.0f));
}

} // TEST_SUITE("skills")
