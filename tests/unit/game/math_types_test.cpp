#include <gtest/gtest.h>

#include <limits>

#include "msim/game/math_types.hpp"
#include "msim/game/mob_instance.hpp"

using namespace msim::game;

// ===========================================================================
// Vector3 helpers
// ===========================================================================

TEST(MathTypesTest, DistanceAndPlanarDistance) {
    Vector3 a{0.0f, 0.0f, 0.0f};
    Vector3 b{3.0f, 12.0f, 4.0f};
    EXPECT_FLOAT_EQ(Distance(a, b), 13.0f);
    EXPECT_FLOAT_EQ(PlanarDistance(a, b), 5.0f);
}

TEST(MathTypesTest, IsFiniteRejectsNanAndInfinity) {
    EXPECT_TRUE(IsFinite({1.0f, -2.0f, 3.0f}));
    EXPECT_FALSE(IsFinite({std::numeric_limits<float>::quiet_NaN(), 0.0f, 0.0f}));
    EXPECT_FALSE(IsFinite({0.0f, 0.0f, -std::numeric_limits<float>::infinity()}));
}

TEST(MathTypesTest, MoveTowardsStepsWithoutOvershoot) {
    Vector3 from{0.0f, 0.0f, 0.0f};
    Vector3 to{10.0f, 0.0f, 0.0f};

    auto step = MoveTowards(from, to, 3.0f);
    EXPECT_FLOAT_EQ(step.x, 3.0f);
    EXPECT_FLOAT_EQ(step.z, 0.0f);

    EXPECT_EQ(MoveTowards(from, to, 25.0f), to);
    EXPECT_EQ(MoveTowards(to, to, 1.0f), to);
}

TEST(MathTypesTest, NormalizedZeroVectorStaysZero) {
    EXPECT_EQ(Vector3::Zero().Normalized(), Vector3::Zero());
    EXPECT_FLOAT_EQ(Vector3(0.0f, 0.0f, 2.0f).Normalized().z, 1.0f);
}

// ===========================================================================
// MobInstance
// ===========================================================================

TEST(MobInstanceTest, SetHealthClampsToRange) {
    MobInstance mob;
    mob.maxHealth = 50;
    mob.SetHealth(80);
    EXPECT_EQ(mob.health, 50);
    EXPECT_TRUE(mob.isAlive);

    mob.SetHealth(20);
    EXPECT_EQ(mob.health, 20);
}

TEST(MobInstanceTest, ZeroHealthKillsAndClearsTarget) {
    MobInstance mob;
    mob.maxHealth = 50;
    mob.health = 50;
    mob.aiState = MobAIState::Chasing;
    mob.target = msim::foundation::PlayerId(7);

    mob.SetHealth(-10);
    EXPECT_EQ(mob.health, 0);
    EXPECT_FALSE(mob.isAlive);
    EXPECT_EQ(mob.aiState, MobAIState::Dead);
    EXPECT_FALSE(mob.target.has_value());
}

TEST(MobInstanceTest, EngageOnlyAfterRegistration) {
    MobInstance mob;
    EXPECT_FALSE(mob.CanEngage());
    mob.registration = RegistrationState::Degraded;
    EXPECT_TRUE(mob.CanEngage());
    mob.registration = RegistrationState::Confirmed;
    EXPECT_TRUE(mob.CanEngage());
}

TEST(MobInstanceTest, AttackRangeFollowsWeaponStyle) {
    EXPECT_FLOAT_EQ(attackRangeFor(WeaponStyle::Melee), kMeleeAttackRange);
    EXPECT_FLOAT_EQ(attackRangeFor(WeaponStyle::Ranged), kRangedAttackRange);
}
