#include "dice/face_classifier.h"
#include "dice/roll_resolver.h"

#include "helpers/die_orientations.h"
#include "helpers/fake_clock.h"
#include "helpers/fake_physics_world.h"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace
{
    using DiceTest::face_up;
    using DiceTest::FakeClock;
    using DiceTest::FakePhysicsWorld;

    class RecordingListener final : public Dice::RollListener
    {
    public:
        void on_attempt_started(const std::string &seed, int attempt) override
        {
            seeds.push_back(seed);
            attempts.push_back(attempt);
            settled.clear();
            disturbed.clear();
        }

        void on_die_settled(size_t die_index, int face) override
        {
            settled.emplace_back(die_index, face);
        }

        void on_die_disturbed(size_t die_index) override { disturbed.push_back(die_index); }

        std::vector<std::string> seeds;
        std::vector<int> attempts;
        std::vector<std::pair<size_t, int>> settled;
        std::vector<size_t> disturbed;
    };

    struct ResolverRig
    {
        explicit ResolverRig(int die_count, double clock_step_ms = 0.0) : clock(clock_step_ms)
        {
            for (int i = 0; i < die_count; ++i)
            {
                dice.push_back(Physics::BodyBuilder(&world).cube(0.5f).dynamic_body().build());
            }
        }

        std::shared_ptr<const Dice::RollOutcome> roll(const std::optional<std::string> &seed,
                                                      const Dice::RollResolver::Config &config = {})
        {
            Dice::RollResolver resolver(world, generator, clock, config);
            auto outcome = resolver.resolve(dice, seed, &listener);
            for (const auto &w : resolver.watchers())
            {
                EXPECT_EQ(w.state(), Dice::WatcherState::Detached);
            }
            return outcome;
        }

        FakePhysicsWorld world;
        FakeClock clock;
        Dice::ScenarioGenerator generator;
        RecordingListener listener;
        std::vector<Physics::BodyId> dice;
    };
} // namespace

TEST(RollResolver, SettlesEveryDieOnItsRestingFace)
{
    ResolverRig rig(2);
    rig.world.script_rest(rig.dice[0], face_up(6, 0.3f), 5);
    rig.world.script_rest(rig.dice[1], face_up(3, -1.0f), 8);

    const auto outcome = rig.roll(std::string("abc"));

    EXPECT_EQ(outcome->state, Dice::ResolveState::Settled);
    EXPECT_EQ(outcome->face_values, (std::vector<int>{6, 3}));
    EXPECT_EQ(outcome->seed, "abc");
    EXPECT_EQ(outcome->retries, 0);
    EXPECT_EQ(outcome->steps, 8u);

    // One frame before every step plus the final frame.
    EXPECT_EQ(outcome->trajectory.size(), 9u);
    EXPECT_TRUE(outcome->trajectory.frozen());
    EXPECT_EQ(outcome->trajectory.die_count(), 2u);

    ASSERT_EQ(rig.listener.settled.size(), 2u);
    EXPECT_EQ(rig.listener.settled[0], std::make_pair(size_t{0}, 6));
    EXPECT_EQ(rig.listener.settled[1], std::make_pair(size_t{1}, 3));
}

TEST(RollResolver, FinalFrameMatchesReportedFaces)
{
    ResolverRig rig(3);
    rig.world.script_rest(rig.dice[0], face_up(2), 4);
    rig.world.script_rest(rig.dice[1], face_up(5), 6);
    rig.world.script_rest(rig.dice[2], face_up(4), 2);

    const auto outcome = rig.roll(std::string("final"));

    const Dice::TrajectoryFrame &last = outcome->trajectory.back();
    ASSERT_EQ(last.size(), 3u);
    for (size_t d = 0; d < last.size(); ++d)
    {
        EXPECT_EQ(Dice::classify_face(last[d].orientation), outcome->face_values[d]);
    }
}

TEST(RollResolver, KnockedDieReportsItsNewFace)
{
    ResolverRig rig(2);
    rig.world.script_rest(rig.dice[0], face_up(3), 2);
    rig.world.script_rest(rig.dice[0], face_up(5), 3);
    rig.world.script_knock(rig.dice[0], 4);
    rig.world.script_rest(rig.dice[1], face_up(1), 10);

    const auto outcome = rig.roll(std::string("knock"));

    EXPECT_EQ(outcome->state, Dice::ResolveState::Settled);
    EXPECT_EQ(outcome->face_values, (std::vector<int>{5, 1}));

    const Dice::TrajectoryFrame &last = outcome->trajectory.back();
    ASSERT_EQ(last.size(), 2u);
    for (size_t d = 0; d < last.size(); ++d)
    {
        EXPECT_EQ(Dice::classify_face(last[d].orientation), outcome->face_values[d]);
    }

    // Sleeps on 3 at step 2, knocked at step 4, back to rest on 5 at step 6.
    ASSERT_EQ(rig.listener.settled.size(), 3u);
    EXPECT_EQ(rig.listener.settled[0], std::make_pair(size_t{0}, 3));
    EXPECT_EQ(rig.listener.settled[1], std::make_pair(size_t{0}, 5));
    EXPECT_EQ(rig.listener.settled[2], std::make_pair(size_t{1}, 1));
    EXPECT_EQ(rig.listener.disturbed, std::vector<size_t>{0});
}

TEST(RollResolver, EdgeRestKeepsDieAwakeUntilItShowsAFace)
{
    ResolverRig rig(1);
    rig.world.script_rest(rig.dice[0], DiceTest::on_edge(), 3);
    rig.world.script_rest(rig.dice[0], face_up(2), 4);

    const auto outcome = rig.roll(std::string("edge"));

    EXPECT_EQ(outcome->state, Dice::ResolveState::Settled);
    EXPECT_EQ(outcome->face_values, std::vector<int>{2});
    EXPECT_EQ(rig.world.body(rig.dice[0]).sleep_disallowed_count, 1);
    EXPECT_TRUE(rig.world.get_allow_sleeping(rig.dice[0]));
    EXPECT_FALSE(rig.world.is_active(rig.dice[0]));

    // Asleep on the edge at step 3, tips at step 7, sleeps again at step 8.
    EXPECT_EQ(outcome->steps, 8u);
    ASSERT_EQ(rig.listener.settled.size(), 1u);
    EXPECT_EQ(rig.listener.settled[0].second, 2);
}

TEST(RollResolver, StuckRollRetriesWithFreshSeed)
{
    ResolverRig rig(1);
    rig.world.freeze_placements(rig.dice[0], 1);
    rig.world.script_rest(rig.dice[0], face_up(5), 3);

    Dice::RollResolver::Config config{};
    config.stuck_detection_steps = 10;
    config.max_retries = 3;

    const auto outcome = rig.roll(std::string("abc"), config);

    EXPECT_EQ(outcome->state, Dice::ResolveState::Settled);
    EXPECT_EQ(outcome->retries, 1);
    EXPECT_EQ(outcome->face_values, std::vector<int>{5});
    EXPECT_NE(outcome->seed, "abc");
    EXPECT_EQ(outcome->steps, 3u);

    // The discarded attempt leaves no frames behind.
    EXPECT_EQ(outcome->trajectory.size(), 4u);

    ASSERT_EQ(rig.listener.seeds.size(), 2u);
    EXPECT_EQ(rig.listener.seeds[0], "abc");
    EXPECT_EQ(rig.listener.seeds[1], outcome->seed);
    EXPECT_EQ(rig.listener.attempts, (std::vector<int>{0, 1}));
}

TEST(RollResolver, RetryCapEndsAsTimedOut)
{
    ResolverRig rig(2);
    rig.world.freeze_placements(rig.dice[0], 100);
    rig.world.freeze_placements(rig.dice[1], 100);

    Dice::RollResolver::Config config{};
    config.stuck_detection_steps = 5;
    config.max_retries = 2;
    config.fallback_face = 1;

    const auto outcome = rig.roll(std::string("stuck"), config);

    EXPECT_EQ(outcome->state, Dice::ResolveState::TimedOut);
    EXPECT_TRUE(outcome->timed_out());
    EXPECT_EQ(outcome->retries, 2);
    EXPECT_EQ(outcome->face_values, (std::vector<int>{1, 1}));
    EXPECT_EQ(rig.listener.seeds.size(), 3u);
    EXPECT_FALSE(outcome->trajectory.empty());
    EXPECT_TRUE(outcome->trajectory.frozen());
}

TEST(RollResolver, DeadlineGivesFallbackFaceToMovingDice)
{
    ResolverRig rig(2, 1.0); // every clock read advances 1 ms
    rig.world.script_rest(rig.dice[0], face_up(4), 2);
    // dice[1] has no rest and keeps drifting

    Dice::RollResolver::Config config{};
    config.timeout_ms = 50.0;
    config.stuck_detection_steps = 100000;
    config.fallback_face = 1;

    const auto outcome = rig.roll(std::string("late"), config);

    EXPECT_EQ(outcome->state, Dice::ResolveState::TimedOut);
    EXPECT_EQ(outcome->face_values, (std::vector<int>{4, 1}));
    EXPECT_EQ(outcome->retries, 0);
    EXPECT_LT(outcome->steps, 100u);
    EXPECT_EQ(outcome->trajectory.size(), outcome->steps + 1);

    ASSERT_EQ(rig.listener.settled.size(), 1u);
    EXPECT_EQ(rig.listener.settled[0], std::make_pair(size_t{0}, 4));
}

TEST(RollResolver, SameSeedReproducesTheRoll)
{
    auto run = []() {
        ResolverRig rig(3);
        rig.world.script_rest(rig.dice[0], face_up(1), 7);
        rig.world.script_rest(rig.dice[1], face_up(6), 9);
        rig.world.script_rest(rig.dice[2], face_up(2), 4);
        return rig.roll(std::string("repeat-me"));
    };

    const auto a = run();
    const auto b = run();

    EXPECT_EQ(a->face_values, b->face_values);
    ASSERT_EQ(a->trajectory.size(), b->trajectory.size());
    for (size_t i = 0; i < a->trajectory.size(); ++i)
    {
        for (size_t d = 0; d < a->trajectory[i].size(); ++d)
        {
            EXPECT_EQ(a->trajectory[i][d].position, b->trajectory[i][d].position);
            EXPECT_EQ(a->trajectory[i][d].orientation, b->trajectory[i][d].orientation);
        }
    }
}

TEST(RollResolver, LaunchStartsFromZeroVelocity)
{
    ResolverRig rig(1);
    rig.world.set_linear_velocity(rig.dice[0], glm::vec3(100.0f, 0.0f, 0.0f));
    rig.world.script_rest(rig.dice[0], face_up(1), 2);

    Dice::RollResolver::Config config{};
    const auto outcome = rig.roll(std::string("reset"), config);

    const Dice::Scenario scenario = rig.generator.generate(std::string("reset"), 1);
    const glm::vec3 expected_step = scenario.dice[0].impulse * config.timestep;

    ASSERT_GE(outcome->trajectory.size(), 2u);
    EXPECT_EQ(outcome->trajectory[0][0].position, scenario.dice[0].position);
    const glm::vec3 moved = outcome->trajectory[1][0].position - outcome->trajectory[0][0].position;
    EXPECT_NEAR(moved.x, expected_step.x, 1e-4f);
    EXPECT_NEAR(moved.y, expected_step.y, 1e-4f);
    EXPECT_NEAR(moved.z, expected_step.z, 1e-4f);
}

TEST(RollResolver, BodiesAreReusedAcrossRolls)
{
    ResolverRig rig(1);
    rig.world.script_rest(rig.dice[0], face_up(3), 2);
    const auto first = rig.roll(std::string("one"));

    rig.world.script_rest(rig.dice[0], face_up(4), 6);
    const auto second = rig.roll(std::string("two"));

    EXPECT_EQ(first->face_values, std::vector<int>{3});
    EXPECT_EQ(second->face_values, std::vector<int>{4});
    EXPECT_EQ(second->steps, 6u);
    EXPECT_EQ(rig.world.body_count(), 1u);

    // The first outcome is untouched by the second roll.
    EXPECT_EQ(first->trajectory.size(), 3u);
}

TEST(RollResolver, NoDiceResolvesImmediately)
{
    ResolverRig rig(0);
    const auto outcome = rig.roll(std::string("empty"));

    EXPECT_EQ(outcome->state, Dice::ResolveState::Settled);
    EXPECT_TRUE(outcome->face_values.empty());
    EXPECT_EQ(outcome->steps, 0u);
    EXPECT_EQ(outcome->trajectory.size(), 1u);
}
