#include "app/simulation.h"

#include "dice/face_classifier.h"
#include "helpers/die_orientations.h"
#include "helpers/fake_clock.h"
#include "helpers/fake_physics_world.h"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

namespace
{
    using DiceTest::face_up;
    using DiceTest::FakeClock;
    using DiceTest::FakePhysicsWorld;

    class QueueScheduler final : public Playback::FrameScheduler
    {
    public:
        void schedule_next(Callback callback) override { pending.push_back(std::move(callback)); }

        void drain()
        {
            while (!pending.empty())
            {
                std::vector<Callback> current;
                current.swap(pending);
                for (auto &cb : current)
                {
                    cb();
                }
            }
        }

        std::vector<Callback> pending;
    };

    class CountingPresenter final : public Playback::Presenter
    {
    public:
        void present(const Dice::TrajectoryFrame &poses) override
        {
            last = poses;
            ++count;
        }
        std::string capture_frame() override { return std::to_string(count); }

        Dice::TrajectoryFrame last;
        int count{0};
    };

    struct SimulationRig
    {
        explicit SimulationRig(const App::RollConfig &config = {})
        {
            auto fake = std::make_unique<FakePhysicsWorld>();
            world = fake.get();
            simulation = std::make_unique<App::Simulation>(std::move(fake), scheduler, presenter, clock, config);
        }

        // Scripts each die to come to rest on the given face.
        void script(const std::vector<int> &faces, int steps = 4)
        {
            const auto ids = simulation->arena().die_bodies();
            for (size_t d = 0; d < ids.size() && d < faces.size(); ++d)
            {
                world->script_rest(ids[d], face_up(faces[d]), steps + static_cast<int>(d));
            }
        }

        FakeClock clock;
        QueueScheduler scheduler;
        CountingPresenter presenter;
        FakePhysicsWorld *world{nullptr};
        std::unique_ptr<App::Simulation> simulation;
    };
} // namespace

TEST(Simulation, BuildsArenaAndDice)
{
    SimulationRig rig;
    EXPECT_EQ(rig.simulation->arena().die_count(), 2);

    // Floor, four walls, two dice
    EXPECT_EQ(rig.world->body_count(), 7u);
    EXPECT_FLOAT_EQ(rig.world->get_gravity().y, -50.0f);

    // Dice are tagged with their index + 1 and parked asleep.
    for (int d = 0; d < 2; ++d)
    {
        const Physics::BodyId id = rig.simulation->arena().die_body(d);
        EXPECT_EQ(rig.world->get_user_data(id), static_cast<uint64_t>(d + 1));
        EXPECT_FALSE(rig.world->is_active(id));
    }
}

TEST(Simulation, ThrowReportsFacesAndPlaysBack)
{
    SimulationRig rig;
    rig.script({6, 3});

    rig.simulation->throw_dice(std::string("abc"));

    EXPECT_EQ(rig.simulation->outcome_log().text(), "6+3");
    ASSERT_NE(rig.simulation->last_outcome(), nullptr);
    EXPECT_EQ(rig.simulation->last_outcome()->face_values, (std::vector<int>{6, 3}));
    EXPECT_TRUE(rig.simulation->playback().is_playing());

    rig.clock.set(10000.0);
    rig.scheduler.drain();
    EXPECT_FALSE(rig.simulation->playback().is_playing());
    EXPECT_EQ(Dice::classify_face(rig.presenter.last[0].orientation), 6);
}

TEST(Simulation, KnockedDieIsLoggedWithItsFinalFace)
{
    SimulationRig rig;
    const auto ids = rig.simulation->arena().die_bodies();
    rig.world->script_rest(ids[0], face_up(3), 2);
    rig.world->script_rest(ids[0], face_up(5), 3);
    rig.world->script_knock(ids[0], 4);
    rig.world->script_rest(ids[1], face_up(1), 10);

    rig.simulation->throw_dice(std::string("knock"));

    EXPECT_EQ(rig.simulation->outcome_log().text(), "5+1");
    EXPECT_EQ(rig.simulation->last_outcome()->face_values, (std::vector<int>{5, 1}));
}

TEST(Simulation, MagicShowsDesiredFacesButLogsActualOnes)
{
    App::RollConfig config{};
    config.magic = true;
    config.render_fixed_frames = true;
    config.desired_rolls = {2, 5};

    SimulationRig rig(config);
    rig.script({6, 3});
    rig.simulation->throw_dice(std::string("magic"));
    rig.scheduler.drain();

    EXPECT_EQ(rig.simulation->outcome_log().text(), "6+3");
    ASSERT_EQ(rig.presenter.last.size(), 2u);
    EXPECT_EQ(Dice::classify_face(rig.presenter.last[0].orientation), 2);
    EXPECT_EQ(Dice::classify_face(rig.presenter.last[1].orientation), 5);
}

TEST(Simulation, ChangingDieCountRebuildsDice)
{
    SimulationRig rig;
    App::RollConfig config = rig.simulation->config();
    config.number_of_dice = 5;
    rig.simulation->apply_config(config);

    EXPECT_EQ(rig.simulation->arena().die_count(), 5);
    EXPECT_EQ(rig.world->body_count(), 10u);
    EXPECT_EQ(rig.simulation->config().desired_rolls, (std::vector<int>{6, 3, 1, 1, 1}));

    config.number_of_dice = 1;
    rig.simulation->apply_config(config);
    EXPECT_EQ(rig.world->body_count(), 6u);
}

TEST(Simulation, StoredFramesCoverTheWholePlayback)
{
    App::RollConfig config{};
    config.store_frames = true;
    config.render_fixed_frames = true;
    config.number_of_dice = 1;

    SimulationRig rig(config);
    rig.script({4}, 6);
    rig.simulation->throw_dice(std::string("frames"));
    rig.scheduler.drain();

    const auto outcome = rig.simulation->last_outcome();
    EXPECT_EQ(rig.simulation->playback().exported_frames().size(), outcome->trajectory.size());
}

TEST(Simulation, SecondThrowSupersedesFirstPlayback)
{
    SimulationRig rig;
    rig.script({1, 2}, 30);
    rig.simulation->throw_dice(std::string("first"));
    const auto first_token = rig.simulation->playback().current_token();

    rig.script({5, 4});
    rig.simulation->throw_dice(std::string("second"));

    EXPECT_FALSE(rig.simulation->playback().is_current(first_token));
    EXPECT_EQ(rig.simulation->outcome_log().text(), "5+4");

    rig.clock.set(10000.0);
    rig.scheduler.drain();
    EXPECT_EQ(Dice::classify_face(rig.presenter.last[0].orientation), 5);
}
