#pragma once

#include "physics/physics_world.h"

#include <glm/geometric.hpp>

#include <deque>
#include <unordered_map>

namespace DiceTest
{
    // ============================================================================
    // FakePhysicsWorld: scripted stand-in for the rigid-body integrator.
    //
    // Dynamic bodies drift with their velocity (no gravity, no contacts). A body
    // with scripted rests snaps to the next rest orientation after the given
    // number of steps, stops, and falls asleep if sleeping is allowed. A frozen
    // placement never moves and never sleeps. A scripted knock wakes a sleeping
    // body so it heads for its next rest.
    // ============================================================================

    class FakePhysicsWorld final : public Physics::PhysicsWorld
    {
    public:
        struct Rest
        {
            glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
            int steps{1};
        };

        struct Body
        {
            Physics::BodySettings settings;
            Physics::BodyTransform transform;
            glm::vec3 linear_velocity{0.0f};
            glm::vec3 angular_velocity{0.0f};
            bool active{false};
            bool allow_sleeping{true};

            std::deque<Rest> rests;
            bool resting{false};
            int countdown{0};
            int frozen_placements{0};
            bool frozen{false};

            int sleep_disallowed_count{0};
            int knock_at_step{0};
        };

        // ---- Scripting ----

        void script_rest(Physics::BodyId id, const glm::quat &rotation, int steps)
        {
            body(id).rests.push_back(Rest{rotation, steps});
        }

        // The next `placements` set_transform() calls leave the body frozen.
        void freeze_placements(Physics::BodyId id, int placements)
        {
            body(id).frozen_placements = placements;
        }

        // Wakes the body at the given world step, as if another die hit it.
        void script_knock(Physics::BodyId id, int at_step)
        {
            body(id).knock_at_step = at_step;
        }

        Body &body(Physics::BodyId id) { return _bodies.at(id.value); }
        const Body &body(Physics::BodyId id) const { return _bodies.at(id.value); }

        int step_count() const { return _step_count; }
        size_t body_count() const { return _bodies.size(); }

        // ---- PhysicsWorld ----

        void step(float dt) override
        {
            ++_step_count;
            for (auto &[id, b] : _bodies)
            {
                (void)id;
                if (b.knock_at_step == _step_count)
                {
                    b.knock_at_step = 0;
                    if (!b.active)
                    {
                        wake(b);
                    }
                }

                if (b.settings.motion_type != Physics::MotionType::Dynamic || !b.active || b.frozen)
                {
                    continue;
                }

                if (!b.resting)
                {
                    b.transform.position += b.linear_velocity * dt;
                    if (!b.rests.empty() && --b.countdown <= 0)
                    {
                        b.transform.rotation = b.rests.front().rotation;
                        b.rests.pop_front();
                        b.linear_velocity = glm::vec3(0.0f);
                        b.angular_velocity = glm::vec3(0.0f);
                        b.resting = true;
                    }
                }

                if (b.resting && b.allow_sleeping)
                {
                    b.active = false;
                }
            }
        }

        Physics::BodyId create_body(const Physics::BodySettings &settings) override
        {
            const uint32_t id = _next_id++;
            Body b{};
            b.settings = settings;
            b.transform.position = settings.position;
            b.transform.rotation = settings.rotation;
            b.active = settings.motion_type == Physics::MotionType::Dynamic && settings.start_active;
            b.allow_sleeping = settings.allow_sleeping;
            _bodies.emplace(id, b);
            return Physics::BodyId{id};
        }

        void destroy_body(Physics::BodyId id) override { _bodies.erase(id.value); }

        bool is_body_valid(Physics::BodyId id) const override { return _bodies.count(id.value) != 0; }

        Physics::BodyTransform get_transform(Physics::BodyId id) const override
        {
            return is_body_valid(id) ? body(id).transform : Physics::BodyTransform{};
        }

        glm::vec3 get_linear_velocity(Physics::BodyId id) const override
        {
            return is_body_valid(id) ? body(id).linear_velocity : glm::vec3(0.0f);
        }

        glm::vec3 get_angular_velocity(Physics::BodyId id) const override
        {
            return is_body_valid(id) ? body(id).angular_velocity : glm::vec3(0.0f);
        }

        uint64_t get_user_data(Physics::BodyId id) const override
        {
            return is_body_valid(id) ? body(id).settings.user_data : 0;
        }

        void set_transform(Physics::BodyId id, const glm::vec3 &position, const glm::quat &rotation) override
        {
            if (!is_body_valid(id))
            {
                return;
            }
            Body &b = body(id);
            b.transform.position = position;
            b.transform.rotation = rotation;
            b.frozen = b.frozen_placements > 0;
            if (b.frozen)
            {
                --b.frozen_placements;
            }
            wake(b);
        }

        void set_linear_velocity(Physics::BodyId id, const glm::vec3 &velocity) override
        {
            if (is_body_valid(id))
            {
                body(id).linear_velocity = velocity;
            }
        }

        void set_angular_velocity(Physics::BodyId id, const glm::vec3 &velocity) override
        {
            if (is_body_valid(id))
            {
                body(id).angular_velocity = velocity;
            }
        }

        void add_impulse(Physics::BodyId id, const glm::vec3 &impulse, const glm::vec3 &world_point) override
        {
            if (!is_body_valid(id) || body(id).frozen)
            {
                return;
            }
            Body &b = body(id);
            const float mass = b.settings.mass > 0.0f ? b.settings.mass : 1.0f;
            b.linear_velocity += impulse / mass;
            b.angular_velocity += glm::cross(world_point - b.transform.position, impulse);
        }

        void activate(Physics::BodyId id) override
        {
            if (is_body_valid(id) && !body(id).active)
            {
                wake(body(id));
            }
        }

        bool is_active(Physics::BodyId id) const override { return is_body_valid(id) && body(id).active; }

        void set_allow_sleeping(Physics::BodyId id, bool allow) override
        {
            if (!is_body_valid(id))
            {
                return;
            }
            Body &b = body(id);
            if (!allow)
            {
                ++b.sleep_disallowed_count;
            }
            b.allow_sleeping = allow;
        }

        bool get_allow_sleeping(Physics::BodyId id) const override
        {
            return is_body_valid(id) && body(id).allow_sleeping;
        }

        void set_gravity(const glm::vec3 &gravity) override { _gravity = gravity; }
        glm::vec3 get_gravity() const override { return _gravity; }

    private:
        static void wake(Body &b)
        {
            b.active = true;
            b.resting = false;
            b.countdown = b.rests.empty() ? 0 : b.rests.front().steps;
        }

        std::unordered_map<uint32_t, Body> _bodies;
        uint32_t _next_id{1};
        int _step_count{0};
        glm::vec3 _gravity{0.0f};
    };
} // namespace DiceTest
