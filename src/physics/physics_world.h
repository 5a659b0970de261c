#pragma once

#include "body_settings.h"
#include "physics_body.h"
#include <cstdint>

namespace Physics
{
    // ============================================================================
    // PhysicsWorld: Abstract interface for the rigid-body integrator
    // ============================================================================

    class PhysicsWorld
    {
    public:
        virtual ~PhysicsWorld() = default;

        // ========================================================================
        // Simulation
        // ========================================================================

        // Advance the world by dt seconds in a single integration substep.
        virtual void step(float dt) = 0;

        // ========================================================================
        // Debug / instrumentation (optional)
        // ========================================================================

        struct DebugStats
        {
            float last_step_ms{0.0f};
            float avg_step_ms{0.0f};
            float last_dt{0.0f}; // seconds

            uint32_t body_count{0};
            uint32_t active_body_count{0};
        };

        // Backends may return zeros if unsupported.
        virtual DebugStats debug_stats() const { return {}; }

        // ========================================================================
        // Body creation / destruction
        // ========================================================================

        virtual BodyId create_body(const BodySettings &settings) = 0;

        virtual void destroy_body(BodyId id) = 0;

        // Create a body and return RAII handle (auto-destroys on scope exit)
        BodyHandle create_body_handle(const BodySettings &settings)
        {
            return BodyHandle(this, create_body(settings));
        }

        // ========================================================================
        // Body queries
        // ========================================================================

        virtual bool is_body_valid(BodyId id) const = 0;

        virtual BodyTransform get_transform(BodyId id) const = 0;

        virtual glm::vec3 get_position(BodyId id) const { return get_transform(id).position; }

        virtual glm::quat get_rotation(BodyId id) const { return get_transform(id).rotation; }

        virtual glm::vec3 get_linear_velocity(BodyId id) const = 0;

        virtual glm::vec3 get_angular_velocity(BodyId id) const = 0;

        virtual BodyMotion get_motion(BodyId id) const
        {
            BodyMotion m{};
            m.position = get_position(id);
            m.linear_velocity = get_linear_velocity(id);
            m.angular_velocity = get_angular_velocity(id);
            m.active = is_active(id);
            return m;
        }

        virtual uint64_t get_user_data(BodyId id) const = 0;

        // ========================================================================
        // Body manipulation
        // ========================================================================

        virtual void set_transform(BodyId id, const glm::vec3 &position, const glm::quat &rotation) = 0;

        virtual void set_linear_velocity(BodyId id, const glm::vec3 &velocity) = 0;

        virtual void set_angular_velocity(BodyId id, const glm::vec3 &velocity) = 0;

        // Impulse applied at a world-space point (induces spin)
        virtual void add_impulse(BodyId id, const glm::vec3 &impulse, const glm::vec3 &world_point) = 0;

        // ========================================================================
        // Activation / sleeping
        // ========================================================================

        virtual void activate(BodyId id) = 0;

        // A dynamic body that is not active has gone to sleep.
        virtual bool is_active(BodyId id) const = 0;

        // When false the body never goes to sleep, however still it is.
        virtual void set_allow_sleeping(BodyId id, bool allow) = 0;

        virtual bool get_allow_sleeping(BodyId id) const = 0;

        // ========================================================================
        // World settings
        // ========================================================================

        virtual void set_gravity(const glm::vec3 &gravity) = 0;

        virtual glm::vec3 get_gravity() const = 0;
    };

    // ============================================================================
    // BodyBuilder: Fluent API for body creation
    // ============================================================================

    class BodyBuilder
    {
    public:
        explicit BodyBuilder(PhysicsWorld *world) : _world(world)
        {
        }

        BodyBuilder &box(float hx, float hy, float hz)
        {
            _settings.shape = CollisionShape::Box(hx, hy, hz);
            return *this;
        }

        BodyBuilder &box(const glm::vec3 &half_extents)
        {
            _settings.shape = CollisionShape::Box(half_extents);
            return *this;
        }

        BodyBuilder &cube(float half_size)
        {
            _settings.shape = CollisionShape::Cube(half_size);
            return *this;
        }

        BodyBuilder &position(const glm::vec3 &p)
        {
            _settings.position = p;
            return *this;
        }

        BodyBuilder &static_body()
        {
            _settings.motion_type = MotionType::Static;
            _settings.layer = Layer::Static;
            return *this;
        }

        BodyBuilder &dynamic_body()
        {
            _settings.motion_type = MotionType::Dynamic;
            _settings.layer = Layer::Dynamic;
            return *this;
        }

        BodyBuilder &friction(float f)
        {
            _settings.friction = f;
            return *this;
        }

        BodyBuilder &restitution(float r)
        {
            _settings.restitution = r;
            return *this;
        }

        BodyId build() { return _world->create_body(_settings); }
        BodyHandle build_handle() { return _world->create_body_handle(_settings); }

        const BodySettings &settings() const { return _settings; }

    private:
        PhysicsWorld *_world;
        BodySettings _settings;
    };
} // namespace Physics
