#pragma once

#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>

namespace Physics
{
    class PhysicsWorld;

    // ============================================================================
    // BodyId: strongly-typed body identifier
    // ============================================================================

    struct BodyId
    {
        uint32_t value{0};

        BodyId() = default;

        explicit BodyId(uint32_t v) : value(v)
        {
        }

        bool is_valid() const { return value != 0; }
        explicit operator bool() const { return is_valid(); }
        bool operator==(const BodyId &other) const { return value == other.value; }
        bool operator!=(const BodyId &other) const { return value != other.value; }
    };

    // ============================================================================
    // BodyHandle: RAII wrapper for a physics body
    // ============================================================================

    class BodyHandle
    {
    public:
        BodyHandle() = default;

        BodyHandle(PhysicsWorld *world, BodyId id);

        ~BodyHandle();

        // Move only
        BodyHandle(BodyHandle &&other) noexcept;

        BodyHandle &operator=(BodyHandle &&other) noexcept;

        BodyHandle(const BodyHandle &) = delete;

        BodyHandle &operator=(const BodyHandle &) = delete;

        BodyId id() const { return _id; }
        bool is_valid() const { return _world != nullptr && _id.is_valid(); }
        explicit operator bool() const { return is_valid(); }

        // Destroy the owned body (if any) and become empty
        void reset();

        PhysicsWorld *world() const { return _world; }

    private:
        PhysicsWorld *_world{nullptr};
        BodyId _id;
    };

    // ============================================================================
    // Transform data returned from physics
    // ============================================================================

    struct BodyTransform
    {
        glm::vec3 position{0.0f};
        glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    };

    // Position and velocities read together, for rest and stuck sampling.
    struct BodyMotion
    {
        glm::vec3 position{0.0f};
        glm::vec3 linear_velocity{0.0f};
        glm::vec3 angular_velocity{0.0f};
        bool active{false};
    };
} // namespace Physics
