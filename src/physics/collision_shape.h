#pragma once

#include <glm/vec3.hpp>

namespace Physics
{
    // ============================================================================
    // Shape definitions
    // ============================================================================

    struct BoxShape
    {
        glm::vec3 half_extents{0.5f};

        BoxShape() = default;

        explicit BoxShape(float uniform) : half_extents(uniform)
        {
        }

        BoxShape(float hx, float hy, float hz) : half_extents(hx, hy, hz)
        {
        }

        explicit BoxShape(const glm::vec3 &he) : half_extents(he)
        {
        }
    };

    // Dice and arena geometry are all boxes; walls and floor are thick slabs
    // whose inner face sits on the arena boundary.
    struct CollisionShape
    {
        BoxShape box;

        CollisionShape() = default;

        explicit CollisionShape(const BoxShape &b) : box(b)
        {
        }

        static CollisionShape Box(float hx, float hy, float hz) { return CollisionShape{BoxShape{hx, hy, hz}}; }
        static CollisionShape Box(const glm::vec3 &half_extents) { return CollisionShape{BoxShape{half_extents}}; }
        static CollisionShape Cube(float half_size) { return CollisionShape{BoxShape{half_size}}; }
    };
} // namespace Physics
