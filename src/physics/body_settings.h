#pragma once

#include "collision_shape.h"
#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>

namespace Physics
{

// ============================================================================
// Motion type
// ============================================================================

enum class MotionType
{
    Static,    // Never moves (floor, arena walls)
    Dynamic    // Fully simulated by physics (dice)
};

// ============================================================================
// Collision layers
// ============================================================================

namespace Layer
{
    constexpr uint32_t Default = 0;
    constexpr uint32_t Static  = 1;
    constexpr uint32_t Dynamic = 2;
    constexpr uint32_t Count   = 3;
}

// ============================================================================
// Body creation settings
// ============================================================================

struct BodySettings
{
    // Shape
    CollisionShape shape;

    // Transform
    glm::vec3 position{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};

    // Motion
    MotionType motion_type = MotionType::Dynamic;

    // Physical properties
    float mass = 1.0f;           // Only used for dynamic bodies
    float friction = 0.3f;
    float restitution = 0.0f;    // Bounciness (0 = no bounce, 1 = perfect bounce)
    float linear_damping = 0.01f;
    float angular_damping = 0.01f;

    // Collision filtering
    uint32_t layer = Layer::Default;

    // Flags
    bool start_active = true;     // Start awake (dynamic bodies only)
    bool allow_sleeping = true;   // Can go to sleep when at rest

    // Gravity
    float gravity_scale = 1.0f;

    uint64_t user_data = 0;

    // ========================================================================
    // Builder-style setters (return *this for chaining)
    // ========================================================================

    BodySettings& set_shape(const CollisionShape& s) { shape = s; return *this; }

    BodySettings& set_position(const glm::vec3& p) { position = p; return *this; }

    BodySettings& set_dynamic() { motion_type = MotionType::Dynamic; return *this; }

    BodySettings& set_mass(float m) { mass = m; return *this; }
    BodySettings& set_friction(float f) { friction = f; return *this; }
    BodySettings& set_restitution(float r) { restitution = r; return *this; }

    BodySettings& set_layer(uint32_t l) { layer = l; return *this; }
    BodySettings& set_user_data(uint64_t v) { user_data = v; return *this; }
};

} // namespace Physics
