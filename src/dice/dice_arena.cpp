#include "dice_arena.h"

#include "core/util/logger.h"

#include <algorithm>

namespace Dice
{
    namespace
    {
        // Floor slab extends well past the walls.
        constexpr float kFloorHalfExtent = 50.0f;
        constexpr float kFloorHalfThickness = 0.5f;

        // Dice are parked on a row below the floor until a scenario places them.
        constexpr float kParkingDepth = 20.0f;

        // user_data tag for die bodies: index + 1 (0 is used for static geometry).
        uint64_t die_user_data(int index)
        {
            return static_cast<uint64_t>(index) + 1;
        }
    } // namespace

    DiceArena::DiceArena(Physics::PhysicsWorld &world, const Config &config)
        : _world(world), _config(config)
    {
        build_static_geometry();
    }

    void DiceArena::build_static_geometry()
    {
        _static_bodies.clear();

        const float half_w = _config.width * 0.5f;
        const float half_d = _config.depth * 0.5f;
        const float t = _config.wall_thickness;
        const float half_h = _config.wall_height * 0.5f;
        const float wall_y = _config.floor_y + half_h;

        // Floor: top face at floor_y
        _static_bodies.push_back(Physics::BodyBuilder(&_world)
                                     .box(kFloorHalfExtent, kFloorHalfThickness, kFloorHalfExtent)
                                     .position(glm::vec3(0.0f, _config.floor_y - kFloorHalfThickness, 0.0f))
                                     .static_body()
                                     .friction(_config.die_friction)
                                     .restitution(_config.die_restitution)
                                     .build_handle());

        // Walls: inner faces at +-half_w / +-half_d
        const glm::vec3 x_wall_extents(t, half_h, half_d + 2.0f * t);
        const glm::vec3 z_wall_extents(half_w + 2.0f * t, half_h, t);

        const glm::vec3 wall_positions[] = {
            glm::vec3(-half_w - t, wall_y, 0.0f),
            glm::vec3(half_w + t, wall_y, 0.0f),
            glm::vec3(0.0f, wall_y, -half_d - t),
            glm::vec3(0.0f, wall_y, half_d + t),
        };

        for (int i = 0; i < 4; ++i)
        {
            _static_bodies.push_back(Physics::BodyBuilder(&_world)
                                         .box(i < 2 ? x_wall_extents : z_wall_extents)
                                         .position(wall_positions[i])
                                         .static_body()
                                         .friction(_config.die_friction)
                                         .restitution(_config.die_restitution)
                                         .build_handle());
        }

        const bool all_valid = std::all_of(_static_bodies.begin(), _static_bodies.end(),
                                           [](const Physics::BodyHandle &h) { return h.is_valid(); });
        if (!all_valid)
        {
            Logger::error("[DiceArena] Failed to create static arena geometry");
        }
    }

    Physics::BodyHandle DiceArena::build_die(int index)
    {
        const glm::vec3 parked(static_cast<float>(index) * 2.0f * _config.die_half_size * 1.5f,
                               _config.floor_y - kParkingDepth, 0.0f);

        Physics::BodySettings settings;
        settings.set_shape(Physics::CollisionShape::Cube(_config.die_half_size))
            .set_position(parked)
            .set_dynamic()
            .set_mass(_config.die_mass)
            .set_friction(_config.die_friction)
            .set_restitution(_config.die_restitution)
            .set_layer(Physics::Layer::Dynamic)
            .set_user_data(die_user_data(index));
        settings.start_active = false;
        settings.gravity_scale = 1.0f;

        return _world.create_body_handle(settings);
    }

    void DiceArena::set_die_count(int die_count)
    {
        const int count = std::max(die_count, 0);
        if (count == this->die_count())
        {
            return;
        }

        _dice.clear();
        _dice.reserve(count);
        for (int i = 0; i < count; ++i)
        {
            Physics::BodyHandle handle = build_die(i);
            if (!handle.is_valid())
            {
                Logger::error("[DiceArena] Failed to create body for die {}", i);
            }
            _dice.push_back(std::move(handle));
        }

        Logger::debug("[DiceArena] Built {} dice", count);
    }

    void DiceArena::resize(float width, float depth)
    {
        if (width == _config.width && depth == _config.depth)
        {
            return;
        }
        _config.width = width;
        _config.depth = depth;
        build_static_geometry();
    }

    std::vector<Physics::BodyId> DiceArena::die_bodies() const
    {
        std::vector<Physics::BodyId> ids;
        ids.reserve(_dice.size());
        for (const Physics::BodyHandle &h : _dice)
        {
            ids.push_back(h.id());
        }
        return ids;
    }

    Physics::BodyId DiceArena::die_body(int index) const
    {
        if (index < 0 || index >= die_count())
        {
            return Physics::BodyId{};
        }
        return _dice[index].id();
    }

    ArenaBounds DiceArena::bounds() const
    {
        ArenaBounds b{};
        b.half_width = _config.width * 0.5f;
        b.half_depth = _config.depth * 0.5f;
        b.floor_y = _config.floor_y;
        return b;
    }
} // namespace Dice
