#pragma once

#include "core/config.h"
#include "physics/physics_world.h"
#include "scenario_generator.h"

#include <vector>

namespace Dice
{
    // ============================================================================
    // DiceArena: static floor and invisible walls plus one dynamic box per die.
    //
    // The arena holds its bodies through BodyHandles, so it must be destroyed
    // before the PhysicsWorld it was built in.
    // ============================================================================

    class DiceArena
    {
    public:
        struct Config
        {
            float width{kArenaWidth};
            float depth{kArenaDepth};
            float floor_y{kFloorY};
            float wall_height{kWallHeight};
            float wall_thickness{kWallThickness};

            float die_half_size{kDieHalfSize};
            float die_mass{kDieMass};
            float die_friction{kDieFriction};
            float die_restitution{kDieRestitution};
        };

        DiceArena(Physics::PhysicsWorld &world, const Config &config);
        ~DiceArena() = default;

        DiceArena(const DiceArena &) = delete;
        DiceArena &operator=(const DiceArena &) = delete;

        // Destroys the current dice and builds die_count new ones. No-op when
        // the count is unchanged.
        void set_die_count(int die_count);
        int die_count() const { return static_cast<int>(_dice.size()); }

        // Rebuilds walls for a new footprint; dice are kept.
        void resize(float width, float depth);

        std::vector<Physics::BodyId> die_bodies() const;
        Physics::BodyId die_body(int index) const;

        ArenaBounds bounds() const;
        const Config &config() const { return _config; }

        Physics::PhysicsWorld &world() { return _world; }

    private:
        void build_static_geometry();
        Physics::BodyHandle build_die(int index);

        Physics::PhysicsWorld &_world;
        Config _config;

        std::vector<Physics::BodyHandle> _static_bodies;
        std::vector<Physics::BodyHandle> _dice;
    };
} // namespace Dice
