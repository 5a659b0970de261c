#pragma once

#include "core/config.h"
#include "physics/physics_world.h"

namespace Dice
{
    enum class WatcherState
    {
        Detached,
        Active,             // waiting for the body to fall asleep
        IndeterminateRetry, // slept on an edge; kept awake until it reads a face
        Settled
    };

    enum class WatchEvent
    {
        None,
        Settled,  // came to rest on a valid face
        Disturbed // a settled die was woken again, its face is void
    };

    // ============================================================================
    // SettleWatcher: per-die sleep observer, polled once per physics step.
    //
    // Active + asleep -> classify. Valid face -> Settled. Indeterminate -> the
    // body is woken with sleeping disallowed until it reads a valid face, then
    // sleeping is re-allowed and the watcher goes back to Active.
    // Settled + awake (knocked by another die) -> Active.
    // ============================================================================

    class SettleWatcher
    {
    public:
        SettleWatcher() = default;
        explicit SettleWatcher(Physics::BodyId body) : _body(body)
        {
        }

        void arm();
        void detach();

        WatchEvent poll(Physics::PhysicsWorld &world, double epsilon = kFaceEpsilon);

        WatcherState state() const { return _state; }
        bool is_settled() const { return _state == WatcherState::Settled; }

        int face() const { return _face; }
        Physics::BodyId body() const { return _body; }

    private:
        Physics::BodyId _body;
        WatcherState _state{WatcherState::Detached};
        int _face{0};
    };
} // namespace Dice
