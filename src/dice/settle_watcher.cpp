#include "settle_watcher.h"
#include "face_classifier.h"

namespace Dice
{
    void SettleWatcher::arm()
    {
        _state = WatcherState::Active;
        _face = kIndeterminateFace;
    }

    void SettleWatcher::detach()
    {
        _state = WatcherState::Detached;
    }

    WatchEvent SettleWatcher::poll(Physics::PhysicsWorld &world, double epsilon)
    {
        switch (_state)
        {
            case WatcherState::Active:
            {
                if (world.is_active(_body))
                {
                    return WatchEvent::None;
                }

                const int face = classify_face(world.get_rotation(_body), epsilon);
                if (is_valid_face(face))
                {
                    _face = face;
                    _state = WatcherState::Settled;
                    return WatchEvent::Settled;
                }

                // Balanced on an edge or corner: keep it awake until it tips over.
                world.set_allow_sleeping(_body, false);
                world.activate(_body);
                _state = WatcherState::IndeterminateRetry;
                return WatchEvent::None;
            }

            case WatcherState::IndeterminateRetry:
            {
                const int face = classify_face(world.get_rotation(_body), epsilon);
                if (is_valid_face(face))
                {
                    world.set_allow_sleeping(_body, true);
                    _state = WatcherState::Active;
                }
                return WatchEvent::None;
            }

            case WatcherState::Settled:
            {
                if (!world.is_active(_body))
                {
                    return WatchEvent::None;
                }
                _face = kIndeterminateFace;
                _state = WatcherState::Active;
                return WatchEvent::Disturbed;
            }

            case WatcherState::Detached:
                break;
        }
        return WatchEvent::None;
    }
} // namespace Dice
