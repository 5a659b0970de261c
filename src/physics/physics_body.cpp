#include "physics_body.h"
#include "physics_world.h"

#include <utility>

namespace Physics
{
    BodyHandle::BodyHandle(PhysicsWorld *world, BodyId id)
        : _world(world)
        , _id(id)
    {
    }

    BodyHandle::~BodyHandle()
    {
        reset();
    }

    BodyHandle::BodyHandle(BodyHandle &&other) noexcept
        : _world(std::exchange(other._world, nullptr))
        , _id(std::exchange(other._id, BodyId{}))
    {
    }

    BodyHandle &BodyHandle::operator=(BodyHandle &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            _world = std::exchange(other._world, nullptr);
            _id = std::exchange(other._id, BodyId{});
        }
        return *this;
    }

    void BodyHandle::reset()
    {
        if (_world && _id.is_valid())
        {
            _world->destroy_body(_id);
        }
        _world = nullptr;
        _id = BodyId{};
    }
} // namespace Physics
