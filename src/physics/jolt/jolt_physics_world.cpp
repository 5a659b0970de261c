#include "jolt_physics_world.h"

#if defined(DICETRAY_USE_JOLT) && DICETRAY_USE_JOLT

#include <Jolt/RegisterTypes.h>
#include <Jolt/Core/Factory.h>
#include <Jolt/Core/IssueReporting.h>
#include <Jolt/Physics/PhysicsSettings.h>
#include <Jolt/Physics/Body/BodyCreationSettings.h>
#include <Jolt/Physics/Body/BodyInterface.h>
#include <Jolt/Physics/Body/BodyLock.h>
#include <Jolt/Physics/Collision/Shape/BoxShape.h>

#include <fmt/core.h>

#include <algorithm>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <thread>

namespace Physics
{
    namespace
    {
        JPH::Vec3 to_jolt(const glm::vec3 &v)
        {
            return JPH::Vec3(v.x, v.y, v.z);
        }

        JPH::RVec3 to_jolt_r(const glm::vec3 &v)
        {
            return JPH::RVec3(v.x, v.y, v.z);
        }

        JPH::Quat to_jolt(const glm::quat &q)
        {
            return JPH::Quat(q.x, q.y, q.z, q.w);
        }

        // BodyId 0 is reserved as invalid; Jolt's first body has index/sequence 0.
        JPH::BodyID to_jolt_id(BodyId id)
        {
            return JPH::BodyID(id.value - 1);
        }

        BodyId from_jolt_id(const JPH::BodyID &id)
        {
            return BodyId{id.GetIndexAndSequenceNumber() + 1};
        }

        template<typename TVec>
        glm::vec3 to_glm(const TVec &v)
        {
            return glm::vec3(static_cast<float>(v.GetX()), static_cast<float>(v.GetY()), static_cast<float>(v.GetZ()));
        }
    } // namespace

    // ============================================================================
    // JoltGlobals implementation
    // ============================================================================

    std::mutex &JoltPhysicsWorld::JoltGlobals::mutex()
    {
        static std::mutex m;
        return m;
    }

    int &JoltPhysicsWorld::JoltGlobals::ref_count()
    {
        static int count = 0;
        return count;
    }

    JoltPhysicsWorld::JoltGlobals::JoltGlobals()
    {
        std::scoped_lock lock(mutex());
        int &count = ref_count();
        if (count++ == 0)
        {
            JPH::RegisterDefaultAllocator();

            JPH::Trace = &JoltPhysicsWorld::trace_impl;
#ifdef JPH_ENABLE_ASSERTS
            JPH::AssertFailed = &JoltPhysicsWorld::assert_failed_impl;
#endif

            JPH::Factory::sInstance = new JPH::Factory();
            JPH::RegisterTypes();
        }
    }

    JoltPhysicsWorld::JoltGlobals::~JoltGlobals()
    {
        std::scoped_lock lock(mutex());
        int &count = ref_count();
        if (--count == 0)
        {
            JPH::UnregisterTypes();
            delete JPH::Factory::sInstance;
            JPH::Factory::sInstance = nullptr;
        }
    }

    // ============================================================================
    // Layer filters
    // ============================================================================

    JPH::uint JoltPhysicsWorld::BPLayerInterfaceImpl::GetNumBroadPhaseLayers() const
    {
        return BroadPhaseLayers::count;
    }

    JPH::BroadPhaseLayer JoltPhysicsWorld::BPLayerInterfaceImpl::GetBroadPhaseLayer(JPH::ObjectLayer layer) const
    {
        return layer == Layer::Static ? BroadPhaseLayers::non_moving : BroadPhaseLayers::moving;
    }

#if defined(JPH_EXTERNAL_PROFILE) || defined(JPH_PROFILE_ENABLED)
    const char *JoltPhysicsWorld::BPLayerInterfaceImpl::GetBroadPhaseLayerName(JPH::BroadPhaseLayer layer) const
    {
        switch (layer.GetValue())
        {
            case 0: return "NON_MOVING";
            case 1: return "MOVING";
            default: return "INVALID";
        }
    }
#endif

    bool JoltPhysicsWorld::ObjectVsBroadPhaseLayerFilterImpl::ShouldCollide(
        JPH::ObjectLayer layer1, JPH::BroadPhaseLayer layer2) const
    {
        // Static objects only collide with moving objects
        if (layer1 == Layer::Static)
        {
            return layer2 == BroadPhaseLayers::moving;
        }
        return true;
    }

    bool JoltPhysicsWorld::ObjectLayerPairFilterImpl::ShouldCollide(
        JPH::ObjectLayer layer1, JPH::ObjectLayer layer2) const
    {
        return !(layer1 == Layer::Static && layer2 == Layer::Static);
    }

    // ============================================================================
    // JoltPhysicsWorld implementation
    // ============================================================================

    JoltPhysicsWorld::JoltPhysicsWorld()
    {
        init(Config{});
    }

    JoltPhysicsWorld::JoltPhysicsWorld(const Config &config)
    {
        init(config);
    }

    JoltPhysicsWorld::~JoltPhysicsWorld()
    {
        // Bodies still registered are released by the PhysicsSystem destructor
    }

    void JoltPhysicsWorld::init(const Config &config)
    {
        if (_initialized)
        {
            return;
        }

        _temp_allocator = std::make_unique<JPH::TempAllocatorImpl>(config.temp_allocator_size);
        _job_system = std::make_unique<JPH::JobSystemThreadPool>(
            JPH::cMaxPhysicsJobs, JPH::cMaxPhysicsBarriers, compute_worker_threads(config.worker_threads));

        _physics_system.Init(
            config.max_bodies,
            0, // num_body_mutexes (0 = auto)
            config.max_body_pairs,
            config.max_contact_constraints,
            _broad_phase_layer_interface,
            _object_vs_broad_phase_layer_filter,
            _object_layer_pair_filter);

        _physics_system.SetGravity(to_jolt(config.gravity));

        JPH::PhysicsSettings settings = _physics_system.GetPhysicsSettings();
        settings.mTimeBeforeSleep = config.time_before_sleep;
        _physics_system.SetPhysicsSettings(settings);

        _initialized = true;
    }

    int JoltPhysicsWorld::compute_worker_threads(int requested)
    {
        if (requested > 0)
        {
            return requested;
        }
        const uint32_t hw = std::max(1u, std::thread::hardware_concurrency());
        return static_cast<int>(hw > 1 ? hw - 1 : 1);
    }

    void JoltPhysicsWorld::trace_impl(const char *fmt, ...)
    {
        va_list args;
        va_start(args, fmt);
        std::vfprintf(stderr, fmt, args);
        std::fputc('\n', stderr);
        va_end(args);
    }

#ifdef JPH_ENABLE_ASSERTS
    bool JoltPhysicsWorld::assert_failed_impl(const char *expression, const char *message, const char *file,
                                              JPH::uint line)
    {
        fmt::print(stderr, "[Jolt][Assert] {}:{}: {}", file, static_cast<unsigned>(line), expression);
        if (message != nullptr)
        {
            fmt::print(stderr, " ({})", message);
        }
        std::fputc('\n', stderr);
        return false; // Don't trigger breakpoint
    }
#endif

    // ============================================================================
    // Simulation
    // ============================================================================

    void JoltPhysicsWorld::step(float dt)
    {
        if (!_initialized)
        {
            return;
        }

        using Clock = std::chrono::steady_clock;
        const auto t0 = Clock::now();

        _physics_system.Update(dt, 1, _temp_allocator.get(), _job_system.get());

        _debug_last_dt.store(dt, std::memory_order_relaxed);
        _debug_body_count.store(static_cast<uint32_t>(_physics_system.GetNumBodies()), std::memory_order_relaxed);
        _debug_active_body_count.store(_physics_system.GetNumActiveBodies(JPH::EBodyType::RigidBody),
                                       std::memory_order_relaxed);

        const auto t1 = Clock::now();
        const float step_ms = std::chrono::duration<float, std::milli>(t1 - t0).count();
        _debug_last_step_ms.store(step_ms, std::memory_order_relaxed);

        const float prev = _debug_avg_step_ms.load(std::memory_order_relaxed);
        const float next = (prev <= 0.0f) ? step_ms : (prev * 0.9f + step_ms * 0.1f);
        _debug_avg_step_ms.store(next, std::memory_order_relaxed);
    }

    PhysicsWorld::DebugStats JoltPhysicsWorld::debug_stats() const
    {
        DebugStats s{};
        s.last_step_ms = _debug_last_step_ms.load(std::memory_order_relaxed);
        s.avg_step_ms = _debug_avg_step_ms.load(std::memory_order_relaxed);
        s.last_dt = _debug_last_dt.load(std::memory_order_relaxed);
        s.body_count = _debug_body_count.load(std::memory_order_relaxed);
        s.active_body_count = _debug_active_body_count.load(std::memory_order_relaxed);
        return s;
    }

    // ============================================================================
    // Body creation / destruction
    // ============================================================================

    JPH::EMotionType JoltPhysicsWorld::to_jolt_motion_type(MotionType type)
    {
        switch (type)
        {
            case MotionType::Static: return JPH::EMotionType::Static;
            case MotionType::Dynamic: return JPH::EMotionType::Dynamic;
        }
        return JPH::EMotionType::Dynamic;
    }

    JPH::ObjectLayer JoltPhysicsWorld::to_jolt_layer(uint32_t layer, MotionType motion)
    {
        if (layer > 0 && layer < Layer::Count)
        {
            return static_cast<JPH::ObjectLayer>(layer);
        }
        return motion == MotionType::Static ? Layer::Static : Layer::Dynamic;
    }

    BodyId JoltPhysicsWorld::create_body(const BodySettings &settings)
    {
        if (!_initialized)
        {
            return BodyId{};
        }

        const glm::vec3 &he = settings.shape.box.half_extents;
        if (!(he.x > 0.0f && he.y > 0.0f && he.z > 0.0f))
        {
            trace_impl("[Physics][Jolt] create_body: invalid box half extents (%f, %f, %f)",
                       static_cast<double>(he.x), static_cast<double>(he.y), static_cast<double>(he.z));
            return BodyId{};
        }

        // Convex radius must not exceed the smallest half extent.
        const float convex_radius = std::min(JPH::cDefaultConvexRadius, 0.5f * std::min({he.x, he.y, he.z}));
        JPH::RefConst<JPH::Shape> jolt_shape = new JPH::BoxShape(to_jolt(he), convex_radius);

        const MotionType motion = settings.motion_type;

        JPH::BodyCreationSettings body_settings(
            jolt_shape,
            to_jolt_r(settings.position),
            to_jolt(settings.rotation),
            to_jolt_motion_type(motion),
            to_jolt_layer(settings.layer, motion));

        body_settings.mUserData = settings.user_data;

        body_settings.mFriction = settings.friction;
        body_settings.mRestitution = settings.restitution;
        body_settings.mLinearDamping = settings.linear_damping;
        body_settings.mAngularDamping = settings.angular_damping;
        body_settings.mGravityFactor = settings.gravity_scale;
        body_settings.mAllowSleeping = settings.allow_sleeping;

        if (motion == MotionType::Dynamic && settings.mass > 0.0f)
        {
            body_settings.mOverrideMassProperties = JPH::EOverrideMassProperties::CalculateInertia;
            body_settings.mMassPropertiesOverride.mMass = settings.mass;
        }

        JPH::EActivation activation = settings.start_active
                                          ? JPH::EActivation::Activate
                                          : JPH::EActivation::DontActivate;

        // For static bodies, never activate
        if (motion == MotionType::Static)
        {
            activation = JPH::EActivation::DontActivate;
        }

        JPH::BodyID jolt_id = _physics_system.GetBodyInterface().CreateAndAddBody(body_settings, activation);

        if (jolt_id.IsInvalid())
        {
            trace_impl("[Physics][Jolt] create_body: out of bodies (max configured bodies reached)");
            return BodyId{};
        }

        return from_jolt_id(jolt_id);
    }

    void JoltPhysicsWorld::destroy_body(BodyId id)
    {
        if (!_initialized || !id.is_valid())
        {
            return;
        }

        const JPH::BodyID jolt_id = to_jolt_id(id);
        JPH::BodyInterface &bi = _physics_system.GetBodyInterface();

        bi.RemoveBody(jolt_id);
        bi.DestroyBody(jolt_id);
    }

    bool JoltPhysicsWorld::is_body_valid(BodyId id) const
    {
        if (!_initialized || !id.is_valid())
        {
            return false;
        }

        const JPH::BodyID jolt_id = to_jolt_id(id);
        return _physics_system.GetBodyInterface().IsAdded(jolt_id);
    }

    // ============================================================================
    // Body queries
    // ============================================================================

    BodyTransform JoltPhysicsWorld::get_transform(BodyId id) const
    {
        BodyTransform result;

        if (!_initialized || !id.is_valid())
        {
            return result;
        }

        const JPH::BodyID jolt_id = to_jolt_id(id);
        JPH::BodyLockRead lock(_physics_system.GetBodyLockInterface(), jolt_id);

        if (!lock.Succeeded())
        {
            return result;
        }

        const JPH::Body &body = lock.GetBody();
        const JPH::Quat q = body.GetRotation();

        result.position = to_glm(body.GetPosition());
        result.rotation = glm::quat(q.GetW(), q.GetX(), q.GetY(), q.GetZ());

        return result;
    }

    glm::vec3 JoltPhysicsWorld::get_linear_velocity(BodyId id) const
    {
        if (!_initialized || !id.is_valid())
        {
            return glm::vec3(0.0f);
        }

        const JPH::BodyID jolt_id = to_jolt_id(id);
        return to_glm(_physics_system.GetBodyInterface().GetLinearVelocity(jolt_id));
    }

    glm::vec3 JoltPhysicsWorld::get_angular_velocity(BodyId id) const
    {
        if (!_initialized || !id.is_valid())
        {
            return glm::vec3(0.0f);
        }

        const JPH::BodyID jolt_id = to_jolt_id(id);
        return to_glm(_physics_system.GetBodyInterface().GetAngularVelocity(jolt_id));
    }

    BodyMotion JoltPhysicsWorld::get_motion(BodyId id) const
    {
        BodyMotion result;

        if (!_initialized || !id.is_valid())
        {
            return result;
        }

        JPH::BodyLockRead lock(_physics_system.GetBodyLockInterface(), to_jolt_id(id));
        if (!lock.Succeeded())
        {
            return result;
        }

        const JPH::Body &body = lock.GetBody();
        result.position = to_glm(body.GetPosition());
        result.linear_velocity = to_glm(body.GetLinearVelocity());
        result.angular_velocity = to_glm(body.GetAngularVelocity());
        result.active = body.IsActive();
        return result;
    }

    uint64_t JoltPhysicsWorld::get_user_data(BodyId id) const
    {
        if (!_initialized || !id.is_valid())
        {
            return 0;
        }

        const JPH::BodyID jolt_id = to_jolt_id(id);
        return _physics_system.GetBodyInterface().GetUserData(jolt_id);
    }

    // ============================================================================
    // Body manipulation
    // ============================================================================

    void JoltPhysicsWorld::set_transform(BodyId id, const glm::vec3 &position, const glm::quat &rotation)
    {
        if (!_initialized || !id.is_valid())
        {
            return;
        }

        const JPH::BodyID jolt_id = to_jolt_id(id);
        _physics_system.GetBodyInterface().SetPositionAndRotation(
            jolt_id,
            to_jolt_r(position),
            to_jolt(glm::normalize(rotation)),
            JPH::EActivation::Activate);
    }

    void JoltPhysicsWorld::set_linear_velocity(BodyId id, const glm::vec3 &velocity)
    {
        if (!_initialized || !id.is_valid())
        {
            return;
        }

        const JPH::BodyID jolt_id = to_jolt_id(id);
        _physics_system.GetBodyInterface().SetLinearVelocity(jolt_id, to_jolt(velocity));
    }

    void JoltPhysicsWorld::set_angular_velocity(BodyId id, const glm::vec3 &velocity)
    {
        if (!_initialized || !id.is_valid())
        {
            return;
        }

        const JPH::BodyID jolt_id = to_jolt_id(id);
        _physics_system.GetBodyInterface().SetAngularVelocity(jolt_id, to_jolt(velocity));
    }

    void JoltPhysicsWorld::add_impulse(BodyId id, const glm::vec3 &impulse, const glm::vec3 &world_point)
    {
        if (!_initialized || !id.is_valid())
        {
            return;
        }

        const JPH::BodyID jolt_id = to_jolt_id(id);
        _physics_system.GetBodyInterface().AddImpulse(jolt_id, to_jolt(impulse), to_jolt_r(world_point));
    }

    // ============================================================================
    // Activation / sleeping
    // ============================================================================

    void JoltPhysicsWorld::activate(BodyId id)
    {
        if (!_initialized || !id.is_valid())
        {
            return;
        }

        const JPH::BodyID jolt_id = to_jolt_id(id);
        _physics_system.GetBodyInterface().ActivateBody(jolt_id);
    }

    bool JoltPhysicsWorld::is_active(BodyId id) const
    {
        if (!_initialized || !id.is_valid())
        {
            return false;
        }

        const JPH::BodyID jolt_id = to_jolt_id(id);
        return _physics_system.GetBodyInterface().IsActive(jolt_id);
    }

    void JoltPhysicsWorld::set_allow_sleeping(BodyId id, bool allow)
    {
        if (!_initialized || !id.is_valid())
        {
            return;
        }

        const JPH::BodyID jolt_id = to_jolt_id(id);
        JPH::BodyLockWrite lock(_physics_system.GetBodyLockInterface(), jolt_id);
        if (lock.Succeeded())
        {
            lock.GetBody().SetAllowSleeping(allow);
        }
    }

    bool JoltPhysicsWorld::get_allow_sleeping(BodyId id) const
    {
        if (!_initialized || !id.is_valid())
        {
            return false;
        }

        const JPH::BodyID jolt_id = to_jolt_id(id);
        JPH::BodyLockRead lock(_physics_system.GetBodyLockInterface(), jolt_id);
        return lock.Succeeded() && lock.GetBody().GetAllowSleeping();
    }

    // ============================================================================
    // World settings
    // ============================================================================

    void JoltPhysicsWorld::set_gravity(const glm::vec3 &gravity)
    {
        if (!_initialized)
        {
            return;
        }

        _physics_system.SetGravity(to_jolt(gravity));
    }

    glm::vec3 JoltPhysicsWorld::get_gravity() const
    {
        if (!_initialized)
        {
            return glm::vec3(0.0f, -9.81f, 0.0f);
        }

        return to_glm(_physics_system.GetGravity());
    }
} // namespace Physics

#endif // DICETRAY_USE_JOLT
