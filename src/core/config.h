#pragma once

// Centralized simulation configuration constants

#include <cstdint>
#include <cstdlib>
#include <string_view>

// Physics world
inline constexpr float kGravityY = -50.0f;
// Fixed simulation timestep (seconds); one trajectory frame per step
inline constexpr float kSimulationTimestep = 1.0f / 60.0f;
inline constexpr double kSimulationRateHz = 60.0;
// Seconds of rest before a die body is put to sleep
inline constexpr float kDieSleepTime = 0.1f;
inline constexpr float kDieRestitution = 0.3f;
inline constexpr float kDieFriction = 0.3f;
inline constexpr float kDieMass = 1.0f;
inline constexpr float kDieHalfSize = 0.5f;

// Arena: floor height and invisible wall footprint
inline constexpr float kFloorY = -7.0f;
inline constexpr float kArenaWidth = 8.0f;
inline constexpr float kArenaDepth = 8.0f;
inline constexpr float kWallHeight = 40.0f;
inline constexpr float kWallThickness = 0.5f;

// Die count limits accepted by the configuration surface
inline constexpr int kMinDice = 1;
inline constexpr int kMaxDice = 10;

// Scenario generation
inline constexpr float kStartHeight = 3.0f;          // world y of the launch plane
inline constexpr float kStartHeightJitter = 0.5f;
inline constexpr float kPlacementMargin = 1.5f;      // wall margin including the die itself
inline constexpr float kMinDieSeparation = 1.2f;
inline constexpr int kMaxPlacementAttempts = 100;
// Fallback grid columns for the largest die count, ceil(sqrt(kMaxDice))
inline constexpr int kMaxGridColumns = [] {
    int cols = 1;
    while (cols * cols < kMaxDice)
    {
        ++cols;
    }
    return cols;
}();
// Smallest arena side whose footprint holds that grid at full separation
inline constexpr float kMinArenaExtent = 2.0f * kPlacementMargin + (kMaxGridColumns - 1) * kMinDieSeparation;
inline constexpr float kImpulseMin = 3.0f;
inline constexpr float kImpulseRange = 10.0f;
inline constexpr float kImpulseOffsetZ = 0.2f;

// Roll resolution
inline constexpr int kStuckDetectionSteps = 1000;
inline constexpr float kStuckThreshold = 0.001f;
inline constexpr int kMaxRetries = 10;
inline constexpr double kResolveTimeoutMs = 1000.0;
inline constexpr int kFallbackFace = 1;

// Face classification tolerance (radians)
inline constexpr double kFaceEpsilon = 0.1;

// Log verbosity override: DICETRAY_LOG_LEVEL=debug|info|warn|error
inline std::string_view logLevelOverride()
{
    const char *env = std::getenv("DICETRAY_LOG_LEVEL");
    if (env && *env)
    {
        return std::string_view(env);
    }
    return {};
}
