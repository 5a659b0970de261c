#pragma once

#include "core/config.h"

#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>

namespace Dice
{
    inline constexpr int kIndeterminateFace = 0;

    // Euler triple from the Y-Z-X decomposition: heading about Y (y),
    // attitude about Z (z), bank about X (x). Radians.
    struct EulerAngles
    {
        double x{0.0};
        double y{0.0};
        double z{0.0};
    };

    // Near the +-90 degree attitude singularity (|x*y + z*w| > 0.499) the
    // heading absorbs the whole rotation and bank is reported as 0.
    EulerAngles to_euler_yzx(const glm::quat &orientation);

    // Face value 1..6 whose outward normal points up, or kIndeterminateFace
    // when the die rests on an edge or corner (no axis within epsilon).
    int classify_face(const EulerAngles &euler, double epsilon = kFaceEpsilon);
    int classify_face(const glm::quat &orientation, double epsilon = kFaceEpsilon);

    bool is_valid_face(int face);

    // Body-local outward normal of a face:
    // 1 = +Y, 2 = +X, 3 = +Z, 4 = -Z, 5 = -X, 6 = -Y. Zero vector for invalid faces.
    glm::vec3 face_normal(int face);
} // namespace Dice
