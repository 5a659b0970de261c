#include "face_classifier.h"

#include <glm/gtc/constants.hpp>

#include <cmath>

namespace Dice
{
    namespace
    {
        constexpr double kPi = glm::pi<double>();
        constexpr double kHalfPi = glm::half_pi<double>();

        bool near(double value, double target, double epsilon)
        {
            return std::abs(value - target) < epsilon;
        }
    } // namespace

    EulerAngles to_euler_yzx(const glm::quat &orientation)
    {
        const glm::quat q = glm::normalize(orientation);
        const double x = q.x;
        const double y = q.y;
        const double z = q.z;
        const double w = q.w;

        EulerAngles out{};
        const double test = x * y + z * w;
        if (test > 0.499)
        {
            out.y = 2.0 * std::atan2(x, w);
            out.z = kHalfPi;
            out.x = 0.0;
            return out;
        }
        if (test < -0.499)
        {
            out.y = -2.0 * std::atan2(x, w);
            out.z = -kHalfPi;
            out.x = 0.0;
            return out;
        }

        const double sqx = x * x;
        const double sqy = y * y;
        const double sqz = z * z;
        out.y = std::atan2(2.0 * y * w - 2.0 * x * z, 1.0 - 2.0 * sqy - 2.0 * sqz);
        out.z = std::asin(2.0 * test);
        out.x = std::atan2(2.0 * x * w - 2.0 * y * z, 1.0 - 2.0 * sqx - 2.0 * sqz);
        return out;
    }

    int classify_face(const EulerAngles &euler, double epsilon)
    {
        if (near(euler.z, 0.0, epsilon))
        {
            if (near(euler.x, 0.0, epsilon))
            {
                return 1;
            }
            if (near(euler.x, kHalfPi, epsilon))
            {
                return 4;
            }
            if (near(euler.x, -kHalfPi, epsilon))
            {
                return 3;
            }
            if (near(euler.x, kPi, epsilon) || near(euler.x, -kPi, epsilon))
            {
                return 6;
            }
            return kIndeterminateFace;
        }

        if (near(euler.z, kHalfPi, epsilon))
        {
            return 2;
        }
        if (near(euler.z, -kHalfPi, epsilon))
        {
            return 5;
        }
        return kIndeterminateFace;
    }

    int classify_face(const glm::quat &orientation, double epsilon)
    {
        return classify_face(to_euler_yzx(orientation), epsilon);
    }

    bool is_valid_face(int face)
    {
        return face >= 1 && face <= 6;
    }

    glm::vec3 face_normal(int face)
    {
        switch (face)
        {
            case 1: return {0.0f, 1.0f, 0.0f};
            case 2: return {1.0f, 0.0f, 0.0f};
            case 3: return {0.0f, 0.0f, 1.0f};
            case 4: return {0.0f, 0.0f, -1.0f};
            case 5: return {-1.0f, 0.0f, 0.0f};
            case 6: return {0.0f, -1.0f, 0.0f};
            default: return {0.0f, 0.0f, 0.0f};
        }
    }
} // namespace Dice
