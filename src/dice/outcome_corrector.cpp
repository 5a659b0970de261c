#include "outcome_corrector.h"
#include "face_classifier.h"

#include <glm/geometric.hpp>
#include <glm/gtc/constants.hpp>

#include <cmath>

namespace Dice
{
    glm::quat Correction::rotation() const
    {
        if (is_identity())
        {
            return glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
        }
        return glm::angleAxis(angle, axis);
    }

    const DesiredRollTable &DesiredRollTable::instance()
    {
        static const DesiredRollTable table;
        return table;
    }

    DesiredRollTable::DesiredRollTable()
    {
        for (int actual = 1; actual <= 6; ++actual)
        {
            for (int desired = 1; desired <= 6; ++desired)
            {
                _entries[actual][desired] = derive(actual, desired);
            }
        }
    }

    Correction DesiredRollTable::derive(int actual, int desired)
    {
        Correction out{};
        if (actual == desired)
        {
            return out;
        }

        const glm::vec3 n_actual = face_normal(actual);
        const glm::vec3 n_desired = face_normal(desired);

        if (glm::dot(n_actual, n_desired) < -0.5f)
        {
            // Opposite faces: half turn about any local axis perpendicular to the normal.
            const glm::vec3 x_axis{1.0f, 0.0f, 0.0f};
            const glm::vec3 z_axis{0.0f, 0.0f, 1.0f};
            out.axis = std::abs(glm::dot(x_axis, n_desired)) < 0.5f ? x_axis : z_axis;
            out.angle = glm::pi<float>();
            return out;
        }

        out.axis = glm::normalize(glm::cross(n_desired, n_actual));
        out.angle = glm::half_pi<float>();
        return out;
    }

    const Correction &DesiredRollTable::lookup(int actual, int desired) const
    {
        if (!is_valid_face(actual) || !is_valid_face(desired))
        {
            return _entries[0][0];
        }
        return _entries[actual][desired];
    }

    glm::quat apply_correction(const glm::quat &displayed, int actual, int desired)
    {
        const Correction &c = correction(actual, desired);
        if (c.is_identity())
        {
            return displayed;
        }
        return displayed * c.rotation();
    }
} // namespace Dice
