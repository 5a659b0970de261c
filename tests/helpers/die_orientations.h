#pragma once

#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>

namespace DiceTest
{
    inline glm::quat axis_angle(float angle, float x, float y, float z)
    {
        return glm::angleAxis(angle, glm::vec3(x, y, z));
    }

    // Orientation with `face` pointing up, turned by `heading` about world Y.
    inline glm::quat face_up(int face, float heading = 0.0f)
    {
        const float half_pi = glm::half_pi<float>();
        glm::quat base(1.0f, 0.0f, 0.0f, 0.0f);
        switch (face)
        {
            case 2: base = axis_angle(half_pi, 0.0f, 0.0f, 1.0f); break;
            case 3: base = axis_angle(-half_pi, 1.0f, 0.0f, 0.0f); break;
            case 4: base = axis_angle(half_pi, 1.0f, 0.0f, 0.0f); break;
            case 5: base = axis_angle(-half_pi, 0.0f, 0.0f, 1.0f); break;
            case 6: base = axis_angle(glm::pi<float>(), 1.0f, 0.0f, 0.0f); break;
            default: break;
        }
        return axis_angle(heading, 0.0f, 1.0f, 0.0f) * base;
    }

    // Balanced on an edge between faces 1 and 4.
    inline glm::quat on_edge()
    {
        return axis_angle(glm::quarter_pi<float>(), 1.0f, 0.0f, 0.0f);
    }
} // namespace DiceTest
