#pragma once

#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>

#include <array>

namespace Dice
{
    // Rotation in the die's local frame that turns the desired face to where the
    // actual face is. Identity when angle == 0.
    struct Correction
    {
        glm::vec3 axis{1.0f, 0.0f, 0.0f};
        float angle{0.0f};

        bool is_identity() const { return angle == 0.0f; }
        glm::quat rotation() const;
    };

    // ============================================================================
    // DesiredRollTable: (actual, desired) -> Correction for every ordered pair of
    // faces. Built once from the face normals and read-only afterwards.
    // ============================================================================

    class DesiredRollTable
    {
    public:
        static const DesiredRollTable &instance();

        // Identity for equal or out-of-range faces.
        const Correction &lookup(int actual, int desired) const;

    private:
        DesiredRollTable();

        static Correction derive(int actual, int desired);

        std::array<std::array<Correction, 7>, 7> _entries{};
    };

    inline const Correction &correction(int actual, int desired)
    {
        return DesiredRollTable::instance().lookup(actual, desired);
    }

    // Cosmetic only: displayed * correction(actual, desired). The simulated
    // outcome is never touched.
    glm::quat apply_correction(const glm::quat &displayed, int actual, int desired);
} // namespace Dice
