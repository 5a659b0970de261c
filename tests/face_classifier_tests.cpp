#include "dice/face_classifier.h"

#include "helpers/die_orientations.h"

#include <glm/gtc/constants.hpp>
#include <gtest/gtest.h>

namespace
{
    using DiceTest::axis_angle;
    using DiceTest::face_up;

    constexpr float kHeadings[] = {0.0f, 0.7f, 2.0f, -2.5f, 3.1f};
} // namespace

TEST(FaceClassifier, IdentityShowsOne)
{
    EXPECT_EQ(Dice::classify_face(glm::quat(1.0f, 0.0f, 0.0f, 0.0f)), 1);
}

TEST(FaceClassifier, EveryFaceUpIsRecognisedAtAnyHeading)
{
    for (int face = 1; face <= 6; ++face)
    {
        for (float heading : kHeadings)
        {
            EXPECT_EQ(Dice::classify_face(face_up(face, heading)), face)
                << "face " << face << " heading " << heading;
        }
    }
}

TEST(FaceClassifier, UpwardNormalMatchesFaceConvention)
{
    const glm::vec3 up(0.0f, 1.0f, 0.0f);
    for (int face = 1; face <= 6; ++face)
    {
        const glm::vec3 world_normal = face_up(face, 0.4f) * Dice::face_normal(face);
        EXPECT_NEAR(world_normal.x, up.x, 1e-5f);
        EXPECT_NEAR(world_normal.y, up.y, 1e-5f);
        EXPECT_NEAR(world_normal.z, up.z, 1e-5f);
    }
}

TEST(FaceClassifier, EdgeAndCornerRestsAreIndeterminate)
{
    const float quarter = glm::quarter_pi<float>();

    EXPECT_EQ(Dice::classify_face(axis_angle(quarter, 1.0f, 0.0f, 0.0f)), Dice::kIndeterminateFace);
    EXPECT_EQ(Dice::classify_face(axis_angle(quarter, 0.0f, 0.0f, 1.0f)), Dice::kIndeterminateFace);
    EXPECT_EQ(Dice::classify_face(axis_angle(-quarter, 0.0f, 0.0f, 1.0f)), Dice::kIndeterminateFace);

    // Corner: tipped about both horizontal axes
    const glm::quat corner = axis_angle(quarter, 0.0f, 0.0f, 1.0f) * axis_angle(quarter, 1.0f, 0.0f, 0.0f);
    EXPECT_EQ(Dice::classify_face(corner), Dice::kIndeterminateFace);
}

TEST(FaceClassifier, SmallTiltStaysWithinTolerance)
{
    EXPECT_EQ(Dice::classify_face(axis_angle(0.05f, 1.0f, 0.0f, 0.0f)), 1);
    EXPECT_EQ(Dice::classify_face(axis_angle(0.05f, 0.0f, 0.0f, 1.0f) * face_up(2)), 2);
    EXPECT_EQ(Dice::classify_face(axis_angle(0.2f, 1.0f, 0.0f, 0.0f)), Dice::kIndeterminateFace);
}

TEST(FaceClassifier, EulerDecompositionHandlesSingularity)
{
    const Dice::EulerAngles up2 = Dice::to_euler_yzx(face_up(2, 0.3f));
    EXPECT_NEAR(up2.z, glm::half_pi<double>(), 1e-6);
    EXPECT_DOUBLE_EQ(up2.x, 0.0);

    const Dice::EulerAngles up5 = Dice::to_euler_yzx(face_up(5, -1.2f));
    EXPECT_NEAR(up5.z, -glm::half_pi<double>(), 1e-6);
    EXPECT_DOUBLE_EQ(up5.x, 0.0);

    const Dice::EulerAngles heading = Dice::to_euler_yzx(axis_angle(0.9f, 0.0f, 1.0f, 0.0f));
    EXPECT_NEAR(heading.y, 0.9, 1e-5);
    EXPECT_NEAR(heading.x, 0.0, 1e-6);
    EXPECT_NEAR(heading.z, 0.0, 1e-6);
}

TEST(FaceClassifier, ClassifiesFromEulerTriple)
{
    const double half_pi = glm::half_pi<double>();
    const double pi = glm::pi<double>();

    EXPECT_EQ(Dice::classify_face(Dice::EulerAngles{0.0, 1.0, 0.0}), 1);
    EXPECT_EQ(Dice::classify_face(Dice::EulerAngles{half_pi, 0.0, 0.0}), 4);
    EXPECT_EQ(Dice::classify_face(Dice::EulerAngles{-half_pi, 0.0, 0.0}), 3);
    EXPECT_EQ(Dice::classify_face(Dice::EulerAngles{pi, 0.0, 0.0}), 6);
    EXPECT_EQ(Dice::classify_face(Dice::EulerAngles{-pi, 0.0, 0.0}), 6);
    EXPECT_EQ(Dice::classify_face(Dice::EulerAngles{0.0, 0.0, half_pi}), 2);
    EXPECT_EQ(Dice::classify_face(Dice::EulerAngles{0.0, 0.0, -half_pi}), 5);
    EXPECT_EQ(Dice::classify_face(Dice::EulerAngles{0.0, 0.0, 0.6}), Dice::kIndeterminateFace);
    EXPECT_EQ(Dice::classify_face(Dice::EulerAngles{1.0, 0.0, 0.0}), Dice::kIndeterminateFace);
}

TEST(FaceClassifier, FaceValidity)
{
    EXPECT_FALSE(Dice::is_valid_face(0));
    EXPECT_TRUE(Dice::is_valid_face(1));
    EXPECT_TRUE(Dice::is_valid_face(6));
    EXPECT_FALSE(Dice::is_valid_face(7));
    EXPECT_EQ(Dice::face_normal(0), glm::vec3(0.0f));
}
