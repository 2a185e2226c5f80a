#include <Orrery/FrameRotator.hpp>

#include <gtest/gtest.h>

#include <glm/glm.hpp>

#include <cmath>

using Orrery::Vec3;
using Orrery::kPi;

namespace {

void expectVecNear(const Vec3& a, const Vec3& b, double tol = 1e-12)
{
    EXPECT_NEAR(a.x, b.x, tol);
    EXPECT_NEAR(a.y, b.y, tol);
    EXPECT_NEAR(a.z, b.z, tol);
}

} // namespace

TEST(FrameRotator, IdentityForZeroAngles)
{
    expectVecNear(Orrery::FrameRotator::rotate(1.5, -0.5, 0.0, 0.0, 0.0), Vec3(1.5, -0.5, 0.0));
}

TEST(FrameRotator, ArgumentOfPeriapsisTurnsInPlane)
{
    expectVecNear(Orrery::FrameRotator::rotate(1.0, 0.0, kPi / 2, 0.0, 0.0), Vec3(0.0, 1.0, 0.0));
}

TEST(FrameRotator, InclinationLiftsAboutLineOfNodes)
{
    // +Y of the orbital plane tips toward +Z; the line of nodes (+X) stays put
    expectVecNear(Orrery::FrameRotator::rotate(0.0, 1.0, 0.0, kPi / 2, 0.0), Vec3(0.0, 0.0, 1.0));
    expectVecNear(Orrery::FrameRotator::rotate(1.0, 0.0, 0.0, kPi / 2, 0.0), Vec3(1.0, 0.0, 0.0));
}

TEST(FrameRotator, RotationOrderIsOmegaThenInclinationThenNode)
{
    // omega moves periapsis to +Y, inclination lifts it to +Z, node turn leaves Z alone
    expectVecNear(Orrery::FrameRotator::rotate(1.0, 0.0, kPi / 2, kPi / 2, kPi / 2), Vec3(0.0, 0.0, 1.0));
    // node turn alone moves +X to +Y
    expectVecNear(Orrery::FrameRotator::rotate(1.0, 0.0, 0.0, 0.3, kPi / 2), Vec3(0.0, 1.0, 0.0));
}

TEST(FrameRotator, PreservesLength)
{
    const Vec3 p = Orrery::FrameRotator::rotate(0.6, 0.8, 1.1, 2.2, 3.3);
    EXPECT_NEAR(glm::length(p), 1.0, 1e-12);
}

TEST(FrameRotator, PlaneRotationMatchesFreeFunction)
{
    const Orrery::PlaneRotation rotation(0.4, 1.3, 5.1);
    for (double x : {0.0, 1.0, -2.5}) {
        for (double y : {0.0, 0.75, -1.25}) {
            EXPECT_EQ(rotation.apply(x, y), Orrery::FrameRotator::rotate(x, y, 0.4, 1.3, 5.1));
        }
    }
}
