#include <gtest/gtest.h>

#include "services/alignment/frame_reference.hpp"
#include "services/alignment/rigid_alignment.hpp"
#include "../test_utils/geometry_fixtures.hpp"

using namespace screw_planner;
using namespace screw_planner::services::alignment;
using screw_planner::core::CoordinateSystem;
using screw_planner::core::GeometryError;
using screw_planner::core::Vector3;

class FrameReferenceTest : public ::testing::Test {
protected:
    void SetUp() override {
        frame = AnatomicalFrame::standard();
    }

    AnatomicalFrame frame;
    RigidAlignment alignment;
};

// ==================== Anatomical frame ====================

TEST_F(FrameReferenceTest, StandardFrameIsOrthonormal) {
    EXPECT_TRUE(frame.isOrthonormal());
}

TEST_F(FrameReferenceTest, StandardPlaneNormals) {
    test_utils::expectVectorNear(frame.planeNormal(AnatomicalPlane::Axial), {0.0, 0.0, 1.0});
    test_utils::expectVectorNear(frame.planeNormal(AnatomicalPlane::Coronal), {0.0, 1.0, 0.0});
    test_utils::expectVectorNear(frame.planeNormal(AnatomicalPlane::Sagittal), {1.0, 0.0, 0.0});
}

TEST_F(FrameReferenceTest, SkewedFrameIsNotOrthonormal) {
    frame.sagittal[0][0] = 0.5;
    EXPECT_FALSE(frame.isOrthonormal());

    // Construction still succeeds
    FrameReference reference(frame);
    EXPECT_EQ(reference.frame(), frame);
}

TEST_F(FrameReferenceTest, DefaultPivotIsCoronal) {
    FrameReference reference(frame);
    EXPECT_EQ(reference.pivot(), AnatomicalPlane::Coronal);
    EXPECT_EQ(toString(reference.pivot()), "coronal");
}

// ==================== Correction rotation ====================

TEST_F(FrameReferenceTest, CorrectionCarriesPivotNormalOntoDirection) {
    FrameReference reference(frame);
    Vector3 direction = *core::math::normalized({-2.0, -9.0, -2.0});

    auto rfix = reference.correctionRotation(direction);
    ASSERT_TRUE(rfix.has_value());
    test_utils::expectProperRotation(*rfix);
    test_utils::expectVectorNear(
        core::math::multiply(*rfix, reference.planeNormal(AnatomicalPlane::Coronal)), direction);
}

TEST_F(FrameReferenceTest, ZeroDirectionIsDegenerate) {
    FrameReference reference(frame);
    auto pose = core::AffineTransform::identity(CoordinateSystem::RAS);
    auto corrected = reference.correctAxes(pose, {0.0, 0.0, 0.0});
    ASSERT_FALSE(corrected.has_value());
    EXPECT_EQ(corrected.error().code, GeometryError::Code::DegenerateGeometry);
}

// ==================== Axis correction ====================

TEST_F(FrameReferenceTest, PosteriorDirectionOverwritesXAndZ) {
    FrameReference reference(frame);
    auto placement = test_utils::makePlacement("L4", {0.0, 0.0, 0.0}, {0.0, -35.0, 0.0}, 3.25, 35.0);
    auto pose = alignment.computePose(placement, TranslationPolicy::AnchorAtMidpoint);
    ASSERT_TRUE(pose.has_value());

    auto corrected = reference.correctAxes(*pose, {0.0, -1.0, 0.0});
    ASSERT_TRUE(corrected.has_value());

    // Coronal normal (0, 1, 0) onto (0, -1, 0) is a half turn about -Z
    test_utils::expectVectorNear(corrected->column(0), {0.0, 0.0, -1.0});
    test_utils::expectVectorNear(corrected->column(2), {-1.0, 0.0, 0.0});
    test_utils::expectVectorNear(corrected->column(1), pose->column(1));
    test_utils::expectVectorNear(corrected->translation().value, {0.0, -17.5, 0.0});
    EXPECT_EQ(corrected->system, CoordinateSystem::RAS);
}

TEST_F(FrameReferenceTest, CorrectedAxesAreOrthonormal) {
    FrameReference reference(frame);
    for (const auto& placement : test_utils::lumbarPlacements()) {
        auto direction = RigidAlignment::measuredDirection(placement);
        ASSERT_TRUE(direction.has_value());
        auto pose = alignment.computePose(placement, TranslationPolicy::AnchorAtBodyCenter);
        ASSERT_TRUE(pose.has_value());

        auto corrected = reference.correctAxes(*pose, *direction);
        ASSERT_TRUE(corrected.has_value()) << placement.name;

        auto x = corrected->column(0);
        auto z = corrected->column(2);
        EXPECT_NEAR(core::math::norm(x), 1.0, 1e-9);
        EXPECT_NEAR(core::math::norm(z), 1.0, 1e-9);
        EXPECT_NEAR(core::math::dot(x, *direction), 0.0, 1e-9);
        EXPECT_NEAR(core::math::dot(z, *direction), 0.0, 1e-9);
        EXPECT_NEAR(core::math::dot(x, z), 0.0, 1e-9);
        // Translation is untouched
        EXPECT_EQ(corrected->translation(), pose->translation());
    }
}

TEST_F(FrameReferenceTest, AxialPivotUsesAxialNormal) {
    FrameReference reference(frame, AnatomicalPlane::Axial);
    Vector3 direction = {0.0, 0.0, 1.0};
    auto rfix = reference.correctionRotation(direction);
    ASSERT_TRUE(rfix.has_value());
    test_utils::expectMatrix3Near(*rfix, core::math::identity3());
}
