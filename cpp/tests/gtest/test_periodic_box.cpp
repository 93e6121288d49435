// =============================================================================
// PeriodicBox / SystemInfo Tests
// =============================================================================

#include <gtest/gtest.h>
#include "nbp/error.hpp"
#include "nbp/periodic_box.hpp"
#include "nbp/system_info.hpp"

#include <cmath>

using namespace nbp;

class PeriodicBoxTest : public ::testing::Test {
protected:
    PeriodicBox box{10.0};
};

TEST_F(PeriodicBoxTest, WrapsIntoBox) {
    EXPECT_DOUBLE_EQ(box.wrap(-1.0), 9.0);
    EXPECT_DOUBLE_EQ(box.wrap(10.0), 0.0);
    EXPECT_DOUBLE_EQ(box.wrap(25.0), 5.0);
    EXPECT_DOUBLE_EQ(box.wrap(3.5), 3.5);
}

// -1e-18 + 10 rounds to exactly 10, which must fold back to 0
TEST_F(PeriodicBoxTest, TinyNegativeFoldsToZero) {
    const double w = box.wrap(-1e-18);
    EXPECT_GE(w, 0.0);
    EXPECT_LT(w, box.length());
}

TEST_F(PeriodicBoxTest, WrapAllKeepsParticlesInBox) {
    Positions in = {Vec3(-0.5, 10.5, 3.0), Vec3(20.0, -20.0, 9.999)};
    Positions out = box.wrap_all(in);
    ASSERT_EQ(out.size(), 2u);
    for (const auto& p : out) {
        EXPECT_TRUE(box.contains(p));
    }
    EXPECT_DOUBLE_EQ(out[0].x(), 9.5);
    EXPECT_DOUBLE_EQ(out[0].y(), 0.5);
}

TEST_F(PeriodicBoxTest, MinimumImage) {
    Vec3 d = box.minimum_image(Vec3(9.0, -8.0, 2.0));
    EXPECT_DOUBLE_EQ(d.x(), -1.0);
    EXPECT_DOUBLE_EQ(d.y(), 2.0);
    EXPECT_DOUBLE_EQ(d.z(), 2.0);

    EXPECT_DOUBLE_EQ(box.minimum_image_distance(Vec3(0, 0, 0), Vec3(9, 0, 0)), 1.0);
}

TEST_F(PeriodicBoxTest, RejectsNonPositiveLength) {
    EXPECT_THROW(PeriodicBox(0.0), ConfigurationError);
    EXPECT_THROW(PeriodicBox(-3.0), ConfigurationError);
    EXPECT_THROW(PeriodicBox(std::nan("")), ConfigurationError);
}

TEST(SystemInfoTest, DerivesCutoffSkinAndRoundedLength) {
    SystemInfo info(20.0, {1.0});
    EXPECT_DOUBLE_EQ(info.cutoff_radius(), 3.0);
    EXPECT_DOUBLE_EQ(info.skin_radius(), 4.0);
    EXPECT_DOUBLE_EQ(info.box_length(), 21.0);
    EXPECT_DOUBLE_EQ(info.volume(), 21.0 * 21.0 * 21.0);
}

TEST(SystemInfoTest, UsesLargestSigma) {
    SystemInfo info(10.0, {0.5, 1.0, 0.25});
    EXPECT_DOUBLE_EQ(info.sigma_max(), 1.0);
    EXPECT_DOUBLE_EQ(info.cutoff_radius(), 3.0);
    EXPECT_DOUBLE_EQ(info.box_length(), 12.0);
}

TEST(SystemInfoTest, RejectsInvalidSystems) {
    // Cutoff 3 against a 3-long box
    EXPECT_THROW(SystemInfo(2.0, {1.0}), ConfigurationError);
    // Skin equal to cutoff leaves no margin
    EXPECT_THROW(SystemInfo(20.0, {1.0}, 3.0, 3.0), ConfigurationError);
    EXPECT_THROW(SystemInfo(20.0, {}), ConfigurationError);
    EXPECT_THROW(SystemInfo(20.0, {-1.0}), ConfigurationError);
    EXPECT_THROW(SystemInfo(-5.0, {1.0}), ConfigurationError);
}
