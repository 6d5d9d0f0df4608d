#include <gtest/gtest.h>
#include <cmath>
#include "calibration.hpp"
#include "test_helpers.hpp"

class CalibrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        profile = make_profile(175);
    }

    RunnerProfile profile;
};

TEST_F(CalibrationTest, PositiveFiniteRatio) {
    auto ctx = estimate_calibration(make_running_session(), profile);
    EXPECT_TRUE(ctx.valid);
    EXPECT_TRUE(std::isfinite(ctx.ratio));
    EXPECT_GT(ctx.ratio, 0.0);
    EXPECT_GT(ctx.mean_range, 0.0);
    EXPECT_NEAR(ctx.ratio, 1.75 / ctx.mean_range, 1e-9);
    EXPECT_NEAR(ctx.to_meters(0.01), 0.01 * ctx.ratio, 1e-12);
}

TEST_F(CalibrationTest, ZeroRangeIsInvalid) {
    auto ctx = estimate_calibration(make_static_session(40), profile);
    EXPECT_FALSE(ctx.valid);
    EXPECT_DOUBLE_EQ(ctx.ratio, 0.0);
    EXPECT_DOUBLE_EQ(ctx.to_meters(0.5), 0.0);
}

TEST_F(CalibrationTest, EmptySessionIsInvalid) {
    auto ctx = estimate_calibration({}, profile);
    EXPECT_FALSE(ctx.valid);
    EXPECT_DOUBLE_EQ(ctx.ratio, 0.0);
}

TEST_F(CalibrationTest, ZeroHeightIsInvalid) {
    RunnerProfile flat = profile;
    flat.height_cm = 0;
    auto ctx = estimate_calibration(make_running_session(), flat);
    EXPECT_FALSE(ctx.valid);
    EXPECT_DOUBLE_EQ(ctx.ratio, 0.0);
}

TEST_F(CalibrationTest, AnkleReference) {
    CalibrationConfig cfg;
    cfg.reference = CalibrationReference::ANKLES;
    auto ctx = estimate_calibration(make_running_session(), profile, cfg);
    ASSERT_TRUE(ctx.valid);
    // Ankles swing 0.1 from peak to peak
    EXPECT_NEAR(ctx.mean_range, 0.1, 0.005);
}

TEST(CalibrationReferenceTest, Names) {
    EXPECT_EQ(to_string(CalibrationReference::HIPS), "hips");
    EXPECT_EQ(calibration_reference_from_string("hips_and_ankles"),
              CalibrationReference::HIPS_AND_ANKLES);
    EXPECT_EQ(reference_landmarks(CalibrationReference::HIPS_AND_ANKLES).size(), 4u);
    EXPECT_THROW(calibration_reference_from_string("knees"), std::invalid_argument);
}
