#include <gtest/gtest.h>

#include <stdexcept>

#include "gestify/dwell_detector.hpp"

using namespace gestify;

TEST(DwellDetectorTest, FiresOnceAfterResting) {
    DwellDetector dwell(1.0, 30.0f);

    EXPECT_FALSE(dwell.update(cv::Point(100, 100), 0.0));
    EXPECT_FALSE(dwell.update(cv::Point(110, 100), 0.5));
    EXPECT_TRUE(dwell.update(cv::Point(105, 105), 1.0));

    EXPECT_FALSE(dwell.update(cv::Point(100, 100), 1.5));
    EXPECT_FALSE(dwell.update(cv::Point(100, 100), 3.0));
}

TEST(DwellDetectorTest, ProgressTracksElapsedFraction) {
    DwellDetector dwell(1.0, 30.0f);
    EXPECT_FLOAT_EQ(dwell.progress(0.0), 0.0f);

    dwell.update(cv::Point(100, 100), 0.0);
    EXPECT_FLOAT_EQ(dwell.progress(0.25), 0.25f);
    EXPECT_FLOAT_EQ(dwell.progress(4.0), 1.0f);

    dwell.update(cv::Point(100, 100), 1.0);
    EXPECT_FLOAT_EQ(dwell.progress(1.2), 0.0f);  // already fired
}

TEST(DwellDetectorTest, LeavingRadiusRestartsTimer) {
    DwellDetector dwell(1.0, 30.0f);
    dwell.update(cv::Point(100, 100), 0.0);

    EXPECT_FALSE(dwell.update(cv::Point(200, 100), 0.5));
    ASSERT_TRUE(dwell.anchor().has_value());
    EXPECT_EQ(*dwell.anchor(), cv::Point(200, 100));

    EXPECT_FALSE(dwell.update(cv::Point(200, 100), 1.0));
    EXPECT_TRUE(dwell.update(cv::Point(200, 100), 1.5));
}

TEST(DwellDetectorTest, NewEpisodeAfterFiring) {
    DwellDetector dwell(1.0, 30.0f);
    dwell.update(cv::Point(100, 100), 0.0);
    ASSERT_TRUE(dwell.update(cv::Point(100, 100), 1.0));

    dwell.update(cv::Point(300, 300), 1.25);
    EXPECT_TRUE(dwell.update(cv::Point(300, 300), 2.25));
}

TEST(DwellDetectorTest, RadiusBoundaryStaysAnchored) {
    DwellDetector dwell(1.0, 30.0f);
    dwell.update(cv::Point(100, 100), 0.0);

    dwell.update(cv::Point(130, 100), 0.5);
    EXPECT_EQ(*dwell.anchor(), cv::Point(100, 100));
}

TEST(DwellDetectorTest, ResetForgetsAnchor) {
    DwellDetector dwell(1.0, 30.0f);
    dwell.update(cv::Point(100, 100), 0.0);
    dwell.reset();

    EXPECT_FALSE(dwell.anchor().has_value());
    EXPECT_FALSE(dwell.update(cv::Point(100, 100), 1.0));
}

TEST(DwellDetectorTest, RejectsInvalidParameters) {
    EXPECT_THROW(DwellDetector(0.0, 30.0f), std::invalid_argument);
    EXPECT_THROW(DwellDetector(1.0, -1.0f), std::invalid_argument);
}
