#include <gtest/gtest.h>

#include <cmath>
#include <deque>
#include <limits>

#include "gestify/hand_pose_classifier.hpp"
#include "test_hands.hpp"

using namespace gestify;
using namespace gestify::test_support;

class HandPoseClassifierTest : public ::testing::Test {
protected:
    GestureConfig config_;
    HandPoseClassifier classifier_{config_};
    std::deque<cv::Point2f> history_;

    HandPoseState classify(const HandObservation& hand) {
        return classifier_.classify(hand, frameSize(), history_);
    }
};

TEST_F(HandPoseClassifierTest, PointingHandExtendsOnlyIndex) {
    HandPoseState pose = classify(HandBuilder(kPointing).build());

    EXPECT_TRUE(pose.valid);
    EXPECT_EQ(pose.fingers, kPointing);
    EXPECT_FALSE(pose.is_fist);
    EXPECT_FALSE(pose.is_palm);
}

TEST_F(HandPoseClassifierTest, RecognisesEveryBuilderPattern) {
    for (const FingerPattern& pattern : {kPeace, kPalm, kFist, kThumbOnly, kThreeUp}) {
        history_.clear();
        HandPoseState pose = classify(HandBuilder(pattern).build());
        EXPECT_EQ(pose.fingers, pattern);
    }
}

TEST_F(HandPoseClassifierTest, FistAndPalmFlags) {
    HandPoseState fist = classify(HandBuilder(kFist).build());
    EXPECT_TRUE(fist.is_fist);
    EXPECT_FALSE(fist.is_palm);

    history_.clear();
    HandPoseState palm = classify(HandBuilder(kPalm).build());
    EXPECT_TRUE(palm.is_palm);
    EXPECT_FALSE(palm.is_fist);
}

TEST_F(HandPoseClassifierTest, ExtensionSurvivesInPlaneRotation) {
    HandObservation hand = HandBuilder(kPeace).build();
    const Eigen::Vector3f wrist = hand.landmarks[hand_landmark::WRIST];
    const float c = std::cos(0.7f);
    const float s = std::sin(0.7f);
    for (auto& lm : hand.landmarks) {
        Eigen::Vector3f d = lm - wrist;
        lm = wrist + Eigen::Vector3f(c * d.x() - s * d.y(), s * d.x() + c * d.y(), d.z());
    }

    EXPECT_EQ(classify(hand).fingers, kPeace);
}

TEST_F(HandPoseClassifierTest, PositionIsIndexTipInPixels) {
    HandObservation hand = HandBuilder(kPointing).build();
    HandPoseState pose = classify(hand);

    const auto& tip = hand.landmarks[hand_landmark::INDEX_TIP];
    EXPECT_NEAR(pose.position.x, tip.x() * kFrameWidth, 1e-3);
    EXPECT_NEAR(pose.position.y, tip.y() * kFrameHeight, 1e-3);

    const auto& wrist = hand.landmarks[hand_landmark::WRIST];
    EXPECT_NEAR(pose.wrist.x, wrist.x() * kFrameWidth, 1e-3);
}

TEST_F(HandPoseClassifierTest, PinchDistanceIsAbsolutePixels) {
    HandPoseState pinched = classify(HandBuilder(kThreeUp).pinch(5.0f).build());
    EXPECT_NEAR(pinched.pinch_distance, 5.0f, 0.01f);

    history_.clear();
    HandPoseState open = classify(HandBuilder(kThreeUp).build());
    EXPECT_GT(open.pinch_distance, config_.pinch_threshold);
}

TEST_F(HandPoseClassifierTest, VelocityNeedsTwoSamples) {
    HandPoseState pose = classify(HandBuilder(kFist).build());
    EXPECT_EQ(history_.size(), 1u);
    EXPECT_FLOAT_EQ(pose.velocity.x, 0.0f);
    EXPECT_FLOAT_EQ(pose.velocity.y, 0.0f);
}

TEST_F(HandPoseClassifierTest, VelocityAveragesOverHistory) {
    HandPoseState pose;
    for (int i = 0; i < 3; ++i) {
        pose = classify(HandBuilder(kFist).shift(0.0f, 10.0f * i).build());
    }

    // (20px - 0px) over 2 frame intervals
    EXPECT_NEAR(pose.velocity.y, 10.0f, 1e-3);
    EXPECT_NEAR(pose.velocity.x, 0.0f, 1e-3);
}

TEST_F(HandPoseClassifierTest, HistoryIsBounded) {
    for (int i = 0; i < 12; ++i) {
        classify(HandBuilder(kPointing).shift(4.0f * i, 0.0f).build());
    }
    EXPECT_EQ(history_.size(), static_cast<size_t>(config_.velocity_history));

    HandPoseState pose = classify(HandBuilder(kPointing).shift(48.0f, 0.0f).build());
    EXPECT_NEAR(pose.velocity.x, 4.0f, 1e-3);
}

TEST_F(HandPoseClassifierTest, TooFewLandmarksGiveNeutralPose) {
    HandObservation hand = HandBuilder(kPalm).build();
    hand.landmarks.resize(10);

    HandPoseState pose = classify(hand);

    EXPECT_FALSE(pose.valid);
    EXPECT_EQ(pose.fingers, kFist);
    EXPECT_FALSE(pose.is_fist);
    EXPECT_EQ(pose.pinch_distance, std::numeric_limits<float>::max());
    EXPECT_FLOAT_EQ(pose.velocity.y, 0.0f);
    EXPECT_TRUE(history_.empty());
}

TEST_F(HandPoseClassifierTest, NonFiniteLandmarkGivesNeutralPose) {
    HandObservation hand = HandBuilder(kPointing).build();
    hand.landmarks[hand_landmark::INDEX_TIP].x() = std::numeric_limits<float>::quiet_NaN();

    HandPoseState pose = classify(hand);
    EXPECT_FALSE(pose.valid);
    EXPECT_EQ(pose.handedness, hand.handedness);
}

TEST_F(HandPoseClassifierTest, EmptyFrameSizeGivesNeutralPose) {
    HandPoseState pose = classifier_.classify(HandBuilder().build(), cv::Size(), history_);
    EXPECT_FALSE(pose.valid);
}

TEST(HandPoseClassifierRatioTest, StricterRatioRetractsFingers) {
    GestureConfig config;
    config.finger_extension_ratio = 1.6f;  // tips sit at ~1.54x the PIP distance
    HandPoseClassifier classifier(config);
    std::deque<cv::Point2f> history;

    HandPoseState pose = classifier.classify(HandBuilder(kPeace).build(), frameSize(), history);
    EXPECT_FALSE(pose.isExtended(Finger::INDEX));
    EXPECT_FALSE(pose.isExtended(Finger::MIDDLE));
}
