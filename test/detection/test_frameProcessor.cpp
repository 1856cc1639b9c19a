#include <gtest/gtest.h>
#include <ros/time.h>
#include <opencv2/opencv.hpp>

#include "detection/backgroundModel.hpp"
#include "detection/frameProcessor.hpp"
#include "errors.hpp"
#include "motion_sentry/mock_frames.hpp"

using motion_sentry::BackgroundModel;
using motion_sentry::CandidateRegion;
using motion_sentry::FrameProcessor;
using motion_sentry::ProcessingParameters;

class FrameProcessorTests : public ::testing::Test {
    protected:
        MockFrames scene{160, 120};
        ProcessingParameters sharp;     // no blur, no dilation: areas are exact
        BackgroundModel background{3};

        void SetUp() override {
            sharp.diffThreshold = 25;
            sharp.blurKernelSize = 1;
            sharp.dilateIterations = 0;
        }

        void calibrate(const FrameProcessor& processor) {
            for (int i = 0; i < background.requiredSamples(); ++i) {
                background.ingest(processor.preprocess(scene.background()));
            }
        }
};

TEST_F(FrameProcessorTests, PreprocessProducesGrayscale) {
    FrameProcessor processor(ProcessingParameters{}, 100.0);

    cv::Mat gray = processor.preprocess(scene.withSquare(20, 20, 30));
    ASSERT_EQ(gray.channels(), 1);
    ASSERT_EQ(gray.type(), CV_8UC1);
    ASSERT_EQ(gray.size(), cv::Size(160, 120));

    ASSERT_TRUE(processor.preprocess(cv::Mat()).empty());
}

TEST_F(FrameProcessorTests, IdenticalFrameHasNoRegions) {
    FrameProcessor processor(ProcessingParameters{}, 100.0);
    calibrate(processor);

    ASSERT_TRUE(processor.process(scene.background(), background).empty());
    ASSERT_EQ(cv::countNonZero(processor.lastMask()), 0);
}

TEST_F(FrameProcessorTests, BrightSquareBecomesOneRegion) {
    FrameProcessor processor(sharp, 50.0);
    calibrate(processor);

    std::vector<CandidateRegion> regions = processor.process(scene.withSquare(40, 30, 21), background);
    ASSERT_EQ(regions.size(), 1u);
    ASSERT_EQ(regions[0].boundingBox, cv::Rect(40, 30, 21, 21));
    ASSERT_DOUBLE_EQ(regions[0].area, 400.0);
}

TEST_F(FrameProcessorTests, AreaEqualToMinimumIsRetained) {
    /* an 11x11 filled square has a contour area of exactly 100 px^2 */
    cv::Mat frame = scene.withSquare(50, 50, 11);

    FrameProcessor atBoundary(sharp, 100.0);
    calibrate(atBoundary);
    ASSERT_EQ(atBoundary.process(frame, background).size(), 1u);

    FrameProcessor aboveBoundary(sharp, 101.0);
    ASSERT_TRUE(aboveBoundary.process(frame, background).empty());
}

TEST_F(FrameProcessorTests, DiscardSmallRegionsIsInclusive) {
    std::vector<CandidateRegion> regions = {
        {cv::Rect(0, 0, 10, 10), 100.0},
        {cv::Rect(20, 20, 10, 10), 99.0},
        {cv::Rect(40, 40, 20, 20), 350.0},
    };

    std::vector<CandidateRegion> kept = FrameProcessor::discardSmallRegions(regions, 100.0);
    ASSERT_EQ(kept.size(), 2u);
    ASSERT_EQ(kept[0].boundingBox, cv::Rect(0, 0, 10, 10));
    ASSERT_EQ(kept[1].boundingBox, cv::Rect(40, 40, 20, 20));
}

TEST_F(FrameProcessorTests, ThresholdIsAStrictCutoff) {
    FrameProcessor processor(sharp, 1.0);
    calibrate(processor);

    /* background is 128: a difference of exactly 25 is not motion, 26 is */
    ASSERT_TRUE(processor.process(scene.withSquare(60, 40, 20, 153), background).empty());
    ASSERT_EQ(processor.process(scene.withSquare(60, 40, 20, 154), background).size(), 1u);
    ASSERT_EQ(processor.process(scene.withSquare(60, 40, 20, 102), background).size(), 1u);
}

TEST_F(FrameProcessorTests, DefaultSmoothingStillFindsSmallObject) {
    FrameProcessor processor(ProcessingParameters{}, 100.0);
    calibrate(processor);

    std::vector<CandidateRegion> regions = processor.process(scene.withRect(cv::Rect(70, 50, 20, 10)), background);
    ASSERT_EQ(regions.size(), 1u);
    ASSERT_GE(regions[0].area, 100.0);
    ASSERT_TRUE((regions[0].boundingBox & cv::Rect(70, 50, 20, 10)).area() > 0);
}

TEST_F(FrameProcessorTests, SeparateObjectsAreSeparateRegions) {
    FrameProcessor processor(sharp, 50.0);
    calibrate(processor);

    cv::Mat frame = scene.withSquare(10, 10, 15);
    cv::rectangle(frame, cv::Rect(100, 80, 15, 15), cv::Scalar(255, 255, 255), cv::FILLED);

    std::vector<CandidateRegion> first = processor.process(frame, background);
    std::vector<CandidateRegion> second = processor.process(frame, background);
    ASSERT_EQ(first.size(), 2u);
    ASSERT_EQ(second.size(), first.size());
    for (size_t i = 0; i < first.size(); ++i) {
        ASSERT_EQ(first[i].boundingBox, second[i].boundingBox);
        ASSERT_DOUBLE_EQ(first[i].area, second[i].area);
    }
}

TEST_F(FrameProcessorTests, SixteenBitFramesMatchTheBackground) {
    FrameProcessor processor(sharp, 50.0);
    const cv::Mat quiet(120, 160, CV_16UC3, cv::Scalar(128 * 256, 128 * 256, 128 * 256));
    for (int i = 0; i < background.requiredSamples(); ++i) {
        background.ingest(processor.preprocess(quiet));
    }

    cv::Mat gray = processor.preprocess(quiet);
    ASSERT_EQ(gray.type(), CV_8UC1);
    ASSERT_EQ(cv::countNonZero(gray != 128), 0);

    cv::Mat intruder = quiet.clone();
    cv::rectangle(intruder, cv::Rect(40, 30, 21, 21), cv::Scalar(65280, 65280, 65280), cv::FILLED);

    std::vector<CandidateRegion> regions;
    ASSERT_NO_THROW(regions = processor.process(intruder, background));
    ASSERT_EQ(regions.size(), 1u);
    ASSERT_EQ(regions[0].boundingBox, cv::Rect(40, 30, 21, 21));
    ASSERT_TRUE(processor.process(quiet, background).empty());
}

TEST_F(FrameProcessorTests, ProcessRefusesUncalibratedBackground) {
    FrameProcessor processor(sharp, 50.0);
    ASSERT_THROW(processor.process(scene.background(), background), motion_sentry::NotReady);
}

TEST_F(FrameProcessorTests, ProcessRejectsMismatchedFrameSize) {
    FrameProcessor processor(sharp, 50.0);
    calibrate(processor);

    MockFrames other(320, 240);
    ASSERT_THROW(processor.process(other.background(), background), std::invalid_argument);
}


int main(int argc, char **argv) {
    ros::Time::init();
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
