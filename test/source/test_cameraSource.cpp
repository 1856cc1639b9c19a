#include <gtest/gtest.h>
#include <ros/time.h>

#include "source/cameraSource.hpp"
#include "errors.hpp"

using motion_sentry::CameraSource;
using motion_sentry::SourceKind;

TEST(CameraSourceTests, ClassifiesSourceSpecs) {
    ASSERT_EQ(CameraSource::classify("0"), SourceKind::Device);
    ASSERT_EQ(CameraSource::classify("12"), SourceKind::Device);
    ASSERT_EQ(CameraSource::classify("/dev/video2"), SourceKind::Device);
    ASSERT_EQ(CameraSource::classify("rtsp://10.0.0.4/stream1"), SourceKind::Stream);
    ASSERT_EQ(CameraSource::classify("http://cam.local/mjpg"), SourceKind::Stream);
    ASSERT_EQ(CameraSource::classify("footage/lobby.mp4"), SourceKind::File);
}

TEST(CameraSourceTests, OnlyFilesAreFinite) {
    ASSERT_TRUE(CameraSource("0", 10).isLive());
    ASSERT_TRUE(CameraSource("rtsp://10.0.0.4/stream1", 10).isLive());
    ASSERT_FALSE(CameraSource("footage/lobby.mp4", 10).isLive());
}

TEST(CameraSourceTests, MissingFileCannotBeOpened) {
    CameraSource source("/nonexistent/motion_sentry/lobby.avi", 10);
    ASSERT_THROW(source.openSource(), motion_sentry::SourceUnavailable);
}

TEST(CameraSourceTests, FileWithoutFramesIsExhausted) {
    CameraSource source("/nonexistent/motion_sentry/lobby.avi", 10);
    ASSERT_THROW(source.nextFrame(), motion_sentry::SourceExhausted);
}

TEST(CameraSourceTests, LiveSourceGivesUpAfterRetries) {
    CameraSource source("rtsp://127.0.0.1:1/unreachable", 0);
    ASSERT_THROW(source.nextFrame(), motion_sentry::SourceUnavailable);
}

TEST(CameraSourceTests, UnopenedSourceFallsBackToDefaultFps) {
    CameraSource source("footage/lobby.mp4", 10);
    ASSERT_DOUBLE_EQ(source.nominalFps(), 30.0);
}


int main(int argc, char **argv) {
    ros::Time::init();
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
