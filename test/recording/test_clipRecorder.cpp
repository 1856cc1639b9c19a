#include <gtest/gtest.h>
#include <ros/time.h>
#include <boost/filesystem.hpp>
#include <opencv2/opencv.hpp>

#include "recording/clipRecorder.hpp"
#include "errors.hpp"
#include "motion_sentry/mock_frames.hpp"

namespace fs = boost::filesystem;
using motion_sentry::ClipRecorder;
using motion_sentry::RecorderHandle;

class ClipRecorderTests : public ::testing::Test {
    protected:
        fs::path directory;
        MockFrames scene{160, 120};

        void SetUp() override {
            directory = fs::temp_directory_path() / fs::unique_path("motion_sentry_clips_%%%%-%%%%");
        }

        void TearDown() override {
            boost::system::error_code ec;
            fs::remove_all(directory, ec);
        }
};

TEST_F(ClipRecorderTests, CreatesRecordingsDirectory) {
    ClipRecorder recorder(directory.string(), 20.0, cv::Size(160, 120));
    ASSERT_TRUE(fs::is_directory(directory));
}

TEST_F(ClipRecorderTests, ClipIsNamedAfterItsStartTime) {
    ClipRecorder recorder(directory.string(), 20.0, cv::Size(160, 120));
    const auto start = MockFrames::atLocalHour(23, 4, 11);

    const RecorderHandle handle = recorder.open(start, std::chrono::duration<double>(5.0));
    const fs::path clip(recorder.clipPath(handle));
    recorder.close(handle);

    const std::string name = clip.filename().string();
    ASSERT_EQ(name.substr(0, 7), "motion_");
    ASSERT_EQ(name.substr(15, 8), "_230411.");
    ASSERT_EQ(clip.extension().string(), ".avi");
    ASSERT_TRUE(fs::exists(clip));
}

TEST_F(ClipRecorderTests, SameSecondClipsDoNotOverwrite) {
    ClipRecorder recorder(directory.string(), 20.0, cv::Size(160, 120));
    const auto start = MockFrames::atLocalHour(1, 2, 3);

    const RecorderHandle first = recorder.open(start, std::chrono::duration<double>(5.0));
    const RecorderHandle second = recorder.open(start, std::chrono::duration<double>(5.0));
    ASSERT_NE(first, second);
    ASSERT_NE(recorder.clipPath(first), recorder.clipPath(second));
    recorder.close(first);
    recorder.close(second);
}

TEST_F(ClipRecorderTests, WritesSubmittedFramesToDisk) {
    ClipRecorder recorder(directory.string(), 20.0, cv::Size(160, 120), 2);
    const RecorderHandle handle = recorder.open(std::chrono::system_clock::now(), std::chrono::duration<double>(5.0));
    const fs::path clip(recorder.clipPath(handle));

    for (int i = 0; i < 10; ++i) {
        recorder.write(handle, scene.withSquare(i * 10, 20, 20));
    }
    /* gray and mis-sized frames are converted by the writer */
    recorder.write(handle, cv::Mat(60, 80, CV_8UC1, cv::Scalar(40)));
    recorder.close(handle);

    ASSERT_TRUE(fs::exists(clip));
    ASSERT_GT(fs::file_size(clip), 0u);
    ASSERT_TRUE(recorder.clipPath(handle).empty());
}

TEST_F(ClipRecorderTests, FrameLostInWriterIsReportedOnClose) {
    ClipRecorder recorder(directory.string(), 20.0, cv::Size(160, 120));
    const RecorderHandle handle = recorder.open(std::chrono::system_clock::now(), std::chrono::duration<double>(5.0));

    recorder.write(handle, scene.background());
    /* two-channel frames have no BGR conversion */
    recorder.write(handle, cv::Mat(120, 160, CV_8UC2, cv::Scalar(10, 20)));

    ASSERT_THROW(recorder.close(handle), motion_sentry::RecordingIOError);
    ASSERT_TRUE(recorder.clipPath(handle).empty());
    ASSERT_NO_THROW(recorder.close(handle));
}

TEST_F(ClipRecorderTests, UnknownHandleIsRejected) {
    ClipRecorder recorder(directory.string(), 20.0, cv::Size(160, 120));
    ASSERT_THROW(recorder.write(42, scene.background()), motion_sentry::RecordingIOError);

    const RecorderHandle handle = recorder.open(std::chrono::system_clock::now(), std::chrono::duration<double>(1.0));
    recorder.close(handle);
    ASSERT_THROW(recorder.write(handle, scene.background()), motion_sentry::RecordingIOError);
    ASSERT_NO_THROW(recorder.close(handle));
}


int main(int argc, char **argv) {
    ros::Time::init();
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
