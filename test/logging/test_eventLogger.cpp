#include <gtest/gtest.h>
#include <ros/time.h>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "logging/eventLogger.hpp"
#include "logging/fileEventLogger.hpp"
#include "motion_sentry/mock_frames.hpp"
#include "../testDoubles.hpp"

namespace fs = boost::filesystem;
using motion_sentry::EventKind;
using motion_sentry::EventLoggerFanout;
using motion_sentry::EventRecord;
using motion_sentry::FileEventLogger;

namespace {
    class ThrowingEventLogger : public motion_sentry::EventLogger {
        public:
            void record(const EventRecord&) override {
                throw std::runtime_error("sink unavailable");
            }
    };

    std::vector<std::string> readLines(const fs::path& path) {
        fs::ifstream in(path);
        std::vector<std::string> lines;
        for (std::string line; std::getline(in, line);) lines.push_back(line);
        return lines;
    }
}

class EventLoggerTests : public ::testing::Test {
    protected:
        fs::path directory;
        EventRecord started;

        void SetUp() override {
            directory = fs::temp_directory_path() / fs::unique_path("motion_sentry_log_%%%%-%%%%");
            started.timestamp = MockFrames::atLocalHour(23, 4, 11);
            started.kind = EventKind::MotionStarted;
            started.metadata["regions"] = "1";
            started.metadata["total_area"] = "412";
        }

        void TearDown() override {
            boost::system::error_code ec;
            fs::remove_all(directory, ec);
        }
};

TEST_F(EventLoggerTests, KindNames) {
    ASSERT_STREQ(motion_sentry::eventKindName(EventKind::MotionStarted), "motion-started");
    ASSERT_STREQ(motion_sentry::eventKindName(EventKind::Motion), "motion");
    ASSERT_STREQ(motion_sentry::eventKindName(EventKind::MotionEnded), "motion-ended");
    ASSERT_STREQ(motion_sentry::eventKindName(EventKind::RecordingStarted), "recording-started");
    ASSERT_STREQ(motion_sentry::eventKindName(EventKind::RecordingEnded), "recording-ended");
}

TEST_F(EventLoggerTests, FormatsOneLinePerRecord) {
    const std::string line = FileEventLogger::formatRecord(started);
    ASSERT_EQ(line.substr(10), " 23:04:11 | motion-started | regions=1 total_area=412");

    EventRecord ended;
    ended.timestamp = started.timestamp;
    ended.kind = EventKind::MotionEnded;
    ASSERT_EQ(FileEventLogger::formatRecord(ended).substr(10), " 23:04:11 | motion-ended");
}

TEST_F(EventLoggerTests, AppendsToLogFileAndCreatesDirectory) {
    const fs::path logPath = directory / "logs" / "motion_log.txt";
    {
        FileEventLogger logger(logPath.string());
        logger.record(started);
    }
    {
        /* a restart appends instead of truncating */
        FileEventLogger logger(logPath.string());
        EventRecord ended;
        ended.timestamp = started.timestamp;
        ended.kind = EventKind::MotionEnded;
        logger.record(ended);
    }

    std::vector<std::string> lines = readLines(logPath);
    ASSERT_EQ(lines.size(), 2u);
    ASSERT_NE(lines[0].find("| motion-started |"), std::string::npos);
    ASSERT_NE(lines[1].find("| motion-ended"), std::string::npos);
}

TEST_F(EventLoggerTests, UnwritableLogPathThrows) {
    fs::create_directories(directory);
    /* the path is a directory, it cannot be opened as a file */
    ASSERT_THROW(FileEventLogger logger(directory.string()), std::runtime_error);
}

TEST_F(EventLoggerTests, FanoutDeliversToEveryLogger) {
    auto first = std::make_shared<RecordingEventLogger>();
    auto second = std::make_shared<RecordingEventLogger>();

    EventLoggerFanout fanout;
    fanout.attach(first);
    fanout.attach(nullptr);
    fanout.attach(second);
    fanout.record(started);

    ASSERT_EQ(first->events.size(), 1u);
    ASSERT_EQ(second->events.size(), 1u);
}

TEST_F(EventLoggerTests, FailingLoggerDoesNotBlockOthers) {
    auto survivor = std::make_shared<RecordingEventLogger>();

    EventLoggerFanout fanout;
    fanout.attach(std::make_shared<ThrowingEventLogger>());
    fanout.attach(survivor);

    ASSERT_NO_THROW(fanout.record(started));
    ASSERT_EQ(survivor->count(EventKind::MotionStarted), 1u);
}


int main(int argc, char **argv) {
    ros::Time::init();
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
