#pragma once

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <mutex>
#include <string>

#include "logging/eventLogger.hpp"

namespace motion_sentry {

    /*
        One line per record:
        2025-01-31 23:04:11 | motion-started | regions=1 total_area=412
    */
    class FileEventLogger : public EventLogger {
        public:
            explicit FileEventLogger(const std::string& logPath);
            FileEventLogger(const FileEventLogger&) = delete;
            FileEventLogger& operator=(const FileEventLogger&) = delete;

            void record(const EventRecord& event) override;

            static std::string formatRecord(const EventRecord& event);

        private:
            boost::filesystem::path path;
            boost::filesystem::ofstream logFile;
            std::mutex logMutex;
    };
}
