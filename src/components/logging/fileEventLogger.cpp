#include "logging/fileEventLogger.hpp"

#include <boost/format.hpp>
#include <ros/ros.h>
#include <ctime>
#include <stdexcept>

namespace motion_sentry {

FileEventLogger::FileEventLogger(const std::string& logPath) : path(logPath) {
    if (path.has_parent_path() && !boost::filesystem::exists(path.parent_path())) {
        boost::filesystem::create_directories(path.parent_path());
    }

    logFile.open(path, std::ios::out | std::ios::app);
    if (!logFile.is_open()) {
        throw std::runtime_error("cannot open event log " + path.string());
    }
    ROS_INFO_STREAM("[FileEventLogger] Logging events to " << path.string());
}

void FileEventLogger::record(const EventRecord& event) {
    const std::string line = formatRecord(event);

    std::lock_guard<std::mutex> lock(logMutex);
    logFile << line << '\n';
    logFile.flush();
    if (!logFile.good()) {
        throw std::runtime_error("failed to append to event log " + path.string());
    }
}

std::string FileEventLogger::formatRecord(const EventRecord& event) {
    const std::time_t t = std::chrono::system_clock::to_time_t(event.timestamp);
    std::tm local{};
    localtime_r(&t, &local);
    char timestampStr[32];
    std::strftime(timestampStr, sizeof(timestampStr), "%Y-%m-%d %H:%M:%S", &local);

    std::string line = (boost::format("%s | %s") % timestampStr % eventKindName(event.kind)).str();
    if (!event.metadata.empty()) {
        line += " |";
        for (const auto& entry : event.metadata) {
            line += " " + entry.first + "=" + entry.second;
        }
    }
    return line;
}

} // namespace motion_sentry
