#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace motion_sentry {

    enum class EventKind {
        MotionStarted,
        Motion,
        MotionEnded,
        RecordingStarted,
        RecordingEnded
    };

    /* "motion-started", "motion", ... */
    const char* eventKindName(EventKind kind);

    struct EventRecord {
        std::chrono::system_clock::time_point timestamp;
        EventKind kind;
        std::map<std::string, std::string> metadata;
    };

    /* Append-only sink for operational events */
    class EventLogger {
        public:
            virtual ~EventLogger() = default;
            virtual void record(const EventRecord& event) = 0;
    };

    /*
        Forwards every record to each attached logger. A failing logger is reported
        and does not keep the others from receiving the record.
    */
    class EventLoggerFanout : public EventLogger {
        public:
            void attach(std::shared_ptr<EventLogger> logger);
            void record(const EventRecord& event) override;

        private:
            std::vector<std::shared_ptr<EventLogger>> loggers;
    };
}
