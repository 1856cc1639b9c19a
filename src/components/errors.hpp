#pragma once

#include <stdexcept>
#include <string>

namespace motion_sentry {

    /* Invalid or missing settings, fatal before the frame loop starts */
    class ConfigurationError : public std::runtime_error {
        public:
            explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
    };

    /* Background model still calibrating. Expected, never surfaced as a failure */
    class NotReady : public std::runtime_error {
        public:
            explicit NotReady(const std::string& what) : std::runtime_error(what) {}
    };

    /* File playback reached its end */
    class SourceExhausted : public std::runtime_error {
        public:
            explicit SourceExhausted(const std::string& what) : std::runtime_error(what) {}
    };

    /* Live source lost after the bounded number of empty reads */
    class SourceUnavailable : public std::runtime_error {
        public:
            explicit SourceUnavailable(const std::string& what) : std::runtime_error(what) {}
    };

    class RecordingIOError : public std::runtime_error {
        public:
            explicit RecordingIOError(const std::string& what) : std::runtime_error(what) {}
    };
}
