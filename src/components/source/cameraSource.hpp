#pragma once

#include <opencv2/videoio.hpp>
#include <string>

#include "source/videoSource.hpp"

namespace motion_sentry {

    enum class SourceKind {
        Device,     // "0", "/dev/video0"
        Stream,     // "rtsp://...", "http://..."
        File
    };

    /*
        cv::VideoCapture backed source. Live sources (devices, streams) retry a bounded
        number of consecutive empty reads, reconnecting once halfway, before giving up
        with SourceUnavailable. Files end with SourceExhausted.
    */
    class CameraSource : public VideoSource {
        public:
            CameraSource(const std::string& videoSource, int emptyReadRetries);
            ~CameraSource() override;

            CameraSource(const CameraSource&) = delete;
            CameraSource& operator=(const CameraSource&) = delete;

            /* Throws SourceUnavailable when the source cannot be opened */
            void openSource();

            ReadStatus read(Frame& frame) override;
            bool isLive() const override { return kind != SourceKind::File; }
            cv::Size frameSize() const override;
            double nominalFps() const override;

            /*
                Blocking read: Frame, or throws SourceExhausted / SourceUnavailable.
            */
            Frame nextFrame();
            void release();

            static SourceKind classify(const std::string& videoSource);

        private:
            std::string sourceSpec;
            SourceKind kind;
            int maxEmptyReads;
            int consecutiveEmptyReads;
            cv::VideoCapture cap;

            bool openDevice();
            bool reconnect();
    };
}
