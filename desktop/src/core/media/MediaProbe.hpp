#pragma once

#include <QtCore/QString>

#include "../common/Expected.hpp"

// Forward declare FFmpeg types
extern "C" {
    struct AVFormatContext;
}

namespace MomentNav {

enum class ProbeError {
    FileNotFound,
    OpenFailed,
    StreamInfoFailed,
    NoVideoStream,
    InvalidFrameRate
};

QString probeErrorToString(ProbeError error);

struct FrameRate {
    int numerator = 0;
    int denominator = 1;
    
    double value() const {
        return denominator != 0 ? static_cast<double>(numerator) / denominator : 0.0;
    }
    bool isValid() const { return numerator > 0 && denominator > 0; }
};

struct VideoProbeInfo {
    QString filePath;
    QString container;
    QString codec;
    int width = 0;
    int height = 0;
    FrameRate frameRate;
    qint64 duration = 0;    // milliseconds
};

/**
 * @brief Reads video stream properties through libavformat
 *
 * Only the container header and stream info are read; nothing is decoded.
 */
class MediaProbe {
public:
    static Expected<VideoProbeInfo, ProbeError> probe(const QString& filePath);
    static Expected<FrameRate, ProbeError> frameRate(const QString& filePath);

private:
    static Expected<AVFormatContext*, ProbeError> openInputFile(const QString& filePath);
    static void closeFormatContext(AVFormatContext* context);
    static QString getAVErrorString(int errorCode);
};

} // namespace MomentNav
