#include "MediaProbe.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QFileInfo>

// FFmpeg C API includes
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
}

namespace MomentNav {

QString probeErrorToString(ProbeError error) {
    switch (error) {
        case ProbeError::FileNotFound: return "Media file not found";
        case ProbeError::OpenFailed: return "Media file could not be opened";
        case ProbeError::StreamInfoFailed: return "Media stream information unavailable";
        case ProbeError::NoVideoStream: return "No video stream";
        case ProbeError::InvalidFrameRate: return "Video stream has no usable frame rate";
    }
    return "Unknown probe error";
}

Expected<VideoProbeInfo, ProbeError> MediaProbe::probe(const QString& filePath) {
    if (!QFileInfo::exists(filePath)) {
        return makeUnexpected(ProbeError::FileNotFound);
    }
    
    auto openResult = openInputFile(filePath);
    if (openResult.hasError()) {
        return makeUnexpected(openResult.error());
    }
    AVFormatContext* formatContext = openResult.value();
    
    const int streamIndex = av_find_best_stream(formatContext, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (streamIndex < 0) {
        closeFormatContext(formatContext);
        MOMENTNAV_DEBUG("No video stream in {}", filePath.toStdString());
        return makeUnexpected(ProbeError::NoVideoStream);
    }
    
    AVStream* stream = formatContext->streams[streamIndex];
    AVCodecParameters* codecParams = stream->codecpar;
    
    VideoProbeInfo info;
    info.filePath = filePath;
    info.container = QString::fromUtf8(formatContext->iformat->name);
    info.codec = QString::fromUtf8(avcodec_get_name(codecParams->codec_id));
    info.width = codecParams->width;
    info.height = codecParams->height;
    if (formatContext->duration != AV_NOPTS_VALUE) {
        info.duration = formatContext->duration / (AV_TIME_BASE / 1000);
    }
    
    // r_frame_rate is the container's guess; fall back to the average rate
    AVRational rate = stream->r_frame_rate;
    if (rate.num <= 0 || rate.den <= 0) {
        rate = stream->avg_frame_rate;
    }
    info.frameRate.numerator = rate.num;
    info.frameRate.denominator = rate.den;
    
    closeFormatContext(formatContext);
    
    MOMENTNAV_DEBUG("Probed {}: {}x{} {} @ {:.3f} fps", filePath.toStdString(),
                    info.width, info.height, info.codec.toStdString(), info.frameRate.value());
    return info;
}

Expected<FrameRate, ProbeError> MediaProbe::frameRate(const QString& filePath) {
    auto info = probe(filePath);
    if (info.hasError()) {
        return makeUnexpected(info.error());
    }
    if (!info.value().frameRate.isValid()) {
        return makeUnexpected(ProbeError::InvalidFrameRate);
    }
    return info.value().frameRate;
}

Expected<AVFormatContext*, ProbeError> MediaProbe::openInputFile(const QString& filePath) {
    AVFormatContext* formatContext = nullptr;
    
    int ret = avformat_open_input(&formatContext, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        MOMENTNAV_WARN("Failed to open input file: {} ({})", 
                       filePath.toStdString(), getAVErrorString(ret).toStdString());
        return makeUnexpected(ProbeError::OpenFailed);
    }
    
    ret = avformat_find_stream_info(formatContext, nullptr);
    if (ret < 0) {
        avformat_close_input(&formatContext);
        MOMENTNAV_WARN("Failed to find stream info: {}", getAVErrorString(ret).toStdString());
        return makeUnexpected(ProbeError::StreamInfoFailed);
    }
    
    return formatContext;
}

void MediaProbe::closeFormatContext(AVFormatContext* context) {
    if (context) {
        avformat_close_input(&context);
    }
}

QString MediaProbe::getAVErrorString(int errorCode) {
    char buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(errorCode, buffer, sizeof(buffer));
    return QString::fromUtf8(buffer);
}

} // namespace MomentNav
