#include "MediaLauncher.hpp"
#include "../common/Logger.hpp"
#include "../subtitles/Timecode.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QProcess>
#include <QtCore/QStandardPaths>
#include <QtGui/QDesktopServices>

namespace MomentNav {

namespace {

QString locateExecutable(const QString& candidate) {
    if (QDir::isAbsolutePath(candidate)) {
        const QFileInfo info(candidate);
        return info.exists() && info.isFile() ? info.absoluteFilePath() : QString();
    }
    return QStandardPaths::findExecutable(candidate);
}

} // namespace

QString launchErrorToString(LaunchError error) {
    switch (error) {
        case LaunchError::NoVideo: return "No matching video file for this subtitle";
        case LaunchError::VideoNotFound: return "Video file does not exist";
        case LaunchError::PlayerNotFound: return "Media player executable not found";
        case LaunchError::StartFailed: return "Failed to start media player";
        case LaunchError::UnknownLauncher: return "Unknown media player";
    }
    return "Unknown launch error";
}

DefaultApplicationLauncher::DefaultApplicationLauncher()
    : opener_([](const QUrl& url) { return QDesktopServices::openUrl(url); }) {
}

Expected<void, LaunchError> DefaultApplicationLauncher::open(const QString& videoPath, qint64 seekTime) {
    if (videoPath.isEmpty()) {
        return makeUnexpected(LaunchError::NoVideo);
    }
    if (!QFileInfo::exists(videoPath)) {
        MOMENTNAV_WARN("Video file missing: {}", videoPath.toStdString());
        return makeUnexpected(LaunchError::VideoNotFound);
    }
    
    MOMENTNAV_INFO("Opening {} with the default application, seek to {} ms not applied",
                   videoPath.toStdString(), seekTime);
    if (!opener_(QUrl::fromLocalFile(QFileInfo(videoPath).absoluteFilePath()))) {
        MOMENTNAV_ERROR("Failed to open: {}", videoPath.toStdString());
        return makeUnexpected(LaunchError::StartFailed);
    }
    return {};
}

ProcessLauncher::ProcessLauncher(const QString& executableOverride)
    : executableOverride_(executableOverride)
    , starter_([](const QString& program, const QStringList& arguments) {
          return QProcess::startDetached(program, arguments);
      }) {
}

Expected<void, LaunchError> ProcessLauncher::open(const QString& videoPath, qint64 seekTime) {
    if (videoPath.isEmpty()) {
        return makeUnexpected(LaunchError::NoVideo);
    }
    if (!QFileInfo::exists(videoPath)) {
        MOMENTNAV_WARN("Video file missing: {}", videoPath.toStdString());
        return makeUnexpected(LaunchError::VideoNotFound);
    }
    
    auto executable = resolveExecutable();
    if (executable.hasError()) {
        MOMENTNAV_ERROR("No {} executable found", name().toStdString());
        return openWithFallback(videoPath, seekTime, executable.error());
    }
    
    const QStringList args = arguments(videoPath, seekTime);
    MOMENTNAV_INFO("Executing: {} {}", executable.value().toStdString(),
                   args.join(' ').toStdString());
    
    if (!starter_(executable.value(), args)) {
        MOMENTNAV_ERROR("Failed to start {}", executable.value().toStdString());
        return openWithFallback(videoPath, seekTime, LaunchError::StartFailed);
    }
    return {};
}

Expected<void, LaunchError> ProcessLauncher::openWithFallback(const QString& videoPath, qint64 seekTime,
                                                              LaunchError error) {
    if (!fallback_) {
        return makeUnexpected(error);
    }
    
    MOMENTNAV_WARN("Falling back to {} player", fallback_->name().toStdString());
    auto opened = fallback_->open(videoPath, seekTime);
    if (opened.hasError()) {
        // The player's own failure is the more useful one to report
        return makeUnexpected(error);
    }
    return {};
}

Expected<QString, LaunchError> ProcessLauncher::resolveExecutable() const {
    if (!executableOverride_.isEmpty()) {
        const QString located = locateExecutable(executableOverride_);
        if (located.isEmpty()) {
            return makeUnexpected(LaunchError::PlayerNotFound);
        }
        return located;
    }
    
    for (const QString& candidate : candidateExecutables()) {
        const QString located = locateExecutable(candidate);
        if (!located.isEmpty()) {
            return located;
        }
    }
    return makeUnexpected(LaunchError::PlayerNotFound);
}

QStringList MpcHcLauncher::arguments(const QString& videoPath, qint64 seekTime) const {
    return {QDir::toNativeSeparators(videoPath), "/start", Timecode::toClock(seekTime)};
}

QStringList MpcHcLauncher::candidateExecutables() const {
    return {
        "C:/Program Files/MPC-HC/mpc-hc64.exe",
        "C:/Program Files (x86)/MPC-HC/mpc-hc.exe",
        "C:/Program Files (x86)/K-Lite Codec Pack/MPC-HC64/mpc-hc64.exe",
        "C:/Program Files/K-Lite Codec Pack/MPC-HC64/mpc-hc64.exe",
        "mpc-hc64",
        "mpc-hc"
    };
}

QStringList MpvLauncher::arguments(const QString& videoPath, qint64 seekTime) const {
    return {QString("--start=%1").arg(Timecode::toDecimal(seekTime)), videoPath};
}

QStringList MpvLauncher::candidateExecutables() const {
    return {"mpv"};
}

Expected<std::unique_ptr<MediaLauncher>, LaunchError> createLauncher(const Config::PlayerSettings& settings) {
    const QString kind = settings.launcher.trimmed().toLower();
    std::unique_ptr<MediaLauncher> launcher;
    
    if (kind == "default") {
        launcher = std::make_unique<DefaultApplicationLauncher>();
        return std::move(launcher);
    }
    
    std::unique_ptr<ProcessLauncher> process;
    if (kind.isEmpty() || kind == "mpc-hc") {
        process = std::make_unique<MpcHcLauncher>(settings.executablePath);
    } else if (kind == "mpv") {
        process = std::make_unique<MpvLauncher>(settings.executablePath);
    } else {
        MOMENTNAV_ERROR("Unknown media player: {}", settings.launcher.toStdString());
        return makeUnexpected(LaunchError::UnknownLauncher);
    }
    
    if (settings.fallbackToDefault) {
        process->setFallback(std::make_unique<DefaultApplicationLauncher>());
    }
    launcher = std::move(process);
    return std::move(launcher);
}

} // namespace MomentNav
