#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QUrl>
#include <functional>
#include <memory>

#include "../common/Config.hpp"
#include "../common/Expected.hpp"

namespace MomentNav {

enum class LaunchError {
    NoVideo,
    VideoNotFound,
    PlayerNotFound,
    StartFailed,
    UnknownLauncher
};

QString launchErrorToString(LaunchError error);

/**
 * @brief Opens an external player on a video at a seek position
 *
 * The player is expected to either start or bring an existing instance to
 * the front; the launcher does not wait for it.
 */
class MediaLauncher {
public:
    virtual ~MediaLauncher() = default;
    
    virtual QString name() const = 0;
    virtual Expected<void, LaunchError> open(const QString& videoPath, qint64 seekTime) = 0;
};

/**
 * @brief Hands the video to the desktop's default application
 *
 * Goes through QDesktopServices, so it needs a QGuiApplication. The seek
 * time cannot be passed on and playback starts from the beginning.
 */
class DefaultApplicationLauncher : public MediaLauncher {
public:
    using UrlOpener = std::function<bool(const QUrl& url)>;
    
    DefaultApplicationLauncher();
    
    QString name() const override { return "default"; }
    Expected<void, LaunchError> open(const QString& videoPath, qint64 seekTime) override;
    
    // Replaces QDesktopServices::openUrl, used by tests
    void setUrlOpener(UrlOpener opener) { opener_ = std::move(opener); }

private:
    UrlOpener opener_;
};

// Starts a detached player process. Subclasses supply the executable
// search list and the command-line syntax for the seek time.
class ProcessLauncher : public MediaLauncher {
public:
    using ProcessStarter = std::function<bool(const QString& program, const QStringList& arguments)>;
    
    explicit ProcessLauncher(const QString& executableOverride = QString());
    
    Expected<void, LaunchError> open(const QString& videoPath, qint64 seekTime) override;
    
    Expected<QString, LaunchError> resolveExecutable() const;
    virtual QStringList arguments(const QString& videoPath, qint64 seekTime) const = 0;
    
    // Replaces QProcess::startDetached, used by tests
    void setProcessStarter(ProcessStarter starter) { starter_ = std::move(starter); }
    
    // Tried when the player cannot be found or fails to start
    void setFallback(std::unique_ptr<MediaLauncher> fallback) { fallback_ = std::move(fallback); }
    MediaLauncher* fallback() const { return fallback_.get(); }

protected:
    // Absolute paths are checked for existence, bare names looked up on PATH
    virtual QStringList candidateExecutables() const = 0;

private:
    Expected<void, LaunchError> openWithFallback(const QString& videoPath, qint64 seekTime, LaunchError error);
    
    QString executableOverride_;
    ProcessStarter starter_;
    std::unique_ptr<MediaLauncher> fallback_;
};

// Media Player Classic - Home Cinema: "<video> /start HH:MM:SS"
class MpcHcLauncher : public ProcessLauncher {
public:
    using ProcessLauncher::ProcessLauncher;
    
    QString name() const override { return "mpc-hc"; }
    QStringList arguments(const QString& videoPath, qint64 seekTime) const override;

protected:
    QStringList candidateExecutables() const override;
};

// mpv: "--start=HH:MM:SS.mmm <video>"
class MpvLauncher : public ProcessLauncher {
public:
    using ProcessLauncher::ProcessLauncher;
    
    QString name() const override { return "mpv"; }
    QStringList arguments(const QString& videoPath, qint64 seekTime) const override;

protected:
    QStringList candidateExecutables() const override;
};

// "mpc-hc" (the default), "mpv" or "default". The process launchers fall
// back to the default application unless settings turn that off.
Expected<std::unique_ptr<MediaLauncher>, LaunchError> createLauncher(const Config::PlayerSettings& settings);

} // namespace MomentNav
