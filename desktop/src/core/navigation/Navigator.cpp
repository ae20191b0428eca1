#include "Navigator.hpp"
#include "../common/Logger.hpp"
#include "../subtitles/Timecode.hpp"

namespace MomentNav {

Navigator::Navigator(const Config::LibrarySettings& settings, SubtitleLoader loader)
    : settings_(settings)
    , loader_(std::move(loader))
    , library_(settings) {
}

QList<QPair<QString, LibraryError>> Navigator::reload(const QStringList& roots) {
    LibraryScanner scanner(settings_.skipHiddenEntries);
    const ScanResult scanned = scanner.scan(roots);
    load(scanned.files, TopLevelFolderGrouper());
    return scanned.failedRoots;
}

void Navigator::load(const QList<ScannedFile>& files, const ShowGrouper& grouper) {
    const QString previous = selectedShow();
    session_.reset();
    library_.load(files, grouper);
    
    // Keep the user on the same show across a rescan when it still exists
    if (!previous.isEmpty() && selectShow(previous).hasError()) {
        MOMENTNAV_INFO("Show {} disappeared after reload", previous.toStdString());
    }
}

Expected<void, LibraryError> Navigator::selectShow(const QString& name) {
    auto show = library_.show(name);
    if (show.hasError()) {
        return makeUnexpected(show.error());
    }
    
    session_ = std::make_unique<ShowSession>(show.value(), loader_);
    MOMENTNAV_INFO("Selected show {} ({} subtitle files)", name.toStdString(),
                   show.value().subtitlePaths.size());
    return {};
}

QString Navigator::selectedShow() const {
    return session_ ? session_->show().name : QString();
}

Expected<SearchResult, LibraryError> Navigator::search(const QString& keyword) {
    if (!session_) {
        return makeUnexpected(LibraryError::NoShowSelected);
    }
    return session_->search(keyword);
}

Expected<void, LaunchError> Navigator::open(const SearchHit& hit, MediaLauncher& launcher) const {
    if (!hit.isLaunchable()) {
        MOMENTNAV_WARN("No video mapped to {}", hit.subtitlePath.toStdString());
        return makeUnexpected(LaunchError::NoVideo);
    }
    
    MOMENTNAV_INFO("Opening {} at {} with {}", hit.videoPath.toStdString(),
                   Timecode::toSrt(hit.seekTime).toStdString(), launcher.name().toStdString());
    return launcher.open(hit.videoPath, hit.seekTime);
}

Expected<QString, EditorError> Navigator::exportClip(const SearchHit& hit, EditorIntegration& editor) const {
    if (!hit.isLaunchable()) {
        return makeUnexpected(EditorError::MediaNotFound);
    }
    
    ClipRequest clip;
    clip.mediaPath = hit.videoPath;
    clip.inTime = hit.cue.startTime;
    clip.outTime = hit.cue.endTime;
    clip.label = hit.cue.text.simplified();
    return editor.importClip(clip);
}

} // namespace MomentNav
