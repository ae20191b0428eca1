#include "MediaLibrary.hpp"
#include "FileMatcher.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QFileInfo>
#include <QtCore/QMap>
#include <algorithm>

namespace MomentNav {

namespace {

QSet<QString> extensionSet(const QStringList& extensions, const QStringList& fallback) {
    const QStringList& source = extensions.isEmpty() ? fallback : extensions;
    QSet<QString> result;
    for (const QString& extension : source) {
        QString cleaned = extension.trimmed().toLower();
        if (cleaned.startsWith(QChar('.'))) {
            cleaned.remove(0, 1);
        }
        if (!cleaned.isEmpty()) {
            result.insert(cleaned);
        }
    }
    return result;
}

NameNormalizer makeNormalizer(const Config::LibrarySettings& settings) {
    const QStringList noise = settings.noiseTokens.isEmpty()
        ? NameNormalizer::defaultNoiseTokens() : settings.noiseTokens;
    
    QStringList extensions = NameNormalizer::defaultExtensions();
    extensions << settings.subtitleExtensions << settings.videoExtensions;
    return NameNormalizer(noise, extensions);
}

} // namespace

QString libraryErrorToString(LibraryError error) {
    switch (error) {
        case LibraryError::RootNotFound: return "Media directory not found";
        case LibraryError::RootNotReadable: return "Media directory is not readable";
        case LibraryError::ShowNotFound: return "Show not found";
        case LibraryError::NoShowSelected: return "No show selected";
    }
    return "Unknown library error";
}

MediaLibrary::MediaLibrary(const Config::LibrarySettings& settings)
    : normalizer_(makeNormalizer(settings))
    , subtitleExtensions_(extensionSet(settings.subtitleExtensions, Config::defaultSubtitleExtensions()))
    , videoExtensions_(extensionSet(settings.videoExtensions, Config::defaultVideoExtensions())) {
}

MediaKind MediaLibrary::classify(const QString& path) const {
    const QString suffix = QFileInfo(path).suffix().toLower();
    if (subtitleExtensions_.contains(suffix)) {
        return MediaKind::Subtitle;
    }
    if (videoExtensions_.contains(suffix)) {
        return MediaKind::Video;
    }
    return MediaKind::Other;
}

void MediaLibrary::load(const QList<ScannedFile>& files, const ShowGrouper& grouper) {
    clear();
    
    // QMap keeps the shows sorted by name
    QMap<QString, Show> grouped;
    
    for (const ScannedFile& file : files) {
        const MediaKind kind = classify(file.path);
        if (kind == MediaKind::Other) {
            statistics_.ignoredFileCount++;
            continue;
        }
        
        const QString showName = grouper.showNameFor(file);
        if (showName.isEmpty()) {
            statistics_.ignoredFileCount++;
            continue;
        }
        
        Show& show = grouped[showName];
        show.name = showName;
        if (kind == MediaKind::Subtitle) {
            if (!show.subtitlePaths.contains(file.path)) {
                show.subtitlePaths.append(file.path);
            }
        } else if (!show.videoPaths.contains(file.path)) {
            show.videoPaths.append(file.path);
        }
    }
    
    FileMatcher matcher(normalizer_);
    
    for (auto it = grouped.begin(); it != grouped.end(); ++it) {
        Show& show = it.value();
        if (show.subtitlePaths.isEmpty()) {
            MOMENTNAV_DEBUG("Ignoring {}: no subtitle files", show.name.toStdString());
            statistics_.ignoredFileCount += static_cast<int>(show.videoPaths.size());
            continue;
        }
        
        show.matches = FileMatchTable(matcher.match(show.subtitlePaths, show.videoPaths));
        
        statistics_.subtitleCount += static_cast<int>(show.subtitlePaths.size());
        statistics_.videoCount += static_cast<int>(show.videoPaths.size());
        statistics_.matchedSubtitleCount += show.matches.matchedCount();
        
        MOMENTNAV_INFO("{}: mapped {} of {} subtitle files to videos", show.name.toStdString(),
                       show.matches.matchedCount(), show.subtitlePaths.size());
        shows_.append(show);
    }
    
    statistics_.showCount = static_cast<int>(shows_.size());
    MOMENTNAV_INFO("Library loaded: {} shows, {} subtitle files, {} matched",
                   statistics_.showCount, statistics_.subtitleCount, 
                   statistics_.matchedSubtitleCount);
}

void MediaLibrary::clear() {
    shows_.clear();
    statistics_ = LibraryStatistics();
}

QStringList MediaLibrary::showNames() const {
    QStringList names;
    names.reserve(shows_.size());
    for (const Show& show : shows_) {
        names.append(show.name);
    }
    return names;
}

Expected<Show, LibraryError> MediaLibrary::show(const QString& name) const {
    auto it = std::find_if(shows_.begin(), shows_.end(),
        [&name](const Show& show) { return show.name == name; });
    if (it == shows_.end()) {
        return makeUnexpected(LibraryError::ShowNotFound);
    }
    return *it;
}

} // namespace MomentNav
