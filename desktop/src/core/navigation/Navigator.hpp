#pragma once

#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <memory>

#include "../common/Config.hpp"
#include "../common/Expected.hpp"
#include "../editor/EditorIntegration.hpp"
#include "../library/LibraryScanner.hpp"
#include "../library/MediaLibrary.hpp"
#include "../player/MediaLauncher.hpp"
#include "../search/ShowSession.hpp"

namespace MomentNav {

/**
 * @brief Library, active show and search, as seen by a front-end
 *
 * Holds at most one ShowSession. Selecting a show throws away the previous
 * session together with its cached cues.
 */
class Navigator {
public:
    explicit Navigator(const Config::LibrarySettings& settings = Config::LibrarySettings(),
                       SubtitleLoader loader = SubtitleLoader());
    
    // Rescans the roots and regroups the library. Returns the roots that
    // could not be scanned; the others are loaded regardless.
    QList<QPair<QString, LibraryError>> reload(const QStringList& roots);
    void load(const QList<ScannedFile>& files, const ShowGrouper& grouper);
    
    const MediaLibrary& library() const { return library_; }
    QStringList showNames() const { return library_.showNames(); }
    
    Expected<void, LibraryError> selectShow(const QString& name);
    bool hasSelection() const { return session_ != nullptr; }
    QString selectedShow() const;
    ShowSession* session() const { return session_.get(); }
    
    Expected<SearchResult, LibraryError> search(const QString& keyword);
    
    Expected<void, LaunchError> open(const SearchHit& hit, MediaLauncher& launcher) const;
    
    // Hands the hit's cue range to a video editor
    Expected<QString, EditorError> exportClip(const SearchHit& hit, EditorIntegration& editor) const;

private:
    Config::LibrarySettings settings_;
    SubtitleLoader loader_;
    MediaLibrary library_;
    std::unique_ptr<ShowSession> session_;
};

} // namespace MomentNav
