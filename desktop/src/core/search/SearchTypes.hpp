#pragma once

#include <QtCore/QList>
#include <QtCore/QString>

#include "../subtitles/SubtitleTypes.hpp"

namespace MomentNav {

struct SearchHit {
    QString subtitlePath;
    Cue cue;
    qint64 seekTime = 0;    // milliseconds, the cue start
    QString videoPath;      // empty when the subtitle has no matched video
    
    bool isLaunchable() const { return !videoPath.isEmpty(); }
};

struct SubtitleFailure {
    QString subtitlePath;
    SubtitleError error = SubtitleError::ReadFailed;
};

struct SearchResult {
    QString keyword;
    QList<SearchHit> hits;
    QList<SubtitleFailure> failures;    // files that could not be read or parsed
    
    bool isEmpty() const { return hits.isEmpty(); }
};

} // namespace MomentNav
