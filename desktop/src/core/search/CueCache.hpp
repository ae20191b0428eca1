#pragma once

#include <QtCore/QHash>
#include <QtCore/QString>
#include <functional>

#include "../common/Expected.hpp"
#include "../subtitles/SubtitleTypes.hpp"

namespace MomentNav {

using SubtitleLoader = std::function<Expected<ParsedSubtitle, SubtitleError>(const QString&)>;

/**
 * @brief Parsed cues of the active show, keyed by subtitle path
 *
 * Each file is loaded at most once until invalidated. Failures are cached
 * as well so a broken file is not re-read on every query.
 */
class CueCache {
public:
    // Defaults to CueParser::parseFile
    explicit CueCache(SubtitleLoader loader = SubtitleLoader());
    
    Expected<ParsedSubtitle, SubtitleError> get(const QString& subtitlePath);
    
    bool contains(const QString& subtitlePath) const;
    void invalidate(const QString& subtitlePath);
    void invalidate();
    
    int size() const { return static_cast<int>(entries_.size()); }
    int loadCount() const { return loadCount_; }

private:
    SubtitleLoader loader_;
    QHash<QString, Expected<ParsedSubtitle, SubtitleError>> entries_;
    int loadCount_ = 0;
};

} // namespace MomentNav
