#pragma once

#include <QtCore/QList>
#include <QtCore/QString>

#include "../library/LibraryTypes.hpp"
#include "CueCache.hpp"
#include "SearchTypes.hpp"
#include "SubtitleIndex.hpp"

namespace MomentNav {

/**
 * @brief Search context for the currently selected show
 *
 * Owns the show's cue cache and index. Nothing is parsed when the session
 * is created; the first non-empty query loads every subtitle file and
 * builds the index. Selecting another show replaces the whole session.
 */
class ShowSession {
public:
    explicit ShowSession(const Show& show, SubtitleLoader loader = SubtitleLoader());
    
    const Show& show() const { return show_; }
    
    SearchResult search(const QString& keyword);
    
    QString videoFor(const QString& subtitlePath) const;
    
    bool isIndexBuilt() const { return indexBuilt_; }
    const SubtitleIndex& index() const { return index_; }
    const CueCache& cache() const { return cache_; }
    
    // Drops parsed cues so the next query re-reads the files
    void invalidate();

private:
    void ensureIndex();
    
    Show show_;
    CueCache cache_;
    SubtitleIndex index_;
    QList<SubtitleFailure> failures_;
    bool indexBuilt_ = false;
};

} // namespace MomentNav
