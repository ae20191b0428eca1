#pragma once

#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "SearchTypes.hpp"

namespace MomentNav {

struct IndexedSubtitle {
    QString path;
    QList<Cue> cues;
};

/**
 * @brief In-memory keyword search over the cues of one show
 *
 * Matching is a case-insensitive substring test against the markup-free
 * cue text. Hits come out in subtitle order as given to build(), then in
 * cue order. An empty or blank keyword yields no hits.
 */
class SubtitleIndex {
public:
    void build(const QList<IndexedSubtitle>& subtitles);
    void clear();
    
    QList<SearchHit> query(const QString& keyword) const;
    
    int subtitleCount() const { return static_cast<int>(entries_.size()); }
    int cueCount() const { return cueCount_; }

private:
    struct Entry {
        QString path;
        QList<Cue> cues;
        QStringList foldedText;
    };
    
    QList<Entry> entries_;
    int cueCount_ = 0;
};

} // namespace MomentNav
