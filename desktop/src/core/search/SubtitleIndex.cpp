#include "SubtitleIndex.hpp"
#include "../common/Logger.hpp"

namespace MomentNav {

void SubtitleIndex::build(const QList<IndexedSubtitle>& subtitles) {
    clear();
    entries_.reserve(subtitles.size());
    
    for (const IndexedSubtitle& subtitle : subtitles) {
        Entry entry;
        entry.path = subtitle.path;
        entry.cues = subtitle.cues;
        entry.foldedText.reserve(subtitle.cues.size());
        for (const Cue& cue : subtitle.cues) {
            entry.foldedText.append(cue.text.toCaseFolded());
        }
        cueCount_ += static_cast<int>(entry.cues.size());
        entries_.append(std::move(entry));
    }
    
    MOMENTNAV_DEBUG("Subtitle index built: {} files, {} cues", entries_.size(), cueCount_);
}

void SubtitleIndex::clear() {
    entries_.clear();
    cueCount_ = 0;
}

QList<SearchHit> SubtitleIndex::query(const QString& keyword) const {
    QList<SearchHit> hits;
    
    const QString needle = keyword.trimmed().toCaseFolded();
    if (needle.isEmpty()) {
        return hits;
    }
    
    for (const Entry& entry : entries_) {
        for (int i = 0; i < entry.cues.size(); ++i) {
            if (!entry.foldedText.at(i).contains(needle)) {
                continue;
            }
            SearchHit hit;
            hit.subtitlePath = entry.path;
            hit.cue = entry.cues.at(i);
            hit.seekTime = hit.cue.startTime;
            hits.append(hit);
        }
    }
    
    return hits;
}

} // namespace MomentNav
