#include "ShowSession.hpp"
#include "../common/Logger.hpp"

namespace MomentNav {

ShowSession::ShowSession(const Show& show, SubtitleLoader loader)
    : show_(show)
    , cache_(std::move(loader)) {
}

SearchResult ShowSession::search(const QString& keyword) {
    SearchResult result;
    result.keyword = keyword.trimmed();
    if (result.keyword.isEmpty()) {
        return result;
    }
    
    ensureIndex();
    
    result.hits = index_.query(result.keyword);
    for (SearchHit& hit : result.hits) {
        hit.videoPath = show_.matches.videoFor(hit.subtitlePath);
    }
    result.failures = failures_;
    
    MOMENTNAV_INFO("Found {} matches for '{}' in {}", result.hits.size(),
                   result.keyword.toStdString(), show_.name.toStdString());
    return result;
}

QString ShowSession::videoFor(const QString& subtitlePath) const {
    return show_.matches.videoFor(subtitlePath);
}

void ShowSession::invalidate() {
    cache_.invalidate();
    index_.clear();
    failures_.clear();
    indexBuilt_ = false;
}

void ShowSession::ensureIndex() {
    if (indexBuilt_) {
        return;
    }
    
    QList<IndexedSubtitle> subtitles;
    subtitles.reserve(show_.subtitlePaths.size());
    failures_.clear();
    
    for (const QString& path : show_.subtitlePaths) {
        auto parsed = cache_.get(path);
        if (parsed.hasError()) {
            const SubtitleError error = parsed.error();
            if (isIoError(error)) {
                MOMENTNAV_ERROR("Cannot read {}: {}", path.toStdString(),
                                subtitleErrorToString(error).toStdString());
            } else {
                MOMENTNAV_WARN("Skipping {}: {}", path.toStdString(),
                               subtitleErrorToString(error).toStdString());
            }
            failures_.append({path, error});
            continue;
        }
        subtitles.append({path, parsed.value().cues});
    }
    
    index_.build(subtitles);
    indexBuilt_ = true;
}

} // namespace MomentNav
