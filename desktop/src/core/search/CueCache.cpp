#include "CueCache.hpp"
#include "../common/Logger.hpp"
#include "../subtitles/CueParser.hpp"

namespace MomentNav {

CueCache::CueCache(SubtitleLoader loader)
    : loader_(loader ? std::move(loader) : SubtitleLoader(&CueParser::parseFile)) {
}

Expected<ParsedSubtitle, SubtitleError> CueCache::get(const QString& subtitlePath) {
    auto it = entries_.constFind(subtitlePath);
    if (it != entries_.constEnd()) {
        MOMENTNAV_TRACE("Cue cache hit: {}", subtitlePath.toStdString());
        return it.value();
    }
    
    MOMENTNAV_TRACE("Cue cache miss: {}", subtitlePath.toStdString());
    loadCount_++;
    auto loaded = loader_(subtitlePath);
    entries_.insert(subtitlePath, loaded);
    return loaded;
}

bool CueCache::contains(const QString& subtitlePath) const {
    return entries_.contains(subtitlePath);
}

void CueCache::invalidate(const QString& subtitlePath) {
    entries_.remove(subtitlePath);
}

void CueCache::invalidate() {
    entries_.clear();
}

} // namespace MomentNav
