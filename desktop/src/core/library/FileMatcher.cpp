#include "FileMatcher.hpp"
#include "../common/Logger.hpp"

#include <algorithm>
#include <vector>

namespace MomentNav {

namespace {

struct VideoCandidate {
    QString path;
    NormalizedName key;
    bool claimed = false;
};

// Shorter path first, then lexicographic
bool preferredPath(const QString& a, const QString& b) {
    if (a.size() != b.size()) {
        return a.size() < b.size();
    }
    return a < b;
}

} // namespace

QString matchKindToString(MatchKind kind) {
    switch (kind) {
        case MatchKind::None: return "none";
        case MatchKind::Exact: return "exact";
        case MatchKind::Containment: return "containment";
    }
    return "unknown";
}

FileMatchTable::FileMatchTable(const QList<FileMatch>& matches)
    : matches_(matches) {
    for (int i = 0; i < matches_.size(); ++i) {
        bySubtitle_.insert(matches_.at(i).subtitlePath, i);
    }
}

QString FileMatchTable::videoFor(const QString& subtitlePath) const {
    const FileMatch* match = find(subtitlePath);
    return match ? match->videoPath : QString();
}

const FileMatch* FileMatchTable::find(const QString& subtitlePath) const {
    auto it = bySubtitle_.constFind(subtitlePath);
    if (it == bySubtitle_.constEnd()) {
        return nullptr;
    }
    return &matches_.at(it.value());
}

int FileMatchTable::matchedCount() const {
    return static_cast<int>(std::count_if(matches_.begin(), matches_.end(),
        [](const FileMatch& match) { return match.isMatched(); }));
}

FileMatcher::FileMatcher(const NameNormalizer& normalizer)
    : normalizer_(normalizer) {
}

QList<FileMatch> FileMatcher::match(const QStringList& subtitlePaths, const QStringList& videoPaths) const {
    QStringList subtitles = subtitlePaths;
    subtitles.removeDuplicates();
    std::sort(subtitles.begin(), subtitles.end());

    QStringList videos = videoPaths;
    videos.removeDuplicates();

    std::vector<VideoCandidate> pool;
    pool.reserve(videos.size());
    for (const QString& video : videos) {
        pool.push_back({video, normalizer_.normalize(video), false});
    }

    QList<FileMatch> results;
    results.reserve(subtitles.size());

    for (const QString& subtitle : subtitles) {
        const NormalizedName key = normalizer_.normalize(subtitle);

        FileMatch match;
        match.subtitlePath = subtitle;

        if (key.isEmpty()) {
            MOMENTNAV_DEBUG("Nothing to match on in {}", subtitle.toStdString());
            results.append(match);
            continue;
        }

        VideoCandidate* best = nullptr;
        for (auto& candidate : pool) {
            if (candidate.claimed || candidate.key.loose != key.loose) {
                continue;
            }
            if (!best || preferredPath(candidate.path, best->path)) {
                best = &candidate;
            }
        }

        if (best) {
            match.kind = MatchKind::Exact;
            match.overlap = static_cast<int>(key.tight.size());
        } else {
            int bestOverlap = 0;
            for (auto& candidate : pool) {
                if (candidate.claimed || candidate.key.isEmpty()) {
                    continue;
                }
                int overlap = 0;
                if (candidate.key.tight.contains(key.tight)) {
                    overlap = static_cast<int>(key.tight.size());
                } else if (key.tight.contains(candidate.key.tight)) {
                    overlap = static_cast<int>(candidate.key.tight.size());
                } else {
                    continue;
                }

                if (!best || overlap > bestOverlap ||
                    (overlap == bestOverlap && preferredPath(candidate.path, best->path))) {
                    best = &candidate;
                    bestOverlap = overlap;
                }
            }
            if (best) {
                match.kind = MatchKind::Containment;
                match.overlap = bestOverlap;
            }
        }

        if (best) {
            best->claimed = true;
            match.videoPath = best->path;
            MOMENTNAV_TRACE("Matched {} -> {} ({})", subtitle.toStdString(),
                            best->path.toStdString(), matchKindToString(match.kind).toStdString());
        } else {
            MOMENTNAV_DEBUG("No video found for {}", subtitle.toStdString());
        }

        results.append(match);
    }

    return results;
}

} // namespace MomentNav
