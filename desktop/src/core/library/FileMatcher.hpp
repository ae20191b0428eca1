#pragma once

#include <QtCore/QHash>
#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "NameNormalizer.hpp"

namespace MomentNav {

enum class MatchKind {
    None,
    Exact,
    Containment
};

QString matchKindToString(MatchKind kind);

struct FileMatch {
    QString subtitlePath;
    QString videoPath;          // empty when unmatched
    MatchKind kind = MatchKind::None;
    int overlap = 0;            // shared key length for containment matches

    bool isMatched() const { return kind != MatchKind::None; }
};

/**
 * @brief Subtitle path to video path lookup produced by FileMatcher
 */
class FileMatchTable {
public:
    FileMatchTable() = default;
    explicit FileMatchTable(const QList<FileMatch>& matches);

    const QList<FileMatch>& matches() const { return matches_; }

    // Empty string when the subtitle is unknown or unmatched
    QString videoFor(const QString& subtitlePath) const;
    const FileMatch* find(const QString& subtitlePath) const;

    int matchedCount() const;
    int size() const { return static_cast<int>(matches_.size()); }

private:
    QList<FileMatch> matches_;
    QHash<QString, int> bySubtitle_;
};

/**
 * @brief Associates each subtitle file with at most one video file
 *
 * Subtitles are processed in sorted path order. An exact pass compares
 * loose keys; only when it finds nothing does a containment pass compare
 * tight keys, preferring the longest shared key. Ties go to the shortest
 * video path, then the lexicographically smallest. A claimed video leaves
 * the pool, so the first subtitle processed wins it. The assignment is
 * greedy and deterministic rather than globally optimal. Names that
 * normalize to an empty key are never matched.
 */
class FileMatcher {
public:
    explicit FileMatcher(const NameNormalizer& normalizer);

    QList<FileMatch> match(const QStringList& subtitlePaths, const QStringList& videoPaths) const;

private:
    NameNormalizer normalizer_;
};

} // namespace MomentNav
