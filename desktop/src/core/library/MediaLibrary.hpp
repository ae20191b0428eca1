#pragma once

#include <QtCore/QList>
#include <QtCore/QSet>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "../common/Config.hpp"
#include "../common/Expected.hpp"
#include "LibraryTypes.hpp"
#include "NameNormalizer.hpp"
#include "ShowGrouper.hpp"

namespace MomentNav {

/**
 * @brief The set of shows discovered under the registered media directories
 *
 * Files are partitioned into subtitles and videos purely by extension and
 * grouped into shows by the supplied ShowGrouper. Groups without any
 * subtitle file are dropped, since there is nothing to search in them.
 * Nothing is persisted: load() rebuilds everything from the file list.
 */
class MediaLibrary {
public:
    explicit MediaLibrary(const Config::LibrarySettings& settings = Config::LibrarySettings());

    void load(const QList<ScannedFile>& files, const ShowGrouper& grouper);
    void clear();

    MediaKind classify(const QString& path) const;

    // Sorted by name
    QStringList showNames() const;
    const QList<Show>& shows() const { return shows_; }
    Expected<Show, LibraryError> show(const QString& name) const;
    bool isEmpty() const { return shows_.isEmpty(); }

    LibraryStatistics statistics() const { return statistics_; }

private:
    NameNormalizer normalizer_;
    QSet<QString> subtitleExtensions_;
    QSet<QString> videoExtensions_;
    QList<Show> shows_;
    LibraryStatistics statistics_;
};

} // namespace MomentNav
