#pragma once

#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "FileMatcher.hpp"

namespace MomentNav {

enum class LibraryError {
    RootNotFound,
    RootNotReadable,
    ShowNotFound,
    NoShowSelected
};

QString libraryErrorToString(LibraryError error);

enum class MediaKind {
    Other,
    Subtitle,
    Video
};

// One file found beneath a registered media directory
struct ScannedFile {
    QString root;
    QString path;   // absolute
};

struct Show {
    QString name;
    QStringList subtitlePaths;  // discovery order
    QStringList videoPaths;
    FileMatchTable matches;     // recomputed whenever the file sets change
};

struct LibraryStatistics {
    int showCount = 0;
    int subtitleCount = 0;
    int videoCount = 0;
    int matchedSubtitleCount = 0;
    int ignoredFileCount = 0;
};

} // namespace MomentNav
