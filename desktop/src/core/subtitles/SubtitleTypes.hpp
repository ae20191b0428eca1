#pragma once

#include <QtCore/QList>
#include <QtCore/QString>

namespace MomentNav {

enum class SubtitleError {
    NotFound,
    PermissionDenied,
    ReadFailed,
    NoCuesFound
};

// I/O failures need a different remedy (permissions, disk) than a file
// whose contents could not be understood.
inline bool isIoError(SubtitleError error) {
    return error != SubtitleError::NoCuesFound;
}

QString subtitleErrorToString(SubtitleError error);

struct Cue {
    int index = 0;          // parse order, starting at 1
    qint64 startTime = 0;   // milliseconds
    qint64 endTime = 0;     // milliseconds
    QString text;           // markup stripped
    
    bool operator==(const Cue& other) const {
        return index == other.index && startTime == other.startTime &&
               endTime == other.endTime && text == other.text;
    }
    
    bool operator!=(const Cue& other) const {
        return !(*this == other);
    }
};

struct ParsedSubtitle {
    QList<Cue> cues;
    int skippedBlocks = 0;
};

} // namespace MomentNav
