#include "NameNormalizer.hpp"

#include <QtCore/QRegularExpression>

namespace MomentNav {

namespace {

const QRegularExpression& separatorPattern() {
    static const QRegularExpression pattern("[\\s\\-_.(),\\[\\]{}]+");
    return pattern;
}

// [SubsPlease], {Group}
const QRegularExpression& bracketTagPattern() {
    static const QRegularExpression pattern("\\[[^\\]]*\\]|\\{[^}]*\\}");
    return pattern;
}

QSet<QString> toLowerSet(const QStringList& values) {
    QSet<QString> result;
    for (const QString& value : values) {
        const QString trimmed = value.trimmed().toLower();
        if (!trimmed.isEmpty()) {
            result.insert(trimmed.startsWith(QChar('.')) ? trimmed.mid(1) : trimmed);
        }
    }
    return result;
}

} // namespace

NameNormalizer::NameNormalizer()
    : NameNormalizer(defaultNoiseTokens()) {
}

NameNormalizer::NameNormalizer(const QStringList& noiseTokens, const QStringList& knownExtensions)
    : noiseTokens_(toLowerSet(noiseTokens))
    , extensions_(toLowerSet(knownExtensions)) {
}

QStringList NameNormalizer::defaultNoiseTokens() {
    return {
        // resolution
        "480p", "576p", "720p", "1080p", "1080i", "2160p", "4k", "uhd",
        // video and audio codecs
        "x264", "x265", "h264", "h265", "hevc", "avc", "xvid", "divx",
        "10bit", "8bit", "hdr", "aac", "ac3", "eac3", "dts", "flac",
        // source and release tags
        "bluray", "bdrip", "brrip", "webrip", "webdl", "hdtv", "dvdrip",
        "hdrip", "remux", "proper", "repack",
        // containers and subtitle flavours
        "mkv", "mp4", "avi", "eng", "sdh", "forced"
    };
}

QStringList NameNormalizer::defaultExtensions() {
    return {
        "srt", "txt", "vtt", "ass", "ssa", "sub",
        "mp4", "mkv", "avi", "mov", "m4v", "wmv", "webm", "mpg", "mpeg"
    };
}

NormalizedName NameNormalizer::normalize(const QString& fileName) const {
    QString name = fileName;
    const int slash = qMax(name.lastIndexOf(QChar('/')), name.lastIndexOf(QChar('\\')));
    if (slash >= 0) {
        name = name.mid(slash + 1);
    }
    name = stripExtensions(name.toLower());

    QString withoutTags = name;
    withoutTags.remove(bracketTagPattern());

    QStringList tokens = tokenize(withoutTags);
    if (tokens.isEmpty()) {
        tokens = tokenize(name);
    }

    QStringList meaningful;
    for (const QString& token : tokens) {
        if (!noiseTokens_.contains(token)) {
            meaningful.append(token);
        }
    }
    if (!meaningful.isEmpty()) {
        tokens = meaningful;
    }

    NormalizedName result;
    result.loose = tokens.join(QChar(' '));
    result.tight = tokens.join(QString());
    return result;
}

QString NameNormalizer::stripExtensions(const QString& name) const {
    QString stripped = name;
    // "episode.mp4.srt" carries the video extension inside the subtitle name
    for (int pass = 0; pass < 2; ++pass) {
        const int dot = stripped.lastIndexOf(QChar('.'));
        if (dot <= 0) {
            break;
        }
        if (!extensions_.contains(stripped.mid(dot + 1))) {
            break;
        }
        stripped.truncate(dot);
    }
    return stripped;
}

QStringList NameNormalizer::tokenize(const QString& name) {
    return name.split(separatorPattern(), Qt::SkipEmptyParts);
}

} // namespace MomentNav
