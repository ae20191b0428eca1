#include "CueParser.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QRegularExpression>
#include <QtCore/QStringDecoder>
#include <optional>

namespace MomentNav {

namespace {

const QRegularExpression& timestampPattern() {
    static const QRegularExpression pattern(
        "^\\s*(?:(\\d{1,2}):)?(\\d{1,2}):(\\d{1,2})[,.](\\d{1,3})"
        "\\s*-{1,2}>\\s*"
        "(?:(\\d{1,2}):)?(\\d{1,2}):(\\d{1,2})[,.](\\d{1,3})"
        "(?:\\s.*)?$");
    return pattern;
}

const QRegularExpression& markupPattern() {
    static const QRegularExpression pattern("<[^>]*>");
    return pattern;
}

// Fraction digits are a decimal fraction of a second, so ",5" is 500 ms.
std::optional<qint64> toMilliseconds(const QString& hours, const QString& minutes,
                                     const QString& seconds, const QString& fraction) {
    const qint64 h = hours.isEmpty() ? 0 : hours.toLongLong();
    const qint64 m = minutes.toLongLong();
    const qint64 s = seconds.toLongLong();
    if (m > 59 || s > 59) {
        return std::nullopt;
    }

    QString padded = fraction;
    while (padded.size() < 3) {
        padded.append(QChar('0'));
    }
    const qint64 ms = padded.toLongLong();

    return ((h * 60 + m) * 60 + s) * 1000 + ms;
}

// A timestamp line is either the first line of the block or follows the
// embedded index/identifier line.
std::optional<Cue> parseBlock(const QStringList& lines, int first, int last) {
    const int searchEnd = qMin(last, first + 2);
    for (int i = first; i < searchEnd; ++i) {
        const QRegularExpressionMatch match = timestampPattern().match(lines.at(i));
        if (!match.hasMatch()) {
            continue;
        }

        const auto start = toMilliseconds(match.captured(1), match.captured(2),
                                          match.captured(3), match.captured(4));
        const auto end = toMilliseconds(match.captured(5), match.captured(6),
                                        match.captured(7), match.captured(8));
        if (!start || !end || *start > *end) {
            return std::nullopt;
        }

        Cue cue;
        cue.startTime = *start;
        cue.endTime = *end;
        cue.text = CueParser::stripMarkup(lines.mid(i + 1, last - i - 1).join(QChar('\n'))).trimmed();
        return cue;
    }
    return std::nullopt;
}

} // namespace

CueSequence::CueSequence(const QString& content) {
    QString normalized = content;
    if (normalized.startsWith(QChar(0xFEFF))) {
        normalized.remove(0, 1);
    }
    normalized.replace("\r\n", "\n");
    normalized.replace(QChar('\r'), QChar('\n'));
    lines_ = normalized.split(QChar('\n'));
}

CueSequence::const_iterator CueSequence::begin() const {
    return const_iterator(&lines_);
}

CueSequence::const_iterator CueSequence::end() const {
    return const_iterator();
}

CueSequence::const_iterator::const_iterator(const QStringList* lines)
    : lines_(lines)
    , atEnd_(false) {
    advance();
}

CueSequence::const_iterator& CueSequence::const_iterator::operator++() {
    advance();
    return *this;
}

CueSequence::const_iterator CueSequence::const_iterator::operator++(int) {
    const_iterator previous = *this;
    advance();
    return previous;
}

bool CueSequence::const_iterator::operator==(const const_iterator& other) const {
    if (atEnd_ || other.atEnd_) {
        return atEnd_ == other.atEnd_;
    }
    return lines_ == other.lines_ && position_ == other.position_;
}

void CueSequence::const_iterator::advance() {
    if (atEnd_) {
        return;
    }

    const QStringList& lines = *lines_;
    const int count = lines.size();

    while (position_ < count) {
        while (position_ < count && lines.at(position_).trimmed().isEmpty()) {
            ++position_;
        }
        if (position_ >= count) {
            break;
        }

        const int blockStart = position_;
        while (position_ < count && !lines.at(position_).trimmed().isEmpty()) {
            ++position_;
        }

        auto cue = parseBlock(lines, blockStart, position_);
        if (cue) {
            cue->index = ++ordinal_;
            current_ = std::move(*cue);
            return;
        }
        ++skipped_;
    }

    atEnd_ = true;
    current_ = Cue();
}

Expected<ParsedSubtitle, SubtitleError> CueParser::parse(const QString& content) {
    CueSequence sequence(content);

    ParsedSubtitle result;
    auto it = sequence.begin();
    for (; it != sequence.end(); ++it) {
        result.cues.append(*it);
    }
    result.skippedBlocks = it.skippedBlocks();

    if (result.cues.isEmpty()) {
        return makeUnexpected(SubtitleError::NoCuesFound);
    }

    if (result.skippedBlocks > 0) {
        MOMENTNAV_DEBUG("Parsed {} cues, skipped {} malformed blocks",
                        result.cues.size(), result.skippedBlocks);
    }
    return result;
}

Expected<ParsedSubtitle, SubtitleError> CueParser::parseFile(const QString& filePath) {
    auto content = readFile(filePath);
    if (content.hasError()) {
        return makeUnexpected(content.error());
    }

    auto parsed = parse(content.value());
    if (parsed.hasError()) {
        MOMENTNAV_WARN("No cues found in {}", filePath.toStdString());
    }
    return parsed;
}

Expected<QString, SubtitleError> CueParser::readFile(const QString& filePath) {
    QFileInfo info(filePath);
    if (!info.exists() || !info.isFile()) {
        return makeUnexpected(SubtitleError::NotFound);
    }
    if (!info.isReadable()) {
        return makeUnexpected(SubtitleError::PermissionDenied);
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        MOMENTNAV_ERROR("Failed to open {}: {}", filePath.toStdString(),
                        file.errorString().toStdString());
        return makeUnexpected(file.error() == QFileDevice::PermissionsError
                              ? SubtitleError::PermissionDenied
                              : SubtitleError::ReadFailed);
    }

    const QByteArray bytes = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        MOMENTNAV_ERROR("Failed to read {}: {}", filePath.toStdString(),
                        file.errorString().toStdString());
        return makeUnexpected(SubtitleError::ReadFailed);
    }

    // A byte order mark decides, otherwise UTF-8 with a Latin-1 fallback
    const QStringConverter::Encoding encoding =
        QStringConverter::encodingForData(bytes).value_or(QStringConverter::Utf8);
    QStringDecoder decoder(encoding);
    QString text = decoder(bytes);
    if (decoder.hasError()) {
        MOMENTNAV_WARN("{} is not valid {}, decoding as Latin-1", filePath.toStdString(),
                       QStringConverter::nameForEncoding(encoding));
        text = QString::fromLatin1(bytes);
    }
    return text;
}

QString CueParser::stripMarkup(const QString& text) {
    QString stripped = text;
    stripped.remove(markupPattern());
    return stripped;
}

QString subtitleErrorToString(SubtitleError error) {
    switch (error) {
        case SubtitleError::NotFound: return "Subtitle file not found";
        case SubtitleError::PermissionDenied: return "Permission denied reading subtitle file";
        case SubtitleError::ReadFailed: return "Failed to read subtitle file";
        case SubtitleError::NoCuesFound: return "No subtitle cues found";
    }
    return "Unknown subtitle error";
}

} // namespace MomentNav
