#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <cstddef>
#include <iterator>

#include "../common/Expected.hpp"
#include "SubtitleTypes.hpp"

namespace MomentNav {

/**
 * @brief Lazy, restartable view over the cues of a timed-text document
 *
 * Blocks are parsed one at a time as the iterator advances. Every call to
 * begin() starts a fresh pass over the same content, so the sequence can be
 * walked any number of times with identical results. The sequence must
 * outlive its iterators.
 */
class CueSequence {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Cue;
        using difference_type = std::ptrdiff_t;
        using pointer = const Cue*;
        using reference = const Cue&;

        const_iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        const_iterator& operator++();
        const_iterator operator++(int);

        bool operator==(const const_iterator& other) const;
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

        // Malformed blocks passed over so far in this pass
        int skippedBlocks() const { return skipped_; }

    private:
        friend class CueSequence;
        explicit const_iterator(const QStringList* lines);

        void advance();

        const QStringList* lines_ = nullptr;
        int position_ = 0;
        int ordinal_ = 0;
        int skipped_ = 0;
        bool atEnd_ = true;
        Cue current_;
    };

    explicit CueSequence(const QString& content);

    const_iterator begin() const;
    const_iterator end() const;

private:
    QStringList lines_;
};

/**
 * @brief SubRip style cue parser
 *
 * Accepts "HH:MM:SS,mmm --> HH:MM:SS,mmm" timestamp lines, with "." in
 * place of "," and optional hours as WebVTT writes them. Isolated malformed
 * blocks are skipped and counted; only a document without a single
 * parseable cue is rejected.
 */
class CueParser {
public:
    static Expected<ParsedSubtitle, SubtitleError> parse(const QString& content);

    // Reads and decodes the file, then parses it. I/O failures are reported
    // as NotFound, PermissionDenied or ReadFailed, never as NoCuesFound.
    static Expected<ParsedSubtitle, SubtitleError> parseFile(const QString& filePath);

    static Expected<QString, SubtitleError> readFile(const QString& filePath);

    // Removes <...> markup, leaves everything else untouched
    static QString stripMarkup(const QString& text);
};

} // namespace MomentNav
