#pragma once

#include <QtCore/QSet>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace MomentNav {

struct NormalizedName {
    QString loose;  // tokens joined by a single space
    QString tight;  // tokens joined with no separator

    bool isEmpty() const { return tight.isEmpty(); }

    bool operator==(const NormalizedName& other) const {
        return loose == other.loose && tight == other.tight;
    }
};

/**
 * @brief Turns raw media filenames into comparable keys
 *
 * Normalization lower-cases the name, removes known extensions (including
 * the ".mp4.srt" double extension), splits on separator characters and
 * drops noise tokens such as resolution, codec and release tags. Stripping
 * is best effort: a name made only of noise keeps its tokens.
 */
class NameNormalizer {
public:
    NameNormalizer();
    explicit NameNormalizer(const QStringList& noiseTokens,
                            const QStringList& knownExtensions = defaultExtensions());

    NormalizedName normalize(const QString& fileName) const;

    static QStringList defaultNoiseTokens();
    static QStringList defaultExtensions();

private:
    QString stripExtensions(const QString& name) const;
    static QStringList tokenize(const QString& name);

    QSet<QString> noiseTokens_;
    QSet<QString> extensions_;
};

} // namespace MomentNav
