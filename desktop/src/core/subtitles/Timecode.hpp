#pragma once

#include <QtCore/QString>

namespace MomentNav {

/**
 * @brief Conversions from elapsed milliseconds to the textual timecodes
 * shown to the user and handed to external players.
 */
class Timecode {
public:
    // 01:02:03,456
    static QString toSrt(qint64 milliseconds);
    
    // 01:02:03, milliseconds truncated
    static QString toClock(qint64 milliseconds);
    
    // 01:02:03.456
    static QString toDecimal(qint64 milliseconds);
    
    // Frame number at the given rate, rounded down
    static qint64 toFrame(qint64 milliseconds, double frameRate);

private:
    static QString format(qint64 milliseconds, QChar fractionSeparator, bool withFraction);
};

} // namespace MomentNav
