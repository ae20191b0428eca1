#include "Timecode.hpp"

#include <cmath>

namespace MomentNav {

QString Timecode::toSrt(qint64 milliseconds) {
    return format(milliseconds, QChar(','), true);
}

QString Timecode::toClock(qint64 milliseconds) {
    return format(milliseconds, QChar(), false);
}

QString Timecode::toDecimal(qint64 milliseconds) {
    return format(milliseconds, QChar('.'), true);
}

qint64 Timecode::toFrame(qint64 milliseconds, double frameRate) {
    if (milliseconds <= 0 || frameRate <= 0.0) {
        return 0;
    }
    return static_cast<qint64>(std::floor(milliseconds * frameRate / 1000.0));
}

QString Timecode::format(qint64 milliseconds, QChar fractionSeparator, bool withFraction) {
    if (milliseconds < 0) milliseconds = 0;
    
    const qint64 ms = milliseconds % 1000;
    const qint64 totalSeconds = milliseconds / 1000;
    const qint64 secs = totalSeconds % 60;
    const qint64 totalMinutes = totalSeconds / 60;
    const qint64 mins = totalMinutes % 60;
    const qint64 hours = totalMinutes / 60;
    
    QString clock = QString("%1:%2:%3")
                    .arg(hours, 2, 10, QChar('0'))
                    .arg(mins, 2, 10, QChar('0'))
                    .arg(secs, 2, 10, QChar('0'));
    if (!withFraction) {
        return clock;
    }
    return clock + fractionSeparator + QString("%1").arg(ms, 3, 10, QChar('0'));
}

} // namespace MomentNav
