#pragma once
#include <QtGlobal>
#include <QString>
#include <QStringList>

namespace Utils {

// Human readable byte count with one decimal: 0B, 512.0B, 195.3KB, 1.2MB.
// Non-positive sizes render as "0B".
inline QString formatBytes(qint64 bytes) {
    if (bytes <= 0) return QStringLiteral("0B");
    static const char* labels[] = {"", "K", "M", "G", "T"};
    double size = double(bytes);
    int n = 0;
    while (size >= 1024.0 && n < 4) { size /= 1024.0; ++n; }
    return QString::number(size, 'f', 1) + QLatin1String(labels[n]) + QLatin1Char('B');
}

// Percentage of `part` relative to `whole` with one decimal; 0.0 when whole is not positive.
inline QString formatPercent(qint64 part, qint64 whole) {
    const double pct = whole > 0 ? double(part) / double(whole) * 100.0 : 0.0;
    return QString::number(pct, 'f', 1);
}

// Seconds with two decimals, as shown in batch summaries.
inline QString formatSeconds(qint64 elapsedMs) {
    return QString::number(double(elapsedMs) / 1000.0, 'f', 2);
}

// MM:SS clock used by the progress header.
inline QString formatClock(qint64 elapsedMs) {
    const qint64 totalSec = qMax<qint64>(0, elapsedMs / 1000);
    return QString("%1:%2").arg(totalSec / 60, 2, 10, QLatin1Char('0')).arg(totalSec % 60, 2, 10, QLatin1Char('0'));
}

// Last non-blank line of a tool's diagnostic output, trimmed. Empty if there is none.
inline QString lastNonEmptyLine(const QString& text) {
    const QStringList lines = text.split(QLatin1Char('\n'));
    for (auto it = lines.crbegin(); it != lines.crend(); ++it) {
        const QString line = it->trimmed();
        if (!line.isEmpty()) return line;
    }
    return QString();
}

} // namespace Utils
