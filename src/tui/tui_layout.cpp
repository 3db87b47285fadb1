#include "tui/tui_layout.h"

#include <QStringList>

namespace TuiLayout {

ListLayout computeLayout(int width)
{
    constexpr int infoW = 24;
    constexpr int statusW = 12;
    constexpr int sep = 3;

    ListLayout l;
    l.infoX = qMax(width - infoW, 0);
    l.statusX = qMax(l.infoX - sep - statusW, 0);
    const int middle = qMax(l.statusX - sep - l.origX, 0);
    l.origW = middle * 2 / 5;
    l.previewW = middle - l.origW;
    l.previewX = l.origX + l.origW + sep;
    l.statusW = statusW;
    l.infoW = infoW;
    return l;
}

QString fitText(const QString& text, int width)
{
    if (width <= 0) return QString();
    QString out = text;
    if (out.size() > width - 1) out = out.left(qMax(width - 2, 0)) + QChar(0x2026);
    return out.leftJustified(width, QLatin1Char(' '), true);
}

QString abbreviatePath(const QString& path, int maxLen)
{
    if (path.size() <= maxLen) return path;
    if (maxLen <= 3) return QStringLiteral("...").left(qMax(maxLen, 0));

    const QString tail = QStringLiteral("...") + path.right(maxLen - 3);
    const bool absolute = path.startsWith(QLatin1Char('/'));
    const QStringList parts = path.split(QLatin1Char('/'), Qt::SkipEmptyParts);
    const int partCount = parts.size() + (absolute ? 1 : 0);
    if (partCount <= 2) return tail;

    const QString first = absolute ? QStringLiteral("/") : parts.first();
    const QString last = parts.last();
    const int chrome = first.size() + last.size() + 2 + 3;
    if (chrome > maxLen) return tail;
    return absolute ? QStringLiteral("/.../") + last : first + QStringLiteral("/.../") + last;
}

} // namespace TuiLayout
