#include "converter_settings.h"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

bool ConverterSettings::setQuality(int value)
{
    if (value < kMinQuality || value > kMaxQuality) return false;
    quality = value;
    return true;
}

bool ConverterSettings::setEffort(int value)
{
    if (value < kMinEffort || value > kMaxEffort) return false;
    effort = value;
    return true;
}

QString ConverterSettings::defaultOutputDir()
{
    return QDir::current().absoluteFilePath(QStringLiteral("converted"));
}

QString ConverterSettings::normalizeDir(const QString& path)
{
    QString p = path.trimmed();
    if (p == QLatin1String("~")) p = QDir::homePath();
    else if (p.startsWith(QLatin1String("~/"))) p = QDir::homePath() + p.mid(1);
    return QDir::cleanPath(QFileInfo(p).absoluteFilePath());
}

ToolPaths ToolPaths::locate()
{
    ToolPaths t;
    t.encoder = QStandardPaths::findExecutable(QStringLiteral("cjxl"));
    t.sanitizer = QStandardPaths::findExecutable(QStringLiteral("magick"));
    if (t.sanitizer.isEmpty()) t.sanitizer = QStandardPaths::findExecutable(QStringLiteral("convert"));
    return t;
}
