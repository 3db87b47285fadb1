#pragma once

#include <QSet>
#include <QString>

// Extension checks used by the inventory and the worker. Extensions are
// passed without the leading dot and compared case-insensitively.
bool isConvertibleImage(const QString& ext);
bool isJpegFile(const QString& ext);

// Extension of the encoder's output files, without the dot.
inline QString targetExtension() { return QStringLiteral("jxl"); }
