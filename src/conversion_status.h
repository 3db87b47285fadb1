#pragma once
#include <QString>
#include <QtGlobal>

// Per-file conversion state. Selected is a display state only: it is derived
// from Pending plus membership in the selection and never stored.
enum class ConversionStatus { Pending, Selected, Queued, Sanitizing, Converting, Success, Failed };

// Colour role a front end maps to its own palette.
enum class StatusTone { Neutral, Highlight, Queued, Busy, Good, Bad };

QString statusLabel(ConversionStatus s);
StatusTone statusTone(ConversionStatus s);
bool isTerminalStatus(ConversionStatus s);

// Status as shown in a row: Pending rows in the selection read as Selected.
ConversionStatus displayStatus(ConversionStatus stored, bool selected);

// Mutable per-file record, written only by the aggregator on the UI thread.
struct StatusRecord {
    ConversionStatus status = ConversionStatus::Pending;
    QString targetPath;  // empty until the file is first queued
    QString message;     // last error text
    QString infoStr;     // savings summary or error
    qint64 sizeBefore = 0;
    qint64 sizeAfter = 0;
};

// Message sent from the worker to the UI thread through the status channel.
struct StatusUpdate {
    int index = -1;
    ConversionStatus status = ConversionStatus::Pending;
    QString message;
    qint64 sizeBefore = 0;
    qint64 sizeAfter = 0;
};
