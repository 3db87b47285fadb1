#pragma once
#include <QElapsedTimer>
#include <QSet>
#include <QtGlobal>

// Counters for the running (or just finished) batch. Owned by the aggregator
// on the UI thread.
struct BatchSession {
    bool active = false;
    int totalSelected = 0;
    int successCount = 0;
    int failedCount = 0;
    qint64 bytesBefore = 0;
    qint64 bytesAfter = 0;
    QElapsedTimer timer;
    QSet<int> failedIndices;
    // Failures included in failedCount. Unqueueable indices sit in
    // failedIndices without being counted here.
    QSet<int> countedFailures;

    int processed() const { return successCount + failedCount; }
    qint64 savedBytes() const { return bytesBefore - bytesAfter; }
    qint64 elapsedMs() const { return timer.isValid() ? timer.elapsed() : 0; }
};
