#pragma once
#include <QString>
#include <QVector>

#include "batch_session.h"
#include "conversion_status.h"

class StatusChannel;

// Sole owner of the per-file status records and the batch counters. Folds
// worker updates in on the UI thread and detects batch completion exactly
// once per batch.
class StatusAggregator {
public:
    // Discards all records and the batch state; `count` fresh Pending records.
    void reset(int count);

    int recordCount() const { return m_records.size(); }
    const StatusRecord& record(int index) const { return m_records.at(index); }
    bool isValidIndex(int index) const { return index >= 0 && index < m_records.size(); }

    const BatchSession& batch() const { return m_batch; }
    bool isBatchActive() const { return m_batch.active; }
    QSet<int> failedIndices() const { return m_batch.failedIndices; }

    // Fresh batch: zero the counters, clear the failed set, restart the clock.
    void beginFreshBatch(int total);
    // Sanitize retry: counters carry over and the batch becomes active again.
    // A retried failure is un-counted; a retried index that never counted
    // (it could not be queued before) adds one to the total instead.
    void beginRetryBatch(const QVector<int>& requeued);

    // Task built: remember the target, leave the failed set, show as Queued.
    void markQueued(int index, const QString& targetPath);
    // Task could not be built (no output directory). Not part of the totals.
    void markUnqueueable(int index, const QString& message);

    void apply(const StatusUpdate& update);

    // Applies every pending update. Returns true only on the call during which
    // the active batch reached its total.
    bool drain(StatusChannel& channel);

    QString lastSummary() const { return m_lastSummary; }
    void clearSummary() { m_lastSummary.clear(); }
    QString finishedMessage() const { return m_finishedMessage; }

    static QString savingsInfo(qint64 sizeBefore, qint64 sizeAfter);

private:
    bool checkFinished();

    QVector<StatusRecord> m_records;
    BatchSession m_batch;
    QString m_lastSummary;
    QString m_finishedMessage;
};
