#include "status_aggregator.h"
#include "log_manager.h"
#include "status_channel.h"
#include "utils.h"

void StatusAggregator::reset(int count)
{
    m_records.clear();
    m_records.resize(qMax(0, count));
    m_batch = BatchSession();
    m_lastSummary.clear();
    m_finishedMessage.clear();
}

void StatusAggregator::beginFreshBatch(int total)
{
    m_batch.active = true;
    m_batch.totalSelected = total;
    m_batch.successCount = 0;
    m_batch.failedCount = 0;
    m_batch.bytesBefore = 0;
    m_batch.bytesAfter = 0;
    m_batch.failedIndices.clear();
    m_batch.countedFailures.clear();
    m_batch.timer.start();
    m_lastSummary.clear();
}

void StatusAggregator::beginRetryBatch(const QVector<int>& requeued)
{
    for (int index : requeued) {
        if (m_batch.countedFailures.remove(index)) --m_batch.failedCount;
        else ++m_batch.totalSelected;  // never part of the totals so far
    }
    m_batch.active = true;
    if (!m_batch.timer.isValid()) m_batch.timer.start();
    m_lastSummary.clear();
}

void StatusAggregator::markQueued(int index, const QString& targetPath)
{
    if (!isValidIndex(index)) return;
    StatusRecord& r = m_records[index];
    r.targetPath = targetPath;
    r.status = ConversionStatus::Queued;
    r.message.clear();
    r.infoStr.clear();
    m_batch.failedIndices.remove(index);
    m_batch.countedFailures.remove(index);
}

void StatusAggregator::markUnqueueable(int index, const QString& message)
{
    if (!isValidIndex(index)) return;
    StatusRecord& r = m_records[index];
    r.status = ConversionStatus::Failed;
    r.message = message;
    r.infoStr = message;
    m_batch.failedIndices.insert(index);
}

QString StatusAggregator::savingsInfo(qint64 sizeBefore, qint64 sizeAfter)
{
    const qint64 saved = sizeBefore - sizeAfter;
    return QString("%1 saved (%2%)").arg(Utils::formatBytes(saved), Utils::formatPercent(saved, sizeBefore));
}

void StatusAggregator::apply(const StatusUpdate& u)
{
    // indices from before a reload are meaningless now
    if (!isValidIndex(u.index)) return;

    StatusRecord& r = m_records[u.index];
    r.status = u.status;
    if (!u.message.isEmpty()) r.message = u.message;

    if (u.status == ConversionStatus::Success) {
        ++m_batch.successCount;
        r.sizeBefore = u.sizeBefore;
        r.sizeAfter = u.sizeAfter;
        r.infoStr.clear();
        if (u.sizeBefore > 0 && u.sizeAfter > 0) {
            m_batch.bytesBefore += u.sizeBefore;
            m_batch.bytesAfter += u.sizeAfter;
            r.infoStr = savingsInfo(u.sizeBefore, u.sizeAfter);
        }
    } else if (u.status == ConversionStatus::Failed) {
        ++m_batch.failedCount;
        m_batch.failedIndices.insert(u.index);
        m_batch.countedFailures.insert(u.index);
        r.infoStr = u.message.isEmpty() ? QStringLiteral("Unknown Error") : u.message;
    } else {
        r.infoStr.clear();
    }
}

bool StatusAggregator::drain(StatusChannel& channel)
{
    const QVector<StatusUpdate> updates = channel.drain();
    for (const StatusUpdate& u : updates) apply(u);
    return checkFinished();
}

bool StatusAggregator::checkFinished()
{
    if (!m_batch.active || m_batch.processed() < m_batch.totalSelected) return false;

    m_batch.active = false;
    const int processed = m_batch.processed();
    const QString secs = Utils::formatSeconds(m_batch.elapsedMs());
    m_finishedMessage = QString("Finished %1 files in %2s.").arg(processed).arg(secs);
    if (m_batch.bytesBefore > 0) {
        m_lastSummary = QString("Finished: %1 files | Total Saved: %2 (%3%) | Time: %4s")
                            .arg(processed)
                            .arg(Utils::formatBytes(m_batch.savedBytes()),
                                 Utils::formatPercent(m_batch.savedBytes(), m_batch.bytesBefore), secs);
    } else {
        m_lastSummary = QString("Finished: %1 files | Time: %2s").arg(processed).arg(secs);
    }
    LogManager::instance().addLog(QString("[Batch] %1 (%2 ok, %3 failed)")
                                      .arg(m_lastSummary).arg(m_batch.successCount).arg(m_batch.failedCount));
    return true;
}
