#pragma once
#include <QMutex>
#include <QQueue>
#include <QWaitCondition>
#include <QVector>

#include "conversion_task.h"

// FIFO of conversion tasks. Any thread may enqueue; the single worker pulls
// with a bounded wait so it can notice cancellation between tasks.
class TaskQueue {
public:
    void enqueue(const ConversionTask& task);
    void enqueue(const QVector<ConversionTask>& tasks);

    // Waits up to timeoutMs for a task. Returns false if none arrived.
    bool tryTake(ConversionTask& task, int timeoutMs);

    // Drops everything still waiting and returns how many tasks were dropped.
    int clear();

    // Wakes any waiting consumer without handing out a task.
    void wakeAll();

    int size() const;
    bool isEmpty() const;

private:
    mutable QMutex m_mutex;
    QWaitCondition m_notEmpty;
    QQueue<ConversionTask> m_tasks;
};
