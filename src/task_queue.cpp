#include "task_queue.h"

#include <QDeadlineTimer>
#include <QMutexLocker>

void TaskQueue::enqueue(const ConversionTask& task)
{
    QMutexLocker lk(&m_mutex);
    m_tasks.enqueue(task);
    m_notEmpty.wakeOne();
}

void TaskQueue::enqueue(const QVector<ConversionTask>& tasks)
{
    if (tasks.isEmpty()) return;
    QMutexLocker lk(&m_mutex);
    for (const ConversionTask& t : tasks) m_tasks.enqueue(t);
    m_notEmpty.wakeAll();
}

bool TaskQueue::tryTake(ConversionTask& task, int timeoutMs)
{
    QMutexLocker lk(&m_mutex);
    if (m_tasks.isEmpty()) {
        QDeadlineTimer deadline(timeoutMs);
        while (m_tasks.isEmpty()) {
            if (!m_notEmpty.wait(&m_mutex, deadline)) break;
            // woken by wakeAll() with nothing queued: report empty so the
            // caller can re-check its cancellation flag
            if (m_tasks.isEmpty()) break;
        }
    }
    if (m_tasks.isEmpty()) return false;
    task = m_tasks.dequeue();
    return true;
}

int TaskQueue::clear()
{
    QMutexLocker lk(&m_mutex);
    const int dropped = m_tasks.size();
    m_tasks.clear();
    return dropped;
}

void TaskQueue::wakeAll()
{
    QMutexLocker lk(&m_mutex);
    m_notEmpty.wakeAll();
}

int TaskQueue::size() const
{
    QMutexLocker lk(&m_mutex);
    return m_tasks.size();
}

bool TaskQueue::isEmpty() const
{
    QMutexLocker lk(&m_mutex);
    return m_tasks.isEmpty();
}
