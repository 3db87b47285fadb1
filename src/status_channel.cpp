#include "status_channel.h"

#include <QMutexLocker>

void StatusChannel::push(const StatusUpdate& update)
{
    QMutexLocker lk(&m_mutex);
    m_updates.enqueue(update);
}

QVector<StatusUpdate> StatusChannel::drain()
{
    QVector<StatusUpdate> out;
    QMutexLocker lk(&m_mutex);
    out.reserve(m_updates.size());
    while (!m_updates.isEmpty()) out.push_back(m_updates.dequeue());
    return out;
}

bool StatusChannel::isEmpty() const
{
    QMutexLocker lk(&m_mutex);
    return m_updates.isEmpty();
}
