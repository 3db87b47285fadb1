#pragma once
#include <QMutex>
#include <QQueue>
#include <QVector>

#include "conversion_status.h"

// One-way FIFO from the worker (sole producer) to the UI loop (sole consumer).
// Draining never blocks beyond the short critical section.
class StatusChannel {
public:
    void push(const StatusUpdate& update);

    // Removes and returns every pending update in emission order.
    QVector<StatusUpdate> drain();

    bool isEmpty() const;

private:
    mutable QMutex m_mutex;
    QQueue<StatusUpdate> m_updates;
};
