#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <atomic>
#include <memory>

#include "conversion_status.h"
#include "conversion_task.h"
#include "process_runner.h"

class TaskQueue;
class StatusChannel;

// Background consumer of the task queue. Runs tasks strictly one at a time in
// enqueue order and reports every state change through the status channel;
// it never touches status records or batch counters. Lives on its own QThread
// (moveToThread + run() on QThread::started) for the life of the process.
class ConversionWorker : public QObject {
    Q_OBJECT
public:
    ConversionWorker(std::shared_ptr<TaskQueue> queue, std::shared_ptr<StatusChannel> channel,
                     std::shared_ptr<ProcessRunner> runner, QObject* parent = nullptr);

    // Set before the worker thread starts; read-only afterwards.
    void setEncoderPath(const QString& path) { m_encoderPath = path; }
    void setSanitizerPath(const QString& path) { m_sanitizerPath = path; }
    void setPollIntervalMs(int ms) { m_pollMs = ms; }

    // Runs one task to completion. Exceptions are caught here and turned into
    // a Failed update, so this never throws.
    void processTask(const ConversionTask& task);

    static QStringList encoderBaseArgs(const QString& input, const QString& output, int effort);

signals:
    void finished();

public slots:
    // Worker loop; returns after stop().
    void run();
    // Thread-safe. The task in flight, if any, runs to completion first.
    void stop();

private:
    void convert(const ConversionTask& task);
    ProcessResult runLogged(const QString& what, const QString& program, const QStringList& args);
    void report(int index, ConversionStatus status, const QString& message = QString(), qint64 sizeBefore = 0, qint64 sizeAfter = 0);

    std::shared_ptr<TaskQueue> m_queue;
    std::shared_ptr<StatusChannel> m_channel;
    std::shared_ptr<ProcessRunner> m_runner;
    QString m_encoderPath;
    QString m_sanitizerPath;
    int m_pollMs = 1000;
    std::atomic_bool m_stop{false};
};
