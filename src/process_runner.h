#pragma once
#include <QString>
#include <QStringList>

struct ProcessResult {
    int exitCode = -1;
    bool started = false;
    bool crashed = false;
    QString stdErr;

    bool succeeded() const { return started && !crashed && exitCode == 0; }
};

// Runs an external program to completion. The worker talks to encoders only
// through this interface so tests can script tool behaviour.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual ProcessResult run(const QString& program, const QStringList& args) = 0;
};

// QProcess-backed runner. Waits for natural completion (no timeout) and
// captures standard error as UTF-8.
class QProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const QString& program, const QStringList& args) override;
};
