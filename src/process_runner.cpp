#include "process_runner.h"

#include <QProcess>

ProcessResult QProcessRunner::run(const QString& program, const QStringList& args)
{
    ProcessResult r;
    QProcess p;
    p.setProgram(program);
    p.setArguments(args);
    p.setProcessChannelMode(QProcess::SeparateChannels);
    p.setStandardInputFile(QProcess::nullDevice());
    p.setStandardOutputFile(QProcess::nullDevice());
    p.start();
    if (!p.waitForStarted()) {
        r.stdErr = QString("Failed to start %1: %2").arg(program, p.errorString());
        return r;
    }
    r.started = true;
    p.waitForFinished(-1);
    r.crashed = (p.exitStatus() != QProcess::NormalExit);
    r.exitCode = r.crashed ? -1 : p.exitCode();
    r.stdErr = QString::fromUtf8(p.readAllStandardError());
    if (r.crashed && r.stdErr.trimmed().isEmpty()) r.stdErr = QString("%1 crashed").arg(program);
    return r;
}
