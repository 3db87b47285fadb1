#include "conversion_worker.h"
#include "file_type_helpers.h"
#include "file_utils.h"
#include "log_manager.h"
#include "status_channel.h"
#include "task_queue.h"
#include "utils.h"

#include <QDir>
#include <QFileInfo>
#include <QTemporaryFile>

#include <exception>

namespace {
const char* kSanitizeFailed = "Sanitize failed";
const char* kSanitizerMissing = "ImageMagick not found";
const char* kEncoderFallbackError = "cjxl error";

void logLine(const QString& line, const QString& level = "INFO")
{
    LogManager::instance().addLog(QStringLiteral("[Worker] ") + line, level);
}
}

ConversionWorker::ConversionWorker(std::shared_ptr<TaskQueue> queue, std::shared_ptr<StatusChannel> channel,
                                   std::shared_ptr<ProcessRunner> runner, QObject* parent)
    : QObject(parent)
    , m_queue(std::move(queue))
    , m_channel(std::move(channel))
    , m_runner(std::move(runner))
{
}

void ConversionWorker::run()
{
    logLine("Worker loop started");
    while (!m_stop.load()) {
        ConversionTask task;
        if (!m_queue->tryTake(task, m_pollMs)) continue;
        processTask(task);
    }
    logLine("Worker loop stopped");
    emit finished();
}

void ConversionWorker::stop()
{
    m_stop.store(true);
    m_queue->wakeAll();
}

void ConversionWorker::processTask(const ConversionTask& task)
{
    try {
        convert(task);
    } catch (const std::exception& e) {
        logLine(QString("WORKER CRASH on index %1: %2").arg(task.index).arg(QString::fromLocal8Bit(e.what())), "ERROR");
        report(task.index, ConversionStatus::Failed, QString("Worker crash: %1").arg(QString::fromLocal8Bit(e.what())));
    } catch (...) {
        logLine(QString("WORKER CRASH on index %1: unknown exception").arg(task.index), "ERROR");
        report(task.index, ConversionStatus::Failed, QStringLiteral("Worker crash: unknown error"));
    }
}

QStringList ConversionWorker::encoderBaseArgs(const QString& input, const QString& output, int effort)
{
    return QStringList{input, output, QStringLiteral("--effort"), QString::number(effort)};
}

void ConversionWorker::convert(const ConversionTask& t)
{
    const QFileInfo inFi(t.inputPath);
    logLine(QString("PULLED TASK: Idx=%1, Target=%2, Sanitize=%3")
                .arg(t.index).arg(QFileInfo(t.targetPath).fileName(), t.sanitize ? QStringLiteral("true") : QStringLiteral("false")));

    QString source = t.inputPath;
    // Removed when this goes out of scope, whatever path we leave by.
    std::unique_ptr<QTemporaryFile> sanitized;

    if (t.sanitize) {
        logLine(QString("SANITIZING %1").arg(inFi.fileName()));
        report(t.index, ConversionStatus::Sanitizing);
        if (m_sanitizerPath.isEmpty()) {
            report(t.index, ConversionStatus::Failed, kSanitizerMissing);
            return;
        }
        sanitized.reset(new QTemporaryFile(QDir::temp().filePath(QString("jxlbatch_sanitize_%1_XXXXXX.png").arg(t.index))));
        if (!sanitized->open()) {
            logLine(QString("Cannot create sanitize temp file: %1").arg(sanitized->errorString()), "ERROR");
            report(t.index, ConversionStatus::Failed, kSanitizeFailed);
            return;
        }
        sanitized->close();
        const ProcessResult r = runLogged("Sanitize", m_sanitizerPath,
                                          {t.inputPath, QStringLiteral("-strip"), sanitized->fileName()});
        if (!r.succeeded() || FileUtils::fileSize(sanitized->fileName()) <= 0) {
            report(t.index, ConversionStatus::Failed, kSanitizeFailed);
            return;
        }
        source = sanitized->fileName();
    }

    report(t.index, ConversionStatus::Converting);

    const QStringList base = encoderBaseArgs(source, t.targetPath, t.effort);
    const QStringList qualityArgs{QStringLiteral("--lossless_jpeg"), QStringLiteral("0"),
                                  QStringLiteral("-q"), QString::number(t.quality), QStringLiteral("--quiet")};
    ProcessResult result;
    if (isJpegFile(inFi.suffix()) && !t.sanitize) {
        result = runLogged("Lossless", m_encoderPath, base + QStringList{"--lossless_jpeg", "1", "--quiet"});
        if (!result.succeeded()) {
            logLine("Lossless failed, falling back to quality.");
            result = runLogged("Quality", m_encoderPath, base + qualityArgs);
        }
    } else {
        result = runLogged("Quality (non-JPEG/sanitized)", m_encoderPath, base + qualityArgs);
    }

    sanitized.reset();

    if (result.succeeded() && FileUtils::fileExists(t.targetPath)) {
        if (!FileUtils::copyFileMetadata(t.inputPath, t.targetPath))
            logLine(QString("Could not copy metadata to %1").arg(t.targetPath), "WARN");
        const qint64 before = FileUtils::fileSize(t.inputPath);
        const qint64 after = FileUtils::fileSize(t.targetPath);
        report(t.index, ConversionStatus::Success, QString(), before, after);
        if (t.deleteOriginal && !QFile::remove(t.inputPath))
            logLine(QString("Could not delete original %1").arg(t.inputPath), "WARN");
        return;
    }

    QString err = Utils::lastNonEmptyLine(result.stdErr);
    if (err.isEmpty()) err = kEncoderFallbackError;
    if (!FileUtils::removeIfExists(t.targetPath))
        logLine(QString("Could not remove partial output %1").arg(t.targetPath), "WARN");
    report(t.index, ConversionStatus::Failed, err);
}

ProcessResult ConversionWorker::runLogged(const QString& what, const QString& program, const QStringList& args)
{
    logLine(QString("Executing %1: %2 %3").arg(what, program, args.join(' ')));
    const ProcessResult r = m_runner->run(program, args);
    logLine(QString("%1 Result: code=%2, stderr=%3").arg(what).arg(r.exitCode).arg(r.stdErr.trimmed()));
    return r;
}

void ConversionWorker::report(int index, ConversionStatus status, const QString& message, qint64 sizeBefore, qint64 sizeAfter)
{
    StatusUpdate u;
    u.index = index;
    u.status = status;
    u.message = message;
    u.sizeBefore = sizeBefore;
    u.sizeAfter = sizeAfter;
    m_channel->push(u);
}
