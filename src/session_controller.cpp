#include "session_controller.h"
#include "conversion_worker.h"
#include "file_type_helpers.h"
#include "log_manager.h"
#include "output_path_resolver.h"
#include "process_runner.h"
#include "status_channel.h"
#include "task_queue.h"
#include "user_prompter.h"

#include <QFileInfo>
#include <QPair>

namespace {
void logLine(const QString& line, const QString& level = "INFO")
{
    LogManager::instance().addLog(QStringLiteral("[Session] ") + line, level);
}

bool isAllDigits(const QString& s)
{
    if (s.isEmpty()) return false;
    for (const QChar c : s) {
        if (c < QLatin1Char('0') || c > QLatin1Char('9')) return false;
    }
    return true;
}

QString unqueueableMessage(const QVector<QPair<int, QString>>& unqueueable)
{
    if (unqueueable.size() == 1) return unqueueable.first().second;
    return QString("%1 files could not be queued: %2").arg(unqueueable.size()).arg(unqueueable.first().second);
}
}

SessionController::SessionController(const QString& rootDir, const ConverterSettings& settings, const ToolPaths& tools,
                                     std::shared_ptr<ProcessRunner> runner, UserPrompter* prompter, QObject* parent)
    : QObject(parent)
    , m_rootDir(QFileInfo(rootDir).absoluteFilePath())
    , m_settings(settings)
    , m_tools(tools)
    , m_runner(std::move(runner))
    , m_prompter(prompter)
    , m_queue(std::make_shared<TaskQueue>())
    , m_channel(std::make_shared<StatusChannel>())
{
    if (!m_runner) m_runner = std::make_shared<QProcessRunner>();
    LogManager::instance().setFileLoggingEnabled(m_settings.debugLogging);
    reload();
}

SessionController::~SessionController()
{
    shutdown();
}

void SessionController::postMessage(const QString& text, MessageLevel level)
{
    m_lastMessage = text;
    m_lastLevel = level;
    emit messagePosted(text, level);
}

bool SessionController::reload()
{
    if (isBatchActive()) {
        postMessage("Cannot reload while a conversion is running.", MessageLevel::Warning);
        return false;
    }
    QString err;
    const bool ok = m_inventory.load(m_rootDir, m_settings.recursive, &err);
    m_aggregator.reset(m_inventory.size());
    m_selection.reset(m_inventory.size());
    if (!ok) {
        logLine(QString("Scan failed: %1").arg(err), "ERROR");
        postMessage(QString("Error loading files: %1").arg(err), MessageLevel::Error);
        return false;
    }
    logLine(QString("Loaded %1 files from %2 (recursive=%3)")
                .arg(m_inventory.size()).arg(m_rootDir).arg(m_settings.recursive ? QStringLiteral("on") : QStringLiteral("off")));
    return true;
}

bool SessionController::startBatch(bool isSanitizeRetry)
{
    if (isBatchActive()) { postMessage("A conversion is already in progress.", MessageLevel::Warning); return false; }
    if (m_selection.isEmpty()) { postMessage("No files selected to convert.", MessageLevel::Warning); return false; }
    if (!m_tools.hasEncoder()) { postMessage("cjxl command not found in PATH.", MessageLevel::Error); return false; }
    if (m_settings.deleteOriginals && !isSanitizeRetry) {
        if (!m_prompter || !m_prompter->confirm("Delete originals is ON. Proceed? (y/n)")) {
            postMessage("Conversion cancelled.");
            return false;
        }
    }

    logLine("--- Preparing new conversion session ---");
    OutputPathResolver resolver(m_rootDir, m_settings.outputDir, m_settings.recursive);
    QVector<ConversionTask> tasks;
    QVector<int> taskIndices;
    QVector<QPair<int, QString>> unqueueable;
    for (int idx : m_selection.sortedSelection()) {
        if (!m_inventory.isValidIndex(idx)) continue;
        const FileEntry& entry = m_inventory.at(idx);
        QString target, err;
        if (!resolver.resolve(entry.path, target, err)) {
            logLine(QString("  - Skipped %1: %2").arg(entry.fileName, err), "WARN");
            unqueueable.push_back(qMakePair(idx, err));
            continue;
        }
        ConversionTask t;
        t.index = idx;
        t.inputPath = entry.path;
        t.targetPath = target;
        t.sanitize = isSanitizeRetry;
        t.quality = m_settings.quality;
        t.effort = m_settings.effort;
        t.deleteOriginal = m_settings.deleteOriginals;
        tasks.push_back(t);
        taskIndices.push_back(idx);
        logLine(QString("  - Queued Task: %1 -> %2").arg(entry.fileName, QFileInfo(target).fileName()));
    }

    if (tasks.isEmpty()) {
        for (const auto& u : unqueueable) m_aggregator.markUnqueueable(u.first, u.second);
        postMessage(unqueueable.isEmpty() ? QStringLiteral("No files selected to convert.")
                                          : unqueueableMessage(unqueueable),
                    MessageLevel::Error);
        return false;
    }
    if (!unqueueable.isEmpty()) postMessage(unqueueableMessage(unqueueable), MessageLevel::Warning);

    if (isSanitizeRetry) m_aggregator.beginRetryBatch(taskIndices);
    else m_aggregator.beginFreshBatch(tasks.size());
    for (const auto& u : unqueueable) m_aggregator.markUnqueueable(u.first, u.second);
    for (const ConversionTask& t : tasks) m_aggregator.markQueued(t.index, t.targetPath);

    m_queue->enqueue(tasks);
    logLine(QString("--- Starting worker thread with %1 tasks ---").arg(tasks.size()));
    ensureWorker();
    return true;
}

void SessionController::ensureWorker()
{
    if (m_worker) return;
    m_thread.reset(new QThread);
    m_worker = new ConversionWorker(m_queue, m_channel, m_runner);
    m_worker->setEncoderPath(m_tools.encoder);
    m_worker->setSanitizerPath(m_tools.sanitizer);
    m_worker->setPollIntervalMs(m_pollMs);
    m_worker->moveToThread(m_thread.get());
    connect(m_thread.get(), &QThread::started, m_worker, &ConversionWorker::run);
    connect(m_thread.get(), &QThread::finished, m_worker, &QObject::deleteLater);
    m_thread->start(QThread::LowPriority);
}

bool SessionController::poll()
{
    if (LogManager::instance().takeWriteFailure()) {
        m_settings.debugLogging = false;
        postMessage("Error writing to debug log. Disabling.", MessageLevel::Error);
    }
    if (!m_aggregator.drain(*m_channel)) return false;
    postMessage(m_aggregator.finishedMessage(), MessageLevel::Success);
    onBatchFinished();
    return true;
}

void SessionController::onBatchFinished()
{
    const QSet<int> failed = m_aggregator.failedIndices();
    if (failed.isEmpty()) return;
    if (!m_tools.hasSanitizer()) {
        postMessage("Some files failed. Install ImageMagick to enable sanitize/retry.", MessageLevel::Warning);
        return;
    }
    const QString question = QString("%1 files failed. Sanitize & retry them now? (y/n)").arg(failed.size());
    if (!m_prompter || !m_prompter->confirm(question)) return;

    postMessage("Re-queueing failed files for sanitized conversion...");
    m_selection.setSelection(failed);
    startBatch(true);
}

void SessionController::shutdown(int timeoutMs)
{
    if (!m_thread) return;
    const int dropped = m_queue->clear();
    if (dropped > 0) logLine(QString("Discarding %1 queued tasks").arg(dropped));
    m_worker->stop();
    m_thread->quit();
    if (m_thread->wait(timeoutMs)) {
        m_thread.reset();
    } else {
        // Still inside an encoder call. The thread owns shared references to
        // the queue and channel, so it is left for process exit to reap.
        logLine(QString("Worker still busy after %1 ms; detaching").arg(timeoutMs), "WARN");
        m_thread.release();
    }
    m_worker = nullptr;
}

int SessionController::pendingTaskCount() const
{
    return m_queue->size();
}

QString SessionController::targetName(int index) const
{
    if (m_aggregator.isValidIndex(index)) {
        const QString assigned = m_aggregator.record(index).targetPath;
        if (!assigned.isEmpty()) return QFileInfo(assigned).fileName();
    }
    if (!m_inventory.isValidIndex(index)) return QString();
    return m_inventory.at(index).stem() + QLatin1Char('.') + targetExtension();
}

bool SessionController::toggleRecursive()
{
    if (isBatchActive()) {
        postMessage("Cannot reload while a conversion is running.", MessageLevel::Warning);
        return false;
    }
    m_settings.recursive = !m_settings.recursive;
    return reload();
}

void SessionController::toggleDeleteOriginals()
{
    m_settings.deleteOriginals = !m_settings.deleteOriginals;
}

void SessionController::toggleDebugLogging()
{
    m_settings.debugLogging = !m_settings.debugLogging;
    LogManager::instance().setFileLoggingEnabled(m_settings.debugLogging);
    postMessage(QString("Debug logging %1").arg(m_settings.debugLogging ? QStringLiteral("ENABLED") : QStringLiteral("DISABLED")));
}

bool SessionController::toggleFailedFilter()
{
    if (!hasFailures() && !m_selection.failedOnly()) return false;
    m_selection.setFailedOnly(!m_selection.failedOnly());
    return true;
}

bool SessionController::editNumber(const QString& label, int current, int minValue, int maxValue, int& result)
{
    if (!m_prompter) return false;
    QString text;
    if (!m_prompter->promptText(QString("%1 (%2-%3)").arg(label).arg(minValue).arg(maxValue), QString::number(current), text))
        return false;
    const QString trimmed = text.trimmed();
    const int value = isAllDigits(trimmed) ? trimmed.toInt() : -1;
    if (value < minValue || value > maxValue) {
        postMessage(QString("%1 must be between %2 and %3.").arg(label).arg(minValue).arg(maxValue), MessageLevel::Error);
        return false;
    }
    result = value;
    return true;
}

void SessionController::editQuality()
{
    int value = 0;
    if (!editNumber("Quality", m_settings.quality, ConverterSettings::kMinQuality, ConverterSettings::kMaxQuality, value)) return;
    m_settings.setQuality(value);
    postMessage(QString("Quality set to %1").arg(m_settings.quality));
}

void SessionController::editEffort()
{
    int value = 0;
    if (!editNumber("Effort", m_settings.effort, ConverterSettings::kMinEffort, ConverterSettings::kMaxEffort, value)) return;
    m_settings.setEffort(value);
    postMessage(QString("Effort set to %1").arg(m_settings.effort));
}

void SessionController::editOutputDir()
{
    if (!m_prompter) return;
    QString text;
    if (!m_prompter->promptText("Output Dir (blank=Same as Source)", m_settings.outputDir, text)) return;
    if (text.trimmed().isEmpty()) {
        m_settings.outputDir.clear();
        postMessage("Output set to same directory as source files.");
        return;
    }
    m_settings.outputDir = ConverterSettings::normalizeDir(text);
    postMessage(QString("Output directory set to %1").arg(m_settings.outputDir));
}
