#pragma once

#include <QObject>
#include <QString>
#include <QThread>
#include <QVector>
#include <memory>

#include "converter_settings.h"
#include "file_inventory.h"
#include "selection_model.h"
#include "status_aggregator.h"

class ConversionWorker;
class ProcessRunner;
class StatusChannel;
class TaskQueue;
class UserPrompter;

// Drives conversion batches for one source directory. Everything here runs on
// the UI thread; the only other thread is the single conversion worker, which
// is spawned on the first batch and kept until shutdown().
class SessionController : public QObject {
    Q_OBJECT
public:
    enum class MessageLevel { Info, Success, Warning, Error };
    Q_ENUM(MessageLevel)

    SessionController(const QString& rootDir, const ConverterSettings& settings, const ToolPaths& tools,
                      std::shared_ptr<ProcessRunner> runner, UserPrompter* prompter, QObject* parent = nullptr);
    ~SessionController() override;

    // Rescans the source directory. Rejected while a batch is running.
    bool reload();

    // Builds and queues one task per selected file. A sanitize retry keeps the
    // running counters; a fresh batch resets them. Returns false when rejected.
    bool startBatch(bool isSanitizeRetry = false);

    // Called every UI tick: folds in worker updates and, when the batch has
    // just completed, runs onBatchFinished(). Returns true on that tick.
    bool poll();

    // Offers sanitize & retry for the failed files of the finished batch.
    void onBatchFinished();

    // Stops the worker, discards queued tasks and waits up to timeoutMs.
    void shutdown(int timeoutMs = 5000);

    // Settings edited from the UI.
    bool toggleRecursive();
    void toggleDeleteOriginals();
    void toggleDebugLogging();
    bool toggleFailedFilter();
    void editQuality();
    void editEffort();
    void editOutputDir();

    const ConverterSettings& settings() const { return m_settings; }
    const ToolPaths& tools() const { return m_tools; }
    QString rootDir() const { return m_rootDir; }
    const FileInventory& inventory() const { return m_inventory; }
    SelectionModel& selection() { return m_selection; }
    const SelectionModel& selection() const { return m_selection; }
    const StatusAggregator& aggregator() const { return m_aggregator; }
    bool isBatchActive() const { return m_aggregator.isBatchActive(); }
    bool hasFailures() const { return !m_aggregator.failedIndices().isEmpty(); }
    QVector<int> visibleIndices() const { return m_selection.visibleIndices(m_aggregator.failedIndices()); }
    bool isWorkerRunning() const { return m_thread && m_thread->isRunning(); }
    int pendingTaskCount() const;

    // File name shown in the target column: the assigned target, else <stem>.jxl.
    QString targetName(int index) const;

    void postMessage(const QString& text, MessageLevel level = MessageLevel::Info);
    QString lastMessage() const { return m_lastMessage; }
    MessageLevel lastMessageLevel() const { return m_lastLevel; }
    void clearMessage() { m_lastMessage.clear(); m_lastLevel = MessageLevel::Info; }

    void setWorkerPollIntervalMs(int ms) { m_pollMs = ms; }

    // Drops the post-batch summary once the user moves on.
    void clearSummary() { m_aggregator.clearSummary(); }

signals:
    void messagePosted(const QString& text, SessionController::MessageLevel level);


private:
    void ensureWorker();
    bool editNumber(const QString& label, int current, int minValue, int maxValue, int& result);

    QString m_rootDir;
    ConverterSettings m_settings;
    ToolPaths m_tools;
    std::shared_ptr<ProcessRunner> m_runner;
    UserPrompter* m_prompter = nullptr;

    FileInventory m_inventory;
    SelectionModel m_selection;
    StatusAggregator m_aggregator;
    std::shared_ptr<TaskQueue> m_queue;
    std::shared_ptr<StatusChannel> m_channel;

    std::unique_ptr<QThread> m_thread;
    ConversionWorker* m_worker = nullptr;
    int m_pollMs = 1000;

    QString m_lastMessage;
    MessageLevel m_lastLevel = MessageLevel::Info;
};
