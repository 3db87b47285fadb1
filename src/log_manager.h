#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QObject>
#include <QStringList>
#include <QMutex>
#include <QDateTime>
#include <QFile>
#include <QTextStream>

// Process-wide diagnostic sink shared by the UI loop and the worker thread.
// Records are always kept in memory; they reach the debug log file only while
// file logging is enabled. A failed open or write switches file logging off
// and latches writeFailed() so the UI can say so once.
class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance() {
        static LogManager inst;
        return inst;
    }

    ~LogManager() override;

    QStringList logs() const;

    void addLog(const QString& message, const QString& level = "INFO");
    void clear();

    void setLogFilePath(const QString& path);
    QString logFilePath() const;

    void setFileLoggingEnabled(bool enabled);
    bool isFileLoggingEnabled() const;

    // True once after a file error disabled logging; reading resets it.
    bool takeWriteFailure();

signals:
    void logAdded(const QString& entry);

private:
    explicit LogManager(QObject* parent = nullptr);
    bool ensureOpenLocked();
    void closeLocked();

    QStringList m_logs;
    mutable QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    QString m_path = QStringLiteral("jxl_converter_debug.txt");
    bool m_enabled = false;
    bool m_writeFailed = false;
    static constexpr int MAX_LOGS = 1000;
};

// Custom message handler for qDebug/qWarning/qCritical
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOG_MANAGER_H
