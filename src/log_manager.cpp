#include "log_manager.h"
#include <QFileInfo>
#include <QMutexLocker>

LogManager::LogManager(QObject* parent) : QObject(parent) {
}

LogManager::~LogManager() {
    QMutexLocker locker(&m_mutex);
    closeLocked();
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

void LogManager::addLog(const QString& message, const QString& level) {
    QString logEntry;
    {
        QMutexLocker locker(&m_mutex);
        const QString timestamp = QDateTime::currentDateTime().toString(Qt::ISODateWithMs);
        const QString upper = level.toUpper();
        if (upper == "INFO" || upper == "DEBUG")
            logEntry = QString("[%1] %2").arg(timestamp, message);
        else
            logEntry = QString("[%1] [%2] %3").arg(timestamp, upper, message);
        m_logs.append(logEntry);
        if (m_logs.size() > MAX_LOGS) {
            m_logs.removeFirst();
        }

        if (m_enabled && ensureOpenLocked()) {
            m_ts << logEntry << '\n';
            m_ts.flush();
            if (m_ts.status() != QTextStream::Ok || m_file.error() != QFileDevice::NoError) {
                closeLocked();
                m_enabled = false;
                m_writeFailed = true;
            }
        }
    } // unlock before emitting

    emit logAdded(logEntry);
}

bool LogManager::ensureOpenLocked() {
    if (m_file.isOpen()) return true;
    const bool fresh = !QFileInfo::exists(m_path);
    m_file.setFileName(m_path);
    if (!m_file.open(QIODevice::Append | QIODevice::Text)) {
        m_enabled = false;
        m_writeFailed = true;
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts.resetStatus();
    if (fresh) {
        m_ts << "JxlBatch Debug Log\n\nSession started: "
             << QDateTime::currentDateTime().toString(Qt::ISODateWithMs) << "\n\n";
        m_ts.flush();
    }
    return true;
}

void LogManager::closeLocked() {
    if (m_ts.device()) {
        m_ts.flush();
        m_ts.setDevice(nullptr);
    }
    if (m_file.isOpen()) m_file.close();
}

void LogManager::clear() {
    QMutexLocker locker(&m_mutex);
    m_logs.clear();
}

void LogManager::setLogFilePath(const QString& path) {
    QMutexLocker locker(&m_mutex);
    if (path == m_path) return;
    closeLocked();
    m_path = path;
}

QString LogManager::logFilePath() const {
    QMutexLocker locker(&m_mutex);
    return m_path;
}

void LogManager::setFileLoggingEnabled(bool enabled) {
    QMutexLocker locker(&m_mutex);
    m_enabled = enabled;
    if (!enabled) closeLocked();
}

bool LogManager::isFileLoggingEnabled() const {
    QMutexLocker locker(&m_mutex);
    return m_enabled;
}

bool LogManager::takeWriteFailure() {
    QMutexLocker locker(&m_mutex);
    const bool failed = m_writeFailed;
    m_writeFailed = false;
    return failed;
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    QString level;
    switch (type) {
        case QtDebugMsg:
            level = "DEBUG";
            break;
        case QtInfoMsg:
            level = "INFO";
            break;
        case QtWarningMsg:
            level = "WARN";
            break;
        case QtCriticalMsg:
            level = "ERROR";
            break;
        case QtFatalMsg:
            level = "FATAL";
            break;
    }

    // Nothing goes to stderr: the terminal belongs to curses.
    LogManager::instance().addLog(msg, level);

    if (type == QtFatalMsg) {
        abort();
    }
}
