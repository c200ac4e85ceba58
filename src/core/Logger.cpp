#include "Logger.h"
#include "Version.h"
#include <QFileInfo>
#include <QStringConverter>
#include <QThread>
#include <iostream>
#include <cstring>
#include <cstdlib>
#include <algorithm>

// Static member initialization
QFile* Logger::s_logFile = nullptr;
QTextStream* Logger::s_logStream = nullptr;
QRecursiveMutex Logger::s_mutex;
QString Logger::s_logDirPath;
QString Logger::s_currentLogPath;
int Logger::s_maxLogFiles = 5;
bool Logger::s_initialized = false;
QtMessageHandler Logger::s_previousHandler = nullptr;

void Logger::init(const QString& logDirPath, int maxLogFiles)
{
    QMutexLocker locker(&s_mutex);

    if (s_initialized) return;

    s_maxLogFiles = std::max(1, maxLogFiles);

    // Determine log directory
    if (logDirPath.isEmpty()) {
        // Default: app directory/logs
        QString appDir = QCoreApplication::applicationDirPath();
        s_logDirPath = appDir + "/logs";
    } else {
        s_logDirPath = logDirPath;
    }

    // Create log directory if needed
    QDir dir(s_logDirPath);
    if (!dir.exists() && !dir.mkpath(".")) {
        std::cerr << "Failed to create log directory: " << s_logDirPath.toStdString() << std::endl;
        return;
    }

    // Make room for the new file before creating it
    rotateLogFiles();

    const QString stamp = QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss_zzz");
    s_currentLogPath = dir.filePath(QString("ArnoldSweep_%1.log").arg(stamp));

    s_logFile = new QFile(s_currentLogPath);
    if (!s_logFile->open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Append)) {
        std::cerr << "Failed to open log file: " << s_currentLogPath.toStdString() << std::endl;
        delete s_logFile;
        s_logFile = nullptr;
        s_currentLogPath.clear();
        return;
    }

    s_logStream = new QTextStream(s_logFile);
    s_logStream->setEncoding(QStringConverter::Utf8);

    // Write header
    *s_logStream << "================================================================================\n";
    *s_logStream << "ArnoldSweep Log - Started " << QDateTime::currentDateTime().toString(Qt::ISODate) << "\n";
    *s_logStream << "Version: " << ArnoldSweep::getVersion() << "\n";
    *s_logStream << "Ideal thread count: " << QThread::idealThreadCount() << "\n";
#ifdef Q_OS_WIN
    *s_logStream << "Platform: Windows\n";
#elif defined(Q_OS_MAC)
    *s_logStream << "Platform: macOS\n";
#else
    *s_logStream << "Platform: Linux/Other\n";
#endif
    *s_logStream << "================================================================================\n\n";
    s_logStream->flush();

    // Install Qt message handler
    s_previousHandler = qInstallMessageHandler(qtMessageHandler);

    s_initialized = true;

    log(Info, "Logging system initialized", "Logger");
    log(Info, QString("Log file: %1").arg(s_currentLogPath), "Logger");
}

void Logger::shutdown()
{
    QMutexLocker locker(&s_mutex);

    if (!s_initialized) return;

    // Restore previous handler (may be null, which restores Qt's default)
    qInstallMessageHandler(s_previousHandler);
    s_previousHandler = nullptr;

    // Write footer
    if (s_logStream) {
        *s_logStream << "\n================================================================================\n";
        *s_logStream << "ArnoldSweep Log - Ended " << QDateTime::currentDateTime().toString(Qt::ISODate) << "\n";
        *s_logStream << "================================================================================\n";
        s_logStream->flush();
        delete s_logStream;
        s_logStream = nullptr;
    }

    if (s_logFile) {
        s_logFile->close();
        delete s_logFile;
        s_logFile = nullptr;
    }

    s_initialized = false;
}

void Logger::log(Level level, const QString& message, const QString& category)
{
    QMutexLocker locker(&s_mutex);

    if (!s_logStream) return;

    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    QString levelStr = levelToString(level);
    QString categoryStr = category.isEmpty() ? "" : QString("[%1] ").arg(category);

    QString formattedMsg = QString("[%1] [%2] %3%4")
                              .arg(timestamp)
                              .arg(levelStr, -8)
                              .arg(categoryStr)
                              .arg(message);

    *s_logStream << formattedMsg << "\n";

    // Warnings and above must survive a crash right after them
    if (level >= Warning) {
        s_logStream->flush();
    }
}

void Logger::qtMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
    Level level;
    switch (type) {
        case QtDebugMsg:    level = Debug; break;
        case QtInfoMsg:     level = Info; break;
        case QtWarningMsg:  level = Warning; break;
        case QtCriticalMsg: level = Critical; break;
        case QtFatalMsg:    level = Fatal; break;
        default:            level = Info; break;
    }

    QString category;
    if (context.category && std::strcmp(context.category, "default") != 0) {
        category = QString::fromUtf8(context.category);
    }

    log(level, msg, category);

    if (type == QtFatalMsg) {
        std::cerr << msg.toStdString() << std::endl;
        shutdown();
        std::abort();
    }
}

void Logger::rotateLogFiles()
{
    QDir dir(s_logDirPath);
    QStringList filters;
    filters << "ArnoldSweep_*.log";

    QFileInfoList logFiles = dir.entryInfoList(filters, QDir::Files, QDir::Time);

    // Newest first; drop the oldest until the new file fits under the limit
    while (!logFiles.isEmpty() && logFiles.size() >= s_maxLogFiles) {
        QFile::remove(logFiles.last().absoluteFilePath());
        logFiles.removeLast();
    }
}

QString Logger::levelToString(Level level)
{
    switch (level) {
        case Debug:    return "DEBUG";
        case Info:     return "INFO";
        case Warning:  return "WARNING";
        case Error:    return "ERROR";
        case Critical: return "CRITICAL";
        case Fatal:    return "FATAL";
        default:       return "UNKNOWN";
    }
}

QString Logger::currentLogFile()
{
    QMutexLocker locker(&s_mutex);
    return s_currentLogPath;
}

bool Logger::isInitialized()
{
    QMutexLocker locker(&s_mutex);
    return s_initialized;
}
