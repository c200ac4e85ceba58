#include "AppSettings.h"
#include "ErrorHandling.h"
#include "Logger.h"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <algorithm>

QString AppSettings::defaultPath()
{
    return QDir(QCoreApplication::applicationDirPath()).filePath("arnoldsweep.ini");
}

bool AppSettings::load(const QString& iniPath, AppSettings& out, QString* errorMsg)
{
    out = AppSettings();

    const QString path = iniPath.isEmpty() ? defaultPath() : iniPath;
    if (!QFileInfo::exists(path)) {
        // Only an explicitly requested file has to exist
        if (!iniPath.isEmpty()) {
            if (errorMsg) *errorMsg = formatError("Configuration file not found", path, "");
            return false;
        }
        return true;
    }

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        if (errorMsg) *errorMsg = formatError("Cannot parse configuration file", path,
            settings.status() == QSettings::AccessError ? "access error" : "format error");
        return false;
    }

    out.outputDirName = settings.value("output/dir_name", out.outputDirName).toString().trimmed();
    out.outputFormat = settings.value("output/format", out.outputFormat).toString().trimmed().toLower();
    out.rankingEnabled = settings.value("ranking/enabled", out.rankingEnabled).toBool();
    out.topCount = std::max(1, settings.value("ranking/top_count", out.topCount).toInt());
    out.maxThreads = std::max(0, settings.value("resources/max_threads", out.maxThreads).toInt());
    out.maxCombinations = std::max<qint64>(1, settings.value("sweep/max_combinations", out.maxCombinations).toLongLong());
    out.logDir = settings.value("log/dir", out.logDir).toString();
    out.maxLogFiles = std::max(1, settings.value("log/max_files", out.maxLogFiles).toInt());
    out.pauseOnExit = settings.value("general/pause_on_exit", out.pauseOnExit).toBool();

    if (out.outputDirName.isEmpty()) out.outputDirName = "Arnold_Output";
    if (out.outputFormat.isEmpty()) out.outputFormat = "png";

    Logger::info(QString("Settings loaded from %1").arg(path), "Settings");
    return true;
}
