#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QString>

/**
 * @brief Run configuration read from an INI file
 *
 * Defaults live here; the file only needs the keys a user wants to change.
 * Command-line options are applied on top by main().
 */
struct AppSettings {
    // [output]
    QString outputDirName = "Arnold_Output";  ///< Created next to the source image
    QString outputFormat = "png";              ///< Candidate file extension / codec

    // [ranking]
    bool rankingEnabled = true;
    int topCount = 5;

    // [resources]
    int maxThreads = 0;                        ///< 0 = automatic (90% of cores)

    // [sweep]
    qint64 maxCombinations = 10000000;

    // [log]
    QString logDir;                            ///< Empty = <app dir>/logs
    int maxLogFiles = 5;

    // [general]
    bool pauseOnExit = true;

    /**
     * @brief Default location: <application dir>/arnoldsweep.ini
     */
    static QString defaultPath();

    /**
     * @brief Load settings; a missing file yields the defaults
     * @param iniPath File to read (empty = defaultPath())
     * @param errorMsg Set when the file exists but cannot be parsed
     * @return false on a malformed or unreadable file (defaults are kept)
     */
    static bool load(const QString& iniPath, AppSettings& out, QString* errorMsg = nullptr);
};

#endif // APPSETTINGS_H
