#ifndef GLOBALEXCEPTIONHANDLER_H
#define GLOBALEXCEPTIONHANDLER_H

#include <QString>
#include <exception>

#ifndef Q_OS_WIN
#include <csignal>
#endif

/**
 * @brief Last line of defence for crashes and exceptions that escape main()
 *
 * Everything ends up in the log file and on stderr; a long sweep that dies
 * overnight still leaves the reason behind.
 */
class GlobalExceptionHandler
{
public:
    static void init();
    static void handle(const std::exception& e);

    // Platform-specific handlers
#ifdef Q_OS_WIN
    static long __stdcall handleSEH(struct _EXCEPTION_POINTERS* exceptionInfo);
#else
    static void handlePosixSignal(int sig, siginfo_t* info, void* context);
#endif
    static void handleTerminate();

private:
    static void printToConsole(const QString& message, bool isFatal);
};

#endif // GLOBALEXCEPTIONHANDLER_H
