#include "GlobalExceptionHandler.h"
#include "Logger.h"
#include <cstdlib>
#include <cstring>
#include <iostream>

#ifdef Q_OS_WIN
#include <windows.h>
#else
#include <signal.h>
#include <execinfo.h> // For backtrace
#include <unistd.h>
#endif

void GlobalExceptionHandler::init()
{
#ifdef Q_OS_WIN
    SetUnhandledExceptionFilter((LPTOP_LEVEL_EXCEPTION_FILTER)GlobalExceptionHandler::handleSEH);
#else
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(struct sigaction));
    sa.sa_flags = SA_SIGINFO; // Use extended signal handling
    sa.sa_sigaction = GlobalExceptionHandler::handlePosixSignal;
    sigemptyset(&sa.sa_mask);

    sigaction(SIGSEGV, &sa, nullptr);
    sigaction(SIGABRT, &sa, nullptr);
    sigaction(SIGFPE, &sa, nullptr);
    sigaction(SIGILL, &sa, nullptr);
    sigaction(SIGBUS, &sa, nullptr);
#endif

    std::set_terminate(GlobalExceptionHandler::handleTerminate);
}

#ifdef Q_OS_WIN
long __stdcall GlobalExceptionHandler::handleSEH(struct _EXCEPTION_POINTERS* exceptionInfo)
{
    DWORD code = exceptionInfo->ExceptionRecord->ExceptionCode;
    PVOID addr = exceptionInfo->ExceptionRecord->ExceptionAddress;

    QString errorMsg = QString("Critical System Error (SEH)\nCode: 0x%1\nAddress: 0x%2")
        .arg(code, 8, 16, QChar('0')).arg(reinterpret_cast<quintptr>(addr), 16, 16, QChar('0'));

    if (code == EXCEPTION_ACCESS_VIOLATION) {
        errorMsg += "\nType: Access Violation";
    }

    Logger::critical(errorMsg, "GlobalExceptionHandler");
    printToConsole(errorMsg, true);
    Logger::shutdown();

    return EXCEPTION_EXECUTE_HANDLER;
}
#else
void GlobalExceptionHandler::handlePosixSignal(int sig, siginfo_t* info, void* context)
{
    Q_UNUSED(context);
    QString sigName;
    switch (sig) {
        case SIGSEGV: sigName = "SIGSEGV (Segmentation Fault)"; break;
        case SIGABRT: sigName = "SIGABRT (Aborted)"; break;
        case SIGFPE:  sigName = "SIGFPE (Floating Point Exception)"; break;
        case SIGILL:  sigName = "SIGILL (Illegal Instruction)"; break;
        case SIGBUS:  sigName = "SIGBUS (Bus Error)"; break;
        default:      sigName = QString("Signal %1").arg(sig); break;
    }

    QString msg = QString("Critical System Error (Signal)\nType: %1").arg(sigName);

    if (info && info->si_addr) {
        msg += QString("\nMemory Address: 0x%1").arg(reinterpret_cast<quintptr>(info->si_addr), 16, 16, QChar('0'));
    }

    void* array[20];
    int size = backtrace(array, 20);
    char** strings = backtrace_symbols(array, size);

    if (strings) {
        msg += "\n\nStack Trace:\n";
        for (int i = 0; i < size; ++i) {
            msg += QString::fromLatin1(strings[i]) + "\n";
        }
        std::free(strings);
    }

    Logger::critical(msg, "GlobalExceptionHandler");
    printToConsole(msg, true);
    Logger::shutdown();

    // Restore default handler and raise to exit properly
    signal(sig, SIG_DFL);
    raise(sig);
}
#endif

void GlobalExceptionHandler::handleTerminate()
{
    std::exception_ptr current = std::current_exception();
    if (current) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            handle(e);
        } catch (...) {
            Logger::critical("Application terminated by an unknown exception", "GlobalExceptionHandler");
            printToConsole("Application terminated by an unknown exception", true);
        }
    } else {
        Logger::critical("Application terminated abnormally (std::terminate called)", "GlobalExceptionHandler");
        printToConsole("Application terminated abnormally", true);
    }
    Logger::shutdown();
    std::abort();
}

void GlobalExceptionHandler::handle(const std::exception& e)
{
    QString msg = QString::fromLocal8Bit(e.what());
    Logger::critical("Caught unhandled exception: " + msg, "ExceptionHandler");
    printToConsole(msg, false);
}

void GlobalExceptionHandler::printToConsole(const QString& message, bool isFatal)
{
    std::cerr << (isFatal ? "\n*** Critical error, the application must terminate ***\n"
                          : "\n*** Unexpected error ***\n")
              << message.toStdString() << std::endl;

    const QString logPath = Logger::currentLogFile();
    if (!logPath.isEmpty()) {
        std::cerr << "Details were written to " << logPath.toStdString() << std::endl;
    }
}
