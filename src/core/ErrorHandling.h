#ifndef ERRORHANDLING_H
#define ERRORHANDLING_H

#include <QString>
#include <QtGlobal>
#include <utility>

/**
 * @brief Consistent error handling utilities for ArnoldSweep
 *
 * ArnoldSweep uses error codes (Qt-style) rather than exceptions for most operations.
 * This header provides utilities to standardize error handling across image I/O,
 * the parameter sweep and the ranking pass.
 *
 * Standard patterns:
 * 1. Bool return + optional QString* error output
 *    bool run(const ImageBuffer& src, ProgressCallback cb, QString* err = nullptr)
 *
 * 2. Result<T> for parsers that either yield a value or a reason
 *    Result<ParameterRange> r = ParameterRange::parse(text);
 *
 * 3. RAII cleanup for resource management (ScopeGuard)
 *
 * Exceptions are only expected to escape to main(), where
 * GlobalExceptionHandler::handle() logs and reports them.
 */

// ============================================================================
// Error Message Formatting
// ============================================================================

/**
 * @brief Format error message with context
 *
 * Usage:
 *   QString errMsg = formatError("Failed to load image", filePath, "unsupported format");
 *   // Output: "Failed to load image: /path/to/file.png - unsupported format"
 */
inline QString formatError(const QString& operation, const QString& context, int errorCode) {
    return QString("%1: %2 (error %3)").arg(operation, context, QString::number(errorCode));
}

inline QString formatError(const QString& operation, const QString& context, const QString& reason) {
    if (reason.isEmpty()) {
        return QString("%1: %2").arg(operation, context);
    }
    return QString("%1: %2 - %3").arg(operation, context, reason);
}

// ============================================================================
// Error Result Type (Optional-like, but more semantic)
// ============================================================================

template<typename T>
class Result {
public:
    // Success constructor
    explicit Result(const T& value) : m_value(value), m_hasError(false) {}
    explicit Result(T&& value) : m_value(std::move(value)), m_hasError(false) {}

    // Error factory (a QString payload would be ambiguous with T = QString)
    static Result failure(const QString& error) {
        Result r;
        r.m_hasError = true;
        r.m_error = error;
        return r;
    }

    // Status checks
    bool isSuccess() const { return !m_hasError; }
    bool isError() const { return m_hasError; }

    // Get value (asserts if error)
    const T& value() const {
        Q_ASSERT(!m_hasError);
        return m_value;
    }

    // Get error message
    const QString& error() const {
        Q_ASSERT(m_hasError);
        return m_error;
    }

    explicit operator bool() const { return isSuccess(); }
    bool operator!() const { return isError(); }

private:
    Result() : m_hasError(false) {}

    T m_value{};
    bool m_hasError;
    QString m_error;
};

// ============================================================================
// RAII Wrappers for Resource Cleanup
// ============================================================================

/**
 * @brief RAII wrapper for cleanup functions
 *
 * Usage:
 *   Logger::init(dir);
 *   ScopeGuard closeLog([] { Logger::shutdown(); });
 */
template<typename CleanupFunc>
class ScopeGuard {
public:
    explicit ScopeGuard(CleanupFunc func) : m_cleanup(std::move(func)) {}

    ~ScopeGuard() {
        m_cleanup();
    }

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

private:
    CleanupFunc m_cleanup;
};

// ============================================================================
// Error Logging & Reporting
// ============================================================================

/**
 * @brief Log and forward error to the operator (stderr)
 *
 * Usage:
 *   if (!image.loadStandard(path, &errorMsg)) {
 *       reportUserError("Image Load Failed", errorMsg);
 *       return 1;
 *   }
 */
void reportUserError(const QString& title, const QString& message);
void reportWarning(const QString& title, const QString& message);

// ============================================================================
// Validation Helpers
// ============================================================================

/**
 * @brief Validate file exists and is readable
 */
bool validateFileExists(const QString& path, QString* error = nullptr);

/**
 * @brief Validate ImageBuffer has valid dimensions and pixel data
 */
bool validateBuffer(const class ImageBuffer& buffer, QString* error = nullptr);

/**
 * @brief Validate ImageBuffer is square (width == height)
 */
bool validateSquare(const class ImageBuffer& buffer, QString* error = nullptr);

#endif // ERRORHANDLING_H
