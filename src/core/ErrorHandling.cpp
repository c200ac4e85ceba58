#include "ErrorHandling.h"
#include "Logger.h"
#include "ImageBuffer.h"
#include <QFile>
#include <QFileInfo>
#include <iostream>

// ============================================================================
// Error Reporting to User
// ============================================================================

void reportUserError(const QString& title, const QString& message) {
    Logger::error(QString("%1 - %2").arg(title, message), "User");
    std::cerr << "[ERROR] " << title.toStdString() << ": " << message.toStdString() << std::endl;
}

void reportWarning(const QString& title, const QString& message) {
    Logger::warning(QString("%1 - %2").arg(title, message), "User");
    std::cerr << "[WARNING] " << title.toStdString() << ": " << message.toStdString() << std::endl;
}

// ============================================================================
// Validation Helpers
// ============================================================================

bool validateFileExists(const QString& path, QString* error) {
    if (path.isEmpty()) {
        if (error) *error = "File path cannot be empty";
        return false;
    }

    QFileInfo info(path);
    if (!info.exists()) {
        if (error) *error = formatError("File not found", path, "");
        return false;
    }

    if (!info.isFile()) {
        if (error) *error = formatError("Not a regular file", path, "");
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) *error = formatError("Cannot open file", path, file.errorString());
        return false;
    }
    file.close();

    return true;
}

bool validateBuffer(const ImageBuffer& buffer, QString* error) {
    if (buffer.width() <= 0 || buffer.height() <= 0 || buffer.channels() <= 0) {
        if (error) *error = QString("Invalid buffer dimensions: %1x%2 channels=%3")
            .arg(buffer.width())
            .arg(buffer.height())
            .arg(buffer.channels());
        return false;
    }

    if (!buffer.isValid()) {
        if (error) *error = "ImageBuffer has no pixel data";
        return false;
    }

    return true;
}

bool validateSquare(const ImageBuffer& buffer, QString* error) {
    if (!validateBuffer(buffer, error)) {
        return false;
    }

    if (!buffer.isSquare()) {
        if (error) *error = QString("The Arnold transform requires a square image, got %1x%2")
            .arg(buffer.width())
            .arg(buffer.height());
        return false;
    }

    return true;
}
