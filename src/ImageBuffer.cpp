#include "ImageBuffer.h"
#include "core/ErrorHandling.h"
#include "core/Logger.h"
#include <QFileInfo>
#include <QImageReader>
#include <QImageWriter>
#include <algorithm>
#include <cstring>
#include <opencv2/opencv.hpp>

ImageBuffer::ImageBuffer() {}

ImageBuffer::ImageBuffer(int width, int height, int channels) {
    resize(width, height, channels);
}

ImageBuffer::~ImageBuffer() {}

void ImageBuffer::resize(int width, int height, int channels) {
    m_width = std::max(0, width);
    m_height = std::max(0, height);
    m_channels = std::max(1, channels);
    m_data.assign(size(), 0);
}

bool ImageBuffer::fromQImage(const QImage& image) {
    if (image.isNull()) return false;

    const QImage rgb = image.convertToFormat(QImage::Format_RGB888);
    if (rgb.isNull()) return false;

    m_width = rgb.width();
    m_height = rgb.height();
    m_channels = kChannels;
    m_data.resize(size());

    // QImage pads scan lines to 4 bytes; copy row by row
    const size_t rowBytes = bytesPerLine();
    for (int y = 0; y < m_height; ++y) {
        std::memcpy(scanLine(y), rgb.constScanLine(y), rowBytes);
    }
    return true;
}

QImage ImageBuffer::toQImage() const {
    if (!isValid() || m_channels != kChannels) return QImage();

    // Wrap then copy so the QImage does not alias m_data
    QImage view(m_data.data(), m_width, m_height, static_cast<qsizetype>(bytesPerLine()), QImage::Format_RGB888);
    return view.copy();
}

bool ImageBuffer::loadStandard(const QString& filePath, QString* errorMsg) {
    QImageReader reader(filePath);
    reader.setAutoTransform(false);
    QImage img = reader.read();

    if (img.isNull()) {
        Logger::debug(QString("QImageReader failed for %1 (%2), trying OpenCV")
                          .arg(filePath, reader.errorString()), "ImageBuffer");
        return loadWithOpenCV(filePath, errorMsg);
    }

    if (!fromQImage(img)) {
        if (errorMsg) *errorMsg = formatError("Cannot convert image to RGB888", filePath, "");
        return false;
    }
    return true;
}

bool ImageBuffer::loadWithOpenCV(const QString& filePath, QString* errorMsg) {
    cv::Mat img;
    try {
        img = cv::imread(filePath.toStdString(), cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        if (errorMsg) *errorMsg = formatError("Failed to decode image", filePath, QString::fromStdString(e.what()));
        return false;
    }

    if (img.empty()) {
        if (errorMsg) *errorMsg = formatError("Failed to decode image", filePath, "unsupported or corrupt file");
        return false;
    }

    // IMREAD_COLOR always yields 8-bit BGR
    cv::Mat rgb;
    cv::cvtColor(img, rgb, cv::COLOR_BGR2RGB);

    m_width = rgb.cols;
    m_height = rgb.rows;
    m_channels = kChannels;
    m_data.resize(size());

    const size_t rowBytes = bytesPerLine();
    for (int y = 0; y < m_height; ++y) {
        std::memcpy(scanLine(y), rgb.ptr<uint8_t>(y), rowBytes);
    }
    return true;
}

bool ImageBuffer::save(const QString& filePath, const QString& format, QString* errorMsg) const {
    if (!isValid()) {
        if (errorMsg) *errorMsg = formatError("Cannot save empty image", filePath, "");
        return false;
    }

    QString codec = format;
    if (codec.isEmpty()) {
        codec = QFileInfo(filePath).suffix().toLower();
    }

    QImageWriter writer(filePath, codec.toLatin1());
    if (!writer.write(toQImage())) {
        if (errorMsg) *errorMsg = formatError("Failed to write image", filePath, writer.errorString());
        return false;
    }
    return true;
}
