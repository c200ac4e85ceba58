#ifndef IMAGEBUFFER_H
#define IMAGEBUFFER_H

#include <vector>
#include <cstdint>
#include <cstddef>
#include <QImage>
#include <QString>

/**
 * @brief Owned 8-bit RGB pixel grid
 *
 * Samples are interleaved (R, G, B) and stored row-major, so row y starts at
 * scanLine(y) and pixel (x, y) at pixel(x, y). Everything the sweep touches
 * is 3 channels; other layouts are converted on load.
 */
class ImageBuffer {
public:
    static constexpr int kChannels = 3;

    ImageBuffer();
    ImageBuffer(int width, int height, int channels = kChannels);
    ~ImageBuffer();

    ImageBuffer(const ImageBuffer& other) = default;
    ImageBuffer& operator=(const ImageBuffer& other) = default;
    ImageBuffer(ImageBuffer&& other) noexcept = default;
    ImageBuffer& operator=(ImageBuffer&& other) noexcept = default;

    // Reallocates only when the sample count changes; contents are zeroed.
    void resize(int width, int height, int channels = kChannels);

    // Raw Access
    const std::vector<uint8_t>& data() const { return m_data; }
    std::vector<uint8_t>& data() { return m_data; }

    uint8_t* scanLine(int y) { return m_data.data() + static_cast<size_t>(y) * m_width * m_channels; }
    const uint8_t* scanLine(int y) const { return m_data.data() + static_cast<size_t>(y) * m_width * m_channels; }

    uint8_t* pixel(int x, int y) { return scanLine(y) + static_cast<size_t>(x) * m_channels; }
    const uint8_t* pixel(int x, int y) const { return scanLine(y) + static_cast<size_t>(x) * m_channels; }

    int width() const { return m_width; }
    int height() const { return m_height; }
    int channels() const { return m_channels; }
    size_t size() const { return static_cast<size_t>(m_width) * m_height * m_channels; }
    size_t bytesPerLine() const { return static_cast<size_t>(m_width) * m_channels; }

    bool isValid() const { return !m_data.empty() && m_width > 0 && m_height > 0; }
    bool isSquare() const { return isValid() && m_width == m_height; }
    bool sameGeometry(const ImageBuffer& other) const {
        return m_width == other.m_width && m_height == other.m_height && m_channels == other.m_channels;
    }

    bool operator==(const ImageBuffer& other) const {
        return sameGeometry(other) && m_data == other.m_data;
    }
    bool operator!=(const ImageBuffer& other) const { return !(*this == other); }

    // I/O
    /**
     * @brief Load any raster Qt can decode, falling back to OpenCV
     * @param filePath Image file
     * @param errorMsg Reason on failure (optional)
     * @return true on success; the buffer is untouched on failure
     */
    bool loadStandard(const QString& filePath, QString* errorMsg = nullptr);

    /**
     * @brief Write the buffer through QImage
     * @param format Codec name ("png", "bmp", ...); empty = guess from suffix
     */
    bool save(const QString& filePath, const QString& format = QString(), QString* errorMsg = nullptr) const;

    bool fromQImage(const QImage& image);
    QImage toQImage() const;

private:
    bool loadWithOpenCV(const QString& filePath, QString* errorMsg);

    std::vector<uint8_t> m_data;
    int m_width = 0;
    int m_height = 0;
    int m_channels = kChannels;
};

#endif // IMAGEBUFFER_H
