#ifndef ARNOLDSWEEP_TEST_IMAGES_H
#define ARNOLDSWEEP_TEST_IMAGES_H

#include "ImageBuffer.h"
#include <algorithm>
#include <array>
#include <vector>

namespace TestImages {

// R = row*30, G = col*30, B = (row+col)*15. Every pixel is distinct and every
// neighbour pair differs by exactly 45, so the smoothness score is 45.
inline ImageBuffer gradient(int n)
{
    ImageBuffer img(n, n);
    for (int r = 0; r < n; ++r) {
        for (int c = 0; c < n; ++c) {
            uint8_t* p = img.pixel(c, r);
            p[0] = static_cast<uint8_t>(r * 30);
            p[1] = static_cast<uint8_t>(c * 30);
            p[2] = static_cast<uint8_t>((r + c) * 15);
        }
    }
    return img;
}

// Red channel holds the row-major index, handy for checking single pixels
inline ImageBuffer indexed(int n)
{
    ImageBuffer img(n, n);
    for (int r = 0; r < n; ++r) {
        for (int c = 0; c < n; ++c) {
            uint8_t* p = img.pixel(c, r);
            p[0] = static_cast<uint8_t>(r * n + c);
            p[1] = static_cast<uint8_t>(255 - r);
            p[2] = static_cast<uint8_t>(c * 7);
        }
    }
    return img;
}

inline ImageBuffer uniform(int w, int h, uint8_t value)
{
    ImageBuffer img(w, h);
    std::fill(img.data().begin(), img.data().end(), value);
    return img;
}

inline std::vector<std::array<uint8_t, 3>> sortedPixels(const ImageBuffer& img)
{
    std::vector<std::array<uint8_t, 3>> out;
    for (int y = 0; y < img.height(); ++y) {
        for (int x = 0; x < img.width(); ++x) {
            const uint8_t* p = img.pixel(x, y);
            out.push_back({p[0], p[1], p[2]});
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace TestImages

#endif // ARNOLDSWEEP_TEST_IMAGES_H
