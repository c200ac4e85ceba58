#include "SmoothnessScorer.h"
#include <cstdint>
#include <cstdlib>
#include <limits>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace Analysis {

double invalidScore()
{
    return std::numeric_limits<double>::max();
}

double smoothnessScore(const ImageBuffer& image, int threads)
{
    const int w = image.width();
    const int h = image.height();
    if (w < 2 || h < 2 || !image.isValid()) {
        return invalidScore();
    }

    const int ch = image.channels();
    const size_t stride = image.bytesPerLine();
    const uint8_t* data = image.data().data();

#ifdef _OPENMP
    const int team = threads > 0 ? threads : omp_get_max_threads();
#else
    const int team = 1;
    Q_UNUSED(threads);
#endif

    unsigned long long total = 0;

    #pragma omp parallel for num_threads(team) schedule(static) reduction(+:total) if(team > 1)
    for (int y = 0; y < h - 1; ++y) {
        const uint8_t* row = data + static_cast<size_t>(y) * stride;
        const uint8_t* below = row + stride;
        unsigned long long rowSum = 0;
        for (int x = 0; x < w - 1; ++x) {
            const uint8_t* p = row + static_cast<size_t>(x) * ch;
            const uint8_t* right = p + ch;
            const uint8_t* down = below + static_cast<size_t>(x) * ch;
            for (int c = 0; c < ch; ++c) {
                rowSum += static_cast<unsigned>(std::abs(int(p[c]) - int(right[c])));
                rowSum += static_cast<unsigned>(std::abs(int(p[c]) - int(down[c])));
            }
        }
        total += rowSum;
    }

    const double pairs = 2.0 * static_cast<double>(w - 1) * static_cast<double>(h - 1);
    return static_cast<double>(total) / pairs;
}

} // namespace Analysis
