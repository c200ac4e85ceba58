#include "IteratedDecoder.h"
#include "ArnoldTransform.h"
#include <array>

namespace Cipher {

namespace {

using PassFn = bool (*)(const ImageBuffer&, ImageBuffer&, qint64, qint64, int);

ImageBuffer iterate(const ImageBuffer& image, const TransformParams& params, int threads, PassFn pass)
{
    if (params.iterations <= 0) {
        return image;
    }
    if (!image.isSquare()) {
        return ImageBuffer();
    }

    // buffers[current] holds the latest result, buffers[current ^ 1] is scratch
    std::array<ImageBuffer, 2> buffers = {
        image,
        ImageBuffer(image.width(), image.height(), image.channels())
    };
    int current = 0;

    for (int i = 0; i < params.iterations; ++i) {
        if (!pass(buffers[current], buffers[current ^ 1], params.a, params.b, threads)) {
            return ImageBuffer();
        }
        current ^= 1;
    }

    return std::move(buffers[current]);
}

} // namespace

ImageBuffer decode(const ImageBuffer& image, const TransformParams& params, int threads)
{
    return iterate(image, params, threads, &transformOnce);
}

ImageBuffer encode(const ImageBuffer& image, const TransformParams& params, int threads)
{
    return iterate(image, params, threads, &scrambleOnce);
}

} // namespace Cipher
