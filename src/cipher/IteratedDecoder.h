/**
 * @file IteratedDecoder.h
 * @brief k-fold application of the cat map with a fixed pair of buffers
 */

#ifndef CIPHER_ITERATED_DECODER_H
#define CIPHER_ITERATED_DECODER_H

#include "CatMapTypes.h"
#include "ImageBuffer.h"

namespace Cipher {

/**
 * @brief Undo params.iterations forward applications of the map
 *
 * k == 0 returns a copy of the input. Otherwise exactly two buffers are
 * allocated up front and swap roles after every pass, so a long run never
 * reallocates.
 *
 * @param image Square source image
 * @param threads OpenMP team size for each pass (0 = OpenMP default)
 * @return Decoded candidate; an empty buffer if image is not square
 */
ImageBuffer decode(const ImageBuffer& image, const TransformParams& params, int threads = 0);

/**
 * @brief Apply the forward map params.iterations times (inverse of decode())
 */
ImageBuffer encode(const ImageBuffer& image, const TransformParams& params, int threads = 0);

} // namespace Cipher

#endif // CIPHER_ITERATED_DECODER_H
