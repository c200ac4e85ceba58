/**
 * @file ArnoldTransform.h
 * @brief Single passes of the generalized Arnold cat map on square images
 */

#ifndef CIPHER_ARNOLD_TRANSFORM_H
#define CIPHER_ARNOLD_TRANSFORM_H

#include "ImageBuffer.h"
#include <QtGlobal>

namespace Cipher {

/**
 * @brief One inverse pass: undo a single forward application of the map
 *
 * For every destination (row, col):
 *   old_row = (row + b*col) mod N
 *   old_col = (a*row + (a*b+1)*col) mod N
 *   dst(x=col, y=row) = src(x=old_col, y=old_row)
 *
 * Rows are processed in parallel; each row only reads src and writes its own
 * slice of dst, so src and dst must be distinct buffers.
 *
 * @param src Square source image (read-only during the pass)
 * @param dst Destination, resized to src's geometry if needed
 * @param threads OpenMP team size for the row loop; 0 = OpenMP default
 * @return false if src is empty or not square (dst untouched)
 */
bool transformOnce(const ImageBuffer& src, ImageBuffer& dst, qint64 a, qint64 b, int threads = 0);

/**
 * @brief One forward pass of the map (the scramble transformOnce() undoes)
 *
 * dst(row, col) = src(((ab+1)*row - b*col) mod N, (-a*row + col) mod N),
 * which moves the pixel at q to A*q with A = [[1, b], [a, ab+1]].
 */
bool scrambleOnce(const ImageBuffer& src, ImageBuffer& dst, qint64 a, qint64 b, int threads = 0);

} // namespace Cipher

#endif // CIPHER_ARNOLD_TRANSFORM_H
