#ifndef ANALYSIS_SMOOTHNESS_SCORER_H
#define ANALYSIS_SMOOTHNESS_SCORER_H

#include "ImageBuffer.h"

namespace Analysis {

/**
 * @brief Mean absolute difference between neighbouring pixels
 *
 * For every pixel that has both a right and a bottom neighbour, the absolute
 * per-channel differences against both are summed (6 terms for RGB). The
 * total is divided by 2 * (W-1) * (H-1). Lower is smoother; a correctly
 * decoded natural image scores far below a scrambled one.
 *
 * The sum is kept in an unsigned 64-bit integer, so the result does not
 * depend on the thread count.
 *
 * @param threads OpenMP team size; 0 = OpenMP default
 * @return invalidScore() if width or height is below 2
 */
double smoothnessScore(const ImageBuffer& image, int threads = 0);

/// Sentinel for images too small to score; sorts last
double invalidScore();

} // namespace Analysis

#endif // ANALYSIS_SMOOTHNESS_SCORER_H
