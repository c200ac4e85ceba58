#include "ArnoldTransform.h"
#include "CatMapTypes.h"
#include <cstring>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace Cipher {

namespace {

inline int teamSize(int threads) {
#ifdef _OPENMP
    return threads > 0 ? threads : omp_get_max_threads();
#else
    Q_UNUSED(threads);
    return 1;
#endif
}

// Shared row kernel. For destination row `row` the source coordinates start at
// (rowStart, colStart) for col = 0 and advance by (rowStep, colStep) per column.
// All four values are already reduced to [0, N), so the walk needs no multiply
// and no signed remainder in the inner loop.
inline void remapRow(const ImageBuffer& src, uint8_t* out, qint64 n,
                     qint64 rowStart, qint64 colStart, qint64 rowStep, qint64 colStep)
{
    const int ch = src.channels();
    qint64 srcRow = rowStart;
    qint64 srcCol = colStart;
    for (qint64 col = 0; col < n; ++col) {
        const uint8_t* in = src.pixel(static_cast<int>(srcCol), static_cast<int>(srcRow));
        std::memcpy(out + col * ch, in, ch);

        srcRow += rowStep;
        if (srcRow >= n) srcRow -= n;
        srcCol += colStep;
        if (srcCol >= n) srcCol -= n;
    }
}

} // namespace

bool transformOnce(const ImageBuffer& src, ImageBuffer& dst, qint64 a, qint64 b, int threads)
{
    if (!src.isSquare()) return false;
    Q_ASSERT(&src != &dst);

    if (!dst.sameGeometry(src)) {
        dst.resize(src.width(), src.height(), src.channels());
    }

    const int size = src.width();
    const qint64 n = size;

    // Reduce the coefficients first: every product below stays under N^2.
    const qint64 am = floorMod(a, n);
    const qint64 bm = floorMod(b, n);
    const qint64 cm = floorMod(am * bm + 1, n);   // (ab + 1) mod N

    const int team = teamSize(threads);

    #pragma omp parallel for num_threads(team) schedule(static) if(team > 1)
    for (int row = 0; row < size; ++row) {
        // old_row = row + b*col, old_col = a*row + (ab+1)*col
        remapRow(src, dst.scanLine(row), n,
                 floorMod(row, n), floorMod(am * row, n),
                 bm, cm);
    }
    return true;
}

bool scrambleOnce(const ImageBuffer& src, ImageBuffer& dst, qint64 a, qint64 b, int threads)
{
    if (!src.isSquare()) return false;
    Q_ASSERT(&src != &dst);

    if (!dst.sameGeometry(src)) {
        dst.resize(src.width(), src.height(), src.channels());
    }

    const int size = src.width();
    const qint64 n = size;

    const qint64 am = floorMod(a, n);
    const qint64 bm = floorMod(b, n);
    const qint64 cm = floorMod(am * bm + 1, n);
    const qint64 negB = floorMod(-bm, n);

    const int team = teamSize(threads);

    #pragma omp parallel for num_threads(team) schedule(static) if(team > 1)
    for (int row = 0; row < size; ++row) {
        // orig_row = (ab+1)*row - b*col, orig_col = -a*row + col
        remapRow(src, dst.scanLine(row), n,
                 floorMod(cm * row, n), floorMod(-am * row, n),
                 negB, 1 % n);
    }
    return true;
}

} // namespace Cipher
