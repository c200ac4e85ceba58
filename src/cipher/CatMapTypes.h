/**
 * @file CatMapTypes.h
 * @brief Parameter types for the generalized Arnold cat map
 */

#ifndef CIPHER_CATMAP_TYPES_H
#define CIPHER_CATMAP_TYPES_H

#include <QString>
#include <QtGlobal>
#include <optional>

namespace Cipher {

/**
 * @brief One point of the search cube
 *
 * The map is x' = A x (mod N) on (row, col) with A = [[1, b], [a, ab+1]];
 * det(A) = 1, so the map is a permutation for every integer a, b.
 */
struct TransformParams {
    int iterations = 0;   ///< k, number of forward applications to undo
    qint64 a = 0;
    qint64 b = 0;

    /**
     * @brief Candidate file name, "{k}_{a}_{b}.{ext}"
     */
    QString fileName(const QString& extension = "png") const;

    /**
     * @brief Inverse of fileName(); accepts any extension
     * @return std::nullopt when the base name is not three underscore-joined integers
     */
    static std::optional<TransformParams> fromFileName(const QString& fileName);

    QString toString() const;

    bool operator==(const TransformParams& o) const {
        return iterations == o.iterations && a == o.a && b == o.b;
    }
    bool operator!=(const TransformParams& o) const { return !(*this == o); }
};

/**
 * @brief Floor-style remainder, always in [0, n) for n > 0
 */
inline qint64 floorMod(qint64 value, qint64 n) {
    const qint64 r = value % n;
    return r < 0 ? r + n : r;
}

} // namespace Cipher

#endif // CIPHER_CATMAP_TYPES_H
