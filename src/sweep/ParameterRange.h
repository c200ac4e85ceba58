/**
 * @file ParameterRange.h
 * @brief Inclusive integer ranges and the (k, a, b) search space
 */

#ifndef SWEEP_PARAMETER_RANGE_H
#define SWEEP_PARAMETER_RANGE_H

#include "cipher/CatMapTypes.h"
#include "core/ErrorHandling.h"
#include <QString>
#include <QVector>
#include <limits>

namespace Sweep {

/**
 * @brief Inclusive range [lower, upper]; a single value is [v, v]
 *
 * An inverted range (lower > upper) is empty rather than invalid, so an
 * upstream mistake degrades to "no parameter combinations".
 */
struct ParameterRange {
    qint64 lower = 0;
    qint64 upper = -1;

    static ParameterRange single(qint64 value) { return ParameterRange{value, value}; }
    static ParameterRange span(qint64 lo, qint64 hi) { return ParameterRange{lo, hi}; }

    /**
     * @brief Parse "8", "-3", "0-10" or "-5 - 5"
     *
     * Inverted ranges ("5-2") are rejected here; callers that need an empty
     * range build it with span().
     */
    static Result<ParameterRange> parse(const QString& text);

    bool isEmpty() const { return upper < lower; }
    /// Number of values, saturating at max qint64
    qint64 count() const {
        if (isEmpty()) return 0;
        const quint64 width = static_cast<quint64>(upper) - static_cast<quint64>(lower);
        const quint64 maxValue = static_cast<quint64>(std::numeric_limits<qint64>::max());
        return width >= maxValue ? std::numeric_limits<qint64>::max() : static_cast<qint64>(width + 1);
    }

    QString toString() const;

    bool operator==(const ParameterRange& o) const { return lower == o.lower && upper == o.upper; }
};

/**
 * @brief The three ranges of one sweep
 */
struct SearchRanges {
    ParameterRange iterations;
    ParameterRange a;
    ParameterRange b;

    /**
     * @brief Number of triples in the product, saturating at max qint64
     */
    qint64 combinationCount() const;

    /**
     * @brief k must lie in [0, INT_MAX]
     */
    static bool validateIterations(const ParameterRange& range, QString* errorMsg = nullptr);

    /**
     * @brief Extra constraints on top of ParameterRange::parse
     */
    bool validate(QString* errorMsg = nullptr) const;

    /**
     * @brief Cartesian product, k outermost, b innermost
     */
    QVector<Cipher::TransformParams> enumerate() const;

    QString toString() const;
};

} // namespace Sweep

#endif // SWEEP_PARAMETER_RANGE_H
