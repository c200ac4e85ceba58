#include "ParameterRange.h"
#include <QRegularExpression>
#include <limits>

namespace Sweep {

Result<ParameterRange> ParameterRange::parse(const QString& text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return Result<ParameterRange>::failure("Empty input");
    }

    bool ok = false;
    const qint64 single = trimmed.toLongLong(&ok);
    if (ok) {
        return Result<ParameterRange>(ParameterRange::single(single));
    }

    // "lo-hi"; each bound may carry its own minus sign
    static const QRegularExpression rangePattern("^(-?\\d+)\\s*-\\s*(-?\\d+)$");
    const QRegularExpressionMatch m = rangePattern.match(trimmed);
    if (!m.hasMatch()) {
        return Result<ParameterRange>::failure(
            QString("'%1' is neither a single integer (e.g. '8') nor a range (e.g. '0-10')").arg(trimmed));
    }

    bool okLo = false, okHi = false;
    const qint64 lo = m.captured(1).toLongLong(&okLo);
    const qint64 hi = m.captured(2).toLongLong(&okHi);
    if (!okLo || !okHi) {
        return Result<ParameterRange>::failure(QString("'%1' is out of the 64-bit integer range").arg(trimmed));
    }
    if (lo > hi) {
        return Result<ParameterRange>::failure(QString("Range start %1 is greater than its end %2").arg(lo).arg(hi));
    }
    return Result<ParameterRange>(ParameterRange::span(lo, hi));
}

QString ParameterRange::toString() const
{
    if (isEmpty()) return QString("[empty %1..%2]").arg(lower).arg(upper);
    if (lower == upper) return QString::number(lower);
    return QString("%1-%2").arg(lower).arg(upper);
}

qint64 SearchRanges::combinationCount() const
{
    const qint64 ck = iterations.count();
    const qint64 ca = a.count();
    const qint64 cb = b.count();
    if (ck == 0 || ca == 0 || cb == 0) return 0;

    // Each count is at least 1 here; saturate instead of overflowing
    const qint64 maxValue = std::numeric_limits<qint64>::max();
    if (ca > maxValue / ck) return maxValue;
    const qint64 kxa = ck * ca;
    if (cb > maxValue / kxa) return maxValue;
    return kxa * cb;
}

bool SearchRanges::validateIterations(const ParameterRange& range, QString* errorMsg)
{
    if (range.isEmpty()) return true;
    if (range.lower < 0) {
        if (errorMsg) *errorMsg = QString("Iteration count cannot be negative (got %1)").arg(range.lower);
        return false;
    }
    if (range.upper > std::numeric_limits<int>::max()) {
        if (errorMsg) {
            *errorMsg = QString("Iteration count %1 is too large (at most %2)")
                            .arg(range.upper).arg(std::numeric_limits<int>::max());
        }
        return false;
    }
    return true;
}

bool SearchRanges::validate(QString* errorMsg) const
{
    return validateIterations(iterations, errorMsg);
}

QVector<Cipher::TransformParams> SearchRanges::enumerate() const
{
    QVector<Cipher::TransformParams> out;
    const qint64 total = combinationCount();
    if (total <= 0) return out;
    out.reserve(static_cast<qsizetype>(total));

    for (qint64 k = iterations.lower; k <= iterations.upper; ++k) {
        for (qint64 av = a.lower; av <= a.upper; ++av) {
            for (qint64 bv = b.lower; bv <= b.upper; ++bv) {
                Cipher::TransformParams p;
                p.iterations = static_cast<int>(k);
                p.a = av;
                p.b = bv;
                out.append(p);
                if (bv == b.upper) break;   // upper may be INT64_MAX
            }
            if (av == a.upper) break;
        }
        if (k == iterations.upper) break;
    }
    return out;
}

QString SearchRanges::toString() const
{
    return QString("k=%1 a=%2 b=%3").arg(iterations.toString(), a.toString(), b.toString());
}

} // namespace Sweep
