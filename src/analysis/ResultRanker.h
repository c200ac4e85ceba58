/**
 * @file ResultRanker.h
 * @brief Scores every candidate of a sweep directory and sorts them
 */

#ifndef ANALYSIS_RESULT_RANKER_H
#define ANALYSIS_RESULT_RANKER_H

#include "cipher/CatMapTypes.h"
#include <QString>
#include <QStringList>
#include <QThreadPool>
#include <QVector>
#include <functional>
#include <optional>

namespace Analysis {

struct ScoredCandidate {
    QString fileName;
    QString path;
    double score = 0.0;
    std::optional<Cipher::TransformParams> params;   ///< Parsed from fileName when it follows {k}_{a}_{b}
};

struct RankerParams {
    QStringList nameFilters = {"*.png"};
    int topCount = 5;
    int threads = 0;             ///< 0 = ResourceManager budget
};

struct RankingReport {
    int scanned = 0;             ///< Files matching the filters
    int skipped = 0;             ///< Files that could not be decoded
    QVector<ScoredCandidate> ranked;   ///< Ascending score, ties in name order
};

/**
 * @brief Loads and scores candidates in parallel, then ranks them
 *
 * Each file is read and scored on its own task; unreadable files are counted
 * as skipped. The result is sorted with std::stable_sort so candidates with
 * equal scores keep their directory (name) order.
 */
class ResultRanker {
public:
    /// (processed, total)
    using ProgressCallback = std::function<void(int processed, int total)>;

    explicit ResultRanker(const RankerParams& params = RankerParams());
    ~ResultRanker();

    const RankerParams& params() const { return m_params; }

    /**
     * @return false if the directory does not exist or cannot be listed;
     *         an empty directory returns true with an empty report
     */
    bool rank(const QString& directory, ProgressCallback progress = nullptr, QString* errorMsg = nullptr);

    const RankingReport& lastReport() const { return m_report; }

    /**
     * @brief First n ranked candidates (n < 0 uses RankerParams::topCount)
     */
    QVector<ScoredCandidate> top(int n = -1) const;

private:
    RankerParams m_params;
    RankingReport m_report;
    QThreadPool m_pool;
};

} // namespace Analysis

#endif // ANALYSIS_RESULT_RANKER_H
