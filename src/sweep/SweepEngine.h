/**
 * @file SweepEngine.h
 * @brief Brute-force decode of every (k, a, b) triple in a search space
 */

#ifndef SWEEP_ENGINE_H
#define SWEEP_ENGINE_H

#include "ParameterRange.h"
#include "ImageBuffer.h"
#include <QMap>
#include <QString>
#include <QThreadPool>
#include <functional>

namespace Sweep {

/**
 * @brief Sweep configuration
 */
struct SweepParams {
    SearchRanges ranges;
    QString outputDir;                    ///< Candidates are written here
    QString format = "png";               ///< Extension and codec of every candidate
    int threads = 0;                      ///< Worker count; 0 = ResourceManager budget
    qint64 maxCombinations = 10000000;    ///< Refuse larger search spaces
};

/**
 * @brief Outcome of the last run()
 */
struct SweepStats {
    qint64 total = 0;
    int written = 0;
    int failed = 0;
    qint64 elapsedMs = 0;
    QMap<QString, QString> failures;      ///< Candidate file name -> reason
};

/**
 * @brief Decodes a source image with every triple and saves each candidate
 *
 * Triples are independent; they are dispatched with QtConcurrent::blockingMap
 * on a pool owned by the engine. A candidate that fails to save is recorded
 * in SweepStats::failures and does not stop the sweep.
 */
class SweepEngine {
public:
    /// (completed, total), called from worker threads under a mutex
    using ProgressCallback = std::function<void(int completed, int total)>;

    explicit SweepEngine(const SweepParams& params = SweepParams());
    ~SweepEngine();

    const SweepParams& params() const { return m_params; }

    /**
     * @brief Run the sweep
     * @param source Square image to decode
     * @param progress Optional progress callback
     * @param errorMsg Reason on a fatal error (invalid source, oversized
     *        search space, output directory not creatable)
     * @return true when every triple was attempted; an empty search space
     *         also returns true with lastStats().total == 0
     */
    bool run(const ImageBuffer& source, ProgressCallback progress = nullptr, QString* errorMsg = nullptr);

    const SweepStats& lastStats() const { return m_stats; }

    /**
     * @brief <directory of imagePath>/<dirName>
     */
    static QString defaultOutputDir(const QString& imagePath, const QString& dirName = "Arnold_Output");

private:
    int workerCount() const;

    SweepParams m_params;
    SweepStats m_stats;
    QThreadPool m_pool;
};

} // namespace Sweep

#endif // SWEEP_ENGINE_H
