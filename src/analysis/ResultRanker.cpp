#include "ResultRanker.h"
#include "SmoothnessScorer.h"
#include "ImageBuffer.h"
#include "core/ErrorHandling.h"
#include "core/Logger.h"
#include "core/ResourceManager.h"

#include <QAtomicInt>
#include <QDir>
#include <QFileInfo>
#include <QtConcurrent>
#include <algorithm>
#include <mutex>
#include <vector>

namespace Analysis {

ResultRanker::ResultRanker(const RankerParams& params)
    : m_params(params)
{
}

ResultRanker::~ResultRanker()
{
    m_pool.waitForDone();
}

bool ResultRanker::rank(const QString& directory, ProgressCallback progress, QString* errorMsg)
{
    m_report = RankingReport();

    QDir dir(directory);
    if (directory.isEmpty() || !dir.exists()) {
        if (errorMsg) *errorMsg = formatError("Result directory not found", directory, "");
        return false;
    }
    if (!QFileInfo(dir.absolutePath()).isReadable()) {
        if (errorMsg) *errorMsg = formatError("Result directory is not readable", directory, "");
        return false;
    }

    const QStringList files = dir.entryList(m_params.nameFilters, QDir::Files | QDir::Readable, QDir::Name);
    const int total = static_cast<int>(files.size());
    m_report.scanned = total;
    if (total == 0) {
        Logger::info(QString("No candidates in %1").arg(dir.absolutePath()), "Ranker");
        return true;
    }

    const int threads = m_params.threads > 0 ? m_params.threads
                                             : std::max(1, ResourceManager::instance().maxThreads());
    m_pool.setMaxThreadCount(threads);

    // One slot per file so workers never touch shared state
    std::vector<ScoredCandidate> candidates(static_cast<size_t>(total));
    std::vector<char> loaded(static_cast<size_t>(total), 0);
    QVector<int> indices(total);
    for (int i = 0; i < total; ++i) indices[i] = i;

    QAtomicInt processed(0);
    std::mutex progressMutex;
    int lastReported = 0;
    const int step = std::max(1, total / 100);

    Logger::info(QString("Scoring %1 candidates in %2 on %3 threads").arg(total).arg(dir.absolutePath()).arg(threads),
                 "Ranker");

    QtConcurrent::blockingMap(&m_pool, indices, [&](int i) {
        ScoredCandidate& c = candidates[static_cast<size_t>(i)];
        c.fileName = files.at(i);
        c.path = dir.filePath(c.fileName);
        c.params = Cipher::TransformParams::fromFileName(c.fileName);

        ImageBuffer image;
        QString loadError;
        if (image.loadStandard(c.path, &loadError)) {
            c.score = smoothnessScore(image, 1);
            loaded[static_cast<size_t>(i)] = 1;
        } else {
            Logger::debug(QString("Skipping %1: %2").arg(c.fileName, loadError), "Ranker");
        }

        processed.fetchAndAddOrdered(1);
        if (progress) {
            std::lock_guard<std::mutex> lock(progressMutex);
            const int done = processed.loadAcquire();
            if (done > lastReported && (done - lastReported >= step || done == total)) {
                lastReported = done;
                progress(done, total);
            }
        }
    });

    m_report.ranked.reserve(total);
    for (int i = 0; i < total; ++i) {
        if (loaded[static_cast<size_t>(i)]) {
            m_report.ranked.append(candidates[static_cast<size_t>(i)]);
        } else {
            ++m_report.skipped;
        }
    }

    std::stable_sort(m_report.ranked.begin(), m_report.ranked.end(),
                     [](const ScoredCandidate& l, const ScoredCandidate& r) { return l.score < r.score; });

    Logger::info(QString("Ranked %1 candidates, %2 skipped").arg(m_report.ranked.size()).arg(m_report.skipped),
                 "Ranker");
    return true;
}

QVector<ScoredCandidate> ResultRanker::top(int n) const
{
    const int limit = n < 0 ? m_params.topCount : n;
    const int count = std::min(limit, static_cast<int>(m_report.ranked.size()));
    return m_report.ranked.mid(0, std::max(0, count));
}

} // namespace Analysis
