#include "SweepEngine.h"
#include "cipher/IteratedDecoder.h"
#include "core/ErrorHandling.h"
#include "core/Logger.h"
#include "core/ResourceManager.h"

#include <QAtomicInt>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QtConcurrent>
#include <algorithm>
#include <limits>
#include <mutex>

namespace Sweep {

SweepEngine::SweepEngine(const SweepParams& params)
    : m_params(params)
{
}

SweepEngine::~SweepEngine()
{
    m_pool.waitForDone();
}

QString SweepEngine::defaultOutputDir(const QString& imagePath, const QString& dirName)
{
    const QFileInfo fi(imagePath);
    return QDir(fi.absolutePath()).filePath(dirName.isEmpty() ? QString("Arnold_Output") : dirName);
}

int SweepEngine::workerCount() const
{
    if (m_params.threads > 0) return m_params.threads;
    return std::max(1, ResourceManager::instance().maxThreads());
}

bool SweepEngine::run(const ImageBuffer& source, ProgressCallback progress, QString* errorMsg)
{
    m_stats = SweepStats();

    if (!validateBuffer(source, errorMsg)) return false;
    if (!validateSquare(source, errorMsg)) return false;
    if (!m_params.ranges.validate(errorMsg)) return false;

    const qint64 total = m_params.ranges.combinationCount();
    m_stats.total = total;
    if (total == 0) {
        Logger::info(QString("Empty search space %1, nothing to do").arg(m_params.ranges.toString()), "Sweep");
        return true;
    }
    // Progress and the task list are int-indexed, whatever the configured limit
    const qint64 hardLimit = std::numeric_limits<int>::max();
    const qint64 limit = m_params.maxCombinations > 0 ? std::min(m_params.maxCombinations, hardLimit) : hardLimit;
    if (total > limit) {
        if (errorMsg) {
            *errorMsg = QString("Search space %1 has %2 combinations, more than the limit of %3 (sweep/max_combinations)")
                            .arg(m_params.ranges.toString()).arg(total).arg(limit);
        }
        return false;
    }

    QDir outDir(m_params.outputDir);
    if (m_params.outputDir.isEmpty() || !outDir.mkpath(".")) {
        if (errorMsg) *errorMsg = formatError("Cannot create output directory", m_params.outputDir, "");
        return false;
    }

    const QVector<Cipher::TransformParams> triples = m_params.ranges.enumerate();
    const int count = static_cast<int>(triples.size());

    // Spare pool threads go to the row loop inside each decode
    const int poolThreads = workerCount();
    const int concurrent = std::min(count, poolThreads);
    const int innerThreads = std::max(1, poolThreads / std::max(1, concurrent));
    m_pool.setMaxThreadCount(poolThreads);

    const size_t bufferBytes = source.size() * 2;
    if (!ResourceManager::instance().isMemorySafe(bufferBytes * static_cast<size_t>(concurrent))) {
        Logger::warning(QString("Sweep may exceed the memory limit (%1 workers x %2 bytes)")
                            .arg(concurrent).arg(bufferBytes), "Sweep");
    }

    Logger::info(QString("Sweeping %1 combinations (%2) on %3 workers, %4 row threads each -> %5")
                     .arg(count).arg(m_params.ranges.toString()).arg(concurrent).arg(innerThreads)
                     .arg(outDir.absolutePath()), "Sweep");

    const QString format = m_params.format.isEmpty() ? QString("png") : m_params.format;
    const int step = std::max(1, count / 100);

    QAtomicInt completed(0);
    QAtomicInt written(0);
    std::mutex progressMutex;
    int lastReported = 0;
    std::mutex failureMutex;

    QElapsedTimer timer;
    timer.start();

    QtConcurrent::blockingMap(&m_pool, triples, [&](const Cipher::TransformParams& p) {
        const QString name = p.fileName(format);
        const QString path = outDir.filePath(name);

        const ImageBuffer candidate = Cipher::decode(source, p, innerThreads);
        QString saveError;
        if (candidate.isValid() && candidate.save(path, format, &saveError)) {
            written.fetchAndAddRelaxed(1);
        } else {
            if (saveError.isEmpty()) saveError = QString("decode produced no image");
            Logger::warning(QString("Candidate %1 not written: %2").arg(name, saveError), "Sweep");
            std::lock_guard<std::mutex> lock(failureMutex);
            m_stats.failures.insert(name, saveError);
        }

        completed.fetchAndAddOrdered(1);
        if (progress) {
            // Read under the lock so reported values never go backwards
            std::lock_guard<std::mutex> lock(progressMutex);
            const int done = completed.loadAcquire();
            if (done > lastReported && (done - lastReported >= step || done == count)) {
                lastReported = done;
                progress(done, count);
            }
        }
    });

    m_stats.elapsedMs = timer.elapsed();
    m_stats.written = written.loadRelaxed();
    m_stats.failed = m_stats.failures.size();

    Logger::info(QString("Sweep finished: %1 written, %2 failed in %3 ms")
                     .arg(m_stats.written).arg(m_stats.failed).arg(m_stats.elapsedMs), "Sweep");
    return true;
}

} // namespace Sweep
