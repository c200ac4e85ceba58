#ifndef CONSOLE_CONSOLE_REPORTER_H
#define CONSOLE_CONSOLE_REPORTER_H

#include "analysis/ResultRanker.h"
#include "sweep/SweepEngine.h"
#include <QElapsedTimer>
#include <QTextStream>

namespace Console {

/**
 * @brief Everything the user sees on stdout
 *
 * Errors are not printed here; they go through reportUserError().
 */
class ConsoleReporter {
public:
    explicit ConsoleReporter(QTextStream& out);

    void banner(const QString& version);
    void imageLoaded(int width, int height);
    void sweepStarting(const Sweep::SearchRanges& ranges, qint64 total, const QString& outputDir);
    void noCombinations();

    /**
     * @brief Redraw the progress bar in place; finishes the line at total
     */
    void progress(const QString& label, int done, int total);

    void sweepFinished(const Sweep::SweepStats& stats);
    void rankingStarting(const QString& directory);
    void noCandidates(const QString& directory);
    void ranking(const Analysis::RankingReport& report, const QVector<Analysis::ScoredCandidate>& top);
    void scrambled(const QString& outputPath, qint64 elapsedMs);
    void done();

    /**
     * @brief "Press Enter to exit..." and wait for a line (or end of input)
     */
    void pause(QTextStream& in);

private:
    QTextStream& m_out;
    QElapsedTimer m_progressTimer;
    int m_lastPercent = -1;
};

} // namespace Console

#endif // CONSOLE_CONSOLE_REPORTER_H
