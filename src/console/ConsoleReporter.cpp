#include "ConsoleReporter.h"
#include <QDir>
#include <algorithm>

namespace Console {

namespace {

const int kBarWidth = 40;

QString rule() { return QString(70, '-'); }

QString seconds(qint64 ms) { return QString::number(ms / 1000.0, 'f', 2); }

QString formatElapsed(qint64 ms)
{
    const qint64 s = ms / 1000;
    return QString("%1:%2:%3")
        .arg(s / 3600, 2, 10, QChar('0'))
        .arg((s / 60) % 60, 2, 10, QChar('0'))
        .arg(s % 60, 2, 10, QChar('0'));
}

} // namespace

ConsoleReporter::ConsoleReporter(QTextStream& out)
    : m_out(out)
{
}

void ConsoleReporter::banner(const QString& version)
{
    m_out << QString(70, '=') << "\n"
          << "  ArnoldSweep " << version << "\n"
          << "  Arnold cat map brute-force decoder\n"
          << QString(70, '=') << "\n\n";
    m_out.flush();
}

void ConsoleReporter::imageLoaded(int width, int height)
{
    m_out << "Image loaded: " << width << "x" << height << "\n" << rule() << "\n";
    m_out.flush();
}

void ConsoleReporter::sweepStarting(const Sweep::SearchRanges& ranges, qint64 total, const QString& outputDir)
{
    m_out << rule() << "\n"
          << "Search space: " << ranges.toString() << " (" << total << " combinations)\n"
          << "Results will be saved in: " << QDir::toNativeSeparators(outputDir) << "\n\n";
    m_out.flush();
}

void ConsoleReporter::noCombinations()
{
    m_out << "No parameter combinations to try\n";
    m_out.flush();
}

void ConsoleReporter::progress(const QString& label, int done, int total)
{
    if (total <= 0) return;
    if (done <= 1 || !m_progressTimer.isValid()) {
        m_progressTimer.start();
        m_lastPercent = -1;
    }

    const int percent = static_cast<int>(static_cast<qint64>(done) * 100 / total);
    if (percent == m_lastPercent && done != total) return;
    m_lastPercent = percent;

    const int filled = static_cast<int>(static_cast<qint64>(done) * kBarWidth / total);
    const QString bar = QString(filled, '#') + QString(kBarWidth - filled, '-');

    m_out << "\r[" << formatElapsed(m_progressTimer.elapsed()) << "] [" << bar << "] "
          << done << "/" << total << " (" << percent << "%)  " << label;
    if (done >= total) {
        m_out << "\n";
        m_progressTimer.invalidate();
    }
    m_out.flush();
}

void ConsoleReporter::sweepFinished(const Sweep::SweepStats& stats)
{
    m_out << "\nElapsed: " << seconds(stats.elapsedMs) << " s\n"
          << "Candidates written: " << stats.written << "/" << stats.total << "\n";
    if (stats.failed > 0) {
        m_out << "Failed: " << stats.failed << "\n";
        int shown = 0;
        for (auto it = stats.failures.constBegin(); it != stats.failures.constEnd() && shown < 5; ++it, ++shown) {
            m_out << "   - " << it.key() << ": " << it.value() << "\n";
        }
        if (stats.failed > shown) {
            m_out << "   ... see the log for the remaining " << (stats.failed - shown) << "\n";
        }
    }
    m_out.flush();
}

void ConsoleReporter::rankingStarting(const QString& directory)
{
    m_out << "\nScoring candidates in " << QDir::toNativeSeparators(directory) << "\n";
    m_out.flush();
}

void ConsoleReporter::noCandidates(const QString& directory)
{
    m_out << "No candidate images found in " << QDir::toNativeSeparators(directory) << "\n";
    m_out.flush();
}

void ConsoleReporter::ranking(const Analysis::RankingReport& report, const QVector<Analysis::ScoredCandidate>& top)
{
    m_out << "\nAnalysis complete, the " << top.size()
          << " most likely results (lower score = smoother = more likely):\n"
          << rule() << "\n";

    for (const Analysis::ScoredCandidate& c : top) {
        m_out << "   - file: " << c.fileName.leftJustified(25) << " | score: "
              << QString::number(c.score, 'f', 2).rightJustified(10);
        if (c.params) {
            m_out << " | " << c.params->toString();
        }
        m_out << "\n";
    }
    m_out << rule() << "\n";
    if (report.skipped > 0) {
        m_out << report.skipped << " of " << report.scanned << " files could not be read and were skipped\n";
    }
    m_out.flush();
}

void ConsoleReporter::scrambled(const QString& outputPath, qint64 elapsedMs)
{
    m_out << "Scrambled image written to " << QDir::toNativeSeparators(outputPath)
          << " (" << seconds(elapsedMs) << " s)\n";
    m_out.flush();
}

void ConsoleReporter::done()
{
    m_out << "Done\n";
    m_out.flush();
}

void ConsoleReporter::pause(QTextStream& in)
{
    m_out << "\nPress Enter to exit...";
    m_out.flush();
    QString ignored;
    if (!in.readLineInto(&ignored)) {
        m_out << "\n";
        m_out.flush();
    }
}

} // namespace Console
