#include <gtest/gtest.h>
#include "console/ConsoleReporter.h"

#include <QStringList>
#include <QTextStream>

using namespace Console;

namespace {

Analysis::ScoredCandidate candidate(const QString& name, double score)
{
    Analysis::ScoredCandidate c;
    c.fileName = name;
    c.path = "/out/" + name;
    c.score = score;
    c.params = Cipher::TransformParams::fromFileName(name);
    return c;
}

} // namespace

class ConsoleReporterTest : public ::testing::Test {
protected:
    QString m_text;
    QTextStream m_out{&m_text, QIODevice::WriteOnly};
    ConsoleReporter m_reporter{m_out};
};

TEST_F(ConsoleReporterTest, ReportsEmptySearchSpace)
{
    m_reporter.noCombinations();
    EXPECT_TRUE(m_text.contains("No parameter combinations"));
}

TEST_F(ConsoleReporterTest, RankingTableShowsTopRowsWithTwoDecimals)
{
    Analysis::RankingReport report;
    report.scanned = 8;
    report.skipped = 1;
    QVector<Analysis::ScoredCandidate> top;
    top << candidate("3_1_1.png", 12.345) << candidate("0_0_0.png", 45.0) << candidate("1_2_2.png", 46.5)
        << candidate("2_0_1.png", 50.0) << candidate("notes.png", 60.125);
    report.ranked = top;
    report.ranked << candidate("5_2_2.png", 99.0);

    m_reporter.ranking(report, top);

    EXPECT_TRUE(m_text.contains("the 5 most likely results"));
    EXPECT_EQ(m_text.count("   - file: "), 5);
    EXPECT_TRUE(m_text.contains("12.35"));
    EXPECT_TRUE(m_text.contains("45.00"));
    EXPECT_TRUE(m_text.contains("60.13") || m_text.contains("60.12"));
    EXPECT_TRUE(m_text.contains("k=3 a=1 b=1"));
    EXPECT_FALSE(m_text.contains("5_2_2.png"));
    EXPECT_TRUE(m_text.contains("1 of 8 files could not be read"));

    // Rows keep the ranked order
    EXPECT_LT(m_text.indexOf("3_1_1.png"), m_text.indexOf("0_0_0.png"));
}

TEST_F(ConsoleReporterTest, NoSkippedLineWhenAllFilesLoaded)
{
    Analysis::RankingReport report;
    report.scanned = 1;
    report.ranked << candidate("1_1_1.png", 3.0);
    m_reporter.ranking(report, report.ranked);
    EXPECT_FALSE(m_text.contains("could not be read"));
}

TEST_F(ConsoleReporterTest, ProgressBarCompletesOnFinalCount)
{
    m_reporter.progress("decoding", 1, 4);
    m_reporter.progress("decoding", 2, 4);
    m_reporter.progress("decoding", 4, 4);

    EXPECT_TRUE(m_text.contains("4/4 (100%)"));
    EXPECT_TRUE(m_text.contains(QString(40, '#')));
    EXPECT_TRUE(m_text.contains("2/4 (50%)"));
    EXPECT_TRUE(m_text.endsWith("\n"));
}

TEST_F(ConsoleReporterTest, ProgressIgnoresZeroTotal)
{
    m_reporter.progress("scoring", 0, 0);
    EXPECT_TRUE(m_text.isEmpty());
}

TEST_F(ConsoleReporterTest, SweepSummaryShowsElapsedAndFailures)
{
    Sweep::SweepStats stats;
    stats.total = 3;
    stats.written = 2;
    stats.failed = 1;
    stats.elapsedMs = 1234;
    stats.failures.insert("1_1_1.png", "disk full");

    m_reporter.sweepFinished(stats);
    EXPECT_TRUE(m_text.contains("Elapsed: 1.23 s"));
    EXPECT_TRUE(m_text.contains("Candidates written: 2/3"));
    EXPECT_TRUE(m_text.contains("1_1_1.png: disk full"));
}
