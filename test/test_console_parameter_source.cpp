#include <gtest/gtest.h>
#include "console/ArgumentParameterSource.h"
#include "console/ConsoleParameterSource.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <QTextStream>

using namespace Console;
using Sweep::ParameterRange;

class ConsoleParameterSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_tmp.isValid());
        m_image = QDir(m_tmp.path()).filePath("scrambled.png");
        QFile f(m_image);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write("x");
    }

    QTemporaryDir m_tmp;
    QString m_image;
    QString m_output;
};

TEST_F(ConsoleParameterSourceTest, RepromptsUntilPathExists)
{
    QString input = QString("\n/definitely/not/here.png\n\"%1\"\n").arg(m_image);
    QTextStream in(&input, QIODevice::ReadOnly);
    QTextStream out(&m_output, QIODevice::WriteOnly);

    ConsoleParameterSource source(in, out);
    QString path;
    QString err;
    ASSERT_TRUE(source.imagePath(path, &err)) << err.toStdString();
    EXPECT_EQ(path, m_image);
    EXPECT_EQ(m_output.count("Image path: "), 3);
    EXPECT_TRUE(m_output.contains("/definitely/not/here.png"));
}

TEST_F(ConsoleParameterSourceTest, RepromptsOnMalformedRanges)
{
    QString input("abc\n1-\n5-2\n0-5\n-1\n0-2\n-5 - 5\n");
    QTextStream in(&input, QIODevice::ReadOnly);
    QTextStream out(&m_output, QIODevice::WriteOnly);

    ConsoleParameterSource source(in, out);
    Sweep::SearchRanges ranges;
    QString err;
    ASSERT_TRUE(source.searchRanges(ranges, &err)) << err.toStdString();
    EXPECT_EQ(ranges.iterations, ParameterRange::span(0, 5));
    EXPECT_EQ(ranges.a, ParameterRange::single(-1));
    EXPECT_EQ(ranges.b, ParameterRange::span(0, 2));
    EXPECT_EQ(m_output.count("Invalid format"), 3);
}

TEST_F(ConsoleParameterSourceTest, RejectsNegativeIterationCount)
{
    QString input("-2\n3\n1\n1\n");
    QTextStream in(&input, QIODevice::ReadOnly);
    QTextStream out(&m_output, QIODevice::WriteOnly);

    ConsoleParameterSource source(in, out);
    Sweep::SearchRanges ranges;
    ASSERT_TRUE(source.searchRanges(ranges));
    EXPECT_EQ(ranges.iterations, ParameterRange::single(3));
    EXPECT_TRUE(m_output.contains("cannot be negative"));
}

TEST_F(ConsoleParameterSourceTest, RepromptsOnIterationCountTooLarge)
{
    QString input("0-3000000000\n0-4\n0\n0\n");
    QTextStream in(&input, QIODevice::ReadOnly);
    QTextStream out(&m_output, QIODevice::WriteOnly);

    ConsoleParameterSource source(in, out);
    Sweep::SearchRanges ranges;
    QString err;
    ASSERT_TRUE(source.searchRanges(ranges, &err)) << err.toStdString();
    EXPECT_EQ(ranges.iterations, ParameterRange::span(0, 4));
    EXPECT_EQ(ranges.a, ParameterRange::single(0));
    EXPECT_EQ(ranges.b, ParameterRange::single(0));
    EXPECT_TRUE(m_output.contains("too large"));
    EXPECT_EQ(m_output.count("iterations k"), 2);
}

TEST_F(ConsoleParameterSourceTest, ClosedInputIsAnError)
{
    QString input("abc\n");
    QTextStream in(&input, QIODevice::ReadOnly);
    QTextStream out(&m_output, QIODevice::WriteOnly);

    ConsoleParameterSource source(in, out);
    Sweep::SearchRanges ranges;
    QString err;
    EXPECT_FALSE(source.searchRanges(ranges, &err));
    EXPECT_TRUE(err.contains("closed"));

    QString path;
    EXPECT_FALSE(source.imagePath(path, &err));
}

TEST_F(ConsoleParameterSourceTest, PresetsSkipPrompts)
{
    QString input("7\n");
    QTextStream in(&input, QIODevice::ReadOnly);
    QTextStream out(&m_output, QIODevice::WriteOnly);

    ConsoleParameterSource source(in, out);
    source.presetImagePath(m_image);
    source.presetIterations(ParameterRange::span(1, 2));
    source.presetA(ParameterRange::single(3));

    QString path;
    ASSERT_TRUE(source.imagePath(path));
    EXPECT_EQ(path, m_image);

    Sweep::SearchRanges ranges;
    ASSERT_TRUE(source.searchRanges(ranges));
    EXPECT_EQ(ranges.iterations, ParameterRange::span(1, 2));
    EXPECT_EQ(ranges.a, ParameterRange::single(3));
    EXPECT_EQ(ranges.b, ParameterRange::single(7));
    EXPECT_FALSE(m_output.contains("Image path"));
    EXPECT_FALSE(m_output.contains("iterations k"));
}

TEST_F(ConsoleParameterSourceTest, ArgumentSourceFailsFast)
{
    ArgumentParameterSource good(m_image, "0-3", "1", "-2 - 2");
    QString path;
    Sweep::SearchRanges ranges;
    QString err;
    ASSERT_TRUE(good.imagePath(path, &err)) << err.toStdString();
    ASSERT_TRUE(good.searchRanges(ranges, &err)) << err.toStdString();
    EXPECT_EQ(ranges.b, ParameterRange::span(-2, 2));

    ArgumentParameterSource badRange(m_image, "0-3", "x", "1");
    EXPECT_FALSE(badRange.searchRanges(ranges, &err));
    EXPECT_TRUE(err.contains("--coef-a"));

    ArgumentParameterSource negativeK(m_image, "-1", "1", "1");
    EXPECT_FALSE(negativeK.searchRanges(ranges, &err));

    ArgumentParameterSource missing(QDir(m_tmp.path()).filePath("gone.png"), "1", "1", "1");
    EXPECT_FALSE(missing.imagePath(path, &err));
    EXPECT_TRUE(err.contains("gone.png"));
}

TEST_F(ConsoleParameterSourceTest, ArgumentSourceCompleteness)
{
    EXPECT_TRUE(ArgumentParameterSource::isComplete(m_image, "0-3", "1", "1"));
    EXPECT_FALSE(ArgumentParameterSource::isComplete(m_image, "0-3", "1", ""));
    EXPECT_FALSE(ArgumentParameterSource::isComplete("", "0-3", "1", "1"));
    EXPECT_FALSE(ArgumentParameterSource::isComplete(m_image, "  ", "1", "1"));
}

TEST(SearchRangesValidationTest, IterationBounds)
{
    QString err;
    EXPECT_TRUE(Sweep::SearchRanges::validateIterations(ParameterRange::span(0, 2147483647), &err));
    EXPECT_FALSE(Sweep::SearchRanges::validateIterations(ParameterRange::span(0, Q_INT64_C(2147483648)), &err));
    EXPECT_TRUE(err.contains("too large"));
    EXPECT_FALSE(Sweep::SearchRanges::validateIterations(ParameterRange::single(-3), &err));
    EXPECT_TRUE(err.contains("negative"));
    EXPECT_TRUE(Sweep::SearchRanges::validateIterations(ParameterRange::span(5, 1), &err));
}

TEST(PathInputTest, NormalizesPastedPaths)
{
    EXPECT_EQ(normalizePathInput("  \"C:\\images\\cat.png\"  "), QString("C:/images/cat.png"));
    EXPECT_EQ(normalizePathInput("'/tmp/a b.png'"), QString("/tmp/a b.png"));
    EXPECT_EQ(normalizePathInput("plain.png"), QString("plain.png"));
    EXPECT_EQ(normalizePathInput("   "), QString());
}
