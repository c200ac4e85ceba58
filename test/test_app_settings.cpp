#include <gtest/gtest.h>
#include "core/AppSettings.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

TEST(AppSettingsTest, DefaultsWithoutFile)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    AppSettings s;
    QString err;
    EXPECT_FALSE(AppSettings::load(QDir(tmp.path()).filePath("missing.ini"), s, &err));
    EXPECT_TRUE(err.contains("missing.ini"));
    EXPECT_EQ(s.outputDirName, "Arnold_Output");
    EXPECT_EQ(s.outputFormat, "png");
    EXPECT_TRUE(s.rankingEnabled);
    EXPECT_EQ(s.topCount, 5);
    EXPECT_EQ(s.maxThreads, 0);
    EXPECT_EQ(s.maxCombinations, 10000000);
    EXPECT_EQ(s.maxLogFiles, 5);
    EXPECT_TRUE(s.pauseOnExit);
}

TEST(AppSettingsTest, ReadsIniValues)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString path = QDir(tmp.path()).filePath("arnoldsweep.ini");
    {
        QFile f(path);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Text));
        f.write("[output]\n"
                "dir_name=Candidates\n"
                "format=BMP\n"
                "[ranking]\n"
                "enabled=false\n"
                "top_count=3\n"
                "[resources]\n"
                "max_threads=2\n"
                "[sweep]\n"
                "max_combinations=500\n"
                "[general]\n"
                "pause_on_exit=false\n");
    }

    AppSettings s;
    QString err;
    ASSERT_TRUE(AppSettings::load(path, s, &err)) << err.toStdString();
    EXPECT_EQ(s.outputDirName, "Candidates");
    EXPECT_EQ(s.outputFormat, "bmp");
    EXPECT_FALSE(s.rankingEnabled);
    EXPECT_EQ(s.topCount, 3);
    EXPECT_EQ(s.maxThreads, 2);
    EXPECT_EQ(s.maxCombinations, 500);
    EXPECT_FALSE(s.pauseOnExit);
    EXPECT_EQ(s.maxLogFiles, 5);
}
