#include <gtest/gtest.h>
#include <QCoreApplication>

// QThreadPool, QSettings and the image plugins expect an application object
int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
