#include <gtest/gtest.h>

#include <QCoreApplication>

// QCommandLineParser::helpText() reads the application's arguments, so the
// suite runs inside a QCoreApplication.
int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
