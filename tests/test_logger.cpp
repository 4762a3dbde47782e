#include <gtest/gtest.h>

#include <QTemporaryDir>

#include "Logger.hpp"
#include "TestHelpers.hpp"

TEST(LoggerTest, StderrGetsEverythingWithoutFileSink) {
    EXPECT_TRUE(echoesToStderr(QtDebugMsg, false));
    EXPECT_TRUE(echoesToStderr(QtInfoMsg, false));
    EXPECT_TRUE(echoesToStderr(QtWarningMsg, false));
}

TEST(LoggerTest, FileSinkKeepsOnlyWarningsOnStderr) {
    EXPECT_FALSE(echoesToStderr(QtDebugMsg, true));
    EXPECT_FALSE(echoesToStderr(QtInfoMsg, true));
    EXPECT_TRUE(echoesToStderr(QtWarningMsg, true));
    EXPECT_TRUE(echoesToStderr(QtCriticalMsg, true));
}

TEST(LoggerTest, WritesCategoryAndMessageToLogFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString logPath = dir.filePath(QStringLiteral("todo.log"));

    initLogging(logPath);
    qWarning(appStorage) << "disk is full";
    shutdownLogging();

    const QByteArray contents = readFile(logPath);
    EXPECT_TRUE(contents.contains("todolist.storage")) << contents.toStdString();
    EXPECT_TRUE(contents.contains("disk is full")) << contents.toStdString();
    EXPECT_TRUE(contents.contains("[warning]")) << contents.toStdString();
}

TEST(LoggerTest, ShutdownClosesFileSoLaterMessagesAreNotWritten) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString logPath = dir.filePath(QStringLiteral("todo.log"));

    initLogging(logPath);
    shutdownLogging();
    qWarning(appCore) << "after shutdown";

    EXPECT_FALSE(readFile(logPath).contains("after shutdown"));
}
