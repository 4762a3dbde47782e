#include <QtCore/QFile>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QDebug>

#include <cstdio>
#include <memory>

#include "Logger.hpp"

Q_LOGGING_CATEGORY(appCore,    "todolist.core")
Q_LOGGING_CATEGORY(appStorage, "todolist.storage")
Q_LOGGING_CATEGORY(appExport,  "todolist.export")
Q_LOGGING_CATEGORY(appCli,     "todolist.cli")

namespace {

std::unique_ptr<QFile> g_logFile;
QMutex g_logMutex;
QtMessageHandler g_previousHandler = nullptr;

void messageHandler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    const QByteArray line = (qFormatLogMessage(type, ctx, msg) + '\n').toLocal8Bit();

    QMutexLocker lock(&g_logMutex);
    const bool fileSinkOpen = g_logFile && g_logFile->isOpen();

    if (echoesToStderr(type, fileSinkOpen)) {
        std::fwrite(line.constData(), 1, static_cast<std::size_t>(line.size()), stderr);
    }

    if (fileSinkOpen) {
        g_logFile->write(line);
        g_logFile->flush();
    }
}

} // namespace

bool echoesToStderr(QtMsgType type, bool fileSinkOpen) {
    if (!fileSinkOpen) {
        return true;
    }
    return type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg;
}

void initLogging(const QString& filePath) {
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{category} "
                       "(%{if-debug}%{function}:%{line}%{endif}): %{message}");

    QString openError;
    {
        QMutexLocker lock(&g_logMutex);
        if (!filePath.isEmpty() && !g_logFile) {
            auto file = std::make_unique<QFile>(filePath);
            if (file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                g_logFile = std::move(file);
            } else {
                openError = file->errorString();
            }
        }
    }

    const QtMessageHandler previous = qInstallMessageHandler(messageHandler);
    if (previous != messageHandler) {
        g_previousHandler = previous;
    }

    if (!openError.isEmpty()) {
        qWarning(appCore) << "Failed to open log file:" << filePath << openError;
    }

    qDebug(appCore) << "Logging initialized"
                    << (g_logFile ? QString("-> %1").arg(filePath) : "(stderr only)");
}

void shutdownLogging() {
    qInstallMessageHandler(g_previousHandler);
    g_previousHandler = nullptr;

    QMutexLocker lock(&g_logMutex);
    g_logFile.reset();
}

void setVerboseLogging(bool verbose) {
    if (verbose) {
        QLoggingCategory::setFilterRules("todolist.*=true\n");
        return;
    }

    QLoggingCategory::setFilterRules("todolist.*.debug=false\n"
                                     "todolist.*.info=false\n");
}
