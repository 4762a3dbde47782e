#ifndef TODOLIST_UTILS_ERRORHANDLER_HPP
#define TODOLIST_UTILS_ERRORHANDLER_HPP

#include <QDateTime>
#include <QStringList>
#include <QTextStream>
#include <exception>
#include <functional>

#include "Logger.hpp"
#include "TodoError.hpp"

enum ExitCode {
    ExitOk = 0,
    ExitUsage = 1,
    ExitInvalidInput = 2,
    ExitIndexOutOfRange = 3,
    ExitCorruptStore = 4,
    ExitIoError = 5,
    ExitExportError = 6,
    ExitInternal = 7,
};

inline int exitCodeFor(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidInput: return ExitInvalidInput;
    case ErrorKind::IndexOutOfRange: return ExitIndexOutOfRange;
    case ErrorKind::CorruptStore: return ExitCorruptStore;
    case ErrorKind::IoError: return ExitIoError;
    case ErrorKind::ExportError: return ExitExportError;
    }
    return ExitInternal;
}

using CommandHandler = std::function<int(const QStringList &args)>;

// Runs a command handler, logs its outcome and turns errors into an exit code
// plus one "error: ..." line on `err`.
inline CommandHandler wrapSafe(const char *commandName, CommandHandler fn, QTextStream &err) {
    return [commandName, fn, &err](const QStringList &args) -> int {
        const qint64 started = QDateTime::currentMSecsSinceEpoch();
        try {
            const int code = fn(args);
            qInfo(appCli) << "[DONE]" << commandName
                          << "| exit=" << code
                          << "| ms=" << (QDateTime::currentMSecsSinceEpoch() - started);
            return code;
        } catch (const TodoError &e) {
            qWarning(appCli) << "[FAIL]" << commandName
                             << "| kind=" << toString(e.kind())
                             << "| ms=" << (QDateTime::currentMSecsSinceEpoch() - started)
                             << "| what=" << e.message();
            err << "error: " << e.message() << Qt::endl;
            return exitCodeFor(e.kind());
        } catch (const std::exception &e) {
            qCritical(appCli) << "[EXC]" << commandName
                              << "| ms=" << (QDateTime::currentMSecsSinceEpoch() - started)
                              << "| what=" << e.what();
            err << "error: internal error: " << e.what() << Qt::endl;
            return ExitInternal;
        } catch (...) {
            qCritical(appCli) << "[EXC]" << commandName
                              << "| ms=" << (QDateTime::currentMSecsSinceEpoch() - started)
                              << "| unknown exception";
            err << "error: internal error: unknown exception" << Qt::endl;
            return ExitInternal;
        }
    };
}

#endif // TODOLIST_UTILS_ERRORHANDLER_HPP
