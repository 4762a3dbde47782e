#ifndef TODOLIST_UTILS_LOGGER_HPP
#define TODOLIST_UTILS_LOGGER_HPP

#include <QtCore/QLoggingCategory>
#include <QtCore/QString>

Q_DECLARE_LOGGING_CATEGORY(appCore)
Q_DECLARE_LOGGING_CATEGORY(appStorage)
Q_DECLARE_LOGGING_CATEGORY(appExport)
Q_DECLARE_LOGGING_CATEGORY(appCli)

// Installs the todolist message handler. With a log file, debug/info lines go
// to the file only and stderr keeps just warnings and above, so command output
// on the terminal stays readable.
void initLogging(const QString& filePath = QString());

// Restores Qt's default handler and closes the log file.
void shutdownLogging();

bool echoesToStderr(QtMsgType type, bool fileSinkOpen);

// Warnings and above by default; verbose turns on todolist.* debug/info.
void setVerboseLogging(bool verbose);

#endif // TODOLIST_UTILS_LOGGER_HPP
