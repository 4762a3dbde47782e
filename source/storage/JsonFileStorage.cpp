#include "JsonFileStorage.hpp"

#include <QFile>
#include <QFileInfo>

#include "FileUtils.hpp"
#include "JsonUtils.hpp"
#include "Logger.hpp"
#include "TodoError.hpp"

std::vector<Task> JsonFileStorage::loadTasks(const QString &path) const {
    if (!QFileInfo::exists(path)) {
        qInfo(appStorage) << "No store at" << path << "- starting empty";
        return {};
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qCritical(appStorage) << "open:" << path << file.errorString();
        throw TodoError(ErrorKind::IoError,
                        QString("cannot read '%1': %2").arg(path, file.errorString()));
    }

    const QByteArray bytes = file.readAll();

    QString parseError;
    auto tasks = parseTaskArray(bytes, &parseError);
    if (!tasks) {
        qCritical(appStorage) << "corrupt store:" << path << parseError;
        throw TodoError(ErrorKind::CorruptStore,
                        QString("store '%1' is corrupt: %2").arg(path, parseError));
    }

    qInfo(appStorage) << "Loaded" << tasks->size() << "tasks from" << path;
    return std::move(*tasks);
}

void JsonFileStorage::saveTasks(const QString &path, const std::vector<Task> &tasks) {
    QString writeError;
    if (!writeAtomically(path, toJsonBytes(tasks), &writeError)) {
        qCritical(appStorage) << "save:" << writeError;
        throw TodoError(ErrorKind::IoError, writeError);
    }

    qInfo(appStorage) << "Saved" << tasks.size() << "tasks to" << path;
}
