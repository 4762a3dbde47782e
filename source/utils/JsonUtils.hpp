#ifndef TODOLIST_UTILS_JSONUTILS_HPP
#define TODOLIST_UTILS_JSONUTILS_HPP

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <initializer_list>
#include <optional>
#include <utility>
#include <vector>

#include "Task.hpp"

inline bool requireFields(const QJsonObject &obj,
                          std::initializer_list<const char *> keys,
                          QString *missing = nullptr) {
    for (const char *key : keys) {
        if (!obj.contains(key)) {
            if (missing) {
                *missing = key;
            }
            return false;
        }
    }
    return true;
}

inline QJsonArray toJsonArray(const std::vector<Task> &tasks) {
    QJsonArray items;
    for (const Task &task : tasks) {
        items.append(task.toJson());
    }
    return items;
}

// Same bytes for the backing store and for the JSON export.
inline QByteArray toJsonBytes(const std::vector<Task> &tasks) {
    return QJsonDocument(toJsonArray(tasks)).toJson(QJsonDocument::Indented);
}

// Validates one element of the persisted array:
//  - "title": non-empty string
//  - "completed": bool
//  - "priority": "High" | "Medium" | "Low" | null | absent
// Unknown keys are ignored.
inline std::optional<Task> parseTaskStrict(const QJsonValue &value,
                                           QString *outError = nullptr) {
    const auto fail = [outError](const QString &why) -> std::optional<Task> {
        if (outError) {
            *outError = why;
        }
        return std::nullopt;
    };

    if (!value.isObject()) {
        return fail(QStringLiteral("expected an object"));
    }

    const QJsonObject obj = value.toObject();

    QString missingKey;
    if (!requireFields(obj, {"title", "completed"}, &missingKey)) {
        return fail(QString("missing field '%1'").arg(missingKey));
    }

    const QJsonValue title = obj.value("title");
    if (!title.isString() || title.toString().trimmed().isEmpty()) {
        return fail(QStringLiteral("'title' must be a non-empty string"));
    }

    const QJsonValue completed = obj.value("completed");
    if (!completed.isBool()) {
        return fail(QStringLiteral("'completed' must be a boolean"));
    }

    Task task;
    task.title = title.toString();
    task.completed = completed.toBool();

    const QJsonValue priority = obj.value("priority");
    if (priority.isString()) {
        task.priority = priorityFromString(priority.toString());
        if (!task.priority) {
            return fail(QString("unknown priority '%1'").arg(priority.toString()));
        }
    } else if (!priority.isNull() && !priority.isUndefined()) {
        return fail(QStringLiteral("'priority' must be a string or null"));
    }

    return task;
}

inline std::optional<std::vector<Task>> parseTaskArray(const QByteArray &bytes,
                                                       QString *outError = nullptr) {
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        if (outError) {
            *outError = parseError.errorString();
        }
        return std::nullopt;
    }

    if (!doc.isArray()) {
        if (outError) {
            *outError = QStringLiteral("document root is not an array");
        }
        return std::nullopt;
    }

    const QJsonArray items = doc.array();
    std::vector<Task> tasks;
    tasks.reserve(static_cast<std::size_t>(items.size()));

    for (qsizetype i = 0; i < items.size(); ++i) {
        QString why;
        auto task = parseTaskStrict(items.at(i), &why);
        if (!task) {
            if (outError) {
                *outError = QString("element %1: %2").arg(i).arg(why);
            }
            return std::nullopt;
        }
        tasks.push_back(std::move(*task));
    }

    return tasks;
}

#endif // TODOLIST_UTILS_JSONUTILS_HPP
