#ifndef TODOLIST_MODEL_TASK_HPP
#define TODOLIST_MODEL_TASK_HPP

#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <optional>

#include "Priority.hpp"
#include "TodoError.hpp"

struct Task {
    QString title;
    bool completed = false;
    std::optional<Priority> priority;

    // Title is checked here, not in the command layer: a whitespace-only title is rejected.
    static Task create(const QString &title, std::optional<Priority> priority = std::nullopt) {
        if (title.trimmed().isEmpty()) {
            throw TodoError(ErrorKind::InvalidInput,
                            QStringLiteral("Task title must not be empty"));
        }

        Task task;
        task.title = title;
        task.priority = priority;
        return task;
    }

    void complete() { completed = true; }

    QJsonObject toJson() const {
        return QJsonObject{{"title", title},
                           {"completed", completed},
                           {"priority", priority ? QJsonValue(priorityToString(*priority))
                                                 : QJsonValue(QJsonValue::Null)}};
    }

    bool operator==(const Task &other) const {
        return title == other.title && completed == other.completed &&
               priority == other.priority;
    }
    bool operator!=(const Task &other) const { return !(*this == other); }
};

#endif // TODOLIST_MODEL_TASK_HPP
