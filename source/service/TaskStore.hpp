#ifndef TODOLIST_SERVICE_TASKSTORE_HPP
#define TODOLIST_SERVICE_TASKSTORE_HPP

#include <QString>
#include <memory>
#include <optional>
#include <vector>

#include "IStorage.hpp"
#include "TaskView.hpp"

// Ordered task list bound to one backing file. A task's identity is its
// zero-based position; removing shifts every later task down by one.
// Mutations stay in memory until save().
class TaskStore {
public:
    TaskStore(QString path, std::shared_ptr<IStorage> storage, std::vector<Task> tasks = {});

    // Missing file -> empty store. Throws CorruptStore / IoError.
    static TaskStore load(const QString &path);
    static TaskStore load(const QString &path, std::shared_ptr<IStorage> storage);

    // Throws IoError.
    void save();
    void save(const QString &path);

    // Returns the index of the new task. Throws InvalidInput on an empty title.
    qsizetype add(const QString &title, std::optional<Priority> priority = std::nullopt);

    TaskView list(TaskFilter filter = TaskFilter::All) const;

    // The three below throw IndexOutOfRange for index < 0 or index >= size().
    const Task &at(qsizetype index) const;
    void complete(qsizetype index);
    void remove(qsizetype index);

    void reset();

    const std::vector<Task> &tasks() const { return m_tasks; }
    qsizetype size() const { return static_cast<qsizetype>(m_tasks.size()); }
    bool isEmpty() const { return m_tasks.empty(); }
    const QString &path() const { return m_path; }

private:
    void checkIndex(qsizetype index) const;

    QString m_path;
    std::shared_ptr<IStorage> m_storage;
    std::vector<Task> m_tasks;
};

#endif // TODOLIST_SERVICE_TASKSTORE_HPP
