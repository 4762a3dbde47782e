#include "TaskStore.hpp"

#include "JsonFileStorage.hpp"
#include "Logger.hpp"
#include "TodoError.hpp"

TaskStore::TaskStore(QString path, std::shared_ptr<IStorage> storage, std::vector<Task> tasks)
    : m_path(std::move(path)), m_storage(std::move(storage)), m_tasks(std::move(tasks)) {}

TaskStore TaskStore::load(const QString &path) {
    return load(path, std::make_shared<JsonFileStorage>());
}

TaskStore TaskStore::load(const QString &path, std::shared_ptr<IStorage> storage) {
    auto tasks = storage->loadTasks(path);
    qDebug(appCore) << "Store opened:" << path << "tasks=" << tasks.size();
    return TaskStore(path, std::move(storage), std::move(tasks));
}

void TaskStore::save() {
    save(m_path);
}

void TaskStore::save(const QString &path) {
    m_storage->saveTasks(path, m_tasks);
}

// ───────────────────────────────────────────────
// Mutations
// ───────────────────────────────────────────────

qsizetype TaskStore::add(const QString &title, std::optional<Priority> priority) {
    Task task = Task::create(title, priority);
    m_tasks.push_back(std::move(task));

    const qsizetype index = size() - 1;
    qInfo(appCore) << "Task added:" << title << "(index=" << index << ")";
    return index;
}

TaskView TaskStore::list(TaskFilter filter) const {
    return TaskView(m_tasks, filter);
}

const Task &TaskStore::at(qsizetype index) const {
    checkIndex(index);
    return m_tasks[static_cast<std::size_t>(index)];
}

void TaskStore::complete(qsizetype index) {
    checkIndex(index);

    Task &task = m_tasks[static_cast<std::size_t>(index)];
    if (task.completed) {
        qInfo(appCore) << "Task already completed (index=" << index << ")";
        return;
    }

    task.complete();
    qInfo(appCore) << "Task completed:" << task.title << "(index=" << index << ")";
}

void TaskStore::remove(qsizetype index) {
    checkIndex(index);

    const auto it = m_tasks.begin() + index;
    qInfo(appCore) << "Task removed:" << it->title << "(index=" << index << ")";
    m_tasks.erase(it);
}

void TaskStore::reset() {
    qInfo(appCore) << "All tasks cleared (" << m_tasks.size() << "removed)";
    m_tasks.clear();
}

void TaskStore::checkIndex(qsizetype index) const {
    if (index < 0 || index >= size()) {
        qWarning(appCore) << "Index" << index << "out of range, size=" << size();
        throw TodoError(ErrorKind::IndexOutOfRange,
                        QString("no task at index %1 (store holds %2)").arg(index).arg(size()));
    }
}
