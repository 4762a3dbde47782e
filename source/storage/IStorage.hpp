#ifndef TODOLIST_STORAGE_ISTORAGE_HPP
#define TODOLIST_STORAGE_ISTORAGE_HPP

#include <QString>
#include <vector>

#include "Task.hpp"

// On-disk format of the backing store. Implementations throw TodoError.
class IStorage {
public:
    virtual ~IStorage() = default;

    // A missing file is an empty list, not an error.
    virtual std::vector<Task> loadTasks(const QString &path) const = 0;

    // Rewrites the whole file; never appends.
    virtual void saveTasks(const QString &path, const std::vector<Task> &tasks) = 0;
};

#endif // TODOLIST_STORAGE_ISTORAGE_HPP
