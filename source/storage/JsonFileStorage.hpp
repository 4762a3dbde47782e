#ifndef TODOLIST_STORAGE_JSONFILESTORAGE_HPP
#define TODOLIST_STORAGE_JSONFILESTORAGE_HPP

#include "IStorage.hpp"

class JsonFileStorage : public IStorage {
public:
    std::vector<Task> loadTasks(const QString &path) const override;
    void saveTasks(const QString &path, const std::vector<Task> &tasks) override;
};

#endif // TODOLIST_STORAGE_JSONFILESTORAGE_HPP
