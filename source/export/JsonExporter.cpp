#include "JsonExporter.hpp"

#include "JsonUtils.hpp"

QByteArray JsonExporter::render(const std::vector<Task> &tasks) const {
    return toJsonBytes(tasks);
}
