#ifndef TODOLIST_EXPORT_IEXPORTER_HPP
#define TODOLIST_EXPORT_IEXPORTER_HPP

#include <QByteArray>
#include <QString>
#include <vector>

#include "Task.hpp"

enum class ExportFormat {
    Json,
    Csv,
    Yaml,
    Markdown,
};

// One implementation per output format. render() is pure: the same tasks
// always give the same bytes.
class IExporter {
public:
    virtual ~IExporter() = default;

    virtual ExportFormat format() const = 0;
    virtual QString fileExtension() const = 0;
    virtual QByteArray render(const std::vector<Task> &tasks) const = 0;
};

#endif // TODOLIST_EXPORT_IEXPORTER_HPP
