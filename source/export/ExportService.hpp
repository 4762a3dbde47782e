#ifndef TODOLIST_EXPORT_EXPORTSERVICE_HPP
#define TODOLIST_EXPORT_EXPORTSERVICE_HPP

#include <QString>
#include <memory>
#include <optional>
#include <vector>

#include "IExporter.hpp"

QString formatName(ExportFormat format);

// "json", "csv", "yaml"/"yml", "markdown"/"md"; case-insensitive.
std::optional<ExportFormat> exportFormatFromString(const QString &text);

// Same as above but throws ExportError for an unsupported tag.
ExportFormat parseExportFormat(const QString &text);

std::unique_ptr<IExporter> makeExporter(ExportFormat format);

// Renders `tasks` and atomically writes them to `destination`.
// Throws ExportError; never touches the tasks.
void exportTasks(const std::vector<Task> &tasks, const QString &destination, ExportFormat format);

#endif // TODOLIST_EXPORT_EXPORTSERVICE_HPP
