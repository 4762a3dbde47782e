#ifndef TODOLIST_EXPORT_MARKDOWNEXPORTER_HPP
#define TODOLIST_EXPORT_MARKDOWNEXPORTER_HPP

#include "IExporter.hpp"

class MarkdownExporter : public IExporter {
public:
    ExportFormat format() const override { return ExportFormat::Markdown; }
    QString fileExtension() const override { return QStringLiteral("md"); }
    QByteArray render(const std::vector<Task> &tasks) const override;
};

#endif // TODOLIST_EXPORT_MARKDOWNEXPORTER_HPP
