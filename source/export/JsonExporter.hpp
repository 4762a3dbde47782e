#ifndef TODOLIST_EXPORT_JSONEXPORTER_HPP
#define TODOLIST_EXPORT_JSONEXPORTER_HPP

#include "IExporter.hpp"

class JsonExporter : public IExporter {
public:
    ExportFormat format() const override { return ExportFormat::Json; }
    QString fileExtension() const override { return QStringLiteral("json"); }
    QByteArray render(const std::vector<Task> &tasks) const override;
};

#endif // TODOLIST_EXPORT_JSONEXPORTER_HPP
