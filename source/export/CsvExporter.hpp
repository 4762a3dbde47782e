#ifndef TODOLIST_EXPORT_CSVEXPORTER_HPP
#define TODOLIST_EXPORT_CSVEXPORTER_HPP

#include "IExporter.hpp"

class CsvExporter : public IExporter {
public:
    ExportFormat format() const override { return ExportFormat::Csv; }
    QString fileExtension() const override { return QStringLiteral("csv"); }
    QByteArray render(const std::vector<Task> &tasks) const override;
};

#endif // TODOLIST_EXPORT_CSVEXPORTER_HPP
