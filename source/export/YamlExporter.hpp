#ifndef TODOLIST_EXPORT_YAMLEXPORTER_HPP
#define TODOLIST_EXPORT_YAMLEXPORTER_HPP

#include "IExporter.hpp"

class YamlExporter : public IExporter {
public:
    ExportFormat format() const override { return ExportFormat::Yaml; }
    QString fileExtension() const override { return QStringLiteral("yaml"); }
    QByteArray render(const std::vector<Task> &tasks) const override;
};

#endif // TODOLIST_EXPORT_YAMLEXPORTER_HPP
