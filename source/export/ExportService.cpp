#include "ExportService.hpp"

#include "CsvExporter.hpp"
#include "FileUtils.hpp"
#include "JsonExporter.hpp"
#include "Logger.hpp"
#include "MarkdownExporter.hpp"
#include "TodoError.hpp"
#include "YamlExporter.hpp"

QString formatName(ExportFormat format) {
    switch (format) {
    case ExportFormat::Json: return QStringLiteral("json");
    case ExportFormat::Csv: return QStringLiteral("csv");
    case ExportFormat::Yaml: return QStringLiteral("yaml");
    case ExportFormat::Markdown: return QStringLiteral("markdown");
    }
    return QString();
}

std::optional<ExportFormat> exportFormatFromString(const QString &text) {
    const QString tag = text.trimmed().toLower();

    if (tag == QLatin1String("json")) {
        return ExportFormat::Json;
    }
    if (tag == QLatin1String("csv")) {
        return ExportFormat::Csv;
    }
    if (tag == QLatin1String("yaml") || tag == QLatin1String("yml")) {
        return ExportFormat::Yaml;
    }
    if (tag == QLatin1String("markdown") || tag == QLatin1String("md")) {
        return ExportFormat::Markdown;
    }

    return std::nullopt;
}

ExportFormat parseExportFormat(const QString &text) {
    auto format = exportFormatFromString(text);
    if (!format) {
        throw TodoError(ErrorKind::ExportError,
                        QString("unsupported export format '%1'").arg(text));
    }
    return *format;
}

std::unique_ptr<IExporter> makeExporter(ExportFormat format) {
    switch (format) {
    case ExportFormat::Json: return std::make_unique<JsonExporter>();
    case ExportFormat::Csv: return std::make_unique<CsvExporter>();
    case ExportFormat::Yaml: return std::make_unique<YamlExporter>();
    case ExportFormat::Markdown: return std::make_unique<MarkdownExporter>();
    }

    throw TodoError(ErrorKind::ExportError, QStringLiteral("unsupported export format"));
}

void exportTasks(const std::vector<Task> &tasks, const QString &destination, ExportFormat format) {
    const auto exporter = makeExporter(format);
    const QByteArray bytes = exporter->render(tasks);

    QString writeError;
    if (!writeAtomically(destination, bytes, &writeError)) {
        qCritical(appExport) << "export" << formatName(format) << "failed:" << writeError;
        throw TodoError(ErrorKind::ExportError, writeError);
    }

    qInfo(appExport) << "Exported" << tasks.size() << "tasks as" << formatName(format)
                     << "to" << destination << "bytes=" << bytes.size();
}
