#include "CsvExporter.hpp"

namespace {

QString csvField(const QString &value) {
    const bool needsQuotes = value.contains(QLatin1Char(',')) ||
                             value.contains(QLatin1Char('"')) ||
                             value.contains(QLatin1Char('\n')) ||
                             value.contains(QLatin1Char('\r'));
    if (!needsQuotes) {
        return value;
    }

    QString quoted = value;
    quoted.replace(QLatin1String("\""), QLatin1String("\"\""));
    return QLatin1Char('"') + quoted + QLatin1Char('"');
}

} // namespace

QByteArray CsvExporter::render(const std::vector<Task> &tasks) const {
    QString out = QStringLiteral("title,completed,priority\n");

    for (const Task &task : tasks) {
        out += csvField(task.title);
        out += QLatin1Char(',');
        out += task.completed ? QLatin1String("true") : QLatin1String("false");
        out += QLatin1Char(',');
        if (task.priority) {
            out += priorityToString(*task.priority);
        }
        out += QLatin1Char('\n');
    }

    return out.toUtf8();
}
