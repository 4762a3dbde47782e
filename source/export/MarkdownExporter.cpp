#include "MarkdownExporter.hpp"

QByteArray MarkdownExporter::render(const std::vector<Task> &tasks) const {
    QString out;

    for (const Task &task : tasks) {
        QString title = task.title;
        title.replace(QLatin1String("\r\n"), QLatin1String(" "));
        title.replace(QLatin1Char('\n'), QLatin1Char(' '));
        title.replace(QLatin1Char('\r'), QLatin1Char(' '));

        out += task.completed ? QLatin1String("- [x] ") : QLatin1String("- [ ] ");
        out += title;
        if (task.priority) {
            out += QLatin1String(" (") + priorityToString(*task.priority) + QLatin1Char(')');
        }
        out += QLatin1Char('\n');
    }

    return out.toUtf8();
}
