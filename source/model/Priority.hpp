#ifndef TODOLIST_MODEL_PRIORITY_HPP
#define TODOLIST_MODEL_PRIORITY_HPP

#include <QString>
#include <optional>

enum class Priority {
    High,
    Medium,
    Low,
};

// Tag used in every serialized form (JSON, CSV, YAML, Markdown).
inline QString priorityToString(Priority priority) {
    switch (priority) {
    case Priority::High: return QStringLiteral("High");
    case Priority::Medium: return QStringLiteral("Medium");
    case Priority::Low: return QStringLiteral("Low");
    }
    return QString();
}

// Case-insensitive; "high", " HIGH " and "High" all map to Priority::High.
inline std::optional<Priority> priorityFromString(const QString &text) {
    const QString tag = text.trimmed();

    if (tag.compare(QLatin1String("high"), Qt::CaseInsensitive) == 0) {
        return Priority::High;
    }
    if (tag.compare(QLatin1String("medium"), Qt::CaseInsensitive) == 0) {
        return Priority::Medium;
    }
    if (tag.compare(QLatin1String("low"), Qt::CaseInsensitive) == 0) {
        return Priority::Low;
    }

    return std::nullopt;
}

#endif // TODOLIST_MODEL_PRIORITY_HPP
