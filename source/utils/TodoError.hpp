#ifndef TODOLIST_UTILS_TODOERROR_HPP
#define TODOLIST_UTILS_TODOERROR_HPP

#include <QString>
#include <stdexcept>

enum class ErrorKind {
    InvalidInput,
    IndexOutOfRange,
    CorruptStore,
    IoError,
    ExportError,
};

inline const char *toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidInput: return "InvalidInput";
    case ErrorKind::IndexOutOfRange: return "IndexOutOfRange";
    case ErrorKind::CorruptStore: return "CorruptStore";
    case ErrorKind::IoError: return "IoError";
    case ErrorKind::ExportError: return "ExportError";
    }
    return "Unknown";
}

// Every failure the core reports to the command layer.
class TodoError : public std::runtime_error {
public:
    TodoError(ErrorKind kind, const QString &message)
        : std::runtime_error(message.toStdString()), m_kind(kind), m_message(message) {}

    ErrorKind kind() const noexcept { return m_kind; }
    const QString &message() const noexcept { return m_message; }

private:
    ErrorKind m_kind;
    QString m_message;
};

#endif // TODOLIST_UTILS_TODOERROR_HPP
