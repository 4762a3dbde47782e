#include "YamlExporter.hpp"

namespace {

// YAML only allows printable characters inside a scalar: C0/C1 controls
// (except TAB/LF/CR/NEL), U+FFFE, U+FFFF and unpaired surrogates must be
// written as escapes.
bool needsEscape(const QChar ch) {
    const char16_t code = ch.unicode();
    return code < 0x20 || code == 0x7f || (code >= 0x80 && code <= 0x9f) ||
           code == 0xfffe || code == 0xffff || ch.isSurrogate();
}

QString escapeCode(char16_t code) {
    if (code <= 0xff) {
        return QString("\\x%1").arg(static_cast<int>(code), 2, 16, QLatin1Char('0'));
    }
    return QString("\\u%1").arg(static_cast<int>(code), 4, 16, QLatin1Char('0'));
}

// Double-quoted YAML scalar; anything that could end the line or the
// scalar is escaped.
QString yamlQuoted(const QString &value) {
    QString out;
    out.reserve(value.size() + 2);
    out += QLatin1Char('"');

    for (qsizetype i = 0; i < value.size(); ++i) {
        const QChar ch = value.at(i);

        // A well-formed pair is a printable character outside the BMP.
        if (ch.isHighSurrogate() && i + 1 < value.size() && value.at(i + 1).isLowSurrogate()) {
            out += ch;
            out += value.at(++i);
            continue;
        }

        const char16_t code = ch.unicode();
        switch (code) {
        case u'\\': out += QLatin1String("\\\\"); break;
        case u'"':  out += QLatin1String("\\\""); break;
        case u'\n': out += QLatin1String("\\n"); break;
        case u'\r': out += QLatin1String("\\r"); break;
        case u'\t': out += QLatin1String("\\t"); break;
        case 0x85:   out += QLatin1String("\\N"); break;
        case 0x2028: out += QLatin1String("\\L"); break;
        case 0x2029: out += QLatin1String("\\P"); break;
        default:
            if (needsEscape(ch)) {
                out += escapeCode(code);
            } else {
                out += ch;
            }
        }
    }

    out += QLatin1Char('"');
    return out;
}

} // namespace

QByteArray YamlExporter::render(const std::vector<Task> &tasks) const {
    if (tasks.empty()) {
        return QByteArrayLiteral("[]\n");
    }

    QString out;
    for (const Task &task : tasks) {
        out += QLatin1String("- title: ") + yamlQuoted(task.title) + QLatin1Char('\n');
        out += QLatin1String("  completed: ");
        out += task.completed ? QLatin1String("true") : QLatin1String("false");
        out += QLatin1Char('\n');
        out += QLatin1String("  priority: ");
        out += task.priority ? priorityToString(*task.priority) : QStringLiteral("null");
        out += QLatin1Char('\n');
    }

    return out.toUtf8();
}
