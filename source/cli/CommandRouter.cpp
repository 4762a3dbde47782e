#include "CommandRouter.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>

#include "Logger.hpp"
#include "TodoError.hpp"

namespace {

qsizetype parseIndex(const QString &text) {
    bool ok = false;
    const qlonglong index = text.trimmed().toLongLong(&ok);
    if (!ok) {
        throw TodoError(ErrorKind::InvalidInput,
                        QString("'%1' is not a task index").arg(text));
    }
    return static_cast<qsizetype>(index);
}

bool samePath(const QString &a, const QString &b) {
    return QFileInfo(a).absoluteFilePath() == QFileInfo(b).absoluteFilePath();
}

} // namespace

std::optional<Command> commandFromString(const QString &name) {
    static const std::map<QString, Command> commands{
        {QStringLiteral("add"), Command::Add},
        {QStringLiteral("list"), Command::List},
        {QStringLiteral("complete"), Command::Complete},
        {QStringLiteral("remove"), Command::Remove},
        {QStringLiteral("reset"), Command::Reset},
        {QStringLiteral("export"), Command::Export},
    };

    const auto it = commands.find(name);
    if (it == commands.end()) {
        return std::nullopt;
    }
    return it->second;
}

QString defaultExportPath(const QString &storePath, const IExporter &exporter) {
    const QFileInfo info(storePath);
    const QString base = info.completeBaseName();
    const QString extension = exporter.fileExtension();

    const QString candidate = info.dir().filePath(base + QLatin1Char('.') + extension);
    if (!samePath(candidate, storePath)) {
        return candidate;
    }

    return info.dir().filePath(base + QLatin1String("-export.") + extension);
}

QString formatTaskLine(qsizetype index, const Task &task) {
    QString line = QString("%1: [%2] %3")
                       .arg(index)
                       .arg(task.completed ? QChar('x') : QChar(' '))
                       .arg(task.title);
    if (task.priority) {
        line += QLatin1String(" - priority ") + priorityToString(*task.priority);
    }
    return line;
}

CommandRouter::CommandRouter(QTextStream &out, QTextStream &err)
    : m_out(out), m_err(err) {}

std::optional<CliOptions> CommandRouter::parse(const QStringList &arguments, int *exitCode) {
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("A simple task manager"));
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);

    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption pathOption(QStringLiteral("path"),
                                        QStringLiteral("Path to the save file."),
                                        QStringLiteral("file"),
                                        QStringLiteral("todo.json"));
    const QCommandLineOption verboseOption({QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Log store operations to stderr."));
    const QCommandLineOption logFileOption(QStringLiteral("log-file"),
                                           QStringLiteral("Also append log output to <file>."),
                                           QStringLiteral("file"));
    parser.addOption(pathOption);
    parser.addOption(verboseOption);
    parser.addOption(logFileOption);
    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("add <title> [--priority high|medium|low]\n"
                       "list [--completed | --pending]\n"
                       "complete <index>\n"
                       "remove <index>\n"
                       "reset\n"
                       "export --format json|csv|yaml|markdown [--output <file>]"));

    if (!parser.parse(arguments)) {
        *exitCode = usageError(parser.errorText());
        return std::nullopt;
    }

    if (parser.isSet(helpOption)) {
        m_out << parser.helpText();
        m_out.flush();
        *exitCode = ExitOk;
        return std::nullopt;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        *exitCode = usageError(QStringLiteral("missing command"));
        return std::nullopt;
    }

    const auto command = commandFromString(positional.first());
    if (!command) {
        *exitCode = usageError(QString("unknown command '%1'").arg(positional.first()));
        return std::nullopt;
    }

    CliOptions options;
    options.storePath = parser.value(pathOption);
    options.logFile = parser.value(logFileOption);
    options.verbose = parser.isSet(verboseOption);
    options.command = *command;
    options.commandArgs = positional.mid(1);

    if (options.storePath.trimmed().isEmpty()) {
        *exitCode = usageError(QStringLiteral("--path must not be empty"));
        return std::nullopt;
    }

    return options;
}

int CommandRouter::execute(const CliOptions &options) {
    registerCommands(options);
    qDebug(appCli) << "Dispatching" << options.commandArgs << "store=" << options.storePath;
    return m_handlers.at(options.command)(options.commandArgs);
}

int CommandRouter::run(const QStringList &arguments) {
    int exitCode = ExitOk;
    const auto options = parse(arguments, &exitCode);
    if (!options) {
        return exitCode;
    }
    return execute(*options);
}

void CommandRouter::registerCommands(const CliOptions &options) {
    const QString storePath = options.storePath;
    m_handlers.clear();

    // ─────────────────────────────────────────────────────────────────────────────
    // add <title> [--priority <level>]
    // ─────────────────────────────────────────────────────────────────────────────
    m_handlers[Command::Add] = wrapSafe("add", [this, storePath](const QStringList &args) {
        QCommandLineParser parser;
        const QCommandLineOption priorityOption({QStringLiteral("p"), QStringLiteral("priority")},
                                                QStringLiteral("Task priority."),
                                                QStringLiteral("level"));
        parser.addOption(priorityOption);

        if (!parser.parse(QStringList{QStringLiteral("add")} + args)) {
            return usageError(parser.errorText());
        }

        const QStringList positional = parser.positionalArguments();
        if (positional.size() != 1) {
            return usageError(QStringLiteral("add expects exactly one title"));
        }

        std::optional<Priority> priority;
        if (parser.isSet(priorityOption)) {
            priority = priorityFromString(parser.value(priorityOption));
            if (!priority) {
                throw TodoError(ErrorKind::InvalidInput,
                                QString("invalid priority '%1' (expected high, medium or low)")
                                    .arg(parser.value(priorityOption)));
            }
        }

        TaskStore store = TaskStore::load(storePath);
        const qsizetype index = store.add(positional.first(), priority);
        store.save();

        m_out << "Added task " << index << Qt::endl;
        return printList(store, TaskFilter::All);
    }, m_err);

    // ─────────────────────────────────────────────────────────────────────────────
    // list [--completed | --pending]
    // ─────────────────────────────────────────────────────────────────────────────
    m_handlers[Command::List] = wrapSafe("list", [this, storePath](const QStringList &args) {
        QCommandLineParser parser;
        const QCommandLineOption completedOption(QStringLiteral("completed"),
                                                 QStringLiteral("Only completed tasks."));
        const QCommandLineOption pendingOption(QStringLiteral("pending"),
                                               QStringLiteral("Only pending tasks."));
        parser.addOption(completedOption);
        parser.addOption(pendingOption);

        if (!parser.parse(QStringList{QStringLiteral("list")} + args)) {
            return usageError(parser.errorText());
        }
        if (!parser.positionalArguments().isEmpty()) {
            return usageError(QStringLiteral("list takes no arguments"));
        }
        if (parser.isSet(completedOption) && parser.isSet(pendingOption)) {
            return usageError(QStringLiteral("--completed and --pending are exclusive"));
        }

        TaskFilter filter = TaskFilter::All;
        if (parser.isSet(completedOption)) {
            filter = TaskFilter::Completed;
        } else if (parser.isSet(pendingOption)) {
            filter = TaskFilter::Pending;
        }

        const TaskStore store = TaskStore::load(storePath);
        return printList(store, filter);
    }, m_err);

    // ─────────────────────────────────────────────────────────────────────────────
    // complete <index>
    // ─────────────────────────────────────────────────────────────────────────────
    m_handlers[Command::Complete] = wrapSafe("complete", [this, storePath](const QStringList &args) {
        if (args.size() != 1) {
            return usageError(QStringLiteral("complete expects exactly one index"));
        }
        const qsizetype index = parseIndex(args.first());

        TaskStore store = TaskStore::load(storePath);
        store.complete(index);
        store.save();

        return printList(store, TaskFilter::All);
    }, m_err);

    // ─────────────────────────────────────────────────────────────────────────────
    // remove <index>
    // ─────────────────────────────────────────────────────────────────────────────
    m_handlers[Command::Remove] = wrapSafe("remove", [this, storePath](const QStringList &args) {
        if (args.size() != 1) {
            return usageError(QStringLiteral("remove expects exactly one index"));
        }
        const qsizetype index = parseIndex(args.first());

        TaskStore store = TaskStore::load(storePath);
        store.remove(index);
        store.save();

        return printList(store, TaskFilter::All);
    }, m_err);

    // ─────────────────────────────────────────────────────────────────────────────
    // reset
    // ─────────────────────────────────────────────────────────────────────────────
    m_handlers[Command::Reset] = wrapSafe("reset", [this, storePath](const QStringList &args) {
        if (!args.isEmpty()) {
            return usageError(QStringLiteral("reset takes no arguments"));
        }

        TaskStore store = TaskStore::load(storePath);
        store.reset();
        store.save();

        return printList(store, TaskFilter::All);
    }, m_err);

    // ─────────────────────────────────────────────────────────────────────────────
    // export --format <format> [--output <file>]
    // ─────────────────────────────────────────────────────────────────────────────
    m_handlers[Command::Export] = wrapSafe("export", [this, storePath](const QStringList &args) {
        QCommandLineParser parser;
        const QCommandLineOption formatOption({QStringLiteral("f"), QStringLiteral("format")},
                                              QStringLiteral("json, csv, yaml or markdown."),
                                              QStringLiteral("format"));
        const QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
                                              QStringLiteral("Destination file."),
                                              QStringLiteral("file"));
        parser.addOption(formatOption);
        parser.addOption(outputOption);

        if (!parser.parse(QStringList{QStringLiteral("export")} + args)) {
            return usageError(parser.errorText());
        }
        if (!parser.positionalArguments().isEmpty()) {
            return usageError(QStringLiteral("export takes no positional arguments"));
        }
        if (!parser.isSet(formatOption)) {
            return usageError(QStringLiteral("export requires --format"));
        }

        const ExportFormat format = parseExportFormat(parser.value(formatOption));
        const auto exporter = makeExporter(format);

        QString destination = parser.value(outputOption);
        if (destination.isEmpty()) {
            destination = defaultExportPath(storePath, *exporter);
        }
        if (samePath(destination, storePath)) {
            throw TodoError(ErrorKind::ExportError,
                            QString("refusing to export over the store '%1'").arg(storePath));
        }

        const TaskStore store = TaskStore::load(storePath);
        exportTasks(store.tasks(), destination, format);

        m_out << "Exported " << store.size() << " tasks to " << destination << Qt::endl;
        return static_cast<int>(ExitOk);
    }, m_err);
}

int CommandRouter::printList(const TaskStore &store, TaskFilter filter) {
    const TaskView view = store.list(filter);
    if (view.isEmpty()) {
        m_out << "No tasks." << Qt::endl;
        return ExitOk;
    }

    for (const TaskEntry entry : view) {
        m_out << formatTaskLine(entry.index, entry.task) << Qt::endl;
    }
    return ExitOk;
}

int CommandRouter::usageError(const QString &message) {
    m_err << "error: " << message << Qt::endl;
    m_err << "Run with --help for usage." << Qt::endl;
    return ExitUsage;
}
