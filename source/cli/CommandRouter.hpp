#ifndef TODOLIST_CLI_COMMANDROUTER_HPP
#define TODOLIST_CLI_COMMANDROUTER_HPP

#include <QString>
#include <QStringList>
#include <QTextStream>
#include <map>
#include <optional>

#include "ErrorHandler.hpp"
#include "ExportService.hpp"
#include "TaskStore.hpp"

enum class Command {
    Add,
    List,
    Complete,
    Remove,
    Reset,
    Export,
};

std::optional<Command> commandFromString(const QString &name);

struct CliOptions {
    QString storePath = QStringLiteral("todo.json");
    QString logFile;
    bool verbose = false;
    Command command = Command::List;
    QStringList commandArgs;
};

// Export target when --output is not given: the store path with the format's
// extension, or "<base>-export.<ext>" if that would be the store itself.
QString defaultExportPath(const QString &storePath, const IExporter &exporter);

QString formatTaskLine(qsizetype index, const Task &task);

class CommandRouter {
public:
    CommandRouter(QTextStream &out, QTextStream &err);

    // `arguments` includes the program name. Returns nullopt when the process
    // should stop with `*exitCode` (usage error or --help).
    std::optional<CliOptions> parse(const QStringList &arguments, int *exitCode);

    int execute(const CliOptions &options);

    int run(const QStringList &arguments);

private:
    void registerCommands(const CliOptions &options);

    int printList(const TaskStore &store, TaskFilter filter);
    int usageError(const QString &message);

    QTextStream &m_out;
    QTextStream &m_err;
    std::map<Command, CommandHandler> m_handlers;
};

#endif // TODOLIST_CLI_COMMANDROUTER_HPP
