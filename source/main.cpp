#include <QCoreApplication>
#include <QTextStream>

#include <cstdio>

#include "CommandRouter.hpp"
#include "Logger.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("todo"));

    QTextStream out(stdout);
    QTextStream err(stderr);

    // ──────────────────────────────
    // 1. Parse global options
    // ──────────────────────────────
    CommandRouter router(out, err);

    int exitCode = ExitOk;
    const auto options = router.parse(QCoreApplication::arguments(), &exitCode);
    if (!options) {
        return exitCode;
    }

    // ──────────────────────────────
    // 2. Logging
    // ──────────────────────────────
    setVerboseLogging(options->verbose);
    initLogging(options->logFile);

    // ──────────────────────────────
    // 3. Run the command
    // ──────────────────────────────
    const int code = router.execute(*options);
    shutdownLogging();
    return code;
}
