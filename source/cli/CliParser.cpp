#include "CliParser.h"
#include "CliHandler.h"
#include "CliSignal.h"

#include <QCoreApplication>
#include <QTextStream>
#include <cstring>

/**
 * @file CliParser.cpp
 * @brief Implementation of CLI argument parsing.
 *
 * @see CliParser.h for API documentation
 */

namespace Cli {

// Project VERSION from CMakeLists.txt
static const char* APP_VERSION = TESSERA_VERSION;

namespace {

struct CommandAlias {
    const char* text;
    Command command;
};

const CommandAlias COMMAND_ALIASES[] = {
    { "run",       Command::Run },
    { "config",    Command::Config },
    { "help",      Command::Help },
    { "--help",    Command::Help },
    { "-h",        Command::Help },
    { "--version", Command::Version },
    { "-v",        Command::Version },
};

/// One QCommandLineOption; valueName is null for flags.
struct OptionSpec {
    const char* name;
    const char* description;
    const char* valueName;
};

const OptionSpec RUN_OPTIONS[] = {
    { "zoom-from",     QT_TRANSLATE_NOOP("CLI", "Gesture start zoom (default: 1)"), "zoom" },
    { "zoom-to",       QT_TRANSLATE_NOOP("CLI", "Gesture end zoom (default: maxZoom)"), "zoom" },
    { "steps",         QT_TRANSLATE_NOOP("CLI", "Gesture samples (default: 60)"), "count" },
    { "step-interval", QT_TRANSLATE_NOOP("CLI", "Milliseconds between samples (default: 16)"), "ms" },
    { "pixel-ratio",   QT_TRANSLATE_NOOP("CLI", "Device pixel ratio (overrides settings)"), "ratio" },
    { "max-zoom",      QT_TRANSLATE_NOOP("CLI", "Maximum zoom (overrides settings)"), "zoom" },
    { "tile-size",     QT_TRANSLATE_NOOP("CLI", "Tile edge in pixels (overrides settings)"), "px" },
    { "latency-ms",    QT_TRANSLATE_NOOP("CLI", "Synthetic render time per tile (default: 5)"), "ms" },
    { "fail-every",    QT_TRANSLATE_NOOP("CLI", "Fail every Nth render (default: never)"), "n" },
    { "timeout",       QT_TRANSLATE_NOOP("CLI", "Seconds to wait for the engine to settle (default: 10)"), "seconds" },
    { "verbose",       QT_TRANSLATE_NOOP("CLI", "Print every gesture step"), nullptr },
    { "json",          QT_TRANSLATE_NOOP("CLI", "Print the report as JSON"), nullptr },
};

const OptionSpec CONFIG_OPTIONS[] = {
    { "json",          QT_TRANSLATE_NOOP("CLI", "Print the configuration as JSON"), nullptr },
};

template <std::size_t N>
void addOptions(QCommandLineParser& parser, const OptionSpec (&specs)[N])
{
    for (const OptionSpec& spec : specs) {
        const QString name = QString::fromLatin1(spec.name);
        const QString description = QCoreApplication::translate("CLI", spec.description);
        if (spec.valueName) {
            parser.addOption(QCommandLineOption(name, description, QString::fromLatin1(spec.valueName)));
        } else {
            parser.addOption(QCommandLineOption(name, description));
        }
    }
}

// argv without the command word, which QCommandLineParser would treat as positional
QStringList argumentsWithoutCommand(int argc, char* argv[])
{
    QStringList args;
    for (int i = 0; i < argc; ++i) {
        if (i != 1) {
            args << QString::fromLocal8Bit(argv[i]);
        }
    }
    return args;
}

} // namespace

// =============================================================================
// Command Detection
// =============================================================================

Command parseCommand(int argc, char* argv[])
{
    if (argc < 2) {
        return Command::None;
    }
    for (const CommandAlias& alias : COMMAND_ALIASES) {
        if (std::strcmp(argv[1], alias.text) == 0) {
            return alias.command;
        }
    }
    return Command::None;
}

QString commandName(Command cmd)
{
    switch (cmd) {
        case Command::Run:     return QStringLiteral("run");
        case Command::Config:  return QStringLiteral("config");
        case Command::Help:    return QStringLiteral("help");
        case Command::Version: return QStringLiteral("version");
        case Command::None:    break;
    }
    return QString();
}

// =============================================================================
// Parser Setup
// =============================================================================

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "Tessera - tile consistency stress tool"));
    parser.addHelpOption();
    parser.addVersionOption();

    if (cmd == Command::Run) {
        addOptions(parser, RUN_OPTIONS);
    } else if (cmd == Command::Config) {
        parser.addPositionalArgument(
            QStringLiteral("action"),
            QCoreApplication::translate("CLI", "show | save-defaults | reset"),
            QStringLiteral("[action]"));
        addOptions(parser, CONFIG_OPTIONS);
    }
}

void showHelp(const QCommandLineParser& parser, Command cmd)
{
    QTextStream out(stdout);

    if (cmd == Command::None || cmd == Command::Help) {
        out << QCoreApplication::translate("CLI",
            "Usage: tessera-stress <command> [options]\n"
            "\n"
            "Drives the Tessera tile engine with a synthetic renderer and checks that\n"
            "zoom tiers, cache keys and accepted render results stay consistent.\n"
            "\n"
            "COMMANDS:\n"
            "  run             Replay a zoom gesture through the engine\n"
            "  config          Show, save or reset the persisted configuration\n"
            "\n"
            "EXIT CODES:\n"
            "  0  consistent   1  error   2  bad arguments\n"
            "  3  inconsistent 4  interrupted\n"
            "\n"
            "EXAMPLES:\n"
            "  tessera-stress run --zoom-to 32 --pixel-ratio 2\n"
            "  tessera-stress run --fail-every 3 --json\n"
            "  tessera-stress config show\n"
            "\n"
            "Ctrl+C once stops the gesture, twice skips the settle wait.\n"
            "Use 'tessera-stress <command> --help' for command options.\n");
        return;
    }

    out << QCoreApplication::translate("CLI", "Usage: tessera-stress %1 [options]\n\n")
               .arg(commandName(cmd));
    out << parser.helpText();
}

void showVersion()
{
    QTextStream out(stdout);
    out << "tessera-stress " << APP_VERSION << " (Qt " << qVersion() << ")\n";
}

// =============================================================================
// Main Entry Point
// =============================================================================

int run(QCoreApplication& app, int argc, char* argv[])
{
    const Command cmd = parseCommand(argc, argv);

    switch (cmd) {
        case Command::Version:
            showVersion();
            return ExitCode::Success;
        case Command::None:
        case Command::Help: {
            QCommandLineParser parser;
            setupParser(parser, Command::None);
            showHelp(parser, cmd);
            return cmd == Command::Help ? ExitCode::Success : ExitCode::InvalidArgs;
        }
        case Command::Run:
        case Command::Config:
            break;
    }

    QCommandLineParser parser;
    setupParser(parser, cmd);

    if (!parser.parse(argumentsWithoutCommand(argc, argv))) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: ") << parser.errorText() << "\n\n";
        showHelp(parser, cmd);
        return ExitCode::InvalidArgs;
    }
    if (parser.isSet(QStringLiteral("help"))) {
        showHelp(parser, cmd);
        return ExitCode::Success;
    }
    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }

    if (cmd == Command::Config) {
        return handleConfig(parser);
    }

    installSignalHandlers();
    return handleRun(app, parser);
}

} // namespace Cli
