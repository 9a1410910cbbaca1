#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line parsing for the tessera-stress tool.
 * 
 * tessera-stress drives the tile engine headlessly with a synthetic renderer
 * and reports whether zoom, cache and render pipeline stayed consistent.
 * 
 * Supported commands:
 * - run: Replay a zoom gesture through the full engine
 * - config: Show, save or reset the persisted engine configuration
 */

#include <QString>
#include <QStringList>
#include <QCommandLineParser>

class QCoreApplication;

namespace Cli {

// =============================================================================
// CLI Commands
// =============================================================================

/**
 * @brief Known CLI commands.
 */
enum class Command {
    None,           ///< No command given
    Help,           ///< Show help message
    Version,        ///< Show version information
    Run,            ///< Replay a zoom gesture
    Config          ///< Inspect or change persisted configuration
};

/**
 * @brief Output mode for results.
 */
enum class OutputMode {
    Simple,         ///< Summary lines (default)
    Verbose,        ///< Summary plus per-step progress
    Json            ///< JSON document for scripting
};

// =============================================================================
// Exit Codes
// =============================================================================

/**
 * @brief Exit codes for CLI operations.
 */
namespace ExitCode {
    constexpr int Success = 0;            ///< Run finished, engine consistent
    constexpr int GeneralError = 1;       ///< Could not run (I/O, settings)
    constexpr int InvalidArgs = 2;        ///< Bad command line arguments
    constexpr int ConsistencyFailure = 3; ///< Engine ended in an inconsistent state
    constexpr int Cancelled = 4;          ///< Interrupted with Ctrl+C
}

// =============================================================================
// Command Detection
// =============================================================================

/**
 * @brief Parse the command from argv[1].
 * @return The detected command, or Command::None
 */
Command parseCommand(int argc, char* argv[]);

/**
 * @brief Command name as typed on the command line (e.g., "run").
 */
QString commandName(Command cmd);

// =============================================================================
// Parser Setup
// =============================================================================

/**
 * @brief Add the options and positional arguments of @p cmd to @p parser.
 */
void setupParser(QCommandLineParser& parser, Command cmd);

/**
 * @brief Print general help (cmd == None/Help) or command help.
 */
void showHelp(const QCommandLineParser& parser, Command cmd);

/**
 * @brief Print version information.
 */
void showVersion();

// =============================================================================
// Main Entry Point
// =============================================================================

/**
 * @brief Parse arguments, run the command and return an exit code.
 * 
 * @param app The QCoreApplication instance (its event loop drives render completions)
 * @param argc Argument count
 * @param argv Argument vector
 * @return Exit code (see ExitCode namespace)
 */
int run(QCoreApplication& app, int argc, char* argv[]);

} // namespace Cli

#endif // CLIPARSER_H
