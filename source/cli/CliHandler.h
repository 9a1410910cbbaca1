#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handlers for tessera-stress.
 * 
 * - run: Replay a zoom gesture and report engine consistency
 * - config: Show, save or reset the persisted TileEngineConfig
 */

#include "CliParser.h"
#include "../stress/GestureReplay.h"

#include <QCommandLineParser>
#include <QJsonObject>

class QCoreApplication;

namespace Cli {

/**
 * @brief Handle the run command.
 * 
 * Loads TileEngineConfig from QSettings, applies command-line overrides,
 * replays the gesture and prints the report.
 * 
 * @return ExitCode::Success, ConsistencyFailure, Cancelled or InvalidArgs
 */
int handleRun(QCoreApplication& app, const QCommandLineParser& parser);

/**
 * @brief Handle the config command (show | save-defaults | reset).
 */
int handleConfig(const QCommandLineParser& parser);

/**
 * @brief Determine the output mode. Priority: --json > --verbose > Simple
 */
OutputMode getOutputMode(const QCommandLineParser& parser);

/**
 * @brief JSON form of a replay report.
 */
QJsonObject reportToJson(const Stress::ReplayReport& report);

/**
 * @brief JSON form of an engine configuration.
 */
QJsonObject configToJson(const TileEngineConfig& config);

} // namespace Cli

#endif // CLIHANDLER_H
