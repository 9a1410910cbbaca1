// ============================================================================
// Tessera - tessera-stress entry point
// ============================================================================

#include <QCoreApplication>

#include "cli/CliParser.h"
#include "core/TileEngineConfig.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName(TileEngineConfig::ORGANIZATION);
    app.setApplicationName(TileEngineConfig::APPLICATION);
    app.setApplicationVersion(QStringLiteral(TESSERA_VERSION));

    return Cli::run(app, argc, argv);
}
