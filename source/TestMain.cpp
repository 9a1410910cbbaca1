// ============================================================================
// Tessera - tessera-tests entry point
// ============================================================================
// Each suite is selected with a --test-<name> flag; --test-all runs them all.
// ============================================================================

#include <QCoreApplication>
#include <QTest>
#include <QTextStream>

#include "tiles/ScaleMathTests.h"
#include "tiles/TileCacheTests.h"
#include "tiles/TileCircuitBreakerTests.h"
#include "tiles/TileRenderCoordinatorTests.h"
#include "core/CameraSnapshotTests.h"
#include "core/ZoomEpochAuthorityTests.h"
#include "core/TileEngineConfigTests.h"
#include "telemetry/TileLifecycleTelemetryTests.h"
#include "stress/GestureReplayTests.h"

// ============================================================================
// Test Runners
// ============================================================================

static const QStringList& suiteNames()
{
    static const QStringList names = {
        "scale", "epoch", "camera", "cache", "breaker",
        "coordinator", "telemetry", "config", "replay"
    };
    return names;
}

static bool runSuite(const QString& testType)
{
    if (testType == "scale") {
        return ScaleMathTests::runAllTests();
    } else if (testType == "breaker") {
        return TileCircuitBreakerTests::runAllTests();
    } else if (testType == "camera") {
        return CameraSnapshotTests::runUnitTests();
    } else if (testType == "epoch") {
        ZoomEpochAuthorityTests tests;
        return QTest::qExec(&tests) == 0;
    } else if (testType == "cache") {
        TileCacheTests tests;
        return QTest::qExec(&tests) == 0;
    } else if (testType == "coordinator") {
        TileRenderCoordinatorTests tests;
        return QTest::qExec(&tests) == 0;
    } else if (testType == "telemetry") {
        TileLifecycleTelemetryTests tests;
        return QTest::qExec(&tests) == 0;
    } else if (testType == "config") {
        TileEngineConfigTests tests;
        return QTest::qExec(&tests) == 0;
    } else if (testType == "replay") {
        GestureReplayTests tests;
        return QTest::qExec(&tests) == 0;
    }
    return false;
}

static int runTests(const QString& testType)
{
    if (testType != "all") {
        return runSuite(testType) ? 0 : 1;
    }

    QStringList failed;
    for (const QString& name : suiteNames()) {
        if (!runSuite(name)) {
            failed << name;
        }
    }
    if (!failed.isEmpty()) {
        QTextStream err(stderr);
        err << "Failed suites: " << failed.join(", ") << "\n";
    }
    return failed.isEmpty() ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName(TileEngineConfig::ORGANIZATION);
    app.setApplicationName("EngineTests");

    QString testToRun;
    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == "--test-all") {
            testToRun = "all";
        } else if (arg.startsWith("--test-") && suiteNames().contains(arg.mid(7))) {
            testToRun = arg.mid(7);
        }
    }

    if (testToRun.isEmpty()) {
        QTextStream out(stdout);
        out << "Usage: tessera-tests --test-<suite>\n"
            << "Suites: " << suiteNames().join(", ") << ", all\n";
        return 2;
    }

    return runTests(testToRun);
}
