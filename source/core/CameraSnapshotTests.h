#pragma once

/**
 * @file CameraSnapshotTests.h
 * @brief Unit tests for CameraSnapshot capture and screen/canvas transforms.
 * 
 * Run with: tessera-tests --test-camera
 */

#include "CameraSnapshot.h"
#include <cmath>
#include <cstdio>
#include <limits>

class CameraSnapshotTests {
public:
    
    // ===== Capture =====
    
    static bool testMutationIndependence() {
        printf("Test: snapshot survives mutation of the source... ");
        
        CameraState live;
        live.x = 10.0;
        live.y = 20.0;
        live.zoom = 2.0;
        
        const CameraSnapshot snapshot = CameraSnapshot::capture(live, 1234);
        live.x = 500.0;
        live.y = 600.0;
        live.zoom = 8.0;
        
        if (snapshot.x() != 10.0 || snapshot.y() != 20.0 || snapshot.zoom() != 2.0) {
            printf("FAILED (snapshot changed with source)\n");
            return false;
        }
        if (snapshot.timestampMs() != 1234) {
            printf("FAILED (timestamp %lld)\n", static_cast<long long>(snapshot.timestampMs()));
            return false;
        }
        
        // Editing the extracted state doesn't reach the snapshot either
        CameraState copy = snapshot.toState();
        copy.zoom = 40.0;
        if (snapshot.zoom() != 2.0) {
            printf("FAILED (toState aliases snapshot)\n");
            return false;
        }
        
        printf("PASSED\n");
        return true;
    }
    
    static bool testCaptureClamps() {
        printf("Test: capture clamps zoom and position... ");
        const double nan = std::numeric_limits<double>::quiet_NaN();
        const double inf = std::numeric_limits<double>::infinity();
        
        CameraState state;
        state.x = -5.0;
        state.y = nan;
        state.zoom = 200.0;
        CameraSnapshot s = createCameraSnapshot(state);
        if (s.x() != 0.0 || s.y() != 0.0 || s.zoom() != CameraSnapshot::MAX_ZOOM) {
            printf("FAILED (x=%f y=%f zoom=%f)\n", s.x(), s.y(), s.zoom());
            return false;
        }
        
        state.zoom = nan;
        if (CameraSnapshot::capture(state).zoom() != CameraSnapshot::MIN_ZOOM) {
            printf("FAILED (NaN zoom)\n");
            return false;
        }
        
        state.zoom = inf;
        if (CameraSnapshot::capture(state).zoom() != CameraSnapshot::MAX_ZOOM) {
            printf("FAILED (infinite zoom)\n");
            return false;
        }
        
        state.zoom = 0.0;
        if (CameraSnapshot::capture(state).zoom() != CameraSnapshot::MIN_ZOOM) {
            printf("FAILED (zero zoom)\n");
            return false;
        }
        
        printf("PASSED\n");
        return true;
    }
    
    // ===== Transforms =====
    
    static bool testRoundTrip() {
        printf("Test: screen/canvas round trip... ");
        
        const double zooms[] = {1.0, 32.0, 64.0};
        const QPointF offsets[] = {QPointF(0, 0), QPointF(37.5, 12.25), QPointF(4000, 9000)};
        const QPointF points[] = {QPointF(0, 0), QPointF(123.4, 567.8), QPointF(1919, 1079)};
        
        for (double zoom : zooms) {
            for (const QPointF& offset : offsets) {
                CameraState state;
                state.x = offset.x();
                state.y = offset.y();
                state.zoom = zoom;
                const CameraSnapshot snapshot = CameraSnapshot::capture(state);
                
                for (const QPointF& screen : points) {
                    const QPointF back = canvasToScreen(screenToCanvas(screen, snapshot), snapshot);
                    const double error = std::hypot(back.x() - screen.x(), back.y() - screen.y());
                    if (error >= 0.5) {
                        printf("FAILED (zoom %f, error %f)\n", zoom, error);
                        return false;
                    }
                }
            }
        }
        
        printf("PASSED\n");
        return true;
    }
    
    static bool testTransformFormula() {
        printf("Test: transform formula... ");
        
        CameraState camera;
        camera.x = 10.0;
        camera.y = 20.0;
        camera.zoom = 2.0;
        
        // canvas = screen / zoom - camera
        const QPointF canvas = screenToCanvas(QPointF(100, 100), camera);
        if (canvas != QPointF(40, 30)) {
            printf("FAILED (canvas %f,%f)\n", canvas.x(), canvas.y());
            return false;
        }
        
        const QPointF screen = canvasToScreen(QPointF(40, 30), camera);
        if (screen != QPointF(100, 100)) {
            printf("FAILED (screen %f,%f)\n", screen.x(), screen.y());
            return false;
        }
        
        // Non-positive zoom never divides by zero
        camera.zoom = 0.0;
        const QPointF safe = screenToCanvas(QPointF(1, 1), camera);
        if (!std::isfinite(safe.x()) || !std::isfinite(safe.y())) {
            printf("FAILED (zero zoom produced non-finite point)\n");
            return false;
        }
        
        printf("PASSED\n");
        return true;
    }
    
    // ===== Movement =====
    
    static bool testPan() {
        printf("Test: pan... ");
        
        CameraState camera;
        camera.zoom = 4.0;
        const CameraState panned = panCamera(camera, 40.0, -80.0);
        if (panned.x != -10.0 || panned.y != 20.0 || panned.zoom != 4.0) {
            printf("FAILED (x=%f y=%f)\n", panned.x, panned.y);
            return false;
        }
        
        printf("PASSED\n");
        return true;
    }
    
    static bool testZoomToPoint() {
        printf("Test: zoom keeps anchor fixed... ");
        
        CameraState camera;
        camera.x = 5.0;
        camera.y = 7.0;
        camera.zoom = 2.0;
        const QPointF cursor(300, 200);
        const QPointF before = screenToCanvas(cursor, camera);
        
        // delta -1 doubles the zoom
        const CameraState zoomed = zoomCameraToPoint(camera, cursor, -1.0, 0.25, 32.0);
        if (std::fabs(zoomed.zoom - 4.0) > 1e-9) {
            printf("FAILED (zoom %f)\n", zoomed.zoom);
            return false;
        }
        const QPointF after = screenToCanvas(cursor, zoomed);
        if (std::hypot(after.x() - before.x(), after.y() - before.y()) > 1e-6) {
            printf("FAILED (anchor moved)\n");
            return false;
        }
        
        // Already at the limit: camera returned untouched
        camera.zoom = 32.0;
        const CameraState capped = zoomCameraToPoint(camera, cursor, -1.0, 0.25, 32.0);
        if (capped.x != camera.x || capped.y != camera.y || capped.zoom != 32.0) {
            printf("FAILED (capped zoom moved camera)\n");
            return false;
        }
        
        printf("PASSED\n");
        return true;
    }
    
    // ===== Run All Unit Tests =====
    
    static bool runUnitTests() {
        printf("\n=== CameraSnapshot Unit Tests ===\n\n");
        
        int passed = 0;
        int failed = 0;
        
        auto runTest = [&](bool (*test)(), const char* name) {
            if (test()) {
                passed++;
            } else {
                failed++;
                printf("  [FAILED] %s\n", name);
            }
        };
        
        runTest(testMutationIndependence, "testMutationIndependence");
        runTest(testCaptureClamps, "testCaptureClamps");
        runTest(testRoundTrip, "testRoundTrip");
        runTest(testTransformFormula, "testTransformFormula");
        runTest(testPan, "testPan");
        runTest(testZoomToPoint, "testZoomToPoint");
        
        printf("\n=== Results: %d passed, %d failed ===\n\n", passed, failed);
        
        return failed == 0;
    }
};
