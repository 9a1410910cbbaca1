#pragma once

// ============================================================================
// SyntheticTileRenderer - Deterministic renderer for tests and stress runs
// ============================================================================
// Produces solid RGBA tiles whose color encodes the page and tier. Latency,
// periodic failures and malformed buffers can be injected to exercise the
// rejection, retry and integrity paths.
// ============================================================================

#include "TileRenderer.h"

#include <QAtomicInt>

class SyntheticTileRenderer : public TileRenderer {
public:
    struct Options {
        int latencyMs = 0;          ///< Sleep per tile on the worker thread
        int failEveryN = 0;         ///< Every Nth call fails (0 = never)
        bool truncateBuffers = false; ///< Emit RGBA buffers one byte short
        bool legacyEncoded = false; ///< Emit encoded blobs without dimensions
    };

    SyntheticTileRenderer();
    explicit SyntheticTileRenderer(const Options& options);

    TileRenderOutput renderTile(const TileRenderRequest& request) const override;
    QString name() const override { return QStringLiteral("synthetic"); }

    int renderCount() const { return m_calls.loadAcquire(); }

    /**
     * @brief Pixel color used for a tile, packed as 0xRRGGBBAA.
     */
    static quint32 tileColor(const TileIdentity& identity);

private:
    Options m_options;
    mutable QAtomicInt m_calls;
};
