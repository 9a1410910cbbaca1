#include "SyntheticTileRenderer.h"

#include <QThread>

SyntheticTileRenderer::SyntheticTileRenderer()
    : SyntheticTileRenderer(Options())
{
}

SyntheticTileRenderer::SyntheticTileRenderer(const Options& options)
    : m_options(options)
{
}

quint32 SyntheticTileRenderer::tileColor(const TileIdentity& identity)
{
    const quint32 r = static_cast<quint32>(identity.page() * 37) & 0xFF;
    const quint32 g = static_cast<quint32>(identity.scaleTier() * 4) & 0xFF;
    const quint32 b = static_cast<quint32>((identity.tileX() + identity.tileY()) * 16) & 0xFF;
    return (r << 24) | (g << 16) | (b << 8) | 0xFF;
}

TileRenderOutput SyntheticTileRenderer::renderTile(const TileRenderRequest& request) const
{
    TileRenderOutput output;
    const int call = m_calls.fetchAndAddOrdered(1) + 1;

    if (m_options.latencyMs > 0) {
        QThread::msleep(static_cast<unsigned long>(m_options.latencyMs));
    }

    if (m_options.failEveryN > 0 && call % m_options.failEveryN == 0) {
        output.errorMessage = QStringLiteral("synthetic failure on call %1").arg(call);
        return output;
    }

    const int size = request.identity.tileSize();
    if (size <= 0) {
        output.errorMessage = QStringLiteral("invalid tile size %1").arg(size);
        return output;
    }

    if (m_options.legacyEncoded) {
        output.success = true;
        output.data = CachedTileData::legacyEncoded(QByteArray("\x89PNG", 4));
        return output;
    }

    const quint32 color = tileColor(request.identity);
    const char pixel[4] = {
        static_cast<char>((color >> 24) & 0xFF),
        static_cast<char>((color >> 16) & 0xFF),
        static_cast<char>((color >> 8) & 0xFF),
        static_cast<char>(color & 0xFF)
    };

    QByteArray pixels;
    pixels.reserve(size * size * 4);
    for (int i = 0; i < size * size; ++i) {
        pixels.append(pixel, 4);
    }
    if (m_options.truncateBuffers) {
        pixels.chop(1);
    }

    output.success = true;
    output.data = CachedTileData::rawRgba(size, size, pixels);
    return output;
}
