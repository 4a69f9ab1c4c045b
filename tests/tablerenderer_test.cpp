#include "recordingsurface.h"
#include "tablerenderer.h"

#include <cassert>

using Layout::Cell;
using Layout::MediaBlock;
using Layout::MediaTile;
using Layout::Segment;

static bool near(qreal a, qreal b)
{
    return qAbs(a - b) < 0.001;
}

static MediaTile photoTile(const QImage &image, const QString &caption = QString())
{
    MediaTile tile;
    tile.kind = MediaTile::Photo;
    tile.uri = QStringLiteral("mem:%1").arg(image.cacheKey());
    tile.image = image;
    tile.caption = caption;
    return tile;
}

static QImage solid(const QColor &color)
{
    QImage image(8, 8, QImage::Format_RGB32);
    image.fill(color);
    return image;
}

int main()
{
    const PageGeometry geometry;

    // Header: one bold line per cell plus padding
    {
        RecordingSurface surface;
        TableRenderer renderer(&surface, geometry);
        assert(near(renderer.headerHeight(), 28.0));
        assert(near(renderer.drawHeader(geometry.contentTop()), 28.0));
        assert(surface.containsText(QStringLiteral("Location")));
        assert(surface.containsText(QStringLiteral("Condition")));
        const QList<DrawOp> rects = surface.ops(DrawOp::Rect);
        assert(rects.size() == 4);
        assert(rects.first().fill == TableRenderer::kHeaderFill);
    }

    // Empty rows never shrink below the minimum height
    {
        RecordingSurface surface;
        TableRenderer renderer(&surface, geometry);
        const QList<Cell> cells{Cell(), Cell(), Cell(), Cell()};
        assert(near(renderer.rowHeight(cells), geometry.minRowHeight));
    }

    // Measured height matches drawn height for wrapped and multi-segment cells
    {
        RecordingSurface surface;
        TableRenderer renderer(&surface, geometry);

        const QList<Cell> lines{Cell::fromText(QStringLiteral("a\nb\nc"))};
        assert(near(renderer.rowHeight(lines), 3 * 12.0 + 16));
        assert(near(renderer.drawRow(100, lines), renderer.rowHeight(lines)));

        Cell twoSegments;
        twoSegments.segments.append(Segment{QStringLiteral("first"), {}, {}});
        twoSegments.segments.append(Segment{QStringLiteral("second"), {}, {}});
        assert(near(renderer.rowHeight({twoSegments}), 12 + 12 + 12 + 16.0));

        // Tiles inside a cell use the column width
        Cell withPhoto;
        withPhoto.segments.append(Segment{QStringLiteral("x"), {photoTile(solid(Qt::blue))}, {}});
        const QList<Cell> photoRow{Cell(), Cell(), withPhoto, Cell()};
        assert(near(renderer.rowHeight(photoRow), 100 + 8 + 12 + 16.0));
        assert(near(renderer.drawRow(200, photoRow), renderer.rowHeight(photoRow)));
        assert(renderer.photosDrawn() == 1);
    }

    // Separate cells get four borders, merged rows one
    {
        RecordingSurface surface;
        TableRenderer renderer(&surface, geometry);
        const QList<Cell> cells{Cell::fromText(QStringLiteral("Front"), true),
                                Cell::fromText(QStringLiteral("1. Openings"), true),
                                Cell::fromText(QStringLiteral("1.1.1 Inspect door")),
                                Cell::fromText(QStringLiteral("Fair"))};
        RowStyle style;
        style.background = QColor(0xf8, 0xfa, 0xfc);
        renderer.drawRow(100, cells, style);
        assert(surface.ops(DrawOp::Rect).size() == 4);
        for (const DrawOp &op : surface.ops(DrawOp::Rect))
            assert(op.stroke == TableRenderer::kBorderColor && op.fill == style.background);

        RecordingSurface merged;
        TableRenderer mergedRenderer(&merged, geometry);
        style.mergeColumns = true;
        mergedRenderer.drawRow(100, cells, style);
        const QList<DrawOp> rects = merged.ops(DrawOp::Rect);
        assert(rects.size() == 1);
        assert(near(rects.first().rect.width(), geometry.contentWidth()));
        assert(merged.containsText(QStringLiteral("Inspect door")));
    }

    // Media chunks: placeholder for buffers the backend refuses
    {
        MediaBlock block;
        block.photos = {photoTile(solid(Qt::green)), photoTile(QImage())};

        RecordingSurface surface;
        TableRenderer renderer(&surface, geometry);
        const MediaLayout layout = renderer.layoutMedia(block);
        assert(layout.rows.size() == 1);
        assert(near(renderer.mediaChunkHeight(layout, 0, 1, false, false), 116.0));
        assert(near(renderer.drawMediaChunk(100, block, layout, 0, 1, false, false, QColor()),
                    116.0));
        assert(renderer.photosDrawn() == 1);
        assert(renderer.placeholdersDrawn() == 1);
        assert(surface.containsText(QStringLiteral("Photo unavailable")));
        bool redBorder = false;
        for (const DrawOp &op : surface.ops(DrawOp::Rect))
            redBorder |= op.stroke == TableRenderer::kUnavailableColor;
        assert(redBorder);

        RecordingSurface refusing;
        refusing.setRejectImages(true);
        TableRenderer refusingRenderer(&refusing, geometry);
        refusingRenderer.drawMediaChunk(100, block, refusingRenderer.layoutMedia(block),
                                        0, 1, false, false, QColor());
        assert(refusingRenderer.photosDrawn() == 0);
        assert(refusingRenderer.placeholdersDrawn() == 2);
        assert(refusing.ops(DrawOp::Image).isEmpty());
    }

    // Title, captions and note add to the chunk
    {
        MediaBlock block;
        block.title = QStringLiteral("1.1.2 Inspect door");
        block.note = QStringLiteral("1 photo");
        block.photos = {photoTile(solid(Qt::red), QStringLiteral("Cracked frame"))};

        RecordingSurface surface;
        TableRenderer renderer(&surface, geometry);
        const MediaLayout layout = renderer.layoutMedia(block);
        assert(near(layout.titleHeight, 12.0));
        assert(near(layout.noteHeight, 12.0));
        assert(near(layout.rows.first().height, 100 + 4 + 9.6));
        assert(near(renderer.mediaChunkHeight(layout, 0, 1, true, true),
                    12 + 8 + 113.6 + 8 + 12 + 16));
        assert(near(renderer.mediaChunkHeight(layout, 1, 0, false, true), 12 + 16.0));

        renderer.drawMediaChunk(50, block, layout, 0, 1, true, true, QColor());
        assert(surface.containsText(QStringLiteral("Cracked frame")));
        assert(surface.containsText(QStringLiteral("1 photo")));
    }

    // Video tiles draw a card with a play icon
    {
        MediaTile clip;
        clip.kind = MediaTile::Video;
        clip.uri = QStringLiteral("https://example.invalid/clip.mp4");
        MediaBlock block;
        block.videos = {clip};

        RecordingSurface surface;
        TableRenderer renderer(&surface, geometry);
        const MediaLayout layout = renderer.layoutMedia(block);
        assert(near(renderer.mediaChunkHeight(layout, 0, 1, false, false), 64 + 16.0));
        renderer.drawMediaChunk(50, block, layout, 0, 1, false, false, QColor());
        assert(renderer.videosDrawn() == 1);
        assert(surface.ops(DrawOp::RoundedRect).size() == 1);
        assert(surface.ops(DrawOp::Circle).size() == 1);
        assert(surface.ops(DrawOp::Polygon).size() == 1);
        assert(surface.containsText(QStringLiteral("Video")));
    }

    return 0;
}
