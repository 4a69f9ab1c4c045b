/*
 * tablerenderer.h — Draws inspection table rows and media blocks
 *
 * rowHeight() is pure and must agree exactly with what drawRow() consumes;
 * the paginator reserves space with the former before calling the latter.
 * Media blocks are drawn in chunks of whole tile rows so the paginator can
 * split them across pages.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_TABLERENDERER_H
#define INSPECTPRINT_TABLERENDERER_H

#include "drawsurface.h"
#include "mediagrid.h"
#include "pagegeometry.h"
#include "rowdescriptor.h"

#include <QColor>
#include <QList>

struct RowStyle {
    bool header = false;
    QColor background;      // invalid = no fill
    bool mergeColumns = false;
};

// Tile rows of one media block, photos first. Photo and video rows form one
// stream, so a chunk split by the paginator always holds whole tile rows but
// may end on the last, partial photo row with videos following in the next
// chunk. Its tile count is then not a multiple of the column count.
struct MediaLayout {
    struct Row {
        Layout::MediaTile::Kind kind = Layout::MediaTile::Photo;
        int first = 0;      // index into the block's photos or videos
        int count = 0;
        qreal height = 0;
    };

    qreal tileWidth = 0;
    QList<Row> rows;
    qreal titleHeight = 0;
    qreal noteHeight = 0;
};

class TableRenderer
{
public:
    TableRenderer(DrawSurface *surface, const PageGeometry &geometry);

    // --- Table rows ---

    qreal rowHeight(const QList<Layout::Cell> &cells) const;
    qreal drawRow(qreal y, const QList<Layout::Cell> &cells, const RowStyle &style = {});

    QList<Layout::Cell> headerCells() const;
    qreal headerHeight() const;
    qreal drawHeader(qreal y);

    // --- Media blocks ---

    MediaLayout layoutMedia(const Layout::MediaBlock &block) const;

    qreal mediaChunkHeight(const MediaLayout &layout, int firstRow, int rowCount,
                           bool withTitle, bool withNote) const;
    qreal drawMediaChunk(qreal y, const Layout::MediaBlock &block, const MediaLayout &layout,
                         int firstRow, int rowCount, bool withTitle, bool withNote,
                         const QColor &background);

    // --- Statistics for the current render ---

    int photosDrawn() const { return m_photosDrawn; }
    int placeholdersDrawn() const { return m_placeholdersDrawn; }
    int videosDrawn() const { return m_videosDrawn; }

    static const QColor kBorderColor;
    static const QColor kHeaderFill;
    static const QColor kTextColor;
    static const QColor kUnavailableColor;

private:
    TextStyle bodyStyle(bool bold = false) const;
    TextStyle captionStyle() const;
    Layout::GridSpec gridSpec() const;
    Layout::TextMeasure captionMeasure() const;
    qreal tileHeight(Layout::MediaTile::Kind kind) const;

    QList<MediaLayout::Row> planTiles(const QList<Layout::MediaTile> &tiles,
                                      Layout::MediaTile::Kind kind, qreal width,
                                      qreal *tileWidth) const;

    qreal segmentMediaHeight(const Layout::Segment &segment, qreal width) const;
    qreal segmentHeight(const Layout::Segment &segment, qreal width, bool bold) const;
    qreal cellHeight(const Layout::Cell &cell, qreal width) const;
    qreal drawSegment(const Layout::Segment &segment, qreal x, qreal y, qreal width, bool bold);

    void drawTile(const Layout::MediaTile &tile, const QRectF &rect);
    void drawPhotoTile(const Layout::MediaTile &tile, const QRectF &rect);
    void drawVideoTile(const QRectF &rect);

    DrawSurface *m_surface;
    PageGeometry m_geometry;
    QList<qreal> m_columnWidths;

    int m_photosDrawn = 0;
    int m_placeholdersDrawn = 0;
    int m_videosDrawn = 0;
};

#endif // INSPECTPRINT_TABLERENDERER_H
