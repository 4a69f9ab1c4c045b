/*
 * tablerenderer.cpp — Draws inspection table rows and media blocks
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "tablerenderer.h"

#include <KLocalizedString>

#include <QPolygonF>

using Layout::Cell;
using Layout::MediaBlock;
using Layout::MediaTile;
using Layout::Segment;

const QColor TableRenderer::kBorderColor = QColor(0x11, 0x18, 0x27);
const QColor TableRenderer::kHeaderFill = QColor(0xe2, 0xe8, 0xf0);
const QColor TableRenderer::kTextColor = QColor(0x11, 0x18, 0x27);
const QColor TableRenderer::kUnavailableColor = QColor(0xef, 0x44, 0x44);

namespace {

const QColor kCaptionColor(0x47, 0x55, 0x69);
const QColor kVideoCardColor(0x1e, 0x29, 0x3b);
const QColor kVideoIconColor(0x0e, 0xa5, 0xe9);

constexpr qreal kVideoCardRadius = 8.0;
constexpr qreal kVideoIconRadius = 12.0;
constexpr qreal kVideoIconInset = 10.0;
constexpr qreal kPlaceholderInset = 4.0;

qreal joinedHeight(const QList<qreal> &parts, qreal gap)
{
    qreal total = 0;
    int count = 0;
    for (qreal h : parts) {
        if (h <= 0)
            continue;
        total += h;
        ++count;
    }
    if (count > 1)
        total += gap * (count - 1);
    return total;
}

} // anonymous namespace

TableRenderer::TableRenderer(DrawSurface *surface, const PageGeometry &geometry)
    : m_surface(surface)
    , m_geometry(geometry)
    , m_columnWidths(geometry.columnWidths())
{
}

// --- Styles ---

TextStyle TableRenderer::bodyStyle(bool bold) const
{
    TextStyle style;
    style.fontSize = m_geometry.bodyFontSize;
    style.bold = bold;
    style.color = kTextColor;
    return style;
}

TextStyle TableRenderer::captionStyle() const
{
    TextStyle style;
    style.fontSize = m_geometry.captionFontSize;
    style.color = kCaptionColor;
    return style;
}

Layout::GridSpec TableRenderer::gridSpec() const
{
    Layout::GridSpec spec;
    spec.columns = m_geometry.tileColumns;
    spec.gutter = m_geometry.gutter;
    spec.captionGap = m_geometry.captionGap;
    return spec;
}

Layout::TextMeasure TableRenderer::captionMeasure() const
{
    const TextStyle style = captionStyle();
    return [this, style](const QString &text, qreal width) {
        return m_surface->heightOfString(text, width, style);
    };
}

qreal TableRenderer::tileHeight(MediaTile::Kind kind) const
{
    return kind == MediaTile::Video ? m_geometry.videoTileHeight : m_geometry.photoTileHeight;
}

// --- Tile planning ---

QList<MediaLayout::Row> TableRenderer::planTiles(const QList<MediaTile> &tiles,
                                                 MediaTile::Kind kind, qreal width,
                                                 qreal *tileWidth) const
{
    QList<MediaLayout::Row> rows;
    if (tiles.isEmpty())
        return rows;

    QStringList captions;
    for (const MediaTile &tile : tiles)
        captions.append(tile.caption);

    const Layout::GridPlan plan = Layout::planGrid(tiles.size(), captions, width,
                                                   tileHeight(kind), gridSpec(),
                                                   captionMeasure());
    if (tileWidth)
        *tileWidth = plan.tileWidth;

    const int columns = qMax(1, m_geometry.tileColumns);
    for (int r = 0; r < plan.rowCount(); ++r) {
        MediaLayout::Row row;
        row.kind = kind;
        row.first = r * columns;
        row.count = qMin(columns, int(tiles.size()) - row.first);
        row.height = plan.rowHeights[r];
        rows.append(row);
    }
    return rows;
}

// --- Table rows ---

qreal TableRenderer::segmentMediaHeight(const Segment &segment, qreal width) const
{
    QList<qreal> rowHeights;
    for (const auto &row : planTiles(segment.photos, MediaTile::Photo, width, nullptr))
        rowHeights.append(row.height);
    for (const auto &row : planTiles(segment.videos, MediaTile::Video, width, nullptr))
        rowHeights.append(row.height);
    return joinedHeight(rowHeights, m_geometry.gutter);
}

qreal TableRenderer::segmentHeight(const Segment &segment, qreal width, bool bold) const
{
    const qreal media = segmentMediaHeight(segment, width);
    const QString text = segment.text.trimmed();
    const qreal textHeight = text.isEmpty()
        ? 0 : m_surface->heightOfString(text, width, bodyStyle(bold));
    return joinedHeight({media, textHeight}, m_geometry.gutter);
}

qreal TableRenderer::cellHeight(const Cell &cell, qreal width) const
{
    QList<qreal> heights;
    for (const Segment &segment : cell.segments) {
        if (!segment.isEmpty())
            heights.append(segmentHeight(segment, width, cell.bold));
    }
    return joinedHeight(heights, m_geometry.segmentSpacing);
}

qreal TableRenderer::rowHeight(const QList<Cell> &cells) const
{
    qreal content = 0;
    for (int i = 0; i < cells.size() && i < m_columnWidths.size(); ++i) {
        const qreal inner = m_columnWidths[i] - 2 * m_geometry.cellPadding;
        content = qMax(content, cellHeight(cells[i], inner));
    }
    return qMax(content + 2 * m_geometry.cellPadding, m_geometry.minRowHeight);
}

qreal TableRenderer::drawSegment(const Segment &segment, qreal x, qreal y, qreal width,
                                 bool bold)
{
    qreal tileWidth = 0;
    QList<MediaLayout::Row> rows = planTiles(segment.photos, MediaTile::Photo, width, &tileWidth);
    rows.append(planTiles(segment.videos, MediaTile::Video, width, &tileWidth));

    qreal cursor = y;
    if (!rows.isEmpty()) {
        for (int r = 0; r < rows.size(); ++r) {
            const MediaLayout::Row &row = rows[r];
            const QList<MediaTile> &tiles = (row.kind == MediaTile::Video)
                ? segment.videos : segment.photos;
            for (int c = 0; c < row.count; ++c) {
                const QRectF rect(x + c * (tileWidth + m_geometry.gutter), cursor,
                                  tileWidth, tileHeight(row.kind));
                drawTile(tiles[row.first + c], rect);
            }
            cursor += row.height;
            if (r + 1 < rows.size())
                cursor += m_geometry.gutter;
        }
    }

    const QString text = segment.text.trimmed();
    if (!text.isEmpty()) {
        if (!rows.isEmpty())
            cursor += m_geometry.gutter;
        cursor += m_surface->drawText(text, QRectF(x, cursor, width, 0), bodyStyle(bold));
    }
    return cursor - y;
}

qreal TableRenderer::drawRow(qreal y, const QList<Cell> &cells, const RowStyle &style)
{
    const qreal height = rowHeight(cells);
    const qreal padding = m_geometry.cellPadding;
    const QColor fill = style.header ? kHeaderFill : style.background;

    if (style.mergeColumns) {
        const QRectF rowRect(m_geometry.contentLeft(), y, m_geometry.contentWidth(), height);
        m_surface->drawRect(rowRect, fill, kBorderColor, m_geometry.lineWidth);
    }

    qreal x = m_geometry.contentLeft();
    for (int i = 0; i < m_columnWidths.size(); ++i) {
        const qreal width = m_columnWidths[i];
        if (!style.mergeColumns)
            m_surface->drawRect(QRectF(x, y, width, height), fill, kBorderColor,
                                m_geometry.lineWidth);

        if (i < cells.size()) {
            const Cell &cell = cells[i];
            const bool bold = style.header || cell.bold;
            qreal cursor = y + padding;
            bool first = true;
            for (const Segment &segment : cell.segments) {
                if (segment.isEmpty())
                    continue;
                if (!first)
                    cursor += m_geometry.segmentSpacing;
                cursor += drawSegment(segment, x + padding, cursor, width - 2 * padding, bold);
                first = false;
            }
        }
        x += width;
    }
    return height;
}

QList<Cell> TableRenderer::headerCells() const
{
    return {
        Cell::fromText(i18n("Location"), true),
        Cell::fromText(i18n("Item"), true),
        Cell::fromText(i18n("Subtask"), true),
        Cell::fromText(i18n("Condition"), true),
    };
}

qreal TableRenderer::headerHeight() const
{
    return rowHeight(headerCells());
}

qreal TableRenderer::drawHeader(qreal y)
{
    RowStyle style;
    style.header = true;
    return drawRow(y, headerCells(), style);
}

// --- Media blocks ---

MediaLayout TableRenderer::layoutMedia(const MediaBlock &block) const
{
    MediaLayout layout;
    const qreal inner = m_geometry.contentWidth() - 2 * m_geometry.cellPadding;

    layout.rows = planTiles(block.photos, MediaTile::Photo, inner, &layout.tileWidth);
    layout.rows.append(planTiles(block.videos, MediaTile::Video, inner, &layout.tileWidth));

    if (!block.title.trimmed().isEmpty())
        layout.titleHeight = m_surface->heightOfString(block.title.trimmed(), inner,
                                                       bodyStyle(true));
    if (!block.note.trimmed().isEmpty())
        layout.noteHeight = m_surface->heightOfString(block.note.trimmed(), inner,
                                                      bodyStyle(false));
    return layout;
}

qreal TableRenderer::mediaChunkHeight(const MediaLayout &layout, int firstRow, int rowCount,
                                      bool withTitle, bool withNote) const
{
    QList<qreal> rowHeights;
    for (int r = firstRow; r < firstRow + rowCount && r < layout.rows.size(); ++r)
        rowHeights.append(layout.rows[r].height);

    const qreal content = joinedHeight({withTitle ? layout.titleHeight : 0,
                                        joinedHeight(rowHeights, m_geometry.gutter),
                                        withNote ? layout.noteHeight : 0},
                                       m_geometry.gutter);
    if (content <= 0)
        return 0;
    return content + 2 * m_geometry.cellPadding;
}

qreal TableRenderer::drawMediaChunk(qreal y, const MediaBlock &block, const MediaLayout &layout,
                                    int firstRow, int rowCount, bool withTitle, bool withNote,
                                    const QColor &background)
{
    const qreal height = mediaChunkHeight(layout, firstRow, rowCount, withTitle, withNote);
    if (height <= 0)
        return 0;

    const qreal padding = m_geometry.cellPadding;
    const qreal gutter = m_geometry.gutter;
    const qreal left = m_geometry.contentLeft();
    const qreal inner = m_geometry.contentWidth() - 2 * padding;

    m_surface->drawRect(QRectF(left, y, m_geometry.contentWidth(), height), background,
                        kBorderColor, m_geometry.lineWidth);

    qreal cursor = y + padding;
    bool needsGap = false;

    if (withTitle && layout.titleHeight > 0) {
        m_surface->drawText(block.title.trimmed(), QRectF(left + padding, cursor, inner, 0),
                            bodyStyle(true));
        cursor += layout.titleHeight;
        needsGap = true;
    }

    const int lastRow = qMin(firstRow + rowCount, int(layout.rows.size()));
    for (int r = firstRow; r < lastRow; ++r) {
        if (needsGap)
            cursor += gutter;
        const MediaLayout::Row &row = layout.rows[r];
        const QList<MediaTile> &tiles = (row.kind == MediaTile::Video)
            ? block.videos : block.photos;
        for (int c = 0; c < row.count; ++c) {
            const QRectF rect(left + padding + c * (layout.tileWidth + gutter), cursor,
                              layout.tileWidth, tileHeight(row.kind));
            drawTile(tiles[row.first + c], rect);
        }
        cursor += row.height;
        needsGap = true;
    }

    if (withNote && layout.noteHeight > 0) {
        if (needsGap)
            cursor += gutter;
        m_surface->drawText(block.note.trimmed(), QRectF(left + padding, cursor, inner, 0),
                            bodyStyle(false));
    }
    return height;
}

// --- Tiles ---

void TableRenderer::drawTile(const MediaTile &tile, const QRectF &rect)
{
    if (tile.kind == MediaTile::Video)
        drawVideoTile(rect);
    else
        drawPhotoTile(tile, rect);

    if (!tile.caption.isEmpty()) {
        const QRectF captionBox(rect.left(), rect.bottom() + m_geometry.captionGap,
                                rect.width(), 0);
        m_surface->drawText(tile.caption, captionBox, captionStyle());
    }
}

void TableRenderer::drawPhotoTile(const MediaTile &tile, const QRectF &rect)
{
    if (m_surface->drawImage(rect, tile.image)) {
        ++m_photosDrawn;
        return;
    }

    m_surface->drawRect(rect, QColor(), kUnavailableColor, 1.0);
    TextStyle style = captionStyle();
    style.color = kUnavailableColor;
    m_surface->drawText(i18n("Photo unavailable"),
                        rect.adjusted(kPlaceholderInset, kPlaceholderInset,
                                      -kPlaceholderInset, -kPlaceholderInset),
                        style);
    ++m_placeholdersDrawn;
}

void TableRenderer::drawVideoTile(const QRectF &rect)
{
    m_surface->drawRoundedRect(rect, kVideoCardRadius, kVideoCardColor);

    const qreal cy = rect.center().y();
    const qreal cx = rect.left() + kVideoIconRadius + kVideoIconInset;
    m_surface->drawCircle(QPointF(cx, cy), kVideoIconRadius, kVideoIconColor);

    QPolygonF play;
    play << QPointF(cx - 4, cy - 6) << QPointF(cx + 6, cy) << QPointF(cx - 4, cy + 6);
    m_surface->drawPolygon(play, Qt::white);

    TextStyle label = captionStyle();
    label.color = Qt::white;
    const qreal labelLeft = cx + kVideoIconRadius + 6;
    const qreal labelWidth = rect.right() - labelLeft - 4;
    if (labelWidth > 0) {
        m_surface->drawText(i18n("Video"),
                            QRectF(labelLeft, cy - m_surface->lineHeight(label) / 2,
                                   labelWidth, 0),
                            label);
    }
    ++m_videosDrawn;
}
