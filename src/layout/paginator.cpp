/*
 * paginator.cpp — Places table rows and media blocks onto pages
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "paginator.h"
#include "drawsurface.h"
#include "tablerenderer.h"

#include <QDebug>

namespace Layout {

const QColor Paginator::kBandColors[2] = {
    QColor(0xf8, 0xfa, 0xfc, 200),
    QColor(0xe0, 0xf2, 0xfe, 140),
};

Paginator::Paginator(DrawSurface *surface, TableRenderer *renderer,
                     const PageGeometry &geometry)
    : m_surface(surface)
    , m_renderer(renderer)
    , m_geometry(geometry)
    , m_cursor(geometry.contentTop())
{
}

void Paginator::beginTable()
{
    const qreal headerHeight = m_renderer->headerHeight();
    if (m_cursor + headerHeight > m_geometry.bottomLimit()
        && m_cursor > m_geometry.contentTop()) {
        newPage(false);
    }
    m_cursor += m_renderer->drawHeader(m_cursor);
    ++m_stats.headerDraws;
    m_tableOpen = true;
    m_freshPage = true;
}

void Paginator::newPage(bool withHeader)
{
    if (m_decorator)
        m_decorator(m_surface->pageIndex());
    m_surface->addPage();
    ++m_stats.pageBreaks;
    m_cursor = m_geometry.contentTop();
    m_freshPage = true;

    if (withHeader) {
        m_cursor += m_renderer->drawHeader(m_cursor);
        ++m_stats.headerDraws;
    }
}

void Paginator::finish()
{
    if (m_decorator)
        m_decorator(m_surface->pageIndex());
}

QColor Paginator::backgroundFor(const RowDescriptor &row)
{
    if (row.kind == RowDescriptor::Task) {
        if (m_haveTaskKey && row.groupingKey != m_lastTaskKey)
            m_band = 1 - m_band;
        m_lastTaskKey = row.groupingKey;
        m_haveTaskKey = true;
    }
    // Annotation and media rows continue the band of the last task row
    return kBandColors[m_band];
}

void Paginator::addRows(const QList<RowDescriptor> &rows)
{
    for (const RowDescriptor &row : rows)
        addRow(row);
}

void Paginator::addRow(const RowDescriptor &row)
{
    const QColor background = backgroundFor(row);
    const qreal limit = m_geometry.bottomLimit();

    if (row.kind != RowDescriptor::MediaOnly) {
        const qreal height = m_renderer->rowHeight(row.cells);
        if (m_cursor + height > limit && !m_freshPage)
            newPage(m_tableOpen);
        if (m_cursor + height > limit) {
            qWarning() << "Paginator: row of height" << height
                       << "does not fit on an empty page, placing it anyway";
            ++m_stats.forcedPlacements;
        }

        RowStyle style;
        style.background = background;
        style.mergeColumns = row.mergeColumns;
        m_cursor += m_renderer->drawRow(m_cursor, row.cells, style);
        m_freshPage = false;
        ++m_stats.rowsDrawn;
    }

    if (row.media && row.media->hasTiles())
        streamMedia(*row.media, background);
}

void Paginator::streamMedia(const MediaBlock &block, const QColor &background)
{
    const MediaLayout layout = m_renderer->layoutMedia(block);
    const qreal limit = m_geometry.bottomLimit();
    const int total = layout.rows.size();

    int next = 0;
    bool titlePending = layout.titleHeight > 0;
    bool notePending = layout.noteHeight > 0;

    while (next < total) {
        const qreal space = limit - m_cursor;

        // Largest number of whole tile rows that fits below the cursor
        int count = 0;
        while (next + count < total
               && m_renderer->mediaChunkHeight(layout, next, count + 1, titlePending, false)
                      <= space) {
            ++count;
        }

        if (count == 0) {
            if (!m_freshPage) {
                newPage(m_tableOpen);
                continue;
            }
            qWarning() << "Paginator: media row does not fit on an empty page,"
                       << "placing it anyway";
            ++m_stats.forcedPlacements;
            count = 1;
        }

        const bool withNote = notePending && next + count == total
            && m_renderer->mediaChunkHeight(layout, next, count, titlePending, true) <= space;

        m_cursor += m_renderer->drawMediaChunk(m_cursor, block, layout, next, count,
                                               titlePending, withNote, background);
        m_freshPage = false;

        int tiles = 0;
        for (int r = next; r < next + count; ++r)
            tiles += layout.rows[r].count;
        m_stats.chunkTileCounts.append(tiles);

        titlePending = false;
        if (withNote)
            notePending = false;
        next += count;

        if (next < total)
            newPage(m_tableOpen);
    }

    if (notePending) {
        const qreal noteHeight = m_renderer->mediaChunkHeight(layout, total, 0, false, true);
        if (m_cursor + noteHeight > limit && !m_freshPage)
            newPage(m_tableOpen);
        m_cursor += m_renderer->drawMediaChunk(m_cursor, block, layout, total, 0,
                                               false, true, background);
        m_freshPage = false;
    }
}

} // namespace Layout
