/*
 * paginator.h — Places table rows and media blocks onto pages
 *
 * Owns the vertical cursor. Rows are never split: a row that does not fit
 * above the footer band moves to a new page, where the header row is
 * redrawn first. Media blocks are streamed in chunks of whole tile rows,
 * so a long photo grid continues over as many pages as it needs.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_PAGINATOR_H
#define INSPECTPRINT_PAGINATOR_H

#include <QColor>
#include <QList>
#include <QString>

#include <functional>

#include "pagegeometry.h"
#include "rowdescriptor.h"

class DrawSurface;
class TableRenderer;

namespace Layout {

struct PaginatorStats {
    int pageBreaks = 0;
    int headerDraws = 0;
    int rowsDrawn = 0;
    QList<int> chunkTileCounts;     // tiles per drawn media chunk, in order
    int forcedPlacements = 0;       // content taller than an empty page
};

class Paginator
{
public:
    // Called with the index of a page just before it is finished, and for
    // the last page from finish(). Draws footers.
    using PageDecorator = std::function<void(int pageIndex)>;

    Paginator(DrawSurface *surface, TableRenderer *renderer, const PageGeometry &geometry);

    void setPageDecorator(const PageDecorator &decorator) { m_decorator = decorator; }

    qreal cursor() const { return m_cursor; }
    void setCursor(qreal y) { m_cursor = y; }
    qreal remaining() const { return m_geometry.bottomLimit() - m_cursor; }

    /// Draw the header row at the cursor, moving to a new page if needed.
    void beginTable();

    void addRow(const RowDescriptor &row);
    void addRows(const QList<RowDescriptor> &rows);

    /// Finish the current page and continue at the top of the next.
    void newPage(bool withHeader);

    /// Decorate the last page. Call once when all content is placed.
    void finish();

    const PaginatorStats &stats() const { return m_stats; }

    static const QColor kBandColors[2];

private:
    QColor backgroundFor(const RowDescriptor &row);
    void streamMedia(const MediaBlock &block, const QColor &background);

    DrawSurface *m_surface;
    TableRenderer *m_renderer;
    PageGeometry m_geometry;
    PageDecorator m_decorator;

    qreal m_cursor = 0;
    bool m_tableOpen = false;
    bool m_freshPage = false;   // nothing but the header placed since the last break

    QString m_lastTaskKey;
    bool m_haveTaskKey = false;
    int m_band = 0;

    PaginatorStats m_stats;
};

} // namespace Layout

#endif // INSPECTPRINT_PAGINATOR_H
