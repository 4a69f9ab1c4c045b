/*
 * pagegeometry.h — Page and table geometry for the inspection table
 *
 * All values are in points (72 dpi). The table spans the page between
 * the left and right margins; the footer band sits directly above the
 * bottom margin and nothing but the footer may be drawn inside it.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_PAGEGEOMETRY_H
#define INSPECTPRINT_PAGEGEOMETRY_H

#include <QList>
#include <QRectF>
#include <QSizeF>

struct PageGeometry
{
    QSizeF pageSize{595.28, 841.89}; // A4

    qreal margin = 36.0;
    qreal footerReserved = 40.0;

    // Media grid
    int tileColumns = 4;
    qreal photoTileHeight = 100.0;
    qreal videoTileHeight = 64.0;
    qreal gutter = 8.0;
    qreal captionGap = 4.0;
    qreal captionFontSize = 8.0;

    // Table cells
    qreal cellPadding = 8.0;
    qreal minRowHeight = 24.0;
    qreal segmentSpacing = 12.0;
    qreal bodyFontSize = 10.0;
    qreal headingFontSize = 14.0;
    qreal lineWidth = 0.7;

    // Location / Item / Subtask / Condition
    QList<qreal> columnFractions{0.22, 0.26, 0.32, 0.20};

    qreal contentLeft() const { return margin; }
    qreal contentTop() const { return margin; }
    qreal contentWidth() const { return pageSize.width() - 2 * margin; }

    // Lowest y any row or media chunk may reach
    qreal bottomLimit() const
    {
        return pageSize.height() - margin - footerReserved;
    }

    QRectF footerRect() const
    {
        return QRectF(margin, bottomLimit(), contentWidth(), footerReserved);
    }

    QList<qreal> columnWidths() const
    {
        qreal total = 0;
        for (qreal f : columnFractions)
            total += f;
        QList<qreal> widths;
        for (qreal f : columnFractions)
            widths.append(total > 0 ? contentWidth() * f / total : 0);
        return widths;
    }

    bool isUsable() const
    {
        return contentWidth() > 0 && bottomLimit() > contentTop()
            && tileColumns > 0 && columnFractions.size() == 4;
    }
};

#endif // INSPECTPRINT_PAGEGEOMETRY_H
