/*
 * mediagrid.cpp — Tile grid planning for photo and video blocks
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "mediagrid.h"

namespace Layout {

qreal GridPlan::heightOfRows(int first, int count, qreal gutter) const
{
    qreal height = 0;
    const int last = qMin(first + count, rowHeights.size());
    for (int r = first; r < last; ++r)
        height += rowHeights[r];
    if (last - first > 1)
        height += gutter * (last - first - 1);
    return height;
}

GridPlan planGrid(int count, const QStringList &captions, qreal availableWidth,
                  qreal tileHeight, const GridSpec &spec, const TextMeasure &measure)
{
    GridPlan plan;
    if (count <= 0)
        return plan;

    const int columns = qMax(1, spec.columns);
    plan.tileWidth = qMax<qreal>(0, (availableWidth - spec.gutter * (columns - 1)) / columns);

    const int rows = (count + columns - 1) / columns;
    for (int r = 0; r < rows; ++r) {
        qreal rowHeight = tileHeight;
        for (int c = 0; c < columns; ++c) {
            const int index = r * columns + c;
            if (index >= count)
                break;
            const QString caption = captions.value(index);
            if (caption.isEmpty() || !measure)
                continue;
            const qreal captioned = tileHeight + spec.captionGap
                                    + measure(caption, plan.tileWidth);
            rowHeight = qMax(rowHeight, captioned);
        }
        plan.rowHeights.append(rowHeight);
    }

    plan.totalHeight = plan.heightOfRows(0, rows, spec.gutter);
    return plan;
}

} // namespace Layout
