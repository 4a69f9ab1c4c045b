/*
 * mediagrid.h — Tile grid planning for photo and video blocks
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_MEDIAGRID_H
#define INSPECTPRINT_MEDIAGRID_H

#include <QList>
#include <QStringList>

#include <functional>

namespace Layout {

struct GridSpec {
    int columns = 4;
    qreal gutter = 8.0;
    qreal captionGap = 4.0;
};

// Height of text wrapped at the given width, in the caption font
using TextMeasure = std::function<qreal(const QString &text, qreal width)>;

struct GridPlan {
    qreal tileWidth = 0;
    QList<qreal> rowHeights;
    qreal totalHeight = 0;

    int rowCount() const { return rowHeights.size(); }

    // Height of rows [first, first + count) including the gutters between them
    qreal heightOfRows(int first, int count, qreal gutter) const;
};

// captions[i] belongs to tile i; missing or empty entries mean no caption.
GridPlan planGrid(int count, const QStringList &captions, qreal availableWidth,
                  qreal tileHeight, const GridSpec &spec, const TextMeasure &measure);

} // namespace Layout

#endif // INSPECTPRINT_MEDIAGRID_H
