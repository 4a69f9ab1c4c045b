/*
 * pagefooter.h — Footer band drawn on every report page
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_PAGEFOOTER_H
#define INSPECTPRINT_PAGEFOOTER_H

#include <QDateTime>
#include <QRectF>
#include <QString>

class DrawSurface;

struct PageMetadata {
    int pageNumber = 0;   // 0-based
    QString title;
    QString version;
    QDateTime generatedOn;
};

namespace PageFooter {

// Separator along the top of rect, then the left and right fields
// vertically centered in the band.
void drawFooter(DrawSurface *surface, const QRectF &rect,
                const QString &left, const QString &right,
                const PageMetadata &meta);

// Expands {page}, {title}, {version}, {date} and {date:<format>}
QString resolveField(const QString &text, const PageMetadata &meta);

} // namespace PageFooter

#endif // INSPECTPRINT_PAGEFOOTER_H
