/*
 * drawsurface.h — Abstract page surface the report engine draws on
 *
 * Declares the primitives each backend (PDF painter, recording surface)
 * implements. Text wrapping and alignment are shared in the base so that
 * every backend breaks lines the same way for a given font metric.
 *
 * All coordinates are in points with the origin at the top-left corner of
 * the current page.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_DRAWSURFACE_H
#define INSPECTPRINT_DRAWSURFACE_H

#include <QColor>
#include <QImage>
#include <QPointF>
#include <QPolygonF>
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QStringList>

struct TextStyle {
    qreal fontSize = 10.0;
    bool bold = false;
    QColor color = QColor(0x11, 0x18, 0x27);
};

class DrawSurface
{
public:
    virtual ~DrawSurface();

    // --- Page metrics ---

    virtual QSizeF pageSize() const = 0;

    /// Zero-based index of the page currently drawn on.
    virtual int pageIndex() const = 0;

    /// Finish the current page and continue on a fresh one.
    virtual void addPage() = 0;

    // --- Measurement ---

    virtual qreal textAdvance(const QString &text, const TextStyle &style) const = 0;
    virtual qreal lineHeight(const TextStyle &style) const = 0;

    QStringList wrap(const QString &text, qreal width, const TextStyle &style) const;
    qreal heightOfString(const QString &text, qreal width, const TextStyle &style) const;

    // --- Drawing primitives (pure virtual, one per backend) ---

    /// Draw one unwrapped line with its top-left corner at topLeft.
    virtual void drawTextLine(const QString &line, const QPointF &topLeft,
                              const TextStyle &style) = 0;

    virtual void drawRect(const QRectF &rect, const QColor &fill,
                          const QColor &stroke = QColor(),
                          qreal strokeWidth = 0) = 0;

    virtual void drawRoundedRect(const QRectF &rect, qreal radius,
                                 const QColor &fill, const QColor &stroke = QColor(),
                                 qreal strokeWidth = 0) = 0;

    virtual void drawCircle(const QPointF &center, qreal radius,
                            const QColor &fill, const QColor &stroke = QColor(),
                            qreal strokeWidth = 0) = 0;

    virtual void drawLine(const QPointF &p1, const QPointF &p2,
                          const QColor &color, qreal width = 0.5) = 0;

    /// Fill a closed polygon.
    virtual void drawPolygon(const QPolygonF &polygon, const QColor &fill) = 0;

    /// Draw an image scaled to fit inside box, centered. Returns false when
    /// the backend cannot use the buffer; nothing is drawn in that case.
    virtual bool drawImage(const QRectF &box, const QImage &image) = 0;

    // --- Shared helpers ---

    /// Wrap text to the width of box and draw it from box.top(). Height of
    /// box is not a clip. Returns the height used.
    qreal drawText(const QString &text, const QRectF &box, const TextStyle &style,
                   Qt::Alignment alignment = Qt::AlignLeft);

protected:
    /// Rectangle of an image of the given size fitted inside box.
    static QRectF fitInside(const QSizeF &imageSize, const QRectF &box);
};

#endif // INSPECTPRINT_DRAWSURFACE_H
