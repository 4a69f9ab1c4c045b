/*
 * paintersurface.h — QPainter backend for DrawSurface
 *
 * Draws on any paged paint device; the report generator uses a QPdfWriter
 * at 72 dpi so that one device unit is one point.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_PAINTERSURFACE_H
#define INSPECTPRINT_PAINTERSURFACE_H

#include "drawsurface.h"

#include <QFont>
#include <QString>

class QPagedPaintDevice;
class QPainter;

class PainterSurface : public DrawSurface
{
public:
    /// The caller retains ownership of painter and device; the painter
    /// must be active on the device.
    PainterSurface(QPainter *painter, QPagedPaintDevice *device, const QSizeF &pageSize);

    void setFontFamily(const QString &family) { m_fontFamily = family; }

    QSizeF pageSize() const override { return m_pageSize; }
    int pageIndex() const override { return m_page; }
    void addPage() override;

    qreal textAdvance(const QString &text, const TextStyle &style) const override;
    qreal lineHeight(const TextStyle &style) const override;

    void drawTextLine(const QString &line, const QPointF &topLeft,
                      const TextStyle &style) override;
    void drawRect(const QRectF &rect, const QColor &fill,
                  const QColor &stroke = QColor(), qreal strokeWidth = 0) override;
    void drawRoundedRect(const QRectF &rect, qreal radius,
                         const QColor &fill, const QColor &stroke = QColor(),
                         qreal strokeWidth = 0) override;
    void drawCircle(const QPointF &center, qreal radius,
                    const QColor &fill, const QColor &stroke = QColor(),
                    qreal strokeWidth = 0) override;
    void drawLine(const QPointF &p1, const QPointF &p2,
                  const QColor &color, qreal width = 0.5) override;
    void drawPolygon(const QPolygonF &polygon, const QColor &fill) override;
    bool drawImage(const QRectF &box, const QImage &image) override;

private:
    QFont fontFor(const TextStyle &style) const;
    void applyFillAndStroke(const QColor &fill, const QColor &stroke, qreal strokeWidth);

    QPainter *m_painter;
    QPagedPaintDevice *m_device;
    QSizeF m_pageSize;
    QString m_fontFamily{QStringLiteral("Helvetica")};
    int m_page = 0;
};

#endif // INSPECTPRINT_PAINTERSURFACE_H
