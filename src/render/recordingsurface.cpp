/*
 * recordingsurface.cpp — Headless DrawSurface that records every operation
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "recordingsurface.h"

RecordingSurface::RecordingSurface(const QSizeF &pageSize)
    : m_pageSize(pageSize)
{
}

void RecordingSurface::addPage()
{
    DrawOp op;
    op.kind = DrawOp::PageBreak;
    record(op);
    ++m_page;
}

qreal RecordingSurface::textAdvance(const QString &text, const TextStyle &style) const
{
    const qreal perChar = style.fontSize * (style.bold ? 0.55 : 0.5);
    return text.size() * perChar;
}

qreal RecordingSurface::lineHeight(const TextStyle &style) const
{
    return style.fontSize * 1.2;
}

void RecordingSurface::drawTextLine(const QString &line, const QPointF &topLeft,
                                    const TextStyle &style)
{
    DrawOp op;
    op.kind = DrawOp::Text;
    op.rect = QRectF(topLeft, QSizeF(textAdvance(line, style), lineHeight(style)));
    op.text = line;
    op.fill = style.color;
    record(op);
}

void RecordingSurface::drawRect(const QRectF &rect, const QColor &fill,
                                const QColor &stroke, qreal strokeWidth)
{
    Q_UNUSED(strokeWidth)
    DrawOp op;
    op.kind = DrawOp::Rect;
    op.rect = rect;
    op.fill = fill;
    op.stroke = stroke;
    record(op);
}

void RecordingSurface::drawRoundedRect(const QRectF &rect, qreal radius,
                                       const QColor &fill, const QColor &stroke,
                                       qreal strokeWidth)
{
    Q_UNUSED(radius)
    Q_UNUSED(strokeWidth)
    DrawOp op;
    op.kind = DrawOp::RoundedRect;
    op.rect = rect;
    op.fill = fill;
    op.stroke = stroke;
    record(op);
}

void RecordingSurface::drawCircle(const QPointF &center, qreal radius,
                                  const QColor &fill, const QColor &stroke,
                                  qreal strokeWidth)
{
    Q_UNUSED(strokeWidth)
    DrawOp op;
    op.kind = DrawOp::Circle;
    op.rect = QRectF(center.x() - radius, center.y() - radius, 2 * radius, 2 * radius);
    op.fill = fill;
    op.stroke = stroke;
    record(op);
}

void RecordingSurface::drawLine(const QPointF &p1, const QPointF &p2,
                                const QColor &color, qreal width)
{
    Q_UNUSED(width)
    DrawOp op;
    op.kind = DrawOp::Line;
    op.rect = QRectF(p1, p2).normalized();
    op.stroke = color;
    record(op);
}

void RecordingSurface::drawPolygon(const QPolygonF &polygon, const QColor &fill)
{
    DrawOp op;
    op.kind = DrawOp::Polygon;
    op.rect = polygon.boundingRect();
    op.fill = fill;
    record(op);
}

bool RecordingSurface::drawImage(const QRectF &box, const QImage &image)
{
    if (m_rejectImages || image.isNull())
        return false;

    DrawOp op;
    op.kind = DrawOp::Image;
    op.rect = fitInside(QSizeF(image.size()), box);
    op.imageKey = image.cacheKey();
    record(op);
    return true;
}

QList<DrawOp> RecordingSurface::ops(DrawOp::Kind kind) const
{
    QList<DrawOp> result;
    for (const DrawOp &op : m_ops) {
        if (op.kind == kind)
            result.append(op);
    }
    return result;
}

bool RecordingSurface::containsText(const QString &needle) const
{
    for (const DrawOp &op : m_ops) {
        if (op.kind == DrawOp::Text && op.text.contains(needle))
            return true;
    }
    return false;
}

void RecordingSurface::record(DrawOp op)
{
    op.page = m_page;
    m_ops.append(op);
}
