/*
 * paintersurface.cpp — QPainter backend for DrawSurface
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "paintersurface.h"

#include <QFontMetricsF>
#include <QPagedPaintDevice>
#include <QPainter>
#include <QPen>

PainterSurface::PainterSurface(QPainter *painter, QPagedPaintDevice *device,
                               const QSizeF &pageSize)
    : m_painter(painter)
    , m_device(device)
    , m_pageSize(pageSize)
{
}

void PainterSurface::addPage()
{
    if (m_device->newPage())
        ++m_page;
}

QFont PainterSurface::fontFor(const TextStyle &style) const
{
    QFont font(m_fontFamily);
    font.setPointSizeF(style.fontSize);
    font.setBold(style.bold);
    return font;
}

qreal PainterSurface::textAdvance(const QString &text, const TextStyle &style) const
{
    QFontMetricsF fm(fontFor(style), m_device);
    return fm.horizontalAdvance(text);
}

qreal PainterSurface::lineHeight(const TextStyle &style) const
{
    QFontMetricsF fm(fontFor(style), m_device);
    return fm.lineSpacing();
}

void PainterSurface::drawTextLine(const QString &line, const QPointF &topLeft,
                                  const TextStyle &style)
{
    const QFont font = fontFor(style);
    QFontMetricsF fm(font, m_device);

    m_painter->save();
    m_painter->setFont(font);
    m_painter->setPen(style.color);
    m_painter->drawText(QPointF(topLeft.x(), topLeft.y() + fm.ascent()), line);
    m_painter->restore();
}

void PainterSurface::applyFillAndStroke(const QColor &fill, const QColor &stroke,
                                        qreal strokeWidth)
{
    if (stroke.isValid())
        m_painter->setPen(QPen(stroke, strokeWidth));
    else
        m_painter->setPen(Qt::NoPen);
    if (fill.isValid())
        m_painter->setBrush(fill);
    else
        m_painter->setBrush(Qt::NoBrush);
}

void PainterSurface::drawRect(const QRectF &rect, const QColor &fill,
                              const QColor &stroke, qreal strokeWidth)
{
    m_painter->save();
    applyFillAndStroke(fill, stroke, strokeWidth);
    m_painter->drawRect(rect);
    m_painter->restore();
}

void PainterSurface::drawRoundedRect(const QRectF &rect, qreal radius,
                                     const QColor &fill, const QColor &stroke,
                                     qreal strokeWidth)
{
    m_painter->save();
    m_painter->setRenderHint(QPainter::Antialiasing);
    applyFillAndStroke(fill, stroke, strokeWidth);
    m_painter->drawRoundedRect(rect, radius, radius);
    m_painter->restore();
}

void PainterSurface::drawCircle(const QPointF &center, qreal radius,
                                const QColor &fill, const QColor &stroke,
                                qreal strokeWidth)
{
    m_painter->save();
    m_painter->setRenderHint(QPainter::Antialiasing);
    applyFillAndStroke(fill, stroke, strokeWidth);
    m_painter->drawEllipse(center, radius, radius);
    m_painter->restore();
}

void PainterSurface::drawLine(const QPointF &p1, const QPointF &p2,
                              const QColor &color, qreal width)
{
    m_painter->save();
    m_painter->setPen(QPen(color, width));
    m_painter->drawLine(p1, p2);
    m_painter->restore();
}

void PainterSurface::drawPolygon(const QPolygonF &polygon, const QColor &fill)
{
    m_painter->save();
    m_painter->setRenderHint(QPainter::Antialiasing);
    m_painter->setPen(Qt::NoPen);
    m_painter->setBrush(fill);
    m_painter->drawPolygon(polygon);
    m_painter->restore();
}

bool PainterSurface::drawImage(const QRectF &box, const QImage &image)
{
    if (image.isNull() || image.format() == QImage::Format_Invalid)
        return false;

    const QRectF target = fitInside(QSizeF(image.size()), box);
    if (target.isEmpty())
        return false;

    m_painter->save();
    m_painter->setRenderHint(QPainter::SmoothPixmapTransform);
    m_painter->drawImage(target, image);
    m_painter->restore();
    return true;
}
