/*
 * drawsurface.cpp — Shared text helpers for DrawSurface backends
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "drawsurface.h"
#include "textwrap.h"

DrawSurface::~DrawSurface() = default;

QStringList DrawSurface::wrap(const QString &text, qreal width, const TextStyle &style) const
{
    return Layout::wrapLines(text, width, [this, &style](const QString &s) {
        return textAdvance(s, style);
    });
}

qreal DrawSurface::heightOfString(const QString &text, qreal width,
                                  const TextStyle &style) const
{
    return wrap(text, width, style).size() * lineHeight(style);
}

qreal DrawSurface::drawText(const QString &text, const QRectF &box,
                            const TextStyle &style, Qt::Alignment alignment)
{
    const QStringList lines = wrap(text, box.width(), style);
    const qreal lh = lineHeight(style);
    qreal y = box.top();
    for (const QString &line : lines) {
        qreal x = box.left();
        if (alignment & (Qt::AlignRight | Qt::AlignHCenter)) {
            const qreal slack = box.width() - textAdvance(line, style);
            x += (alignment & Qt::AlignRight) ? slack : slack / 2;
        }
        if (!line.isEmpty())
            drawTextLine(line, QPointF(x, y), style);
        y += lh;
    }
    return y - box.top();
}

QRectF DrawSurface::fitInside(const QSizeF &imageSize, const QRectF &box)
{
    if (imageSize.isEmpty() || box.isEmpty())
        return {};
    const QSizeF scaled = imageSize.scaled(box.size(), Qt::KeepAspectRatio);
    return QRectF(box.left() + (box.width() - scaled.width()) / 2,
                  box.top() + (box.height() - scaled.height()) / 2,
                  scaled.width(), scaled.height());
}
