/*
 * recordingsurface.h — Headless DrawSurface that records every operation
 *
 * Uses fixed, font-independent metrics so that layouts are reproducible
 * on any machine: a character advances half the font size (55% bold) and
 * a line is 1.2 times the font size tall. Used by the tests and by the
 * command-line dry run.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_RECORDINGSURFACE_H
#define INSPECTPRINT_RECORDINGSURFACE_H

#include "drawsurface.h"

#include <QList>

struct DrawOp {
    enum Kind { Text, Rect, RoundedRect, Circle, Line, Polygon, Image, PageBreak };

    Kind kind = Text;
    int page = 0;
    QRectF rect;        // bounding box on the page
    QString text;       // Text only
    QColor fill;
    QColor stroke;
    qint64 imageKey = 0; // QImage::cacheKey() of drawn images
};

class RecordingSurface : public DrawSurface
{
public:
    explicit RecordingSurface(const QSizeF &pageSize = QSizeF(595.28, 841.89));

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

    /// Simulate a backend that rejects every image buffer.
    void setRejectImages(bool reject) { m_rejectImages = reject; }

    const QList<DrawOp> &ops() const { return m_ops; }
    QList<DrawOp> ops(DrawOp::Kind kind) const;
    int pageCount() const { return m_page + 1; }
    bool containsText(const QString &needle) const;

private:
    void record(DrawOp op);

    QSizeF m_pageSize;
    int m_page = 0;
    bool m_rejectImages = false;
    QList<DrawOp> m_ops;
};

#endif // INSPECTPRINT_RECORDINGSURFACE_H
