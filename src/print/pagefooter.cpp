/*
 * pagefooter.cpp — Footer band drawn on every report page
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagefooter.h"
#include "drawsurface.h"

#include <QLocale>
#include <QRegularExpression>

namespace PageFooter {

namespace {

constexpr qreal kFooterFontSize = 8.0;
constexpr qreal kSeparatorWidth = 0.5;

} // anonymous namespace

void drawFooter(DrawSurface *surface, const QRectF &rect,
                const QString &left, const QString &right,
                const PageMetadata &meta)
{
    if (!surface || rect.height() <= 0)
        return;

    surface->drawLine(rect.topLeft(), rect.topRight(), QColor(0xcc, 0xcc, 0xcc),
                      kSeparatorWidth);

    TextStyle style;
    style.fontSize = kFooterFontSize;
    style.color = QColor(0x64, 0x74, 0x8b);

    const qreal lineHeight = surface->lineHeight(style);
    const qreal top = rect.top() + (rect.height() - lineHeight) / 2;
    const qreal half = rect.width() / 2;

    const QString resolvedLeft = resolveField(left, meta);
    const QString resolvedRight = resolveField(right, meta);

    if (!resolvedLeft.isEmpty())
        surface->drawText(resolvedLeft, QRectF(rect.left(), top, half, lineHeight), style);
    if (!resolvedRight.isEmpty())
        surface->drawText(resolvedRight, QRectF(rect.left() + half, top, half, lineHeight),
                          style, Qt::AlignRight);
}

QString resolveField(const QString &text, const PageMetadata &meta)
{
    if (text.isEmpty())
        return {};

    const QDate date = meta.generatedOn.isValid() ? meta.generatedOn.date()
                                                  : QDate::currentDate();

    QString result = text;
    result.replace(QLatin1String("{page}"), QString::number(meta.pageNumber + 1));
    result.replace(QLatin1String("{title}"), meta.title);
    result.replace(QLatin1String("{version}"), meta.version);
    result.replace(QLatin1String("{date}"),
                   QLocale(QLocale::English).toString(date, QStringLiteral("d MMM yyyy")));

    // Custom date format: {date:yyyy-MM-dd}
    static const QRegularExpression dateRx(QStringLiteral(R"(\{date:([^}]+)\})"));
    QRegularExpressionMatch match = dateRx.match(result);
    while (match.hasMatch()) {
        result.replace(match.captured(0), date.toString(match.captured(1)));
        match = dateRx.match(result);
    }

    return result.trimmed();
}

} // namespace PageFooter
