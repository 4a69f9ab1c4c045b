/*
 * reportgenerator.cpp — One inspection report render, start to finish
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reportgenerator.h"
#include "conditionfilter.h"
#include "contentaggregator.h"
#include "drawsurface.h"
#include "imagecache.h"
#include "pagefooter.h"
#include "paginator.h"
#include "paintersurface.h"
#include "tablerenderer.h"

#include <KLocalizedString>

#include <QDebug>
#include <QLocale>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>

namespace {

constexpr qreal kTitleFontSize = 18.0;
constexpr qreal kSectionFontSize = 12.0;
constexpr qreal kBlockSpacing = 12.0;
constexpr qreal kSignOffBoxHeight = 110.0;
constexpr qreal kSignOffReserve = 150.0;
constexpr qreal kSignOffGap = 16.0;

QString formatStamp(const QDateTime &dt)
{
    return QLocale(QLocale::English).toString(dt, QStringLiteral("d MMM yyyy, HH:mm"));
}

} // anonymous namespace

ReportGenerator::ReportGenerator(const ReportSettings &settings)
    : m_settings(settings)
{
}

void ReportGenerator::addFetcherFactory(const FetcherFactory &factory)
{
    if (factory)
        m_fetcherFactories.append(factory);
}

QList<Inspection::ChecklistItem> ReportGenerator::scopedItems(
    const Inspection::Record &record, const ReportOptions &options) const
{
    if (options.filterByScopeId.isEmpty())
        return record.items;

    QList<Inspection::ChecklistItem> items;
    for (const Inspection::ChecklistItem &item : record.items) {
        // Items without a scope belong to every scope
        if (item.scopeId.isEmpty() || item.scopeId == options.filterByScopeId)
            items.append(item);
    }
    return items;
}

qreal ReportGenerator::drawTitleBlock(DrawSurface *surface, const PageGeometry &geometry,
                                      qreal y, const Inspection::Record &record,
                                      const ReportOptions &options, bool measureOnly)
{
    const qreal left = geometry.contentLeft();
    const qreal width = geometry.contentWidth();
    const qreal top = y;

    auto put = [&](const QString &text, const TextStyle &style,
                   Qt::Alignment alignment = Qt::AlignLeft) {
        if (measureOnly)
            return surface->heightOfString(text, width, style);
        return surface->drawText(text, QRectF(left, y, width, 0), style, alignment);
    };

    TextStyle title;
    title.fontSize = kTitleFontSize;
    title.bold = true;
    const QString titleText = record.title.isEmpty() ? i18n("Inspection Report") : record.title;
    y += put(titleText, title, Qt::AlignHCenter);
    y += kBlockSpacing;

    if (options.includeMeta) {
        TextStyle body;
        body.fontSize = geometry.bodyFontSize;

        QStringList lines;
        if (!options.versionLabel.isEmpty())
            lines.append(i18n("Version: %1", options.versionLabel));
        const QDateTime generated = options.generatedOn.isValid()
            ? options.generatedOn : QDateTime::currentDateTime();
        lines.append(i18n("Generated: %1", formatStamp(generated)));
        if (!record.id.isEmpty())
            lines.append(i18n("Record ID: %1", record.id));
        if (!record.customerName.isEmpty())
            lines.append(i18n("Customer: %1", record.customerName));
        if (!record.address.isEmpty())
            lines.append(i18n("Property: %1", record.address));

        for (const QString &line : std::as_const(lines))
            y += put(line, body);
        y += kBlockSpacing;
    }

    TextStyle section;
    section.fontSize = kSectionFontSize;
    section.bold = true;
    const QString heading = options.heading.isEmpty() ? i18n("Inspection Checklist")
                                                      : options.heading;
    y += put(heading, section);
    y += kBlockSpacing / 2;

    return y - top;
}

qreal ReportGenerator::drawSignOff(DrawSurface *surface, const PageGeometry &geometry,
                                   qreal y, const Inspection::Record &record)
{
    const qreal top = y;
    const qreal left = geometry.contentLeft();

    TextStyle heading;
    heading.fontSize = kSectionFontSize;
    heading.bold = true;
    y += surface->drawText(i18n("Sign-Off"), QRectF(left, y, geometry.contentWidth(), 0),
                           heading);
    y += kBlockSpacing / 2;

    const qreal boxWidth = (geometry.contentWidth() - kSignOffGap) / 2;
    const QString customer = record.customerName.isEmpty() ? i18n("Customer")
                                                           : record.customerName;
    const QString company = m_settings.companyName.isEmpty() ? i18n("Inspection Company")
                                                             : m_settings.companyName;

    TextStyle label;
    label.fontSize = geometry.bodyFontSize;
    label.bold = true;
    TextStyle body;
    body.fontSize = geometry.bodyFontSize;

    auto drawBox = [&](qreal x, const QString &title) {
        const QColor ink = TableRenderer::kBorderColor;
        surface->drawRoundedRect(QRectF(x, y, boxWidth, kSignOffBoxHeight), 6, QColor(),
                                 ink, geometry.lineWidth);
        surface->drawText(title, QRectF(x + 10, y + 10, boxWidth - 20, 0), label);
        surface->drawText(i18n("Signature:"), QRectF(x + 10, y + 28, 70, 0), body);
        surface->drawLine(QPointF(x + 80, y + 42), QPointF(x + boxWidth - 10, y + 42), ink,
                          geometry.lineWidth);
        surface->drawText(i18n("Date:"), QRectF(x + 10, y + 64, 70, 0), body);
        surface->drawLine(QPointF(x + 80, y + 78), QPointF(x + boxWidth - 10, y + 78), ink,
                          geometry.lineWidth);
    };

    drawBox(left, i18n("Customer: %1", customer));
    drawBox(left + boxWidth + kSignOffGap, company);

    y += kSignOffBoxHeight;
    return y - top;
}

bool ReportGenerator::render(DrawSurface *surface, const Inspection::Record &record,
                             const ReportOptions &options, qreal startY,
                             ReportResult *result, QString *error)
{
    if (!surface) {
        if (error)
            *error = QStringLiteral("no drawing surface");
        return false;
    }

    PageGeometry geometry = m_settings.geometry;
    geometry.pageSize = surface->pageSize();
    if (!geometry.isUsable()) {
        if (error)
            *error = QStringLiteral("page %1 x %2 pt leaves no room for the table")
                         .arg(geometry.pageSize.width()).arg(geometry.pageSize.height());
        return false;
    }

    const QList<Inspection::ChecklistItem> items = scopedItems(record, options);

    ImageCache::Options cacheOptions;
    cacheOptions.workers = m_settings.fetchWorkers;
    cacheOptions.fetchTimeoutMs = m_settings.fetchTimeoutMs;
    cacheOptions.prefetchTimeoutMs = m_settings.prefetchTimeoutMs;
    cacheOptions.maxDimension = m_settings.maxImageDimension;
    ImageCache imageCache(cacheOptions);
    for (const FetcherFactory &factory : std::as_const(m_fetcherFactories))
        imageCache.addFetcher(factory());

    if (options.includeMedia)
        imageCache.prefetch(Layout::photoUris(items));

    Layout::AggregatorSettings aggregatorSettings;
    aggregatorSettings.injectOthersTask = m_settings.injectOthersTask;
    const QList<Layout::RowDescriptor> rows =
        Layout::buildRows(items, &imageCache,
                          ConditionFilter::fromList(options.allowedConditions),
                          options.entryOnly, options.includeMedia, aggregatorSettings);

    TableRenderer renderer(surface, geometry);
    Layout::Paginator paginator(surface, &renderer, geometry);

    PageMetadata meta;
    meta.title = record.title;
    meta.version = options.versionLabel;
    meta.generatedOn = options.generatedOn;
    paginator.setPageDecorator([&](int pageIndex) {
        PageMetadata pageMeta = meta;
        pageMeta.pageNumber = pageIndex;
        PageFooter::drawFooter(surface, geometry.footerRect(),
                               m_settings.footerLeft, m_settings.footerRight, pageMeta);
    });

    qreal y = startY < 0 ? geometry.contentTop() : startY;
    paginator.setCursor(y);
    if (options.startOnNewPage && y > geometry.contentTop())
        paginator.newPage(false);

    // The title block stays with the table header or the empty-record line
    TextStyle body;
    body.fontSize = geometry.bodyFontSize;
    const QString emptyText = i18n("No checklist items found for this record.");
    const qreal leadHeight = rows.isEmpty()
        ? surface->heightOfString(emptyText, geometry.contentWidth(), body)
        : renderer.headerHeight();
    const qreal titleHeight = drawTitleBlock(surface, geometry, paginator.cursor(), record,
                                             options, true);
    if (paginator.cursor() > geometry.contentTop()
        && titleHeight + leadHeight > paginator.remaining())
        paginator.newPage(false);

    y = paginator.cursor();
    y += drawTitleBlock(surface, geometry, y, record, options);
    paginator.setCursor(y);

    if (rows.isEmpty()) {
        y += surface->drawText(emptyText,
                               QRectF(geometry.contentLeft(), y, geometry.contentWidth(), 0),
                               body);
        paginator.setCursor(y);
    } else {
        paginator.beginTable();
        paginator.addRows(rows);
    }

    if (options.includeSignOff) {
        if (paginator.remaining() < kSignOffReserve + kBlockSpacing)
            paginator.newPage(false);
        y = paginator.cursor() + kBlockSpacing;
        y += drawSignOff(surface, geometry, y, record);
        paginator.setCursor(y);
    }

    paginator.finish();

    if (result) {
        result->pages = surface->pageIndex() + 1;
        result->rows = paginator.stats().rowsDrawn;
        result->photosDrawn = renderer.photosDrawn();
        result->placeholdersDrawn = renderer.placeholdersDrawn();
        result->videosDrawn = renderer.videosDrawn();
    }
    if (paginator.stats().forcedPlacements > 0)
        qWarning() << "ReportGenerator:" << paginator.stats().forcedPlacements
                   << "blocks were taller than an empty page";
    return true;
}

bool ReportGenerator::renderToPdf(const QString &filePath, const Inspection::Record &record,
                                  const ReportOptions &options,
                                  ReportResult *result, QString *error)
{
    const QSizeF pageSize = m_settings.geometry.pageSize;

    QPdfWriter writer(filePath);
    writer.setResolution(72);
    writer.setPageSize(QPageSize(pageSize, QPageSize::Point));
    writer.setPageMargins(QMarginsF(0, 0, 0, 0));
    writer.setTitle(record.title.isEmpty() ? i18n("Inspection Report") : record.title);
    writer.setCreator(QStringLiteral("InspectPrint"));

    QPainter painter;
    if (!painter.begin(&writer)) {
        if (error)
            *error = QStringLiteral("cannot write %1").arg(filePath);
        return false;
    }

    PainterSurface surface(&painter, &writer, pageSize);
    const bool ok = render(&surface, record, options, -1, result, error);
    painter.end();
    return ok;
}
