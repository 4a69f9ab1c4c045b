/*
 * reportgenerator.h — One inspection report render, start to finish
 *
 * Scopes the image cache to a single render: prefetches the record's
 * photos, aggregates rows, then paginates them onto the surface with the
 * title block, the table, the optional sign-off boxes and a footer on
 * every page.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_REPORTGENERATOR_H
#define INSPECTPRINT_REPORTGENERATOR_H

#include <QString>

#include <functional>
#include <memory>

#include "imagefetcher.h"
#include "inspectionmodel.h"
#include "reportoptions.h"
#include "reportsettings.h"

class DrawSurface;

struct ReportResult {
    int pages = 0;
    int rows = 0;
    int photosDrawn = 0;
    int placeholdersDrawn = 0;
    int videosDrawn = 0;
};

class ReportGenerator {
public:
    using FetcherFactory = std::function<std::unique_ptr<ImageFetcher>()>;

    explicit ReportGenerator(const ReportSettings &settings = {});

    /// Register a byte source for URI schemes the local fetcher does not
    /// serve. A fresh fetcher is created for every render.
    void addFetcherFactory(const FetcherFactory &factory);

    /// Lay the report out on surface, starting at startY on its current
    /// page (negative = top of the page body). Returns false only when the
    /// surface cannot hold a table at all.
    bool render(DrawSurface *surface, const Inspection::Record &record,
                const ReportOptions &options, qreal startY = -1,
                ReportResult *result = nullptr, QString *error = nullptr);

    bool renderToPdf(const QString &filePath, const Inspection::Record &record,
                     const ReportOptions &options,
                     ReportResult *result = nullptr, QString *error = nullptr);

    const ReportSettings &settings() const { return m_settings; }

private:
    QList<Inspection::ChecklistItem> scopedItems(const Inspection::Record &record,
                                                 const ReportOptions &options) const;
    qreal drawTitleBlock(DrawSurface *surface, const PageGeometry &geometry, qreal y,
                         const Inspection::Record &record, const ReportOptions &options,
                         bool measureOnly = false);
    qreal drawSignOff(DrawSurface *surface, const PageGeometry &geometry, qreal y,
                      const Inspection::Record &record);

    ReportSettings m_settings;
    QList<FetcherFactory> m_fetcherFactories;
};

#endif // INSPECTPRINT_REPORTGENERATOR_H
