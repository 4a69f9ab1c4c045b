/*
 * reportsettings.cpp — Tunables read from the inspectprintrc config file
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reportsettings.h"

#include <KConfigGroup>

#include <QDebug>

#include <algorithm>

namespace {

qreal atLeast(qreal value, qreal minimum, const char *key)
{
    if (value < minimum) {
        qWarning() << "ReportSettings:" << key << "=" << value
                   << "is out of range, using" << minimum;
        return minimum;
    }
    return value;
}

} // anonymous namespace

ReportSettings ReportSettings::load(const KSharedConfigPtr &config)
{
    ReportSettings s;
    if (!config)
        return s;

    PageGeometry &g = s.geometry;

    KConfigGroup layout(config, QStringLiteral("Layout"));
    const qreal pageWidth = layout.readEntry("PageWidth", g.pageSize.width());
    const qreal pageHeight = layout.readEntry("PageHeight", g.pageSize.height());
    g.pageSize = QSizeF(pageWidth, pageHeight);
    g.margin = atLeast(layout.readEntry("Margin", g.margin), 0, "Margin");
    g.footerReserved = atLeast(layout.readEntry("FooterReserved", g.footerReserved),
                               0, "FooterReserved");
    g.tileColumns = static_cast<int>(atLeast(layout.readEntry("TileColumns", g.tileColumns),
                                             1, "TileColumns"));
    g.photoTileHeight = atLeast(layout.readEntry("PhotoTileHeight", g.photoTileHeight),
                                8, "PhotoTileHeight");
    g.videoTileHeight = atLeast(layout.readEntry("VideoTileHeight", g.videoTileHeight),
                                8, "VideoTileHeight");
    g.gutter = atLeast(layout.readEntry("Gutter", g.gutter), 0, "Gutter");
    g.captionGap = atLeast(layout.readEntry("CaptionGap", g.captionGap), 0, "CaptionGap");
    g.captionFontSize = atLeast(layout.readEntry("CaptionFontSize", g.captionFontSize),
                                4, "CaptionFontSize");
    g.cellPadding = atLeast(layout.readEntry("CellPadding", g.cellPadding), 0, "CellPadding");
    g.minRowHeight = atLeast(layout.readEntry("MinRowHeight", g.minRowHeight),
                             0, "MinRowHeight");
    g.segmentSpacing = atLeast(layout.readEntry("SegmentSpacing", g.segmentSpacing),
                               0, "SegmentSpacing");
    g.bodyFontSize = atLeast(layout.readEntry("BodyFontSize", g.bodyFontSize),
                             4, "BodyFontSize");

    const QList<qreal> fractions = layout.readEntry("ColumnFractions", QList<qreal>());
    if (fractions.size() == 4
        && std::all_of(fractions.begin(), fractions.end(), [](qreal f) { return f > 0; })) {
        g.columnFractions = fractions;
    } else if (!fractions.isEmpty()) {
        qWarning() << "ReportSettings: ColumnFractions needs four positive values, got"
                   << fractions;
    }

    KConfigGroup images(config, QStringLiteral("Images"));
    s.fetchWorkers = static_cast<int>(atLeast(images.readEntry("FetchWorkers", s.fetchWorkers),
                                              1, "FetchWorkers"));
    s.fetchTimeoutMs = images.readEntry("FetchTimeoutMs", s.fetchTimeoutMs);
    s.prefetchTimeoutMs = images.readEntry("PrefetchTimeoutMs", s.prefetchTimeoutMs);
    s.maxImageDimension = static_cast<int>(
        atLeast(images.readEntry("MaxImageDimension", s.maxImageDimension),
                16, "MaxImageDimension"));

    KConfigGroup content(config, QStringLiteral("Content"));
    s.injectOthersTask = content.readEntry("InjectOthersTask", s.injectOthersTask);
    s.footerLeft = content.readEntry("FooterLeft", s.footerLeft);
    s.footerRight = content.readEntry("FooterRight", s.footerRight);
    s.companyName = content.readEntry("CompanyName", s.companyName);

    return s;
}

ReportSettings ReportSettings::loadFile(const QString &path)
{
    if (path.isEmpty())
        return load(KSharedConfig::openConfig());
    return load(KSharedConfig::openConfig(path, KConfig::SimpleConfig));
}
