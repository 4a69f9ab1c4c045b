/*
 * reportsettings.h — Tunables read from the inspectprintrc config file
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_REPORTSETTINGS_H
#define INSPECTPRINT_REPORTSETTINGS_H

#include <KSharedConfig>

#include "pagegeometry.h"

struct ReportSettings
{
    PageGeometry geometry;

    // [Images]
    int fetchWorkers = 4;
    int fetchTimeoutMs = 5000;
    int prefetchTimeoutMs = 30000;
    int maxImageDimension = 1600;

    // [Content]
    bool injectOthersTask = true;
    QString footerLeft{QStringLiteral("{title}")};
    QString footerRight{QStringLiteral("Page {page}")};
    QString companyName;    // sign-off box; empty = generic label

    // Missing groups and keys keep their defaults; out-of-range values
    // are clamped and reported with qWarning().
    static ReportSettings load(const KSharedConfigPtr &config);
    static ReportSettings loadFile(const QString &path);
};

#endif // INSPECTPRINT_REPORTSETTINGS_H
