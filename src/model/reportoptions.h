/*
 * reportoptions.h — Options for one report render
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_REPORTOPTIONS_H
#define INSPECTPRINT_REPORTOPTIONS_H

#include <QDateTime>
#include <QString>
#include <QStringList>

struct ReportOptions {
    // Section heading drawn above the table
    QString heading;
    bool startOnNewPage = false;
    bool includeMeta = true;        // record title/customer block

    // Content selection
    QString filterByScopeId;        // empty = all items
    QStringList allowedConditions;  // case-insensitive; empty = no filter
    bool entryOnly = false;         // entry-level remarks only
    bool includeMedia = true;

    // Footer fields
    QString versionLabel;
    QDateTime generatedOn;          // invalid = now

    bool includeSignOff = false;
};

#endif // INSPECTPRINT_REPORTOPTIONS_H
