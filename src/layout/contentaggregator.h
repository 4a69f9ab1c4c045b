/*
 * contentaggregator.h — Turn checklist items into ordered table rows
 *
 * Walks each item once: groups its tasks by location, emits one row per
 * task that passes the condition filter, then the media-only rows and
 * merged remark rows of each group's inspector entries. Photo and video
 * URIs are deduplicated per item so nothing is drawn twice.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_CONTENTAGGREGATOR_H
#define INSPECTPRINT_CONTENTAGGREGATOR_H

#include <QList>
#include <QStringList>

#include "conditionfilter.h"
#include "inspectionmodel.h"
#include "rowdescriptor.h"

class ImageCache;

namespace Layout {

struct AggregatorSettings {
    bool injectOthersTask = true;
    int remarksPerRow = 4;
};

// Tasks of item with a synthetic "Others" catch-all appended when no task
// is named "Others" (case-insensitive, trimmed).
QList<Inspection::Task> withOthersTask(const Inspection::ChecklistItem &item);

// imageCache may be null; photos then draw as unavailable tiles.
QList<RowDescriptor> buildRows(const QList<Inspection::ChecklistItem> &items,
                               ImageCache *imageCache,
                               const ConditionFilter::AllowSet &allowed,
                               bool entryOnly, bool includeMedia,
                               const AggregatorSettings &settings = {});

// Every photo URI buildRows() may resolve, in first-use order. Used to
// prefetch before layout.
QStringList photoUris(const QList<Inspection::ChecklistItem> &items);

// "Inspector: Jane • Recorded: 4 Mar 2025, 09:30" plus the remark line
QString formatEntryLine(const Inspection::Entry &entry);

} // namespace Layout

#endif // INSPECTPRINT_CONTENTAGGREGATOR_H
