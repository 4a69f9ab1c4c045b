/*
 * inspectionmodel.h — Inspection record types (header-only)
 *
 * The read-only snapshot the report engine lays out: checklist items,
 * their locations and tasks, and the inspector entries with attached
 * photos and videos. Nothing in the engine mutates these.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_INSPECTIONMODEL_H
#define INSPECTPRINT_INSPECTIONMODEL_H

#include <QDateTime>
#include <QList>
#include <QString>

namespace Inspection {

// --- Media ---

struct MediaRef {
    enum Type { Photo, Video };

    QString uri;
    Type type = Photo;
    QString caption;    // empty = none
    int order = 0;      // sequence index within the owning entry/task
};

// --- Contributions ---

struct Author {
    enum Role { Inspector, Admin };

    QString name;
    Role role = Inspector;
};

struct Entry {
    QString id;
    Author author;
    QString remarks;
    QString condition;      // code, e.g. "FAIR"; empty = none recorded
    QString cause;
    QString resolution;
    QDateTime createdOn;
    QList<MediaRef> media;
    bool includeInReport = false;

    QString locationId;     // empty = not tied to a location
    QString taskId;         // empty = standalone entry
};

// --- Checklist structure ---

struct Location {
    QString id;
    QString name;
    QString remarks;
    QString condition;
};

struct Task {
    QString id;
    QString name;
    QString condition;
    QString locationId;
    QString locationName;   // free-text location when there is no id
    QString cause;          // task-level aggregated detail
    QString resolution;
    QList<MediaRef> media;
    QList<Entry> entries;
    bool synthetic = false; // injected catch-all, see withOthersTask()
};

struct ChecklistItem {
    QString id;
    QString name;
    QString status;
    QString scopeId;
    QList<Location> locations;
    QList<Task> tasks;
    QList<Entry> entries;   // standalone contributions
};

struct Record {
    QString id;
    QString title;
    QString customerName;
    QString address;
    QList<ChecklistItem> items;
};

} // namespace Inspection

#endif // INSPECTPRINT_INSPECTIONMODEL_H
