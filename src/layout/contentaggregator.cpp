/*
 * contentaggregator.cpp — Turn checklist items into ordered table rows
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "contentaggregator.h"
#include "imagecache.h"

#include <KLocalizedString>

#include <QHash>
#include <QLocale>
#include <QSet>

#include <algorithm>

using namespace Inspection;

namespace Layout {

namespace {

bool isOthersName(const QString &name)
{
    return name.trimmed().compare(QLatin1String("others"), Qt::CaseInsensitive) == 0;
}

QString formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid())
        return {};
    return QLocale(QLocale::English).toString(dt, QStringLiteral("d MMM yyyy, HH:mm"));
}

QString formatDate(const QDate &date)
{
    if (!date.isValid())
        return i18n("Undated");
    return QLocale(QLocale::English).toString(date, QStringLiteral("d MMM yyyy"));
}

QString authorLabel(const Author &author)
{
    const QString name = author.name.trimmed();
    if (name.isEmpty())
        return i18n("Team member");
    if (author.role == Author::Admin)
        return i18n("Admin: %1", name);
    return i18n("Inspector: %1", name);
}

QString mediaSummary(int photos, int videos)
{
    QStringList parts;
    if (photos > 0)
        parts.append(i18np("%1 photo", "%1 photos", photos));
    if (videos > 0)
        parts.append(i18np("%1 video", "%1 videos", videos));
    return parts.join(QLatin1String(", "));
}

struct Group {
    QString key;
    QString label;
    QList<const Task *> tasks;
    const Location *location = nullptr;
    QList<const Entry *> entries;   // standalone entries routed to this group
};

// An entry with the numbered label of the task it belongs to
struct PlacedEntry {
    const Entry *entry = nullptr;
    QString taskLabel;              // empty = not tied to a task
};

struct Bucket {
    QString title;
    QList<MediaTile> untaskedPhotos;
    QList<MediaTile> untaskedVideos;
    QList<MediaTile> taskedPhotos;
    QList<MediaTile> taskedVideos;
};

class ItemBuilder
{
public:
    ItemBuilder(const ChecklistItem &item, int itemNumber, ImageCache *imageCache,
                const ConditionFilter::AllowSet &allowed, bool entryOnly, bool includeMedia,
                const AggregatorSettings &settings, QList<RowDescriptor> *rows)
        : m_item(item)
        , m_itemNumber(itemNumber)
        , m_imageCache(imageCache)
        , m_allowed(allowed)
        , m_entryOnly(entryOnly)
        , m_includeMedia(includeMedia)
        , m_settings(settings)
        , m_rows(rows)
    {
        const QString name = item.name.trimmed().isEmpty()
            ? i18n("Checklist Item %1", itemNumber) : item.name.trimmed();
        m_itemLabel = QStringLiteral("%1. %2").arg(itemNumber).arg(name);
        m_generalLabel = i18n("%1 — General", name);
        m_keyPrefix = (item.id.isEmpty() ? QString::number(itemNumber) : item.id)
                      + QLatin1Char('/');
    }

    void build();

private:
    bool entryEligible(const Entry &entry) const;
    void buildGroups();
    void routeStandaloneEntries();
    QList<const Entry *> entriesOfTask(const Task *task) const;

    void emitFallbackRow();
    void emitTaskRow(const Group &group, const Task *task, const QString &taskLabel,
                     const QList<const Entry *> &entries, bool firstInGroup);
    void emitEntryRows(QList<PlacedEntry> entries, const QString &groupLabel,
                       const QString &groupingKey, const QString &leadingRemark);
    void emitMediaRows(const QList<PlacedEntry> &entries, const QString &groupLabel,
                       const QString &groupingKey);
    void emitRemarkRows(const QList<PlacedEntry> &entries, const QString &groupingKey,
                        const QString &leadingRemark);

    QString conditionText(const Task *task, const QList<const Entry *> &entries) const;
    bool claim(const MediaRef &ref);
    MediaTile makeTile(const MediaRef &ref, const QString &caption) const;

    const ChecklistItem &m_item;
    const int m_itemNumber;
    ImageCache *m_imageCache;
    const ConditionFilter::AllowSet &m_allowed;
    const bool m_entryOnly;
    const bool m_includeMedia;
    const AggregatorSettings &m_settings;
    QList<RowDescriptor> *m_rows;

    QString m_itemLabel;
    QString m_generalLabel;
    QString m_keyPrefix;
    bool m_itemLabelPending = true;

    QList<Task> m_tasks;
    QList<Group> m_groups;
    QHash<QString, int> m_groupIndex;
    QHash<QString, QList<const Entry *>> m_extraTaskEntries; // taskId -> standalone entries
    QList<const Entry *> m_leftoverEntries;

    QSet<QString> m_seenPhotos;
    QSet<QString> m_seenVideos;
};

bool ItemBuilder::entryEligible(const Entry &entry) const
{
    if (!entry.includeInReport)
        return false;
    if (m_entryOnly && !ConditionFilter::passes(m_allowed, entry.condition))
        return false;
    return true;
}

void ItemBuilder::build()
{
    const bool hasStructure = !m_item.tasks.isEmpty() || !m_item.locations.isEmpty();
    m_tasks = (hasStructure && m_settings.injectOthersTask) ? withOthersTask(m_item)
                                                            : m_item.tasks;
    buildGroups();
    routeStandaloneEntries();

    if (m_groups.isEmpty()) {
        emitFallbackRow();
    } else {
        for (int g = 0; g < m_groups.size(); ++g) {
            const Group &group = m_groups[g];
            QList<PlacedEntry> groupEntries;
            for (const Entry *entry : group.entries)
                groupEntries.append({entry, QString()});

            bool firstInGroup = true;
            for (int t = 0; t < group.tasks.size(); ++t) {
                const Task *task = group.tasks[t];
                if (!ConditionFilter::passes(m_allowed, task->condition))
                    continue;

                const QList<const Entry *> entries = entriesOfTask(task);
                // The catch-all only earns a row when something landed in it
                if (task->synthetic && entries.isEmpty() && groupEntries.isEmpty())
                    continue;

                const QString name = task->name.trimmed().isEmpty()
                    ? i18n("Subtask") : task->name.trimmed();
                const QString taskLabel = QStringLiteral("%1.%2.%3 %4")
                    .arg(m_itemNumber).arg(g + 1).arg(t + 1).arg(name);

                emitTaskRow(group, task, taskLabel, entries, firstInGroup);
                firstInGroup = false;

                for (const Entry *entry : entries)
                    groupEntries.append({entry, taskLabel});
            }

            QString leadingRemark;
            if (!m_entryOnly && group.location && !group.location->remarks.trimmed().isEmpty())
                leadingRemark = i18n("%1: %2", group.label, group.location->remarks.trimmed());

            emitEntryRows(groupEntries, group.label, m_keyPrefix + group.key, leadingRemark);
        }
    }

    // Entries attached to no known location or task
    QList<PlacedEntry> leftovers;
    for (const Entry *entry : m_leftoverEntries)
        leftovers.append({entry, QString()});
    emitEntryRows(leftovers, m_generalLabel, m_keyPrefix + QStringLiteral("general-entries"),
                  QString());
}

void ItemBuilder::buildGroups()
{
    QHash<QString, const Location *> locationById;
    for (const Location &loc : m_item.locations) {
        if (!loc.id.isEmpty())
            locationById.insert(loc.id, &loc);
    }

    auto groupFor = [this](const QString &key, const QString &label) -> Group & {
        auto it = m_groupIndex.constFind(key);
        if (it != m_groupIndex.constEnd())
            return m_groups[it.value()];
        Group group;
        group.key = key;
        group.label = label;
        m_groupIndex.insert(key, m_groups.size());
        m_groups.append(group);
        return m_groups.last();
    };

    for (const Task &task : std::as_const(m_tasks)) {
        const bool others = isOthersName(task.name);
        const Location *location = locationById.value(task.locationId, nullptr);

        QString key;
        if (!task.locationId.isEmpty())
            key = QStringLiteral("loc-") + task.locationId;
        else if (!task.locationName.isEmpty())
            key = QStringLiteral("locname-") + task.locationName.toLower();
        else if (others)
            key = QStringLiteral("others");
        else
            key = QStringLiteral("general");

        QString label;
        if (others)
            label = i18n("Others");
        else if (location && !location->name.isEmpty())
            label = location->name;
        else if (!task.locationName.isEmpty())
            label = task.locationName;
        else
            label = m_generalLabel;

        Group &group = groupFor(key, label);
        group.tasks.append(&task);
        if (location && !group.location)
            group.location = location;
    }

    // Locations without tasks still get a group, after those with tasks
    for (const Location &loc : m_item.locations) {
        QString key;
        if (!loc.id.isEmpty())
            key = QStringLiteral("loc-") + loc.id;
        else if (!loc.name.isEmpty())
            key = QStringLiteral("locname-") + loc.name.toLower();
        else
            continue;

        Group &group = groupFor(key, loc.name.isEmpty() ? m_generalLabel : loc.name);
        if (!group.location)
            group.location = &loc;
        if (group.label == m_generalLabel && !loc.name.isEmpty())
            group.label = loc.name;
    }
}

void ItemBuilder::routeStandaloneEntries()
{
    QSet<QString> taskIds;
    for (const Task &task : std::as_const(m_tasks)) {
        if (!task.id.isEmpty())
            taskIds.insert(task.id);
    }

    const int othersIndex = m_groupIndex.value(QStringLiteral("others"), -1);

    for (const Entry &entry : m_item.entries) {
        if (!entryEligible(entry))
            continue;

        if (!entry.taskId.isEmpty() && taskIds.contains(entry.taskId)) {
            m_extraTaskEntries[entry.taskId].append(&entry);
            continue;
        }

        const int locIndex = entry.locationId.isEmpty()
            ? -1 : m_groupIndex.value(QStringLiteral("loc-") + entry.locationId, -1);
        if (locIndex >= 0)
            m_groups[locIndex].entries.append(&entry);
        else if (othersIndex >= 0)
            m_groups[othersIndex].entries.append(&entry);
        else
            m_leftoverEntries.append(&entry);
    }
}

QList<const Entry *> ItemBuilder::entriesOfTask(const Task *task) const
{
    QList<const Entry *> entries;
    for (const Entry &entry : task->entries) {
        if (entryEligible(entry))
            entries.append(&entry);
    }
    if (!task->id.isEmpty())
        entries.append(m_extraTaskEntries.value(task->id));
    return entries;
}

void ItemBuilder::emitFallbackRow()
{
    const QString status = ConditionFilter::formatCode(m_item.status);

    RowDescriptor row;
    row.kind = RowDescriptor::Fallback;
    row.groupingKey = m_keyPrefix + QStringLiteral("fallback");
    row.cells = {
        Cell::fromText(QString()),
        Cell::fromText(m_itemLabel, true),
        Cell::fromText(i18n("No subtasks")),
        Cell::fromText(status.isEmpty() ? i18n("N/A") : status),
    };
    m_itemLabelPending = false;
    m_rows->append(row);
}

QString ItemBuilder::conditionText(const Task *task, const QList<const Entry *> &entries) const
{
    const QString formatted = ConditionFilter::formatCode(task->condition);
    QString text = formatted.isEmpty() ? i18n("N/A") : formatted;

    QList<const Entry *> newestFirst = entries;
    std::stable_sort(newestFirst.begin(), newestFirst.end(),
                     [](const Entry *a, const Entry *b) {
                         return a->createdOn > b->createdOn;
                     });

    QString cause;
    QString resolution;
    for (const Entry *entry : std::as_const(newestFirst)) {
        if (cause.isEmpty())
            cause = entry->cause;
        if (resolution.isEmpty())
            resolution = entry->resolution;
    }
    if (cause.isEmpty())
        cause = task->cause;
    if (resolution.isEmpty())
        resolution = task->resolution;

    if (!cause.isEmpty())
        text += QLatin1Char('\n') + i18n("Cause: %1", cause);
    if (!resolution.isEmpty())
        text += QLatin1Char('\n') + i18n("Resolution: %1", resolution);
    return text;
}

void ItemBuilder::emitTaskRow(const Group &group, const Task *task, const QString &taskLabel,
                              const QList<const Entry *> &entries, bool firstInGroup)
{
    RowDescriptor row;
    row.kind = RowDescriptor::Task;
    row.groupingKey = m_keyPrefix + group.key;
    row.cells = {
        Cell::fromText(firstInGroup ? group.label : QString(), true),
        Cell::fromText(m_itemLabelPending ? m_itemLabel : QString(), true),
        Cell::fromText(taskLabel),
        Cell::fromText(conditionText(task, entries)),
    };
    m_itemLabelPending = false;

    if (!m_entryOnly && m_includeMedia) {
        MediaBlock block;
        block.title = taskLabel;
        for (const MediaRef &ref : task->media) {
            if (!claim(ref))
                continue;
            if (ref.type == MediaRef::Video)
                block.videos.append(makeTile(ref, ref.caption));
            else
                block.photos.append(makeTile(ref, ref.caption));
        }
        if (block.hasTiles()) {
            block.note = mediaSummary(block.photos.size(), block.videos.size());
            row.media = block;
        }
    }
    m_rows->append(row);
}

void ItemBuilder::emitEntryRows(QList<PlacedEntry> entries, const QString &groupLabel,
                                const QString &groupingKey, const QString &leadingRemark)
{
    std::stable_sort(entries.begin(), entries.end(),
                     [](const PlacedEntry &a, const PlacedEntry &b) {
                         return a.entry->createdOn < b.entry->createdOn;
                     });

    if (m_includeMedia)
        emitMediaRows(entries, groupLabel, groupingKey);
    emitRemarkRows(entries, groupingKey, leadingRemark);
}

void ItemBuilder::emitMediaRows(const QList<PlacedEntry> &entries, const QString &groupLabel,
                                const QString &groupingKey)
{
    QList<Bucket> buckets;
    QHash<QString, int> bucketIndex;

    for (const PlacedEntry &placed : entries) {
        const Entry *entry = placed.entry;
        if (entry->media.isEmpty())
            continue;

        const QDate day = entry->createdOn.date();
        const QString key = day.toString(Qt::ISODate) + QLatin1Char('|')
                            + entry->author.name.trimmed().toLower();
        if (!bucketIndex.contains(key)) {
            Bucket bucket;
            bucket.title = i18n("%1 • %2", formatDate(day), authorLabel(entry->author));
            bucketIndex.insert(key, buckets.size());
            buckets.append(bucket);
        }
        Bucket &bucket = buckets[bucketIndex.value(key)];

        const bool tasked = !placed.taskLabel.isEmpty();
        const QString owner = tasked ? placed.taskLabel : groupLabel;
        for (const MediaRef &ref : entry->media) {
            if (!claim(ref))
                continue;
            const QString caption = ref.caption.isEmpty()
                ? owner : owner + QLatin1String(": ") + ref.caption;
            const MediaTile tile = makeTile(ref, caption);
            if (ref.type == MediaRef::Video)
                (tasked ? bucket.taskedVideos : bucket.untaskedVideos).append(tile);
            else
                (tasked ? bucket.taskedPhotos : bucket.untaskedPhotos).append(tile);
        }
    }

    auto emitBlock = [&](const QString &title, const QList<MediaTile> &photos,
                         const QList<MediaTile> &videos) {
        if (photos.isEmpty() && videos.isEmpty())
            return;
        MediaBlock block;
        block.title = title;
        block.photos = photos;
        block.videos = videos;
        block.note = mediaSummary(photos.size(), videos.size());

        RowDescriptor row;
        row.kind = RowDescriptor::MediaOnly;
        row.groupingKey = groupingKey;
        row.media = block;
        m_rows->append(row);
    };

    for (const Bucket &bucket : std::as_const(buckets)) {
        emitBlock(bucket.title, bucket.untaskedPhotos, bucket.untaskedVideos);
        emitBlock(bucket.title, bucket.taskedPhotos, bucket.taskedVideos);
    }
}

void ItemBuilder::emitRemarkRows(const QList<PlacedEntry> &entries, const QString &groupingKey,
                                 const QString &leadingRemark)
{
    QStringList texts;
    if (!leadingRemark.isEmpty())
        texts.append(leadingRemark);

    for (const PlacedEntry &placed : entries) {
        const Entry *entry = placed.entry;
        if (entry->remarks.trimmed().isEmpty())
            continue;
        QString text = formatEntryLine(*entry);
        if (!placed.taskLabel.isEmpty())
            text = placed.taskLabel + QLatin1Char('\n') + text;
        const QString condition = ConditionFilter::formatCode(entry->condition);
        if (!condition.isEmpty())
            text += QLatin1Char('\n') + i18n("Condition: %1", condition);
        texts.append(text);
    }

    const int perRow = qMax(1, m_settings.remarksPerRow);
    for (int i = 0; i < texts.size(); i += perRow) {
        RowDescriptor row;
        row.kind = RowDescriptor::Remark;
        row.mergeColumns = true;
        row.groupingKey = groupingKey;
        for (int j = i; j < qMin(i + perRow, int(texts.size())); ++j)
            row.cells.append(Cell::fromText(texts[j]));
        m_rows->append(row);
    }
}

bool ItemBuilder::claim(const MediaRef &ref)
{
    if (ref.uri.isEmpty())
        return false;
    QSet<QString> &seen = (ref.type == MediaRef::Video) ? m_seenVideos : m_seenPhotos;
    if (seen.contains(ref.uri))
        return false;
    seen.insert(ref.uri);
    return true;
}

MediaTile ItemBuilder::makeTile(const MediaRef &ref, const QString &caption) const
{
    MediaTile tile;
    tile.kind = (ref.type == MediaRef::Video) ? MediaTile::Video : MediaTile::Photo;
    tile.uri = ref.uri;
    tile.caption = caption;
    if (tile.kind == MediaTile::Photo && m_imageCache)
        tile.image = m_imageCache->resolve(ref.uri);
    return tile;
}

} // anonymous namespace

QList<Task> withOthersTask(const ChecklistItem &item)
{
    QList<Task> tasks = item.tasks;
    const bool hasOthers = std::any_of(tasks.cbegin(), tasks.cend(), [](const Task &task) {
        return isOthersName(task.name);
    });
    if (!hasOthers) {
        Task others;
        others.id = QStringLiteral("synthetic-") + item.id;
        others.name = QStringLiteral("Others");
        others.synthetic = true;
        tasks.append(others);
    }
    return tasks;
}

QList<RowDescriptor> buildRows(const QList<ChecklistItem> &items, ImageCache *imageCache,
                               const ConditionFilter::AllowSet &allowed,
                               bool entryOnly, bool includeMedia,
                               const AggregatorSettings &settings)
{
    QList<RowDescriptor> rows;
    for (int i = 0; i < items.size(); ++i) {
        ItemBuilder builder(items[i], i + 1, imageCache, allowed, entryOnly, includeMedia,
                            settings, &rows);
        builder.build();
    }
    return rows;
}

QStringList photoUris(const QList<ChecklistItem> &items)
{
    QStringList uris;
    QSet<QString> seen;
    auto collect = [&](const QList<MediaRef> &media) {
        for (const MediaRef &ref : media) {
            if (ref.type != MediaRef::Photo || ref.uri.isEmpty() || seen.contains(ref.uri))
                continue;
            seen.insert(ref.uri);
            uris.append(ref.uri);
        }
    };

    for (const ChecklistItem &item : items) {
        for (const Task &task : item.tasks) {
            collect(task.media);
            for (const Entry &entry : task.entries)
                collect(entry.media);
        }
        for (const Entry &entry : item.entries)
            collect(entry.media);
    }
    return uris;
}

QString formatEntryLine(const Entry &entry)
{
    QStringList meta;
    if (!entry.author.name.trimmed().isEmpty())
        meta.append(authorLabel(entry.author));
    const QString recorded = formatDateTime(entry.createdOn);
    if (!recorded.isEmpty())
        meta.append(i18n("Recorded: %1", recorded));
    if (meta.isEmpty())
        meta.append(i18n("Inspector: Team member"));

    QString line = meta.join(QStringLiteral(" • "));
    const QString remarks = entry.remarks.trimmed();
    if (!remarks.isEmpty())
        line += QLatin1Char('\n') + i18n("Remarks: %1", remarks);
    return line;
}

} // namespace Layout
