#include "contentaggregator.h"
#include "imagecache.h"
#include "recordingsurface.h"
#include "tablerenderer.h"
#include "testsupport.h"

#include <cassert>

using namespace Inspection;
using Layout::RowDescriptor;
using TestSupport::at;

static int countKind(const QList<RowDescriptor> &rows, RowDescriptor::Kind kind)
{
    int n = 0;
    for (const RowDescriptor &row : rows)
        n += row.kind == kind ? 1 : 0;
    return n;
}

static QString text(const RowDescriptor &row, int column)
{
    const Layout::Cell &cell = row.cells.at(column);
    return cell.segments.isEmpty() ? QString() : cell.segments.first().text;
}

// One location, a window task without media and a door task whose entry
// carries five photos
static ChecklistItem openingsItem()
{
    ChecklistItem item;
    item.id = QStringLiteral("item-1");
    item.name = QStringLiteral("Openings");
    Location front;
    front.id = QStringLiteral("L1");
    front.name = QStringLiteral("Front");
    item.locations = {front};

    Task window = TestSupport::task(QStringLiteral("t1"), QStringLiteral("Inspect window"),
                                    QStringLiteral("GOOD"), QStringLiteral("L1"));
    Task door = TestSupport::task(QStringLiteral("t2"), QStringLiteral("Inspect door"),
                                  QStringLiteral("FAIR"), QStringLiteral("L1"));

    Entry visit = TestSupport::entry(QStringLiteral("e1"), QStringLiteral("Jane"),
                                     at(2025, 3, 4));
    visit.taskId = door.id;
    for (int i = 0; i < 5; ++i) {
        visit.media.append(TestSupport::photo(QStringLiteral("https://example.invalid/d%1.jpg").arg(i),
                                              i == 0 ? QStringLiteral("Cracked frame") : QString(),
                                              i));
    }
    door.entries = {visit};

    item.tasks = {window, door};
    return item;
}

int main()
{
    const ConditionFilter::AllowSet noFilter;

    // Two task rows, then one media-only row with the door photos
    {
        const QList<RowDescriptor> rows =
            Layout::buildRows({openingsItem()}, nullptr, noFilter, false, true);
        assert(rows.size() == 3);
        assert(countKind(rows, RowDescriptor::Task) == 2);

        assert(text(rows[0], 0) == QLatin1String("Front"));
        assert(text(rows[0], 1) == QLatin1String("1. Openings"));
        assert(text(rows[0], 2) == QLatin1String("1.1.1 Inspect window"));
        assert(text(rows[0], 3) == QLatin1String("Good"));
        // Location and item labels only on the first row
        assert(text(rows[1], 0).isEmpty() && text(rows[1], 1).isEmpty());
        assert(text(rows[1], 2) == QLatin1String("1.1.2 Inspect door"));
        assert(rows[0].groupingKey == rows[1].groupingKey);

        const RowDescriptor &media = rows[2];
        assert(media.kind == RowDescriptor::MediaOnly);
        assert(media.media && media.media->photos.size() == 5);
        for (const Layout::MediaTile &tile : media.media->photos)
            assert(tile.caption.startsWith(QLatin1String("1.1.2 Inspect door")));
        assert(media.media->photos.first().caption
               == QLatin1String("1.1.2 Inspect door: Cracked frame"));
        assert(media.media->title.contains(QLatin1String("4 Mar 2025")));
        assert(media.media->title.contains(QLatin1String("Inspector: Jane")));
        assert(media.media->note == QLatin1String("5 photos"));

        // 4 + 1 grid
        RecordingSurface surface;
        TableRenderer renderer(&surface, PageGeometry());
        const MediaLayout layout = renderer.layoutMedia(*media.media);
        assert(layout.rows.size() == 2);
        assert(layout.rows[0].count == 4 && layout.rows[1].count == 1);
    }

    // Condition filter drops the task rows that do not match
    {
        const QList<RowDescriptor> rows = Layout::buildRows(
            {openingsItem()}, nullptr, ConditionFilter::fromList({QStringLiteral("fair")}),
            false, true);
        assert(countKind(rows, RowDescriptor::Task) == 1);
        assert(text(rows[0], 2) == QLatin1String("1.1.2 Inspect door"));
        // The group label moves to the first surviving row
        assert(text(rows[0], 0) == QLatin1String("Front"));

        ChecklistItem unrated = openingsItem();
        unrated.tasks[1].condition.clear();
        const QList<RowDescriptor> none = Layout::buildRows(
            {unrated}, nullptr, ConditionFilter::fromList({QStringLiteral("FAIR")}), false, true);
        assert(countKind(none, RowDescriptor::Task) == 0);
    }

    // A photo attached twice in one item is drawn once; other items draw it again
    {
        ChecklistItem item = openingsItem();
        const QString shared = QStringLiteral("https://example.invalid/d0.jpg");
        item.tasks[1].media = {TestSupport::photo(shared)};

        const QList<RowDescriptor> rows =
            Layout::buildRows({item, item}, nullptr, noFilter, false, true);
        int sharedCount = 0;
        int total = 0;
        for (const RowDescriptor &row : rows) {
            if (!row.media)
                continue;
            for (const Layout::MediaTile &tile : row.media->photos) {
                ++total;
                sharedCount += tile.uri == shared ? 1 : 0;
            }
        }
        assert(total == 10);
        assert(sharedCount == 2);

        // The task row carries its own media inline, titled with the task label
        assert(rows[1].media && rows[1].media->photos.size() == 1);
        assert(rows[1].media->title == QLatin1String("1.1.2 Inspect door"));
    }

    // A location entry and a task entry sharing a photo: the earlier entry keeps it
    {
        const QString shared = QStringLiteral("https://example.invalid/d0.jpg");
        auto withLocationEntry = [&](const QDateTime &createdOn) {
            ChecklistItem item = openingsItem();
            Entry walk = TestSupport::entry(QStringLiteral("s1"), QStringLiteral("Sam"), createdOn);
            walk.locationId = QStringLiteral("L1");
            walk.media = {TestSupport::photo(shared)};
            item.entries = {walk};
            return item;
        };
        auto tilesOf = [&](const QList<RowDescriptor> &rows) {
            QList<Layout::MediaTile> tiles;
            for (const RowDescriptor &row : rows) {
                if (!row.media)
                    continue;
                for (const Layout::MediaTile &tile : row.media->photos) {
                    if (tile.uri == shared)
                        tiles.append(tile);
                }
            }
            return tiles;
        };

        // Location entry first: the photo moves to Sam's untasked block
        const QList<RowDescriptor> earlier = Layout::buildRows(
            {withLocationEntry(at(2025, 3, 3))}, nullptr, noFilter, false, true);
        const QList<Layout::MediaTile> earlierTiles = tilesOf(earlier);
        assert(earlierTiles.size() == 1);
        assert(!earlierTiles.first().caption.startsWith(QLatin1String("1.1.2")));
        bool samBlock = false;
        for (const RowDescriptor &row : earlier) {
            if (!row.media || row.media->photos.isEmpty())
                continue;
            if (row.media->photos.first().uri == shared) {
                samBlock = true;
                assert(row.media->title.contains(QLatin1String("3 Mar 2025")));
                assert(row.media->photos.size() == 1);
            } else {
                assert(row.media->photos.size() == 4);
            }
        }
        assert(samBlock);

        // Door entry first: it keeps all five and Sam's block disappears
        const QList<RowDescriptor> later = Layout::buildRows(
            {withLocationEntry(at(2025, 3, 5))}, nullptr, noFilter, false, true);
        const QList<Layout::MediaTile> laterTiles = tilesOf(later);
        assert(laterTiles.size() == 1);
        assert(laterTiles.first().caption.startsWith(QLatin1String("1.1.2 Inspect door")));
        assert(countKind(later, RowDescriptor::MediaOnly) == 1);
    }

    // Standalone entries land in the Others catch-all
    {
        ChecklistItem item = openingsItem();
        item.entries = {TestSupport::entry(QStringLiteral("s1"), QStringLiteral("Sam"),
                                           at(2025, 3, 5), QStringLiteral("Gutter loose"))};

        const QList<Task> tasks = Layout::withOthersTask(item);
        assert(tasks.size() == 3 && tasks.last().synthetic);

        ChecklistItem named = item;
        named.tasks.append(TestSupport::task(QStringLiteral("t9"), QStringLiteral(" others "),
                                             QString(), QString()));
        assert(Layout::withOthersTask(named).size() == named.tasks.size());

        const QList<RowDescriptor> rows =
            Layout::buildRows({item}, nullptr, noFilter, false, true);
        assert(countKind(rows, RowDescriptor::Task) == 3);
        bool othersRow = false;
        bool remark = false;
        for (const RowDescriptor &row : rows) {
            if (row.kind == RowDescriptor::Task && text(row, 2) == QLatin1String("1.2.1 Others"))
                othersRow = text(row, 0) == QLatin1String("Others");
            if (row.kind == RowDescriptor::Remark) {
                remark = text(row, 0).contains(QLatin1String("Remarks: Gutter loose"));
                assert(row.mergeColumns);
            }
        }
        assert(othersRow && remark);

        // Without the catch-all the entry falls back to the general group
        Layout::AggregatorSettings plain;
        plain.injectOthersTask = false;
        const QList<RowDescriptor> general =
            Layout::buildRows({item}, nullptr, noFilter, false, true, plain);
        assert(countKind(general, RowDescriptor::Task) == 2);
        assert(general.last().kind == RowDescriptor::Remark);
        assert(general.last().groupingKey.endsWith(QLatin1String("general-entries")));
    }

    // Entries attached to a location are grouped there
    {
        ChecklistItem item = openingsItem();
        Entry note = TestSupport::entry(QStringLiteral("s2"), QStringLiteral("Sam"),
                                        at(2025, 3, 6), QStringLiteral("Frame repainted"));
        note.locationId = QStringLiteral("L1");
        item.entries = {note};
        item.locations[0].remarks = QStringLiteral("Street facing");

        const QList<RowDescriptor> rows =
            Layout::buildRows({item}, nullptr, noFilter, false, true);
        const RowDescriptor &remarks = rows.last();
        assert(remarks.kind == RowDescriptor::Remark);
        assert(remarks.groupingKey == rows[0].groupingKey);
        assert(text(remarks, 0) == QLatin1String("Front: Street facing"));
        assert(text(remarks, 1).contains(QLatin1String("Frame repainted")));
        assert(countKind(rows, RowDescriptor::Task) == 2);
    }

    // No tasks and no locations: one fallback row
    {
        ChecklistItem bare;
        bare.name = QStringLiteral("Roof");
        bare.status = QStringLiteral("IN_PROGRESS");
        const QList<RowDescriptor> rows = Layout::buildRows({bare}, nullptr, noFilter, false, true);
        assert(rows.size() == 1);
        assert(rows[0].kind == RowDescriptor::Fallback);
        assert(text(rows[0], 1) == QLatin1String("1. Roof"));
        assert(text(rows[0], 2) == QLatin1String("No subtasks"));
        assert(text(rows[0], 3) == QLatin1String("In Progress"));
    }

    // Media rows bucket by day and author
    {
        ChecklistItem item = openingsItem();
        item.tasks[1].entries.clear();
        Entry a = TestSupport::entry(QStringLiteral("a"), QStringLiteral("Jane"), at(2025, 3, 4, 9));
        Entry b = TestSupport::entry(QStringLiteral("b"), QStringLiteral("Jane"), at(2025, 3, 4, 15));
        Entry c = TestSupport::entry(QStringLiteral("c"), QStringLiteral("Omar"), at(2025, 3, 4, 10));
        a.media = {TestSupport::photo(QStringLiteral("https://example.invalid/a.jpg"))};
        b.media = {TestSupport::photo(QStringLiteral("https://example.invalid/b.jpg")),
                   TestSupport::video(QStringLiteral("https://example.invalid/b.mp4"))};
        c.media = {TestSupport::photo(QStringLiteral("https://example.invalid/c.jpg"))};
        for (Entry *e : {&a, &b, &c})
            e->locationId = QStringLiteral("L1");
        item.entries = {a, b, c};

        const QList<RowDescriptor> rows =
            Layout::buildRows({item}, nullptr, noFilter, false, true);
        QList<const RowDescriptor *> media;
        for (const RowDescriptor &row : rows) {
            if (row.kind == RowDescriptor::MediaOnly)
                media.append(&row);
        }
        assert(media.size() == 2);
        assert(media[0]->media->title.contains(QLatin1String("Jane")));
        assert(media[0]->media->photos.size() == 2);
        assert(media[0]->media->videos.size() == 1);
        assert(media[0]->media->note == QLatin1String("2 photos, 1 video"));
        assert(media[0]->media->photos.first().caption == QLatin1String("Front"));
        assert(media[1]->media->title.contains(QLatin1String("Omar")));

        // No media at all when media is switched off
        const QList<RowDescriptor> bare =
            Layout::buildRows({item}, nullptr, noFilter, false, false);
        assert(countKind(bare, RowDescriptor::MediaOnly) == 0);
    }

    // Entry-only mode: no inline task media, entries filtered by condition
    {
        ChecklistItem item = openingsItem();
        item.tasks[1].media = {TestSupport::photo(QStringLiteral("https://example.invalid/inline.jpg"))};
        item.tasks[1].entries[0].condition = QStringLiteral("FAIR");
        Entry poor = TestSupport::entry(QStringLiteral("p"), QStringLiteral("Jane"),
                                        at(2025, 3, 4), QStringLiteral("Rotten sill"));
        poor.condition = QStringLiteral("POOR");
        poor.taskId = QStringLiteral("t2");
        Entry hidden = TestSupport::entry(QStringLiteral("h"), QStringLiteral("Jane"),
                                          at(2025, 3, 4), QStringLiteral("Internal only"));
        hidden.includeInReport = false;
        hidden.taskId = QStringLiteral("t2");
        item.entries = {poor, hidden};
        item.locations[0].remarks = QStringLiteral("Street facing");

        const QList<RowDescriptor> rows = Layout::buildRows(
            {item}, nullptr, ConditionFilter::fromList({QStringLiteral("FAIR")}), true, true);
        for (const RowDescriptor &row : rows) {
            if (row.kind == RowDescriptor::Task)
                assert(!row.media);
            for (const Layout::Cell &cell : row.cells) {
                for (const Layout::Segment &segment : cell.segments) {
                    assert(!segment.text.contains(QLatin1String("Rotten sill")));
                    assert(!segment.text.contains(QLatin1String("Internal only")));
                    assert(!segment.text.contains(QLatin1String("Street facing")));
                }
            }
        }
        assert(countKind(rows, RowDescriptor::MediaOnly) == 1);
    }

    // Remarks are packed four to a row, newest entry's cause wins
    {
        ChecklistItem item = openingsItem();
        QList<Entry> entries;
        for (int i = 0; i < 5; ++i) {
            Entry e = TestSupport::entry(QStringLiteral("r%1").arg(i), QStringLiteral("Jane"),
                                         at(2025, 3, 1 + i), QStringLiteral("Note %1").arg(i));
            e.cause = QStringLiteral("Cause %1").arg(i);
            entries.append(e);
        }
        item.tasks[0].entries = entries;

        const QList<RowDescriptor> rows =
            Layout::buildRows({item}, nullptr, noFilter, false, false);
        assert(countKind(rows, RowDescriptor::Remark) == 2);
        assert(text(rows[0], 3) == QLatin1String("Good\nCause: Cause 4"));

        QList<const RowDescriptor *> remarks;
        for (const RowDescriptor &row : rows) {
            if (row.kind == RowDescriptor::Remark)
                remarks.append(&row);
        }
        assert(remarks[0]->cells.size() == 4 && remarks[1]->cells.size() == 1);
        assert(text(*remarks[0], 0).startsWith(QLatin1String("1.1.1 Inspect window\n")));
    }

    // Photos resolve through the cache; unresolvable ones stay null
    {
        ChecklistItem item = openingsItem();
        const QString good = TestSupport::pngDataUri();
        item.tasks[1].entries[0].media = {TestSupport::photo(good),
                                          TestSupport::photo(QStringLiteral("ftp://nowhere/x.png"))};
        ImageCache cache;
        const QStringList uris = Layout::photoUris({item});
        assert(uris.size() == 2 && uris.first() == good);

        const QList<RowDescriptor> rows =
            Layout::buildRows({item}, &cache, noFilter, false, true);
        const Layout::MediaBlock &block = *rows.last().media;
        assert(!block.photos[0].image.isNull());
        assert(block.photos[1].image.isNull());
    }

    // Entry line formatting
    {
        Entry e = TestSupport::entry(QStringLiteral("x"), QStringLiteral("Jane"),
                                     at(2025, 3, 4, 9, 30), QStringLiteral("Loose hinge"));
        assert(Layout::formatEntryLine(e)
               == QStringLiteral("Inspector: Jane • Recorded: 4 Mar 2025, 09:30\nRemarks: Loose hinge"));
        Entry anonymous;
        assert(Layout::formatEntryLine(anonymous) == QLatin1String("Inspector: Team member"));
    }

    return 0;
}
