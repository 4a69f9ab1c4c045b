/*
 * rowdescriptor.h — Table rows produced by the content aggregator
 *
 * A row is either a four-column table row (Location / Item / Subtask /
 * Condition) or a full-width media-only block. Task rows may also carry a
 * trailing media block that the paginator streams after the row.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_ROWDESCRIPTOR_H
#define INSPECTPRINT_ROWDESCRIPTOR_H

#include <QImage>
#include <QList>
#include <QString>

#include <optional>

namespace Layout {

struct MediaTile {
    enum Kind { Photo, Video };

    Kind kind = Photo;
    QString uri;
    QImage image;       // photos only; null = draw the unavailable tile
    QString caption;
};

struct Segment {
    QString text;
    QList<MediaTile> photos;
    QList<MediaTile> videos;

    bool isEmpty() const
    {
        return text.trimmed().isEmpty() && photos.isEmpty() && videos.isEmpty();
    }
};

struct Cell {
    QList<Segment> segments;
    bool bold = false;

    static Cell fromText(const QString &text, bool bold = false)
    {
        Cell cell;
        cell.bold = bold;
        if (!text.isEmpty())
            cell.segments.append(Segment{text, {}, {}});
        return cell;
    }
};

// Full-width block of tiles with an optional title above the grid and an
// optional note below it. Photos are laid out before videos.
struct MediaBlock {
    QString title;
    QList<MediaTile> photos;
    QList<MediaTile> videos;
    QString note;

    bool hasTiles() const { return !photos.isEmpty() || !videos.isEmpty(); }
};

struct RowDescriptor {
    enum Kind { Task, Remark, Fallback, MediaOnly };

    Kind kind = Task;
    QList<Cell> cells;              // empty for MediaOnly
    std::optional<MediaBlock> media;
    bool mergeColumns = false;      // one outer border, no inner separators
    QString groupingKey;            // background band of task rows
};

} // namespace Layout

#endif // INSPECTPRINT_ROWDESCRIPTOR_H
