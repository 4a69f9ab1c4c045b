/*
 * recordreader.cpp — Load an inspection record from JSON
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "recordreader.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <algorithm>

using namespace Inspection;

namespace {

QString str(const QJsonObject &obj, const char *key)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (v.isDouble())
        return QString::number(v.toDouble(), 'g', 15);
    return v.toString();
}

QList<MediaRef> readMedia(const QJsonObject &obj)
{
    QList<MediaRef> media;

    const QJsonArray arr = obj.value(QLatin1String("media")).toArray();
    for (const QJsonValue &v : arr) {
        const QJsonObject m = v.toObject();
        MediaRef ref;
        ref.uri = str(m, "url");
        if (ref.uri.isEmpty())
            ref.uri = str(m, "uri");
        if (ref.uri.isEmpty())
            continue;
        const QString type = str(m, "type").toUpper();
        ref.type = (type == QLatin1String("VIDEO")) ? MediaRef::Video : MediaRef::Photo;
        ref.caption = str(m, "caption").trimmed();
        ref.order = m.value(QLatin1String("order")).toInt(0);
        media.append(ref);
    }

    // Legacy flat URL arrays
    auto appendUrls = [&](const char *key, MediaRef::Type type) {
        const QJsonArray urls = obj.value(QLatin1String(key)).toArray();
        for (const QJsonValue &u : urls) {
            const QString uri = u.toString();
            if (uri.isEmpty())
                continue;
            MediaRef ref;
            ref.uri = uri;
            ref.type = type;
            ref.order = media.size();
            media.append(ref);
        }
    };
    appendUrls("photos", MediaRef::Photo);
    appendUrls("videos", MediaRef::Video);

    std::stable_sort(media.begin(), media.end(),
                     [](const MediaRef &a, const MediaRef &b) {
                         return a.order < b.order;
                     });
    return media;
}

Entry readEntry(const QJsonObject &obj, const QString &taskId, const QString &taskLocationId)
{
    Entry e;
    e.id = str(obj, "id");
    e.remarks = str(obj, "remarks").trimmed();
    e.condition = str(obj, "condition").trimmed();
    e.cause = str(obj, "cause").trimmed();
    e.resolution = str(obj, "resolution").trimmed();
    e.createdOn = QDateTime::fromString(str(obj, "createdOn"), Qt::ISODateWithMs);
    if (!e.createdOn.isValid())
        e.createdOn = QDateTime::fromString(str(obj, "createdOn"), Qt::ISODate);
    e.includeInReport = obj.value(QLatin1String("includeInReport")).toBool(false);
    e.media = readMedia(obj);

    const QJsonObject author = obj.value(QLatin1String("author")).toObject();
    e.author.name = str(author, "name").trimmed();
    e.author.role = (str(author, "role").toUpper() == QLatin1String("ADMIN"))
                        ? Author::Admin : Author::Inspector;

    e.taskId = str(obj, "taskId");
    if (e.taskId.isEmpty())
        e.taskId = taskId;
    e.locationId = str(obj, "locationId");
    if (e.locationId.isEmpty())
        e.locationId = taskLocationId;
    return e;
}

Task readTask(const QJsonObject &obj)
{
    Task t;
    t.id = str(obj, "id");
    t.name = str(obj, "name").trimmed();
    t.condition = str(obj, "condition").trimmed();
    t.cause = str(obj, "cause").trimmed();
    t.resolution = str(obj, "resolution").trimmed();

    const QJsonObject loc = obj.value(QLatin1String("location")).toObject();
    t.locationId = str(obj, "locationId");
    if (t.locationId.isEmpty())
        t.locationId = str(loc, "id");
    t.locationName = str(obj, "locationName").trimmed();
    if (t.locationName.isEmpty())
        t.locationName = str(loc, "name").trimmed();

    t.media = readMedia(obj);

    const QJsonArray entries = obj.value(QLatin1String("entries")).toArray();
    for (const QJsonValue &v : entries)
        t.entries.append(readEntry(v.toObject(), t.id, t.locationId));
    return t;
}

ChecklistItem readItem(const QJsonObject &obj)
{
    ChecklistItem item;
    item.id = str(obj, "id");
    item.name = str(obj, "name").trimmed();
    item.status = str(obj, "status").trimmed();
    item.scopeId = str(obj, "scopeId");

    const QJsonArray locations = obj.value(QLatin1String("locations")).toArray();
    for (const QJsonValue &v : locations) {
        const QJsonObject l = v.toObject();
        Location loc;
        loc.id = str(l, "id");
        loc.name = str(l, "name").trimmed();
        loc.remarks = str(l, "remarks").trimmed();
        loc.condition = str(l, "condition").trimmed();
        item.locations.append(loc);
    }

    const QJsonArray tasks = obj.value(QLatin1String("tasks")).toArray();
    for (const QJsonValue &v : tasks)
        item.tasks.append(readTask(v.toObject()));

    const QJsonArray entries = obj.value(QLatin1String("entries")).toArray();
    for (const QJsonValue &v : entries)
        item.entries.append(readEntry(v.toObject(), QString(), QString()));
    return item;
}

} // anonymous namespace

namespace RecordReader {

std::optional<Record> parse(const QByteArray &json, QString *error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (doc.isNull()) {
        if (error)
            *error = parseError.errorString();
        return std::nullopt;
    }
    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("record root is not an object");
        return std::nullopt;
    }

    const QJsonObject root = doc.object();
    if (!root.value(QLatin1String("items")).isArray()) {
        if (error)
            *error = QStringLiteral("record has no \"items\" array");
        return std::nullopt;
    }

    Record record;
    record.id = str(root, "id");
    record.title = str(root, "title").trimmed();
    record.customerName = str(root, "customerName").trimmed();
    record.address = str(root, "address").trimmed();

    const QJsonArray items = root.value(QLatin1String("items")).toArray();
    for (const QJsonValue &v : items)
        record.items.append(readItem(v.toObject()));
    return record;
}

std::optional<Record> readFile(const QString &path, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = file.errorString();
        return std::nullopt;
    }
    return parse(file.readAll(), error);
}

} // namespace RecordReader
