/*
 * recordreader.h — Load an inspection record from JSON
 *
 * Accepts the export produced by the work-order service. Media may be
 * given either as a "media" array of objects or as the legacy flat
 * "photos"/"videos" URL arrays; both end up as MediaRef lists sorted
 * by their order index.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_RECORDREADER_H
#define INSPECTPRINT_RECORDREADER_H

#include <QByteArray>
#include <QString>

#include <optional>

#include "inspectionmodel.h"

namespace RecordReader {

std::optional<Inspection::Record> parse(const QByteArray &json,
                                        QString *error = nullptr);

std::optional<Inspection::Record> readFile(const QString &path,
                                           QString *error = nullptr);

} // namespace RecordReader

#endif // INSPECTPRINT_RECORDREADER_H
