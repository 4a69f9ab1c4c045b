/*
 * imagefetcher.h — Byte sources for media references
 *
 * The report engine does not talk to the network itself. A fetcher turns
 * a URI into raw encoded bytes; the embedding application registers one
 * per scheme it can serve. fetch() is called from pool threads and must
 * be reentrant.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_IMAGEFETCHER_H
#define INSPECTPRINT_IMAGEFETCHER_H

#include <QByteArray>
#include <QString>

#include <optional>

class ImageFetcher
{
public:
    virtual ~ImageFetcher();

    virtual bool accepts(const QString &uri) const = 0;

    // Encoded image bytes, or nullopt on any failure. Must give up after
    // roughly timeoutMs.
    virtual std::optional<QByteArray> fetch(const QString &uri, int timeoutMs) = 0;
};

/// Reads file:// URLs and absolute local paths.
class LocalFileFetcher : public ImageFetcher
{
public:
    bool accepts(const QString &uri) const override;
    std::optional<QByteArray> fetch(const QString &uri, int timeoutMs) override;

    static QString localPath(const QString &uri);
};

#endif // INSPECTPRINT_IMAGEFETCHER_H
