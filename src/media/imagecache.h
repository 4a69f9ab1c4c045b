/*
 * imagecache.h — Per-render photo resolver with bounded parallel prefetch
 *
 * resolve() turns a photo URI into a decoded QImage, or a null image when
 * the reference cannot be served (unsupported scheme or encoding, fetch
 * failure, decode failure). Results, including failures, are kept for the
 * lifetime of the cache, which the report generator scopes to one render.
 *
 * prefetch() fans the fetches out over a private thread pool before
 * layout starts; during layout the cache is only read.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_IMAGECACHE_H
#define INSPECTPRINT_IMAGECACHE_H

#include <QHash>
#include <QImage>
#include <QMutex>
#include <QStringList>
#include <QThreadPool>

#include <memory>
#include <vector>

#include "imagefetcher.h"

class ImageCache
{
public:
    struct Options {
        int workers = 4;
        int fetchTimeoutMs = 5000;
        int prefetchTimeoutMs = 30000;
        int maxDimension = 1600;
    };

    ImageCache();
    explicit ImageCache(const Options &options);
    ~ImageCache();

    ImageCache(const ImageCache &) = delete;
    ImageCache &operator=(const ImageCache &) = delete;

    // Fetchers are consulted in registration order; the first that
    // accepts a URI serves it. A LocalFileFetcher is always registered.
    void addFetcher(std::unique_ptr<ImageFetcher> fetcher);

    QImage resolve(const QString &uri);
    void prefetch(const QStringList &uris);

    bool isCached(const QString &uri) const;
    int loadCount() const;

    // Decode helper shared with tests: data: URIs only.
    static QImage decodeDataUri(const QString &uri);

private:
    QImage load(const QString &uri) const;
    QImage normalize(const QImage &image) const;
    void store(const QString &uri, const QImage &image);

    Options m_options;
    std::vector<std::unique_ptr<ImageFetcher>> m_fetchers;

    mutable QMutex m_mutex;
    QHash<QString, QImage> m_images; // null image = known failure
    int m_loadCount = 0;

    QThreadPool m_pool;
};

#endif // INSPECTPRINT_IMAGECACHE_H
