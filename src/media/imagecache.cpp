/*
 * imagecache.cpp — Per-render photo resolver with bounded parallel prefetch
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "imagecache.h"

#include <QDebug>
#include <QMutexLocker>
#include <QSet>

ImageCache::ImageCache()
    : ImageCache(Options{})
{
}

ImageCache::ImageCache(const Options &options)
    : m_options(options)
{
    m_pool.setMaxThreadCount(qMax(1, m_options.workers));
    m_fetchers.push_back(std::make_unique<LocalFileFetcher>());
}

ImageCache::~ImageCache()
{
    m_pool.clear();
    m_pool.waitForDone();
}

void ImageCache::addFetcher(std::unique_ptr<ImageFetcher> fetcher)
{
    if (fetcher)
        m_fetchers.push_back(std::move(fetcher));
}

QImage ImageCache::resolve(const QString &uri)
{
    {
        QMutexLocker lock(&m_mutex);
        auto it = m_images.constFind(uri);
        if (it != m_images.constEnd())
            return it.value();
    }

    QImage image = load(uri);
    store(uri, image);

    QMutexLocker lock(&m_mutex);
    return m_images.value(uri);
}

void ImageCache::prefetch(const QStringList &uris)
{
    QSet<QString> queued;
    for (const QString &uri : uris) {
        if (uri.isEmpty() || queued.contains(uri) || isCached(uri))
            continue;
        queued.insert(uri);
        m_pool.start([this, uri]() {
            store(uri, load(uri));
        });
    }

    if (queued.isEmpty())
        return;

    if (!m_pool.waitForDone(m_options.prefetchTimeoutMs)) {
        // Drop what has not started; those resolve lazily during layout
        m_pool.clear();
        qDebug() << "ImageCache: prefetch timed out after"
                 << m_options.prefetchTimeoutMs << "ms";
    }
}

bool ImageCache::isCached(const QString &uri) const
{
    QMutexLocker lock(&m_mutex);
    return m_images.contains(uri);
}

int ImageCache::loadCount() const
{
    QMutexLocker lock(&m_mutex);
    return m_loadCount;
}

void ImageCache::store(const QString &uri, const QImage &image)
{
    QMutexLocker lock(&m_mutex);
    ++m_loadCount;
    // First result wins so every caller sees the same buffer
    if (!m_images.contains(uri))
        m_images.insert(uri, image);
}

QImage ImageCache::decodeDataUri(const QString &uri)
{
    if (!uri.startsWith(QLatin1String("data:"), Qt::CaseInsensitive))
        return {};

    const int comma = uri.indexOf(QLatin1Char(','));
    if (comma < 0)
        return {};

    const QString header = uri.mid(5, comma - 5).toLower();
    const QStringList params = header.split(QLatin1Char(';'));
    const QString mime = params.value(0);
    if (!mime.isEmpty() && !mime.startsWith(QLatin1String("image/")))
        return {};

    const QByteArray payload = uri.mid(comma + 1).toLatin1();
    QByteArray bytes;
    if (params.contains(QLatin1String("base64"))) {
        auto decoded = QByteArray::fromBase64Encoding(payload);
        if (!decoded)
            return {};
        bytes = *decoded;
    } else {
        bytes = QByteArray::fromPercentEncoding(payload);
    }

    QImage image;
    if (!image.loadFromData(bytes))
        return {};
    return image;
}

QImage ImageCache::load(const QString &uri) const
{
    if (uri.isEmpty())
        return {};

    QImage decoded;
    if (uri.startsWith(QLatin1String("data:"), Qt::CaseInsensitive)) {
        decoded = decodeDataUri(uri);
        if (decoded.isNull())
            qDebug() << "ImageCache: undecodable inline image";
        return normalize(decoded);
    }

    ImageFetcher *fetcher = nullptr;
    for (const auto &candidate : m_fetchers) {
        if (candidate->accepts(uri)) {
            fetcher = candidate.get();
            break;
        }
    }
    if (!fetcher) {
        qDebug() << "ImageCache: no fetcher for" << uri;
        return {};
    }

    const std::optional<QByteArray> bytes = fetcher->fetch(uri, m_options.fetchTimeoutMs);
    if (!bytes || bytes->isEmpty()) {
        qDebug() << "ImageCache: fetch failed for" << uri;
        return {};
    }
    if (!decoded.loadFromData(*bytes)) {
        qDebug() << "ImageCache: cannot decode" << uri;
        return {};
    }
    return normalize(decoded);
}

QImage ImageCache::normalize(const QImage &image) const
{
    if (image.isNull())
        return {};

    QImage result = image;
    const int maxDim = m_options.maxDimension;
    if (maxDim > 0 && (result.width() > maxDim || result.height() > maxDim))
        result = result.scaled(maxDim, maxDim, Qt::KeepAspectRatio, Qt::SmoothTransformation);

    const QImage::Format target = result.hasAlphaChannel()
        ? QImage::Format_ARGB32 : QImage::Format_RGB888;
    if (result.format() != target)
        result = result.convertToFormat(target);
    return result;
}
