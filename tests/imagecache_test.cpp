#include "imagecache.h"
#include "testsupport.h"

#include <QFile>
#include <QTemporaryDir>
#include <QThread>
#include <QUrl>

#include <atomic>
#include <cassert>

namespace {

// Serves "mem:" URIs with a PNG and records call counts and overlap
class CountingFetcher : public ImageFetcher
{
public:
    CountingFetcher(int delayMs, std::atomic<int> *calls, std::atomic<int> *peak)
        : m_delayMs(delayMs)
        , m_calls(calls)
        , m_peak(peak)
    {
    }

    bool accepts(const QString &uri) const override
    {
        return uri.startsWith(QLatin1String("mem:"));
    }

    std::optional<QByteArray> fetch(const QString &uri, int timeoutMs) override
    {
        Q_UNUSED(timeoutMs)
        ++*m_calls;
        const int now = ++m_active;
        int seen = m_peak->load();
        while (now > seen && !m_peak->compare_exchange_weak(seen, now)) {
        }
        QThread::msleep(m_delayMs);
        --m_active;
        if (uri.endsWith(QLatin1String("broken")))
            return std::nullopt;
        return TestSupport::pngBytes(QSize(10, 10), Qt::green);
    }

private:
    int m_delayMs;
    std::atomic<int> *m_calls;
    std::atomic<int> *m_peak;
    std::atomic<int> m_active{0};
};

} // anonymous namespace

int main()
{
    // Inline data URIs decode and normalize to RGB888 when opaque
    {
        ImageCache cache;
        const QImage image = cache.resolve(TestSupport::pngDataUri(QSize(16, 12)));
        assert(!image.isNull());
        assert(image.size() == QSize(16, 12));
        assert(image.format() == QImage::Format_RGB888);
        assert(cache.loadCount() == 1);
    }

    // Transparent images keep an alpha channel
    {
        const QByteArray png = TestSupport::pngBytes(QSize(8, 8), Qt::transparent,
                                                     QImage::Format_ARGB32);
        const QString uri = QStringLiteral("data:image/png;base64,")
                            + QString::fromLatin1(png.toBase64());
        ImageCache cache;
        assert(cache.resolve(uri).format() == QImage::Format_ARGB32);
    }

    // Oversized images are scaled down to the configured bound
    {
        ImageCache::Options options;
        options.maxDimension = 50;
        ImageCache cache(options);
        const QImage image = cache.resolve(TestSupport::pngDataUri(QSize(200, 100)));
        assert(image.size() == QSize(50, 25));
    }

    // Failures resolve to a null image, are cached, and are not retried
    {
        ImageCache cache;
        const QString ftp = QStringLiteral("ftp://example.invalid/a.png");
        assert(cache.resolve(ftp).isNull());
        assert(cache.isCached(ftp));
        assert(cache.resolve(ftp).isNull());
        assert(cache.loadCount() == 1);

        assert(cache.resolve(QStringLiteral("data:image/png;base64,!!!!")).isNull());
        assert(cache.resolve(QStringLiteral("data:text/plain,hello")).isNull());
        assert(cache.resolve(QString()).isNull());
    }

    // Local files by absolute path and by file: URL
    {
        QTemporaryDir dir;
        assert(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("tile.png"));
        QFile file(path);
        const bool opened = file.open(QIODevice::WriteOnly);
        assert(opened);
        file.write(TestSupport::pngBytes(QSize(20, 20), Qt::red));
        file.close();

        ImageCache cache;
        assert(!cache.resolve(path).isNull());
        assert(!cache.resolve(QUrl::fromLocalFile(path).toString()).isNull());
        assert(cache.resolve(dir.filePath(QStringLiteral("missing.png"))).isNull());
    }

    // Prefetch fetches each distinct URI once with bounded parallelism
    {
        std::atomic<int> calls{0};
        std::atomic<int> peak{0};
        ImageCache::Options options;
        options.workers = 3;
        ImageCache cache(options);
        cache.addFetcher(std::make_unique<CountingFetcher>(20, &calls, &peak));

        QStringList uris;
        for (int i = 0; i < 10; ++i)
            uris << QStringLiteral("mem:%1").arg(i);
        uris << QStringLiteral("mem:3") << QStringLiteral("mem:broken");

        cache.prefetch(uris);
        assert(calls == 11);
        assert(peak >= 1 && peak <= 3);

        for (int i = 0; i < 10; ++i)
            assert(!cache.resolve(QStringLiteral("mem:%1").arg(i)).isNull());
        assert(cache.resolve(QStringLiteral("mem:broken")).isNull());
        assert(calls == 11);
        assert(cache.loadCount() == 11);
    }

    // A prefetch that runs out of time leaves the rest to lazy resolution
    {
        std::atomic<int> calls{0};
        std::atomic<int> peak{0};
        ImageCache::Options options;
        options.workers = 1;
        options.prefetchTimeoutMs = 30;
        ImageCache cache(options);
        cache.addFetcher(std::make_unique<CountingFetcher>(100, &calls, &peak));

        const QStringList uris{QStringLiteral("mem:a"), QStringLiteral("mem:b"),
                               QStringLiteral("mem:c"), QStringLiteral("mem:d")};
        cache.prefetch(uris);
        assert(!cache.isCached(QStringLiteral("mem:d")));

        for (const QString &uri : uris)
            assert(!cache.resolve(uri).isNull());
    }

    return 0;
}
