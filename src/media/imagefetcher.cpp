/*
 * imagefetcher.cpp — Byte sources for media references
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "imagefetcher.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QUrl>

ImageFetcher::~ImageFetcher() = default;

QString LocalFileFetcher::localPath(const QString &uri)
{
    if (uri.startsWith(QLatin1String("file:"), Qt::CaseInsensitive))
        return QUrl(uri).toLocalFile();
    if (QDir::isAbsolutePath(uri))
        return uri;
    return {};
}

bool LocalFileFetcher::accepts(const QString &uri) const
{
    return !localPath(uri).isEmpty();
}

std::optional<QByteArray> LocalFileFetcher::fetch(const QString &uri, int timeoutMs)
{
    Q_UNUSED(timeoutMs) // local reads do not block on the network

    QFile file(localPath(uri));
    if (!file.open(QIODevice::ReadOnly)) {
        qDebug() << "LocalFileFetcher: cannot open" << file.fileName()
                 << file.errorString();
        return std::nullopt;
    }
    return file.readAll();
}
