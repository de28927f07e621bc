#include "ThumbnailConverter.h"

#include <QBuffer>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QImage>
#include <QImageReader>

const QStringList& ThumbnailConverter::thumbnailExtensions()
{
    static const QStringList exts = {
        QStringLiteral("webp"),
        QStringLiteral("jpg"),
        QStringLiteral("jpeg"),
        QStringLiteral("png")
    };
    return exts;
}

QString ThumbnailConverter::findThumbnail(const QString& directory, const QString& sourceId)
{
    QDir dir(directory);
    for (const QString& ext : thumbnailExtensions()) {
        QString candidate = dir.filePath(sourceId + QLatin1Char('.') + ext);
        if (QFileInfo::exists(candidate))
            return candidate;
    }
    return {};
}

std::optional<AlbumArt> ThumbnailConverter::toAlbumArt(const QString& thumbnailPath,
                                                       LibraryError* error)
{
    QImageReader reader(thumbnailPath);
    reader.setDecideFormatFromContent(true);

    QImage image = reader.read();
    if (image.isNull()) {
        qWarning() << "[Fetch] Could not decode thumbnail" << thumbnailPath << ":" << reader.errorString();
        if (error) {
            *error = LibraryError(LibraryError::ImageDecodeError,
                                  QStringLiteral("could not decode thumbnail: %1").arg(reader.errorString()),
                                  thumbnailPath);
        }
        return std::nullopt;
    }

    QByteArray jpegData;
    {
        QBuffer buffer(&jpegData);
        buffer.open(QIODevice::WriteOnly);
        if (!image.save(&buffer, "JPEG", 90)) {
            if (error) {
                *error = LibraryError(LibraryError::ImageDecodeError,
                                      QStringLiteral("could not encode thumbnail as JPEG"),
                                      thumbnailPath);
            }
            return std::nullopt;
        }
    }

    AlbumArt art;
    art.data = jpegData;
    art.mimeType = QStringLiteral("image/jpeg");
    return art;
}
