#pragma once

#include <QString>
#include <QStringList>
#include <optional>

#include "../LibraryError.h"
#include "../library/SongMetadata.h"

// Turns the fetch tool's thumbnail into JPEG cover art.
class ThumbnailConverter {
public:
    // Checked in this order.
    static const QStringList& thumbnailExtensions();

    // Path of "<dir>/<sourceId>.<ext>" for the first extension present,
    // or an empty string.
    static QString findThumbnail(const QString& directory, const QString& sourceId);

    // The image format is taken from the file content; the fetch tool is
    // known to write e.g. WebP data under a .jpg name.
    static std::optional<AlbumArt> toAlbumArt(const QString& thumbnailPath,
                                              LibraryError* error = nullptr);
};
