#include "SongMetadata.h"

const QString SongMetadata::kUnknownTitle = QStringLiteral("Unknown Title");
const QString SongMetadata::kUnknownArtist = QStringLiteral("Unknown Artist");
const QString SongMetadata::kUnknownAlbum = QStringLiteral("Unknown Album");

SongMetadata SongMetadata::fallback(const QString& sourceId)
{
    SongMetadata meta;
    meta.title = sourceId;
    meta.artist = kUnknownArtist;
    meta.album = kUnknownAlbum;
    meta.sourceId = sourceId;
    return meta;
}

bool SongMetadata::operator==(const SongMetadata& other) const
{
    return title == other.title
        && artist == other.artist
        && album == other.album
        && sourceId == other.sourceId
        && albumArt == other.albumArt
        && isCropped == other.isCropped
        && isMetadataEdited == other.isMetadataEdited
        && downloadUnixTime == other.downloadUnixTime;
}
