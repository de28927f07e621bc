#pragma once

#include <QByteArray>
#include <QMetaType>
#include <QString>
#include <optional>

// Embedded cover image, stored as an ID3v2 front-cover picture.
struct AlbumArt {
    QByteArray data;
    QString mimeType;

    bool operator==(const AlbumArt& other) const
    {
        return data == other.data && mimeType == other.mimeType;
    }
    bool operator!=(const AlbumArt& other) const { return !(*this == other); }
};

struct SongMetadata {
    QString title;
    QString artist;
    QString album;
    QString sourceId;                    // required; marks the file as ours
    std::optional<AlbumArt> albumArt;

    bool isCropped = false;
    bool isMetadataEdited = false;
    qint64 downloadUnixTime = 0;         // 0 for files written before timestamps

    static const QString kUnknownTitle;
    static const QString kUnknownArtist;
    static const QString kUnknownAlbum;

    // Minimal record used when the fetch tool never produced usable metadata.
    static SongMetadata fallback(const QString& sourceId);

    bool operator==(const SongMetadata& other) const;
    bool operator!=(const SongMetadata& other) const { return !(*this == other); }
};

Q_DECLARE_METATYPE(SongMetadata)
