#pragma once

#include <QString>
#include <optional>

#include "../LibraryError.h"
#include "../library/SongMetadata.h"

namespace TagLib { namespace ID3v2 { class Tag; } }

// Reads and writes the complete SongMetadata of an MP3 file's ID3v2 tag.
class TagWriter {
public:
    // Fails with TagError when the file has no readable ID3v2 tag and with
    // MissingRequiredField when the tag carries no source id.
    static std::optional<SongMetadata> readSongMetadata(const QString& filePath,
                                                        LibraryError* error = nullptr);

    // Rewrites title/artist/album, the cover picture and every custom field.
    static LibraryError writeSongMetadata(const QString& filePath, const SongMetadata& meta);

    static SongMetadata readFromTag(const TagLib::ID3v2::Tag* tag, const QString& sourceId);
    static void writeIntoTag(TagLib::ID3v2::Tag* tag, const SongMetadata& meta);

    static std::optional<AlbumArt> readAlbumArt(const TagLib::ID3v2::Tag* tag);
    static void writeAlbumArt(TagLib::ID3v2::Tag* tag, const std::optional<AlbumArt>& art);
};
