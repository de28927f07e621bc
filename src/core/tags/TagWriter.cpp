#include "TagWriter.h"
#include "TagCodec.h"

#include <QDebug>
#include <QFileInfo>

#include <taglib/attachedpictureframe.h>
#include <taglib/id3v2tag.h>
#include <taglib/mpegfile.h>

namespace {

TagLib::String toTagString(const QString& s)
{
    return TagLib::String(s.toStdString(), TagLib::String::UTF8);
}

QString fromTagString(const TagLib::String& s)
{
    return QString::fromStdString(s.to8Bit(true));
}

QString orDefault(const TagLib::String& value, const QString& fallback)
{
    return value.isEmpty() ? fallback : fromTagString(value);
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════
//  readSongMetadata
// ═══════════════════════════════════════════════════════════════════════

std::optional<SongMetadata> TagWriter::readSongMetadata(const QString& filePath,
                                                        LibraryError* error)
{
    TagLib::MPEG::File mpegFile(filePath.toUtf8().constData(), false);
    if (!mpegFile.isValid() || !mpegFile.hasID3v2Tag()) {
        if (error) {
            *error = LibraryError(LibraryError::TagError,
                                  QStringLiteral("no ID3v2 tag found"), filePath);
        }
        return std::nullopt;
    }

    const TagLib::ID3v2::Tag* tag = mpegFile.ID3v2Tag();
    LibraryError fieldError;
    std::optional<QString> sourceId = TagCodec::readSourceId(tag, &fieldError);
    if (!sourceId) {
        if (error)
            *error = LibraryError(fieldError.code(), fieldError.message(), filePath);
        return std::nullopt;
    }

    return readFromTag(tag, *sourceId);
}

SongMetadata TagWriter::readFromTag(const TagLib::ID3v2::Tag* tag, const QString& sourceId)
{
    SongMetadata meta;
    meta.title = orDefault(tag->title(), SongMetadata::kUnknownTitle);
    meta.artist = orDefault(tag->artist(), SongMetadata::kUnknownArtist);
    meta.album = orDefault(tag->album(), SongMetadata::kUnknownAlbum);
    meta.sourceId = sourceId;
    meta.albumArt = readAlbumArt(tag);
    meta.isCropped = TagCodec::readFlag(tag, TagCodec::Field::Cropped);
    meta.isMetadataEdited = TagCodec::readFlag(tag, TagCodec::Field::MetadataEdited);
    meta.downloadUnixTime = TagCodec::readDownloadTime(tag);
    return meta;
}

// ═══════════════════════════════════════════════════════════════════════
//  writeSongMetadata
// ═══════════════════════════════════════════════════════════════════════

LibraryError TagWriter::writeSongMetadata(const QString& filePath, const SongMetadata& meta)
{
    if (!QFileInfo::exists(filePath))
        return LibraryError(LibraryError::IoError, QStringLiteral("file does not exist"), filePath);

    TagLib::MPEG::File mpegFile(filePath.toUtf8().constData(), false);
    if (!mpegFile.isValid())
        return LibraryError(LibraryError::TagError, QStringLiteral("not a readable MPEG file"), filePath);

    TagLib::ID3v2::Tag* tag = mpegFile.ID3v2Tag(true);
    if (!tag)
        return LibraryError(LibraryError::TagError, QStringLiteral("could not create ID3v2 tag"), filePath);

    writeIntoTag(tag, meta);

    if (!mpegFile.save()) {
        qWarning() << "[Tags] Failed to save tags to" << filePath;
        return LibraryError(LibraryError::TagError, QStringLiteral("failed to save tags"), filePath);
    }
    return {};
}

void TagWriter::writeIntoTag(TagLib::ID3v2::Tag* tag, const SongMetadata& meta)
{
    tag->setTitle(toTagString(meta.title));
    tag->setArtist(toTagString(meta.artist));
    tag->setAlbum(toTagString(meta.album));
    writeAlbumArt(tag, meta.albumArt);

    TagCodec::writeSourceId(tag, meta.sourceId);
    TagCodec::writeFlag(tag, TagCodec::Field::Cropped, meta.isCropped);
    TagCodec::writeFlag(tag, TagCodec::Field::MetadataEdited, meta.isMetadataEdited);
    TagCodec::writeDownloadTime(tag, meta.downloadUnixTime);
}

// ═══════════════════════════════════════════════════════════════════════
//  Album art
// ═══════════════════════════════════════════════════════════════════════

std::optional<AlbumArt> TagWriter::readAlbumArt(const TagLib::ID3v2::Tag* tag)
{
    const TagLib::ID3v2::FrameList& frames = tag->frameList("APIC");
    for (auto* frame : frames) {
        auto* pic = dynamic_cast<TagLib::ID3v2::AttachedPictureFrame*>(frame);
        if (!pic || pic->type() != TagLib::ID3v2::AttachedPictureFrame::FrontCover)
            continue;

        AlbumArt art;
        art.data = QByteArray(pic->picture().data(), static_cast<int>(pic->picture().size()));
        art.mimeType = fromTagString(pic->mimeType());
        return art;
    }
    return std::nullopt;
}

void TagWriter::writeAlbumArt(TagLib::ID3v2::Tag* tag, const std::optional<AlbumArt>& art)
{
    tag->removeFrames("APIC");
    if (!art)
        return;

    auto* picFrame = new TagLib::ID3v2::AttachedPictureFrame();
    picFrame->setMimeType(toTagString(art->mimeType));
    picFrame->setType(TagLib::ID3v2::AttachedPictureFrame::FrontCover);
    picFrame->setPicture(TagLib::ByteVector(art->data.constData(),
                                            static_cast<unsigned int>(art->data.size())));
    tag->addFrame(picFrame);
}
