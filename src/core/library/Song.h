#pragma once

#include <QString>
#include <optional>

#include "SongMetadata.h"
#include "../LibraryError.h"

class AudioTrimmer;

// One library entry: the working MP3 plus the metadata decoded from it.
//
// The first destructive change to a song copies the working file to
// "<path>.original". That copy is never touched again except by
// remove(), so cropping always starts from the untouched download and
// restoreOriginalCopy() can be repeated.
//
// Mutations on the same Song from two call sites at once are not
// synchronised; callers serialise them.
class Song {
public:
    Song() = default;
    Song(const QString& path, const SongMetadata& metadata);

    static QString originalCopySuffix() { return QStringLiteral(".original"); }

    QString path() const { return m_path; }
    const SongMetadata& metadata() const { return m_metadata; }

    QString originalCopyPath() const { return m_path + originalCopySuffix(); }
    bool hasOriginalCopy() const;

    // No-op when the copy already exists.
    LibraryError createOriginalCopy() const;
    // Copies the original back over the working file and reloads metadata.
    LibraryError restoreOriginalCopy();

    LibraryError crop(double startSeconds, double endSeconds, const AudioTrimmer& trimmer);
    LibraryError editMetadata(const QString& title, const QString& artist, const QString& album);

    // Deletes the original copy (if any), then the working file.
    LibraryError remove();

    // Hidden songs carry a leading dot in their file name.
    LibraryError hide();
    LibraryError unhide();
    bool isHidden() const;

    bool isModified() const { return m_metadata.isCropped || m_metadata.isMetadataEdited; }

    std::optional<double> durationSeconds() const;

    bool operator==(const Song& other) const
    {
        return m_path == other.m_path && m_metadata == other.m_metadata;
    }
    bool operator!=(const Song& other) const { return !(*this == other); }

private:
    // Moves a fully written sibling over the working file.
    LibraryError replaceWorkingFile(const QString& stagedPath);
    LibraryError renameTo(const QString& newPath);

    QString m_path;
    SongMetadata m_metadata;
};
