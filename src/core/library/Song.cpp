#include "Song.h"
#include "../audio/AudioProbe.h"
#include "../audio/AudioTrimmer.h"
#include "../tags/TagWriter.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

Song::Song(const QString& path, const SongMetadata& metadata)
    : m_path(path)
    , m_metadata(metadata)
{
}

bool Song::hasOriginalCopy() const
{
    return QFileInfo::exists(originalCopyPath());
}

// ═══════════════════════════════════════════════════════════════════════
//  Original copy
// ═══════════════════════════════════════════════════════════════════════

LibraryError Song::createOriginalCopy() const
{
    if (hasOriginalCopy())
        return {};

    QFile source(m_path);
    if (!source.copy(originalCopyPath())) {
        qWarning() << "[Song] Failed to back up" << m_path << ":" << source.errorString();
        return LibraryError(LibraryError::IoError,
                            QStringLiteral("could not create original copy: %1").arg(source.errorString()),
                            m_path);
    }

    qDebug() << "[Song] Created original copy" << originalCopyPath();
    return {};
}

LibraryError Song::restoreOriginalCopy()
{
    const QString original = originalCopyPath();
    if (!QFileInfo::exists(original)) {
        return LibraryError(LibraryError::IoError,
                            QStringLiteral("no original copy to restore"), original);
    }

    // Copy to a sibling first so a failed copy never leaves the song without
    // a working file.
    const QString staging = m_path + QStringLiteral(".restoring");
    QFile::remove(staging);

    QFile source(original);
    if (!source.copy(staging)) {
        return LibraryError(LibraryError::IoError,
                            QStringLiteral("could not copy original: %1").arg(source.errorString()),
                            original);
    }

    LibraryError err = replaceWorkingFile(staging);
    if (err.isError())
        return err;

    LibraryError readError;
    if (auto meta = TagWriter::readSongMetadata(m_path, &readError)) {
        m_metadata = *meta;
    } else {
        qWarning() << "[Song] Restored file has unreadable metadata:" << readError.toString();
        return readError;
    }

    qDebug() << "[Song] Restored original of" << m_path;
    return {};
}

// ═══════════════════════════════════════════════════════════════════════
//  crop
// ═══════════════════════════════════════════════════════════════════════

LibraryError Song::crop(double startSeconds, double endSeconds, const AudioTrimmer& trimmer)
{
    if (startSeconds < 0.0 || endSeconds <= startSeconds) {
        return LibraryError(LibraryError::InvalidArgument,
                            QStringLiteral("invalid crop range %1-%2").arg(startSeconds).arg(endSeconds),
                            m_path);
    }

    LibraryError err = createOriginalCopy();
    if (err.isError())
        return err;

    // The range is relative to the original, so probe that file.
    if (auto duration = AudioProbe::durationSeconds(originalCopyPath())) {
        if (startSeconds >= *duration) {
            return LibraryError(LibraryError::InvalidArgument,
                                QStringLiteral("crop start %1 is past the end (%2)")
                                    .arg(startSeconds).arg(*duration),
                                m_path);
        }
    }

    // Trim and tag a sibling file; the working file is only replaced once
    // both have succeeded.
    const QString staging = m_path + QStringLiteral(".cropping");
    QFile::remove(staging);

    err = trimmer.trim(originalCopyPath(), staging, startSeconds, endSeconds);
    if (err.isError()) {
        QFile::remove(staging);
        return err;
    }

    SongMetadata updated = m_metadata;
    updated.isCropped = true;
    err = TagWriter::writeSongMetadata(staging, updated);
    if (err.isError()) {
        QFile::remove(staging);
        return err;
    }

    err = replaceWorkingFile(staging);
    if (err.isError())
        return err;

    m_metadata = updated;
    return {};
}

// ═══════════════════════════════════════════════════════════════════════
//  editMetadata
// ═══════════════════════════════════════════════════════════════════════

LibraryError Song::editMetadata(const QString& title, const QString& artist, const QString& album)
{
    LibraryError err = createOriginalCopy();
    if (err.isError())
        return err;

    SongMetadata updated = m_metadata;
    updated.title = title;
    updated.artist = artist;
    updated.album = album;
    updated.isMetadataEdited = true;

    err = TagWriter::writeSongMetadata(m_path, updated);
    if (err.isError())
        return err;

    m_metadata = updated;
    return {};
}

// ═══════════════════════════════════════════════════════════════════════
//  remove
// ═══════════════════════════════════════════════════════════════════════

LibraryError Song::remove()
{
    if (hasOriginalCopy()) {
        QFile original(originalCopyPath());
        if (!original.remove()) {
            return LibraryError(LibraryError::IoError,
                                QStringLiteral("could not delete original copy: %1").arg(original.errorString()),
                                originalCopyPath());
        }
    }

    QFile working(m_path);
    if (!working.remove()) {
        qWarning() << "[Song] Original copy deleted but working file remains:" << m_path;
        return LibraryError(LibraryError::IoError,
                            QStringLiteral("could not delete song: %1").arg(working.errorString()),
                            m_path);
    }

    qDebug() << "[Song] Deleted" << m_path;
    return {};
}

// ═══════════════════════════════════════════════════════════════════════
//  hide / unhide
// ═══════════════════════════════════════════════════════════════════════

bool Song::isHidden() const
{
    return QFileInfo(m_path).fileName().startsWith(QLatin1Char('.'));
}

LibraryError Song::hide()
{
    if (isHidden())
        return {};

    QFileInfo fi(m_path);
    return renameTo(fi.dir().filePath(QLatin1Char('.') + fi.fileName()));
}

LibraryError Song::unhide()
{
    if (!isHidden())
        return {};

    QFileInfo fi(m_path);
    QString name = fi.fileName();
    while (name.startsWith(QLatin1Char('.')))
        name.remove(0, 1);
    return renameTo(fi.dir().filePath(name));
}

LibraryError Song::replaceWorkingFile(const QString& stagedPath)
{
    QFile working(m_path);
    if (working.exists() && !working.remove()) {
        QFile::remove(stagedPath);
        return LibraryError(LibraryError::IoError,
                            QStringLiteral("could not replace working file: %1").arg(working.errorString()),
                            m_path);
    }

    QFile staged(stagedPath);
    if (!staged.rename(m_path)) {
        return LibraryError(LibraryError::IoError,
                            QStringLiteral("could not move %1 into place: %2")
                                .arg(stagedPath, staged.errorString()),
                            m_path);
    }
    return {};
}

LibraryError Song::renameTo(const QString& newPath)
{
    if (QFileInfo::exists(newPath)) {
        return LibraryError(LibraryError::IoError,
                            QStringLiteral("target already exists"), newPath);
    }

    const QString oldPath = m_path;
    const QString oldOriginal = originalCopyPath();
    const bool moveOriginal = hasOriginalCopy();

    QFile working(oldPath);
    if (!working.rename(newPath)) {
        return LibraryError(LibraryError::IoError,
                            QStringLiteral("could not rename: %1").arg(working.errorString()),
                            oldPath);
    }

    if (moveOriginal) {
        QFile original(oldOriginal);
        if (!original.rename(newPath + originalCopySuffix())) {
            const QString reason = original.errorString();
            // Keep the working file and its original paired.
            if (!QFile::rename(newPath, oldPath))
                qWarning() << "[Song] Could not roll back rename of" << oldPath;
            return LibraryError(LibraryError::IoError,
                                QStringLiteral("could not rename original copy: %1").arg(reason),
                                oldOriginal);
        }
    }

    m_path = newPath;
    qDebug() << "[Song] Renamed" << oldPath << "->" << newPath;
    return {};
}

std::optional<double> Song::durationSeconds() const
{
    return AudioProbe::durationSeconds(m_path);
}
