#include "Library.h"
#include "../tags/TagWriter.h"

#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QMutexLocker>
#include <QtConcurrent>

Library::Library(const QString& path)
    : m_path(path)
{
}

QString Library::path() const
{
    QMutexLocker lock(&m_mutex);
    return m_path;
}

void Library::setPath(const QString& path)
{
    QMutexLocker lock(&m_mutex);
    m_path = path;
    m_songs.clear();
}

// ── scan ────────────────────────────────────────────────────────────
LibraryError Library::scan()
{
    QElapsedTimer timer; timer.start();

    const QString root = path();
    QFileInfo rootInfo(root);
    if (!rootInfo.exists())
        return LibraryError(LibraryError::IoError, QStringLiteral("library directory does not exist"), root);
    if (!rootInfo.isDir() || !rootInfo.isReadable())
        return LibraryError(LibraryError::IoError, QStringLiteral("library directory is not readable"), root);

    // Hidden songs stay part of the library, so include dot-files.
    QDir dir(root);
    const QFileInfoList entries = dir.entryInfoList(
        QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot, QDir::Name);

    QStringList candidates;
    for (const QFileInfo& fi : entries) {
        if (fi.suffix().toLower() == audioExtension())
            candidates.append(fi.absoluteFilePath());
    }

    QList<std::optional<Song>> decoded = QtConcurrent::blockingMapped(
        candidates, [](const QString& filePath) -> std::optional<Song> {
            LibraryError error;
            std::optional<SongMetadata> meta = TagWriter::readSongMetadata(filePath, &error);
            if (!meta) {
                qDebug() << "[Library] Skipping" << filePath << "-" << error.toString();
                return std::nullopt;
            }
            return Song(filePath, *meta);
        });

    QVector<Song> fresh;
    fresh.reserve(decoded.size());
    for (const auto& song : decoded) {
        if (song)
            fresh.append(*song);
    }

    {
        QMutexLocker lock(&m_mutex);
        // setPath() during the scan wins; this result belongs to the old root.
        if (m_path != root) {
            qDebug() << "[Library] Discarding scan of" << root << "- path changed";
            return {};
        }
        m_songs = fresh;
    }

    qDebug() << "[Library] Scanned" << root << ":" << fresh.size() << "of"
             << candidates.size() << "MP3 files in" << timer.elapsed() << "ms";
    return {};
}

QVector<Song> Library::songs() const
{
    QMutexLocker lock(&m_mutex);
    return m_songs;
}

int Library::songCount() const
{
    QMutexLocker lock(&m_mutex);
    return m_songs.size();
}

std::optional<Song> Library::songBySourceId(const QString& sourceId) const
{
    QMutexLocker lock(&m_mutex);
    for (const Song& song : m_songs) {
        if (song.metadata().sourceId == sourceId)
            return song;
    }
    return std::nullopt;
}
