#pragma once

#include <QMutex>
#include <QString>
#include <QVector>
#include <optional>

#include "Song.h"
#include "../LibraryError.h"

// Snapshot of the songs in one flat library directory.
//
// The snapshot only changes on scan(); anything that touches the directory
// afterwards (a finished download, a crop, a delete) leaves it stale until
// the next scan.
class Library {
public:
    explicit Library(const QString& path);

    // Safe to call from any thread. Changing the path empties the snapshot;
    // a scan still running against the old path then discards its result.
    QString path() const;
    void setPath(const QString& path);

    // Rebuilds the snapshot from the directory. Files without an ID3v2 tag
    // or without a source id are not ours and are skipped. Only a failure
    // to read the directory itself is reported.
    LibraryError scan();

    QVector<Song> songs() const;
    int songCount() const;
    std::optional<Song> songBySourceId(const QString& sourceId) const;

    static QString audioExtension() { return QStringLiteral("mp3"); }

private:
    // Guards m_path and m_songs.
    mutable QMutex m_mutex;
    QString m_path;
    QVector<Song> m_songs;
};
