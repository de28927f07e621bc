#pragma once

#include <QObject>
#include <QSettings>
#include <QString>

#include "LibraryError.h"
#include "library/SongSort.h"

// INI-backed application settings. One instance is created at startup and
// handed to the components that need it.
class Settings : public QObject {
    Q_OBJECT

public:
    explicit Settings(const QString& iniPath = defaultSettingsPath(), QObject* parent = nullptr);

    static QString defaultSettingsPath();
    static QString defaultLibraryPath();

    QString fileName() const { return m_settings.fileName(); }
    void sync();

    // ── Library ──────────────────────────────────────────────────────
    QString libraryPath() const;
    void setLibraryPath(const QString& path);
    LibraryError ensureLibraryDirectory() const;

    // ── Sorting ──────────────────────────────────────────────────────
    SortBy sortBy() const;
    void setSortBy(SortBy sortBy);

    SortDirection sortDirection() const;
    void setSortDirection(SortDirection direction);
    void toggleSortDirection();

    // ── External tools ───────────────────────────────────────────────
    QString fetchToolProgram() const;
    void setFetchToolProgram(const QString& program);

    QString trimToolProgram() const;
    void setTrimToolProgram(const QString& program);

    // How long to wait for the fetch tool's metadata dump to appear.
    int metadataWaitTimeoutMs() const;
    void setMetadataWaitTimeoutMs(int ms);

signals:
    void libraryPathChanged(const QString& path);
    void sortChanged();

private:
    QSettings m_settings;
};
