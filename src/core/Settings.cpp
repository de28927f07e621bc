#include "Settings.h"

#include <QDebug>
#include <QDir>
#include <QStandardPaths>

// ── Settings INI path ───────────────────────────────────────────────
// <config>/CrossPlay/settings.ini
QString Settings::defaultSettingsPath()
{
    QDir dir(QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
             + QStringLiteral("/CrossPlay"));
    if (!dir.exists()) dir.mkpath(QStringLiteral("."));
    return dir.filePath(QStringLiteral("settings.ini"));
}

QString Settings::defaultLibraryPath()
{
    QString music = QStandardPaths::writableLocation(QStandardPaths::MusicLocation);
    if (music.isEmpty())
        music = QDir::homePath() + QStringLiteral("/Music");
    return QDir(music).filePath(QStringLiteral("CrossPlay"));
}

Settings::Settings(const QString& iniPath, QObject* parent)
    : QObject(parent)
    , m_settings(iniPath, QSettings::IniFormat)
{
    qDebug() << "[Settings] Using" << m_settings.fileName();
}

void Settings::sync()
{
    m_settings.sync();
    if (m_settings.status() != QSettings::NoError)
        qWarning() << "[Settings] Failed to write" << m_settings.fileName();
}

// ── Library ─────────────────────────────────────────────────────────
QString Settings::libraryPath() const
{
    return m_settings.value(QStringLiteral("library/path"), defaultLibraryPath()).toString();
}

void Settings::setLibraryPath(const QString& path)
{
    if (path == libraryPath()) return;
    m_settings.setValue(QStringLiteral("library/path"), path);
    emit libraryPathChanged(path);
}

LibraryError Settings::ensureLibraryDirectory() const
{
    const QString path = libraryPath();
    if (QDir(path).exists())
        return {};
    if (!QDir().mkpath(path)) {
        qWarning() << "[Settings] Could not create library directory" << path;
        return LibraryError(LibraryError::IoError,
                            QStringLiteral("could not create library directory"), path);
    }
    qDebug() << "[Settings] Created library directory" << path;
    return {};
}

// ── Sorting ─────────────────────────────────────────────────────────
SortBy Settings::sortBy() const
{
    return SongSort::sortByFromName(
        m_settings.value(QStringLiteral("library/sortBy")).toString());
}

void Settings::setSortBy(SortBy sortBy)
{
    m_settings.setValue(QStringLiteral("library/sortBy"), SongSort::sortByName(sortBy));
    emit sortChanged();
}

SortDirection Settings::sortDirection() const
{
    return m_settings.value(QStringLiteral("library/sortReverse"), false).toBool()
        ? SortDirection::Reverse : SortDirection::Normal;
}

void Settings::setSortDirection(SortDirection direction)
{
    m_settings.setValue(QStringLiteral("library/sortReverse"), direction == SortDirection::Reverse);
    emit sortChanged();
}

void Settings::toggleSortDirection()
{
    setSortDirection(SongSort::reversed(sortDirection()));
}

// ── External tools ──────────────────────────────────────────────────
QString Settings::fetchToolProgram() const
{
    return m_settings.value(QStringLiteral("tools/fetch"), QStringLiteral("yt-dlp")).toString();
}

void Settings::setFetchToolProgram(const QString& program)
{
    m_settings.setValue(QStringLiteral("tools/fetch"), program);
}

QString Settings::trimToolProgram() const
{
    return m_settings.value(QStringLiteral("tools/trim"), QStringLiteral("ffmpeg")).toString();
}

void Settings::setTrimToolProgram(const QString& program)
{
    m_settings.setValue(QStringLiteral("tools/trim"), program);
}

int Settings::metadataWaitTimeoutMs() const
{
    return m_settings.value(QStringLiteral("tools/metadataWaitTimeoutMs"), 10000).toInt();
}

void Settings::setMetadataWaitTimeoutMs(int ms)
{
    m_settings.setValue(QStringLiteral("tools/metadataWaitTimeoutMs"), ms);
}
