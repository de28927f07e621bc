#include "SongSort.h"

#include <algorithm>

void SongSort::sort(QVector<Song>& songs, SortBy sortBy, SortDirection direction)
{
    auto textKey = [sortBy](const Song& s) -> QString {
        switch (sortBy) {
        case SortBy::Artist: return s.metadata().artist.toLower();
        case SortBy::Album:  return s.metadata().album.toLower();
        default:             return s.metadata().title.toLower();
        }
    };

    if (sortBy == SortBy::Downloaded) {
        std::stable_sort(songs.begin(), songs.end(), [](const Song& a, const Song& b) {
            return a.metadata().downloadUnixTime > b.metadata().downloadUnixTime;
        });
    } else {
        std::stable_sort(songs.begin(), songs.end(), [&textKey](const Song& a, const Song& b) {
            return textKey(a) < textKey(b);
        });
    }

    if (direction == SortDirection::Reverse)
        std::reverse(songs.begin(), songs.end());
}

SortDirection SongSort::reversed(SortDirection direction)
{
    return direction == SortDirection::Normal ? SortDirection::Reverse : SortDirection::Normal;
}

QString SongSort::sortByName(SortBy sortBy)
{
    switch (sortBy) {
    case SortBy::Title:      return QStringLiteral("title");
    case SortBy::Artist:     return QStringLiteral("artist");
    case SortBy::Album:      return QStringLiteral("album");
    case SortBy::Downloaded: return QStringLiteral("downloaded");
    }
    return QStringLiteral("downloaded");
}

SortBy SongSort::sortByFromName(const QString& name, SortBy fallback)
{
    const QString n = name.toLower();
    if (n == QLatin1String("title"))      return SortBy::Title;
    if (n == QLatin1String("artist"))     return SortBy::Artist;
    if (n == QLatin1String("album"))      return SortBy::Album;
    if (n == QLatin1String("downloaded")) return SortBy::Downloaded;
    return fallback;
}
