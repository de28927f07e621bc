#pragma once

#include <QString>
#include <QVector>

#include "Song.h"

enum class SortBy {
    Title,
    Artist,
    Album,
    Downloaded
};

enum class SortDirection {
    Normal,
    Reverse
};

class SongSort {
public:
    // Text keys sort case-insensitively A-Z, Downloaded sorts newest first.
    // Reverse inverts whichever order the key produces.
    static void sort(QVector<Song>& songs, SortBy sortBy, SortDirection direction);

    static SortDirection reversed(SortDirection direction);

    static QString sortByName(SortBy sortBy);
    static SortBy sortByFromName(const QString& name, SortBy fallback = SortBy::Downloaded);
};
