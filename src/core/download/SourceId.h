#pragma once

#include <QString>

class SourceId {
public:
    // Pulls the video id out of a pasted watch URL or short link. Anything
    // else is taken as the id itself (surrounding whitespace removed).
    static QString extract(const QString& input);

    static QString watchUrl(const QString& sourceId);
};
