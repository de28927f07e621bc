#pragma once

#include <QMutex>
#include <optional>

#include "../library/SongMetadata.h"

// Progress of one fetch, written by its FetchTask and polled by the UI.
// Each accessor takes the lock for the duration of a single read or write.
class DownloadProgress {
public:
    double percent() const;
    void setPercent(double percent);

    std::optional<SongMetadata> metadata() const;
    void setMetadata(const SongMetadata& metadata);

private:
    mutable QMutex m_mutex;
    double m_percent = 0.0;
    std::optional<SongMetadata> m_metadata;
};
