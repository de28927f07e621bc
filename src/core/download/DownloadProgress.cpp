#include "DownloadProgress.h"

#include <QMutexLocker>

double DownloadProgress::percent() const
{
    QMutexLocker lock(&m_mutex);
    return m_percent;
}

void DownloadProgress::setPercent(double percent)
{
    QMutexLocker lock(&m_mutex);
    m_percent = qBound(0.0, percent, 100.0);
}

std::optional<SongMetadata> DownloadProgress::metadata() const
{
    QMutexLocker lock(&m_mutex);
    return m_metadata;
}

void DownloadProgress::setMetadata(const SongMetadata& metadata)
{
    QMutexLocker lock(&m_mutex);
    m_metadata = metadata;
}
