#include "DownloadManager.h"
#include "FetchTask.h"
#include "SourceId.h"
#include "../Settings.h"
#include "../library/Library.h"

#include <QDebug>

DownloadManager::DownloadManager(Library* library, Settings* settings, QObject* parent)
    : QObject(parent)
    , m_library(library)
    , m_settings(settings)
{
}

DownloadManager::~DownloadManager()
{
    // Tasks are children of this object; stop them from reporting back
    // while they are torn down.
    for (const auto& dl : m_active)
        dl.task->disconnect(this);
}

FetchTask* DownloadManager::startDownload(const QString& input)
{
    const QString sourceId = SourceId::extract(input);
    if (sourceId.isEmpty()) {
        qWarning() << "[Downloads] Ignoring empty download request";
        return nullptr;
    }

    for (const auto& dl : m_active) {
        if (dl.sourceId == sourceId) {
            qDebug() << "[Downloads]" << sourceId << "is already downloading";
            return dl.task;
        }
    }

    FetchTask::Options options;
    options.program = m_settings->fetchToolProgram();
    options.metadataWaitTimeoutMs = m_settings->metadataWaitTimeoutMs();

    auto* task = new FetchTask(sourceId, m_library->path(), options, this);
    connect(task, &FetchTask::finished, this, [this, task](const LibraryError& error) {
        onTaskFinished(task, error);
    });

    ActiveDownload dl;
    dl.sourceId = sourceId;
    dl.task = task;
    dl.progress = task->progress();
    m_active.append(dl);

    emit downloadStarted(sourceId);
    task->start();
    return task;
}

void DownloadManager::dismissErrors()
{
    m_failed.clear();
}

void DownloadManager::onTaskFinished(FetchTask* task, const LibraryError& error)
{
    const QString sourceId = task->sourceId();

    for (int i = 0; i < m_active.size(); ++i) {
        if (m_active[i].task == task) {
            m_active.removeAt(i);
            break;
        }
    }

    // The latest attempt for an id replaces any earlier failure.
    for (int i = 0; i < m_failed.size(); ++i) {
        if (m_failed[i].sourceId == sourceId) {
            m_failed.removeAt(i);
            break;
        }
    }

    task->deleteLater();

    if (error.isError()) {
        FailedDownload failed;
        failed.sourceId = sourceId;
        failed.error = error;
        m_failed.append(failed);
        emit downloadFinished(sourceId, error);
        return;
    }

    // Only a successful fetch can have added a tagged file.
    LibraryError scanError = m_library->scan();
    if (scanError.isError())
        qWarning() << "[Downloads] Rescan after" << sourceId << "failed:" << scanError.toString();

    emit downloadFinished(sourceId, error);
    emit libraryRescanned(scanError);
}
