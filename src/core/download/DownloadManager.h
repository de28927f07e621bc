#pragma once

#include <QObject>
#include <QString>
#include <QVector>
#include <memory>

#include "DownloadProgress.h"
#include "../LibraryError.h"

class FetchTask;
class Library;
class Settings;

// Bookkeeping for the downloads a user has started: which are in flight,
// which failed and why. A successful download triggers a library rescan.
class DownloadManager : public QObject {
    Q_OBJECT

public:
    struct ActiveDownload {
        QString sourceId;
        FetchTask* task = nullptr;
        std::shared_ptr<DownloadProgress> progress;
    };

    struct FailedDownload {
        QString sourceId;
        LibraryError error;
    };

    DownloadManager(Library* library, Settings* settings, QObject* parent = nullptr);
    ~DownloadManager() override;

    // Accepts a pasted URL or a bare id. Starting an id that is already in
    // flight returns the running task instead of starting a second one.
    FetchTask* startDownload(const QString& input);

    QVector<ActiveDownload> activeDownloads() const { return m_active; }
    QVector<FailedDownload> failedDownloads() const { return m_failed; }
    bool hasActiveDownloads() const { return !m_active.isEmpty(); }

    void dismissErrors();

signals:
    void downloadStarted(const QString& sourceId);
    void downloadFinished(const QString& sourceId, const LibraryError& error);
    void libraryRescanned(const LibraryError& error);

private:
    void onTaskFinished(FetchTask* task, const LibraryError& error);

    Library* m_library = nullptr;
    Settings* m_settings = nullptr;

    QVector<ActiveDownload> m_active;
    QVector<FailedDownload> m_failed;
};
