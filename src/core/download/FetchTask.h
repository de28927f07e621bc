#pragma once

#include <QElapsedTimer>
#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>
#include <memory>
#include <optional>

#include "DownloadProgress.h"
#include "../LibraryError.h"
#include "../library/Song.h"

class QTimer;

// Downloads one source id into the library directory by running the fetch
// tool (yt-dlp by default) and turning its output into a tagged MP3.
//
// Output is consumed line by line while the tool runs, so progress and the
// parsed metadata are visible in progress() before the process exits. Once
// the tool exits successfully the task locates the audio file and the
// thumbnail, converts the thumbnail to JPEG cover art and writes the final
// metadata into the MP3. The library itself is never touched; rescanning
// is up to the caller.
class FetchTask : public QObject {
    Q_OBJECT

public:
    struct Options {
        QString program = QStringLiteral("yt-dlp");
        int metadataWaitTimeoutMs = 10000;
    };

    FetchTask(const QString& sourceId, const QString& libraryPath,
              const Options& options, QObject* parent = nullptr);
    ~FetchTask() override;

    QString sourceId() const { return m_sourceId; }
    QString libraryPath() const { return m_libraryPath; }
    std::shared_ptr<DownloadProgress> progress() const { return m_progress; }

    bool isRunning() const { return m_started && !m_done; }
    bool isFinished() const { return m_done; }

    // Valid once finished() has been emitted.
    LibraryError error() const { return m_error; }
    std::optional<Song> song() const { return m_song; }

    QString audioPath() const;

    static QStringList arguments(const QString& sourceId, const QString& libraryPath);

    // Line classifiers for the fetch tool's stdout.
    static QString parseMetadataLine(const QString& line);
    static std::optional<double> parseProgressLine(const QString& line);
    static std::optional<SongMetadata> parseInfoJson(const QByteArray& json,
                                                     LibraryError* error = nullptr);

public slots:
    void start();
    void cancel();

signals:
    void progressChanged(double percent);
    void metadataResolved(const SongMetadata& metadata);
    void finished(const LibraryError& error);

private:
    void onStandardOutput();
    void onStandardError();
    void onProcessError(QProcess::ProcessError error);
    void onProcessFinished(int exitCode, QProcess::ExitStatus status);

    void consumeOutput(const QByteArray& data, bool flush);
    void handleLine(const QString& line);
    void pollMetadataFiles();
    void absorbMetadataFile(const QString& path);

    void maybeFinalize();
    void finalize();
    void finish(const LibraryError& error);

    QString m_sourceId;
    QString m_libraryPath;
    Options m_options;
    std::shared_ptr<DownloadProgress> m_progress;

    QProcess* m_process = nullptr;
    QByteArray m_lineBuffer;
    QByteArray m_errorOutput;
    bool m_started = false;
    bool m_processExited = false;
    int m_exitCode = 0;
    QProcess::ExitStatus m_exitStatus = QProcess::NormalExit;

    // Metadata dumps announced but not yet absorbed.
    QStringList m_pendingMetadataFiles;
    QTimer* m_pollTimer = nullptr;
    QElapsedTimer m_pollClock;
    int m_pollDelayMs = 0;

    bool m_done = false;
    LibraryError m_error;
    std::optional<Song> m_song;

    static constexpr int POLL_INITIAL_DELAY_MS = 25;
    static constexpr int POLL_MAX_DELAY_MS = 500;
    static constexpr int MAX_ERROR_OUTPUT = 64 * 1024;
};
