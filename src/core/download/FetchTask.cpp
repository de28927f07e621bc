#include "FetchTask.h"
#include "SourceId.h"
#include "ThumbnailConverter.h"
#include "../library/Library.h"
#include "../tags/TagWriter.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QTimer>
#include <utility>

FetchTask::FetchTask(const QString& sourceId, const QString& libraryPath,
                     const Options& options, QObject* parent)
    : QObject(parent)
    , m_sourceId(sourceId)
    , m_libraryPath(libraryPath)
    , m_options(options)
    , m_progress(std::make_shared<DownloadProgress>())
    , m_pollTimer(new QTimer(this))
{
    m_pollTimer->setSingleShot(true);
    connect(m_pollTimer, &QTimer::timeout, this, &FetchTask::pollMetadataFiles);
}

FetchTask::~FetchTask()
{
    // Dropping a running task abandons the download. Files the tool already
    // wrote are left where they are.
    if (m_process && m_process->state() != QProcess::NotRunning) {
        m_process->disconnect(this);
        m_process->kill();
        m_process->waitForFinished(1000);
    }
}

QString FetchTask::audioPath() const
{
    return QDir(m_libraryPath).filePath(m_sourceId + QLatin1Char('.') + Library::audioExtension());
}

QStringList FetchTask::arguments(const QString& sourceId, const QString& libraryPath)
{
    return {
        QStringLiteral("--newline"),
        QStringLiteral("--extract-audio"),
        QStringLiteral("--audio-format"), QStringLiteral("mp3"),
        QStringLiteral("--write-info-json"),
        QStringLiteral("--write-thumbnail"),
        QStringLiteral("--output"),
        QDir(libraryPath).filePath(sourceId + QStringLiteral(".%(ext)s")),
        SourceId::watchUrl(sourceId)
    };
}

// ═══════════════════════════════════════════════════════════════════════
//  Line parsing
// ═══════════════════════════════════════════════════════════════════════

QString FetchTask::parseMetadataLine(const QString& line)
{
    static const QRegularExpression re(
        QStringLiteral(R"(Writing video metadata as JSON to:\s*(.+)$)"));
    QRegularExpressionMatch match = re.match(line);
    if (!match.hasMatch())
        return {};
    return match.captured(1).trimmed();
}

std::optional<double> FetchTask::parseProgressLine(const QString& line)
{
    static const QRegularExpression re(QStringLiteral(R"((\d+(?:\.\d+)?)%)"));
    QRegularExpressionMatch match = re.match(line);
    if (!match.hasMatch())
        return std::nullopt;

    bool ok = false;
    double percent = match.captured(1).toDouble(&ok);
    if (!ok)
        return std::nullopt;
    return percent;
}

std::optional<SongMetadata> FetchTask::parseInfoJson(const QByteArray& json, LibraryError* error)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = LibraryError(LibraryError::MalformedMetadata,
                                  QStringLiteral("invalid metadata JSON: %1").arg(parseError.errorString()));
        }
        return std::nullopt;
    }

    QJsonObject obj = doc.object();
    SongMetadata meta;
    meta.sourceId = obj.value(QStringLiteral("id")).toString();
    meta.title = obj.value(QStringLiteral("title")).toString();
    meta.artist = obj.value(QStringLiteral("uploader")).toString();
    if (meta.artist.isEmpty())
        meta.artist = obj.value(QStringLiteral("channel")).toString();

    if (meta.sourceId.isEmpty() || meta.title.isEmpty()) {
        if (error) {
            *error = LibraryError(LibraryError::MalformedMetadata,
                                  QStringLiteral("metadata JSON lacks id or title"));
        }
        return std::nullopt;
    }

    if (meta.artist.isEmpty())
        meta.artist = SongMetadata::kUnknownArtist;
    meta.album = SongMetadata::kUnknownAlbum;
    return meta;
}

// ═══════════════════════════════════════════════════════════════════════
//  start / cancel
// ═══════════════════════════════════════════════════════════════════════

void FetchTask::start()
{
    if (m_started)
        return;
    m_started = true;

    m_process = new QProcess(this);
    m_process->setWorkingDirectory(m_libraryPath);

    connect(m_process, &QProcess::readyReadStandardOutput, this, &FetchTask::onStandardOutput);
    connect(m_process, &QProcess::readyReadStandardError, this, &FetchTask::onStandardError);
    connect(m_process, &QProcess::errorOccurred, this, &FetchTask::onProcessError);
    connect(m_process, qOverload<int, QProcess::ExitStatus>(&QProcess::finished),
            this, &FetchTask::onProcessFinished);

    qDebug() << "[Fetch] Starting" << m_options.program << "for" << m_sourceId;
    m_process->start(m_options.program, arguments(m_sourceId, m_libraryPath));
}

void FetchTask::cancel()
{
    if (m_done)
        return;
    qDebug() << "[Fetch] Cancelled" << m_sourceId;
    finish(LibraryError(LibraryError::ExternalToolFailure,
                        QStringLiteral("download cancelled"), audioPath()));
}

// ═══════════════════════════════════════════════════════════════════════
//  Process output
// ═══════════════════════════════════════════════════════════════════════

void FetchTask::onStandardOutput()
{
    consumeOutput(m_process->readAllStandardOutput(), false);
}

void FetchTask::onStandardError()
{
    QByteArray data = m_process->readAllStandardError();
    if (m_errorOutput.size() < MAX_ERROR_OUTPUT)
        m_errorOutput.append(data.left(MAX_ERROR_OUTPUT - m_errorOutput.size()));
}

void FetchTask::consumeOutput(const QByteArray& data, bool flush)
{
    m_lineBuffer.append(data);

    // yt-dlp separates updates with '\n' under --newline, '\r' otherwise.
    int start = 0;
    for (int i = 0; i < m_lineBuffer.size() && !m_done; ++i) {
        const char c = m_lineBuffer.at(i);
        if (c != '\n' && c != '\r')
            continue;
        if (i > start)
            handleLine(QString::fromUtf8(m_lineBuffer.mid(start, i - start)));
        start = i + 1;
    }
    m_lineBuffer.remove(0, start);

    if (flush && !m_lineBuffer.isEmpty() && !m_done) {
        handleLine(QString::fromUtf8(m_lineBuffer));
        m_lineBuffer.clear();
    }
}

void FetchTask::handleLine(const QString& line)
{
    const QString metadataPath = parseMetadataLine(line);
    if (!metadataPath.isEmpty()) {
        m_pendingMetadataFiles.append(QDir(m_libraryPath).absoluteFilePath(metadataPath));
        if (m_pendingMetadataFiles.size() == 1) {
            m_pollClock.start();
            m_pollDelayMs = POLL_INITIAL_DELAY_MS;
            pollMetadataFiles();
        }
        return;
    }

    if (auto percent = parseProgressLine(line)) {
        m_progress->setPercent(*percent);
        emit progressChanged(m_progress->percent());
    }
}

// ── Metadata dump ───────────────────────────────────────────────────
// The "written" announcement can come before the file is visible on disk,
// so poll with a growing delay until it shows up or the timeout passes.
void FetchTask::pollMetadataFiles()
{
    while (!m_done && !m_pendingMetadataFiles.isEmpty()) {
        const QString path = m_pendingMetadataFiles.first();

        if (!QFileInfo::exists(path)) {
            if (m_pollClock.elapsed() >= m_options.metadataWaitTimeoutMs) {
                qWarning() << "[Fetch] Metadata file never appeared:" << path;
                finish(LibraryError(LibraryError::MetadataTimeout,
                                    QStringLiteral("metadata file did not appear within %1 ms")
                                        .arg(m_options.metadataWaitTimeoutMs),
                                    path));
                return;
            }
            m_pollTimer->start(m_pollDelayMs);
            m_pollDelayMs = qMin(m_pollDelayMs * 2, POLL_MAX_DELAY_MS);
            return;
        }

        absorbMetadataFile(path);
        m_pendingMetadataFiles.removeFirst();
        m_pollClock.start();
        m_pollDelayMs = POLL_INITIAL_DELAY_MS;
    }

    maybeFinalize();
}

void FetchTask::absorbMetadataFile(const QString& path)
{
    QFile file(path);
    if (file.open(QIODevice::ReadOnly)) {
        const QByteArray json = file.readAll();
        file.close();

        LibraryError parseError;
        if (auto meta = parseInfoJson(json, &parseError)) {
            m_progress->setMetadata(*meta);
            emit metadataResolved(*meta);
            qDebug() << "[Fetch] Resolved metadata for" << m_sourceId << ":" << meta->title;
        } else {
            qWarning() << "[Fetch]" << parseError.toString();
        }
    } else {
        qWarning() << "[Fetch] Cannot read metadata file" << path << ":" << file.errorString();
    }

    if (!QFile::remove(path))
        qWarning() << "[Fetch] Could not delete metadata file" << path;
}

// ═══════════════════════════════════════════════════════════════════════
//  Process exit
// ═══════════════════════════════════════════════════════════════════════

void FetchTask::onProcessError(QProcess::ProcessError error)
{
    // Crashes are reported through finished(); only a failed start ends here.
    if (error != QProcess::FailedToStart || m_done)
        return;

    qWarning() << "[Fetch] Could not start" << m_options.program << ":" << m_process->errorString();
    finish(LibraryError::toolFailure(m_options.program, -1, m_process->errorString().toUtf8()));
}

void FetchTask::onProcessFinished(int exitCode, QProcess::ExitStatus status)
{
    if (m_done)
        return;

    consumeOutput(m_process->readAllStandardOutput(), true);
    onStandardError();

    m_exitCode = exitCode;
    m_exitStatus = status;
    m_processExited = true;

    // A failed tool may have announced a metadata dump it never wrote.
    // Take whatever is already on disk and report the exit status now.
    if (status != QProcess::NormalExit || exitCode != 0) {
        m_pollTimer->stop();
        for (const QString& path : std::as_const(m_pendingMetadataFiles)) {
            if (QFileInfo::exists(path))
                absorbMetadataFile(path);
        }
        m_pendingMetadataFiles.clear();
        finalize();
        return;
    }
    maybeFinalize();
}

void FetchTask::maybeFinalize()
{
    if (m_done || !m_processExited || !m_pendingMetadataFiles.isEmpty())
        return;
    finalize();
}

void FetchTask::finalize()
{
    if (m_exitStatus != QProcess::NormalExit) {
        finish(LibraryError::toolFailure(m_options.program, -1, m_errorOutput));
        return;
    }
    if (m_exitCode != 0) {
        finish(LibraryError::toolFailure(m_options.program, m_exitCode, m_errorOutput));
        return;
    }

    const QString audio = audioPath();
    if (!QFileInfo::exists(audio)) {
        finish(LibraryError(LibraryError::DownloadMissing,
                            QStringLiteral("fetch tool produced no audio file"), audio));
        return;
    }

    const QString thumbnail = ThumbnailConverter::findThumbnail(m_libraryPath, m_sourceId);
    if (thumbnail.isEmpty()) {
        finish(LibraryError(LibraryError::ThumbnailMissing,
                            QStringLiteral("fetch tool produced no thumbnail"), audio));
        return;
    }

    LibraryError err;
    std::optional<AlbumArt> art = ThumbnailConverter::toAlbumArt(thumbnail, &err);
    if (!art) {
        finish(err);
        return;
    }
    if (!QFile::remove(thumbnail))
        qWarning() << "[Fetch] Could not delete thumbnail" << thumbnail;

    SongMetadata meta = m_progress->metadata().value_or(SongMetadata::fallback(m_sourceId));
    if (meta.sourceId.isEmpty())
        meta.sourceId = m_sourceId;
    meta.albumArt = art;
    if (meta.downloadUnixTime == 0)
        meta.downloadUnixTime = QDateTime::currentSecsSinceEpoch();

    err = TagWriter::writeSongMetadata(audio, meta);
    if (err.isError()) {
        finish(err);
        return;
    }

    m_song = Song(audio, meta);
    m_progress->setPercent(100.0);
    qDebug() << "[Fetch] Finished" << m_sourceId << "->" << audio;
    finish(LibraryError());
}

void FetchTask::finish(const LibraryError& error)
{
    if (m_done)
        return;
    m_done = true;
    m_error = error;
    m_pollTimer->stop();

    if (m_process && m_process->state() != QProcess::NotRunning) {
        m_process->disconnect(this);
        m_process->kill();
    }

    if (error.isError())
        qWarning() << "[Fetch]" << m_sourceId << "failed:" << error.toString();

    emit finished(error);
}
