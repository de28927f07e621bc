#include <QtTest/QtTest>
#include <QDir>
#include <QFileInfo>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "TestFixtures.h"
#include "download/FetchTask.h"
#include "download/ThumbnailConverter.h"
#include "tags/TagWriter.h"

class tst_FetchTask : public QObject {
    Q_OBJECT

private:
    QTemporaryDir* m_dir = nullptr;
    QString m_library;
    QString m_fixtures;

    static constexpr const char* kId = "dQw4w9WgXcQ";

    QString fixture(const QString& name) const { return QDir(m_fixtures).filePath(name); }
    QString inLibrary(const QString& name) const { return QDir(m_library).filePath(name); }

    // Builds a fetch tool stand-in from the given shell body.
    FetchTask::Options fakeTool(const QString& body, int metadataWaitTimeoutMs = 5000)
    {
        const QString script = fixture(QStringLiteral("fake-fetch.sh"));
        TestFixtures::writeScript(script, body);
        FetchTask::Options options;
        options.program = script;
        options.metadataWaitTimeoutMs = metadataWaitTimeoutMs;
        return options;
    }

    QString announceMetadata() const
    {
        return QStringLiteral("echo '[info] Writing video metadata as JSON to: %1.info.json'\n"
                              "cp '%2' '%3'\n")
            .arg(QString::fromLatin1(kId), fixture(QStringLiteral("info.json")),
                 inLibrary(QString::fromLatin1(kId) + QStringLiteral(".info.json")));
    }

    QString produceAudio() const
    {
        return QStringLiteral("cp '%1' '%2'\n")
            .arg(fixture(QStringLiteral("silence.mp3")),
                 inLibrary(QString::fromLatin1(kId) + QStringLiteral(".mp3")));
    }

    // PNG bytes under a .jpg name, the way the tool mislabels thumbnails.
    QString produceThumbnail() const
    {
        return QStringLiteral("cp '%1' '%2'\n")
            .arg(fixture(QStringLiteral("thumb.png")),
                 inLibrary(QString::fromLatin1(kId) + QStringLiteral(".jpg")));
    }

    static bool runToCompletion(FetchTask& task, int timeoutMs = 10000)
    {
        QSignalSpy spy(&task, &FetchTask::finished);
        task.start();
        return spy.count() > 0 || spy.wait(timeoutMs);
    }

private slots:
    void init()
    {
        m_dir = new QTemporaryDir;
        QVERIFY(m_dir->isValid());
        QDir root(m_dir->path());
        QVERIFY(root.mkdir(QStringLiteral("library")));
        QVERIFY(root.mkdir(QStringLiteral("fixtures")));
        m_library = root.filePath(QStringLiteral("library"));
        m_fixtures = root.filePath(QStringLiteral("fixtures"));

        QVERIFY(TestFixtures::writeSilentMp3(fixture(QStringLiteral("silence.mp3"))));
        QVERIFY(TestFixtures::writePng(fixture(QStringLiteral("thumb.png"))));

        QFile json(fixture(QStringLiteral("info.json")));
        QVERIFY(json.open(QIODevice::WriteOnly));
        json.write(R"({"id": "dQw4w9WgXcQ", "title": "Never Gonna Give You Up",)"
                   R"( "uploader": "Rick Astley", "duration": 213})");
    }

    void cleanup()
    {
        delete m_dir;
        m_dir = nullptr;
    }

    // ── Line parsing ─────────────────────────────────────────────
    void parseProgressLine_data()
    {
        QTest::addColumn<QString>("line");
        QTest::addColumn<bool>("matches");
        QTest::addColumn<double>("percent");

        QTest::newRow("decimal") << "[download]  42.7% of 3.21MiB at 1.2MiB/s ETA 00:02" << true << 42.7;
        QTest::newRow("integer") << "[download] 100% of 3.21MiB" << true << 100.0;
        QTest::newRow("first wins") << "[download] 5.0% then 7.5%" << true << 5.0;
        QTest::newRow("no percent") << "[youtube] Extracting URL" << false << 0.0;
    }

    void parseProgressLine()
    {
        QFETCH(QString, line);
        QFETCH(bool, matches);
        QFETCH(double, percent);

        auto parsed = FetchTask::parseProgressLine(line);
        QCOMPARE(parsed.has_value(), matches);
        if (matches)
            QCOMPARE(*parsed, percent);
    }

    void parseMetadataLine()
    {
        QCOMPARE(FetchTask::parseMetadataLine(
                     QStringLiteral("[info] Writing video metadata as JSON to: abc.info.json")),
                 QStringLiteral("abc.info.json"));
        QVERIFY(FetchTask::parseMetadataLine(QStringLiteral("[download] 10.0%")).isEmpty());
    }

    void parseInfoJson_mapsFields()
    {
        LibraryError err;
        auto meta = FetchTask::parseInfoJson(
            R"({"id": "abc", "title": "Song", "channel": "Chan"})", &err);
        QVERIFY(meta.has_value());
        QVERIFY(!err.isError());
        QCOMPARE(meta->sourceId, QStringLiteral("abc"));
        QCOMPARE(meta->title, QStringLiteral("Song"));
        QCOMPARE(meta->artist, QStringLiteral("Chan"));
        QCOMPARE(meta->album, SongMetadata::kUnknownAlbum);
    }

    void parseInfoJson_rejectsGarbage()
    {
        LibraryError err;
        QVERIFY(!FetchTask::parseInfoJson("{not json", &err).has_value());
        QCOMPARE(err.code(), LibraryError::MalformedMetadata);

        err = LibraryError();
        QVERIFY(!FetchTask::parseInfoJson(R"({"title": "no id"})", &err).has_value());
        QCOMPARE(err.code(), LibraryError::MalformedMetadata);
    }

    void arguments_targetLibrary()
    {
        const QStringList args = FetchTask::arguments(QStringLiteral("abc"), m_library);
        QVERIFY(args.contains(QStringLiteral("--write-info-json")));
        QVERIFY(args.contains(QStringLiteral("--write-thumbnail")));
        QVERIFY(args.contains(inLibrary(QStringLiteral("abc.%(ext)s"))));
        QCOMPARE(args.last(), QStringLiteral("https://youtube.com/watch?v=abc"));
    }

    // ── Thumbnails ───────────────────────────────────────────────
    void findThumbnail_prefersWebp()
    {
        QVERIFY(TestFixtures::writePng(inLibrary(QStringLiteral("x.png"))));
        QVERIFY(TestFixtures::writePng(inLibrary(QStringLiteral("x.webp"))));
        QCOMPARE(ThumbnailConverter::findThumbnail(m_library, QStringLiteral("x")),
                 inLibrary(QStringLiteral("x.webp")));
        QVERIFY(ThumbnailConverter::findThumbnail(m_library, QStringLiteral("y")).isEmpty());
    }

    void toAlbumArt_rejectsUndecodable()
    {
        QFile f(inLibrary(QStringLiteral("bad.jpg")));
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("definitely not an image");
        f.close();

        LibraryError err;
        QVERIFY(!ThumbnailConverter::toAlbumArt(f.fileName(), &err).has_value());
        QCOMPARE(err.code(), LibraryError::ImageDecodeError);
    }

    // ── Full runs ────────────────────────────────────────────────
    void fetch_success()
    {
        FetchTask task(QString::fromLatin1(kId), m_library,
                       fakeTool(announceMetadata()
                                + QStringLiteral("echo '[download]  50.0% of 3MiB'\n")
                                + produceAudio() + produceThumbnail()));
        QSignalSpy metaSpy(&task, &FetchTask::metadataResolved);

        QVERIFY(runToCompletion(task));
        QVERIFY2(!task.error().isError(), qPrintable(task.error().toString()));
        QCOMPARE(metaSpy.count(), 1);
        QCOMPARE(task.progress()->percent(), 100.0);

        QVERIFY(task.song().has_value());
        QCOMPARE(task.song()->path(), task.audioPath());

        auto onDisk = TagWriter::readSongMetadata(task.audioPath());
        QVERIFY(onDisk.has_value());
        QCOMPARE(onDisk->sourceId, QString::fromLatin1(kId));
        QCOMPARE(onDisk->title, QStringLiteral("Never Gonna Give You Up"));
        QCOMPARE(onDisk->artist, QStringLiteral("Rick Astley"));
        QCOMPARE(onDisk->album, SongMetadata::kUnknownAlbum);
        QVERIFY(onDisk->downloadUnixTime > 0);
        QVERIFY(onDisk->albumArt.has_value());
        QCOMPARE(onDisk->albumArt->mimeType, QStringLiteral("image/jpeg"));
        QVERIFY(onDisk->albumArt->data.startsWith("\xFF\xD8"));

        // Side files are consumed.
        QVERIFY(!QFileInfo::exists(inLibrary(QString::fromLatin1(kId) + QStringLiteral(".jpg"))));
        QVERIFY(!QFileInfo::exists(inLibrary(QString::fromLatin1(kId) + QStringLiteral(".info.json"))));
    }

    void fetch_withoutMetadataUsesFallback()
    {
        FetchTask task(QString::fromLatin1(kId), m_library,
                       fakeTool(produceAudio() + produceThumbnail()));
        QVERIFY(runToCompletion(task));
        QVERIFY(!task.error().isError());

        auto onDisk = TagWriter::readSongMetadata(task.audioPath());
        QVERIFY(onDisk.has_value());
        QCOMPARE(onDisk->title, QString::fromLatin1(kId));
        QCOMPARE(onDisk->artist, SongMetadata::kUnknownArtist);
    }

    void fetch_missingThumbnailLeavesMp3Untagged()
    {
        FetchTask task(QString::fromLatin1(kId), m_library,
                       fakeTool(announceMetadata() + produceAudio()));
        QVERIFY(runToCompletion(task));
        QCOMPARE(task.error().code(), LibraryError::ThumbnailMissing);
        QVERIFY(!task.song().has_value());

        QVERIFY(QFileInfo::exists(task.audioPath()));
        LibraryError readError;
        QVERIFY(!TagWriter::readSongMetadata(task.audioPath(), &readError).has_value());
    }

    void fetch_missingAudio()
    {
        FetchTask task(QString::fromLatin1(kId), m_library,
                       fakeTool(announceMetadata() + produceThumbnail()));
        QVERIFY(runToCompletion(task));
        QCOMPARE(task.error().code(), LibraryError::DownloadMissing);
    }

    void fetch_nonZeroExitKeepsProgress()
    {
        FetchTask task(QString::fromLatin1(kId), m_library,
                       fakeTool(QStringLiteral("echo '[download]  50.0% of 3MiB'\n"
                                               "echo 'ERROR: network unreachable' >&2\n"
                                               "exit 1\n")));
        QVERIFY(runToCompletion(task));
        QCOMPARE(task.error().code(), LibraryError::ExternalToolFailure);
        QCOMPARE(task.error().exitCode(), 1);
        QVERIFY(task.error().toolOutput().contains("network unreachable"));
        QCOMPARE(task.progress()->percent(), 50.0);
        QVERIFY(!QFileInfo::exists(task.audioPath()));
    }

    void fetch_nonZeroExitWithUnwrittenMetadata()
    {
        // Announces the dump, never writes it, then fails.
        FetchTask task(QString::fromLatin1(kId), m_library,
                       fakeTool(QStringLiteral("echo '[info] Writing video metadata as JSON to: %1.info.json'\n"
                                               "echo 'ERROR: No space left on device' >&2\n"
                                               "exit 1\n").arg(QString::fromLatin1(kId)),
                                5000));
        QElapsedTimer clock; clock.start();
        QVERIFY(runToCompletion(task, 4000));
        QCOMPARE(task.error().code(), LibraryError::ExternalToolFailure);
        QCOMPARE(task.error().exitCode(), 1);
        QVERIFY(task.error().toolOutput().contains("No space left on device"));
        QVERIFY(clock.elapsed() < 4000);
    }

    void fetch_nonZeroExitStillAbsorbsWrittenMetadata()
    {
        FetchTask task(QString::fromLatin1(kId), m_library,
                       fakeTool(announceMetadata() + QStringLiteral("exit 2\n")));
        QVERIFY(runToCompletion(task));
        QCOMPARE(task.error().code(), LibraryError::ExternalToolFailure);
        QCOMPARE(task.error().exitCode(), 2);

        // Parsed metadata stays visible and the dump is consumed.
        QVERIFY(task.progress()->metadata().has_value());
        QCOMPARE(task.progress()->metadata()->title, QStringLiteral("Never Gonna Give You Up"));
        QVERIFY(!QFileInfo::exists(inLibrary(QString::fromLatin1(kId) + QStringLiteral(".info.json"))));
    }

    void fetch_unreadableMetadataIsStillRemoved()
    {
        const QString dump = inLibrary(QString::fromLatin1(kId) + QStringLiteral(".info.json"));
        FetchTask task(QString::fromLatin1(kId), m_library,
                       fakeTool(QStringLiteral("cp '%1' '%2'\nchmod 000 '%2'\n"
                                               "echo '[info] Writing video metadata as JSON to: %3.info.json'\n")
                                    .arg(fixture(QStringLiteral("info.json")), dump, QString::fromLatin1(kId))
                                + produceAudio() + produceThumbnail()));
        QVERIFY(runToCompletion(task));
        QVERIFY2(!task.error().isError(), qPrintable(task.error().toString()));
        QVERIFY(!QFileInfo::exists(dump));
    }

    void fetch_metadataTimeout()
    {
        FetchTask task(QString::fromLatin1(kId), m_library,
                       fakeTool(QStringLiteral("echo '[info] Writing video metadata as JSON to: %1.info.json'\n"
                                               "sleep 5\n").arg(QString::fromLatin1(kId)),
                                200));
        QElapsedTimer clock; clock.start();
        QVERIFY(runToCompletion(task, 4000));
        QCOMPARE(task.error().code(), LibraryError::MetadataTimeout);
        QVERIFY(clock.elapsed() < 4000);
    }

    void fetch_toolNotFound()
    {
        FetchTask::Options options;
        options.program = fixture(QStringLiteral("does-not-exist"));
        FetchTask task(QString::fromLatin1(kId), m_library, options);
        QVERIFY(runToCompletion(task));
        QCOMPARE(task.error().code(), LibraryError::ExternalToolFailure);
        QCOMPARE(task.error().exitCode(), -1);
    }

    void cancel_reportsFailure()
    {
        FetchTask task(QString::fromLatin1(kId), m_library,
                       fakeTool(QStringLiteral("sleep 5\n")));
        QSignalSpy spy(&task, &FetchTask::finished);
        task.start();
        task.cancel();
        QCOMPARE(spy.count(), 1);
        QCOMPARE(task.error().code(), LibraryError::ExternalToolFailure);
        QVERIFY(task.isFinished());
    }
};

QTEST_GUILESS_MAIN(tst_FetchTask)
#include "tst_FetchTask.moc"
