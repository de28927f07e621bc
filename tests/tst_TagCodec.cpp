#include <QtTest/QtTest>
#include <QTemporaryDir>

#include <taglib/commentsframe.h>
#include <taglib/id3v2tag.h>

#include "TestFixtures.h"
#include "tags/TagCodec.h"
#include "tags/TagWriter.h"

class tst_TagCodec : public QObject {
    Q_OBJECT

private slots:
    // ── Source id ────────────────────────────────────────────────
    void sourceId_roundTrip()
    {
        TagLib::ID3v2::Tag tag;
        TagCodec::writeSourceId(&tag, QStringLiteral("abc123"));

        auto id = TagCodec::readSourceId(&tag);
        QVERIFY(id.has_value());
        QCOMPARE(*id, QStringLiteral("abc123"));
    }

    void sourceId_missingIsError()
    {
        TagLib::ID3v2::Tag tag;
        LibraryError error;
        auto id = TagCodec::readSourceId(&tag, &error);
        QVERIFY(!id.has_value());
        QCOMPARE(error.code(), LibraryError::MissingRequiredField);
    }

    void sourceId_rewriteKeepsSingleEntry()
    {
        TagLib::ID3v2::Tag tag;
        TagCodec::writeSourceId(&tag, QStringLiteral("first"));
        TagCodec::writeSourceId(&tag, QStringLiteral("second"));

        QCOMPARE(TagCodec::entryCount(&tag, TagCodec::Field::SourceId), 1);
        QCOMPARE(*TagCodec::readSourceId(&tag), QStringLiteral("second"));
    }

    void sourceId_ignoresOtherComments()
    {
        TagLib::ID3v2::Tag tag;
        auto* other = new TagLib::ID3v2::CommentsFrame(TagLib::String::UTF8);
        other->setDescription("something else");
        other->setText("not an id");
        tag.addFrame(other);

        QVERIFY(!TagCodec::readSourceId(&tag).has_value());

        TagCodec::writeSourceId(&tag, QStringLiteral("xyz"));
        QCOMPARE(*TagCodec::readSourceId(&tag), QStringLiteral("xyz"));
        QCOMPARE(tag.frameList("COMM").size(), 2u);
    }

    // ── Flags ────────────────────────────────────────────────────
    void flag_missingReadsFalse()
    {
        TagLib::ID3v2::Tag tag;
        QCOMPARE(TagCodec::readFlag(&tag, TagCodec::Field::Cropped), false);
        QCOMPARE(TagCodec::readFlag(&tag, TagCodec::Field::MetadataEdited), false);
    }

    void flag_trueIsPresenceWithEmptyText()
    {
        TagLib::ID3v2::Tag tag;
        TagCodec::writeFlag(&tag, TagCodec::Field::Cropped, true);

        QVERIFY(TagCodec::readFlag(&tag, TagCodec::Field::Cropped));
        QCOMPARE(TagCodec::entryCount(&tag, TagCodec::Field::Cropped), 1);

        auto* comment = dynamic_cast<TagLib::ID3v2::CommentsFrame*>(tag.frameList("COMM").front());
        QVERIFY(comment);
        QVERIFY(comment->text().isEmpty());
    }

    void flag_falseDeletesEntry()
    {
        TagLib::ID3v2::Tag tag;
        TagCodec::writeFlag(&tag, TagCodec::Field::MetadataEdited, true);
        TagCodec::writeFlag(&tag, TagCodec::Field::MetadataEdited, false);

        QCOMPARE(TagCodec::entryCount(&tag, TagCodec::Field::MetadataEdited), 0);
        QCOMPARE(TagCodec::readFlag(&tag, TagCodec::Field::MetadataEdited), false);
    }

    void flag_anyTextMeansTrue()
    {
        TagLib::ID3v2::Tag tag;
        auto* comment = new TagLib::ID3v2::CommentsFrame(TagLib::String::UTF8);
        comment->setDescription(TagLib::String(TagCodec::key(TagCodec::Field::Cropped).toStdString()));
        comment->setText("whatever");
        tag.addFrame(comment);

        QVERIFY(TagCodec::readFlag(&tag, TagCodec::Field::Cropped));
    }

    // ── Download time ────────────────────────────────────────────
    void downloadTime_roundTrip()
    {
        TagLib::ID3v2::Tag tag;
        TagCodec::writeDownloadTime(&tag, 1650000000);
        QCOMPARE(TagCodec::readDownloadTime(&tag), qint64(1650000000));
    }

    void downloadTime_zeroIsAbsent()
    {
        TagLib::ID3v2::Tag tag;
        TagCodec::writeDownloadTime(&tag, 42);
        TagCodec::writeDownloadTime(&tag, 0);
        QCOMPARE(TagCodec::entryCount(&tag, TagCodec::Field::DownloadTime), 0);
        QCOMPARE(TagCodec::readDownloadTime(&tag), qint64(0));
    }

    void keys_areDistinctAndNamespaced()
    {
        const QList<TagCodec::Field> fields = {
            TagCodec::Field::SourceId, TagCodec::Field::Cropped,
            TagCodec::Field::MetadataEdited, TagCodec::Field::DownloadTime
        };
        QSet<QString> keys;
        for (auto field : fields) {
            QVERIFY(TagCodec::key(field).startsWith(QStringLiteral("[CrossPlay] ")));
            keys.insert(TagCodec::key(field));
        }
        QCOMPARE(keys.size(), fields.size());
    }

    // ── Whole metadata through a file ────────────────────────────
    void songMetadata_fileRoundTrip()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("song.mp3"));
        QVERIFY(TestFixtures::writeSilentMp3(path));

        SongMetadata meta = TestFixtures::sampleMetadata();
        meta.isCropped = true;
        meta.isMetadataEdited = true;
        meta.albumArt = AlbumArt{ QByteArray("\xFF\xD8\xFF\xE0 fake jpeg", 14), QStringLiteral("image/jpeg") };
        QVERIFY(!TagWriter::writeSongMetadata(path, meta).isError());

        auto read = TagWriter::readSongMetadata(path);
        QVERIFY(read.has_value());
        QVERIFY(*read == meta);

        // Writing what was read changes nothing.
        QVERIFY(!TagWriter::writeSongMetadata(path, *read).isError());
        QVERIFY(*TagWriter::readSongMetadata(path) == meta);
    }

    void songMetadata_falseAndZeroMatchUnset()
    {
        QTemporaryDir dir;
        const QString path = dir.filePath(QStringLiteral("song.mp3"));
        QVERIFY(TestFixtures::writeSilentMp3(path));

        SongMetadata meta = TestFixtures::sampleMetadata();
        meta.isCropped = false;
        meta.isMetadataEdited = false;
        meta.downloadUnixTime = 0;
        QVERIFY(!TagWriter::writeSongMetadata(path, meta).isError());

        auto read = TagWriter::readSongMetadata(path);
        QVERIFY(read.has_value());
        QCOMPARE(read->isCropped, false);
        QCOMPARE(read->isMetadataEdited, false);
        QCOMPARE(read->downloadUnixTime, qint64(0));
        QVERIFY(!read->albumArt.has_value());
    }

    void songMetadata_missingTextFieldsUseDefaults()
    {
        QTemporaryDir dir;
        const QString path = dir.filePath(QStringLiteral("song.mp3"));
        QVERIFY(TestFixtures::writeSilentMp3(path));

        SongMetadata meta;
        meta.sourceId = QStringLiteral("only-id");
        QVERIFY(!TagWriter::writeSongMetadata(path, meta).isError());

        auto read = TagWriter::readSongMetadata(path);
        QVERIFY(read.has_value());
        QCOMPARE(read->title, SongMetadata::kUnknownTitle);
        QCOMPARE(read->artist, SongMetadata::kUnknownArtist);
        QCOMPARE(read->album, SongMetadata::kUnknownAlbum);
    }

    void songMetadata_untaggedFileIsTagError()
    {
        QTemporaryDir dir;
        const QString path = dir.filePath(QStringLiteral("plain.mp3"));
        QVERIFY(TestFixtures::writeSilentMp3(path));

        LibraryError error;
        QVERIFY(!TagWriter::readSongMetadata(path, &error).has_value());
        QCOMPARE(error.code(), LibraryError::TagError);
    }
};

QTEST_GUILESS_MAIN(tst_TagCodec)
#include "tst_TagCodec.moc"
