#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QTextStream>
#include <QTimer>

#include "core/LibraryError.h"
#include "core/Settings.h"
#include "core/audio/AudioTrimmer.h"
#include "core/download/DownloadManager.h"
#include "core/download/FetchTask.h"
#include "core/library/Library.h"
#include "core/library/SongSort.h"

static QTextStream& out()
{
    static QTextStream s(stdout);
    return s;
}

static int report(const LibraryError& error)
{
    if (!error.isError())
        return 0;
    QTextStream(stderr) << "error: " << error.toString() << Qt::endl;
    if (!error.toolOutput().isEmpty())
        QTextStream(stderr) << QString::fromUtf8(error.toolOutput()) << Qt::endl;
    return 1;
}

static int listSongs(const Library& library, const Settings& settings)
{
    QVector<Song> songs = library.songs();
    SongSort::sort(songs, settings.sortBy(), settings.sortDirection());

    for (const Song& song : songs) {
        const SongMetadata& m = song.metadata();
        QStringList flags;
        if (m.isCropped) flags << QStringLiteral("cropped");
        if (m.isMetadataEdited) flags << QStringLiteral("edited");
        if (song.isHidden()) flags << QStringLiteral("hidden");

        out() << m.sourceId << "  " << m.title << " - " << m.artist << " [" << m.album << "]";
        if (!flags.isEmpty())
            out() << "  (" << flags.join(QStringLiteral(", ")) << ")";
        out() << Qt::endl;
    }
    out() << songs.size() << " song(s) in " << library.path() << Qt::endl;
    return 0;
}

static int runDownloads(QCoreApplication& app, Library& library, Settings& settings,
                        const QStringList& inputs)
{
    DownloadManager manager(&library, &settings);

    QObject::connect(&manager, &DownloadManager::downloadFinished, &app,
                     [&](const QString& sourceId, const LibraryError& error) {
        if (error.isError())
            QTextStream(stderr) << sourceId << ": " << error.toString() << Qt::endl;
        else
            out() << sourceId << ": done" << Qt::endl;
        if (!manager.hasActiveDownloads())
            app.quit();
    });

    // Progress is polled the same way a UI would.
    QTimer ticker;
    QObject::connect(&ticker, &QTimer::timeout, &app, [&]() {
        for (const auto& dl : manager.activeDownloads()) {
            auto meta = dl.progress->metadata();
            out() << dl.sourceId << ": "
                  << QString::number(dl.progress->percent(), 'f', 1) << "% "
                  << (meta ? meta->title : QStringLiteral("looking up video info..."))
                  << Qt::endl;
        }
    });
    ticker.start(500);

    for (const QString& input : inputs)
        manager.startDownload(input);

    if (!manager.hasActiveDownloads())
        return manager.failedDownloads().isEmpty() ? 0 : 1;

    app.exec();
    return manager.failedDownloads().isEmpty() ? 0 : 1;
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("CrossPlay"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Manage a local library of downloaded songs."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
        QStringLiteral("list | download | crop | edit | restore | delete | hide | unhide"));

    QCommandLineOption settingsOpt(QStringLiteral("settings"),
        QStringLiteral("Settings file to use."), QStringLiteral("file"));
    QCommandLineOption libraryOpt(QStringLiteral("library"),
        QStringLiteral("Library directory to use (saved to the settings file)."), QStringLiteral("dir"));
    QCommandLineOption titleOpt(QStringLiteral("title"), QStringLiteral("New title."), QStringLiteral("title"));
    QCommandLineOption artistOpt(QStringLiteral("artist"), QStringLiteral("New artist."), QStringLiteral("artist"));
    QCommandLineOption albumOpt(QStringLiteral("album"), QStringLiteral("New album."), QStringLiteral("album"));
    parser.addOptions({ settingsOpt, libraryOpt, titleOpt, artistOpt, albumOpt });
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        parser.showHelp(1);

    Settings settings(parser.isSet(settingsOpt) ? parser.value(settingsOpt)
                                                : Settings::defaultSettingsPath());
    if (parser.isSet(libraryOpt))
        settings.setLibraryPath(parser.value(libraryOpt));

    if (int rc = report(settings.ensureLibraryDirectory()))
        return rc;

    Library library(settings.libraryPath());
    if (int rc = report(library.scan()))
        return rc;

    const QString command = args.first();
    const QStringList rest = args.mid(1);

    if (command == QLatin1String("list"))
        return listSongs(library, settings);

    if (command == QLatin1String("download")) {
        if (rest.isEmpty())
            parser.showHelp(1);
        return runDownloads(app, library, settings, rest);
    }

    // Remaining commands act on one song, addressed by its source id.
    if (rest.isEmpty())
        parser.showHelp(1);

    std::optional<Song> found = library.songBySourceId(rest.first());
    if (!found) {
        QTextStream(stderr) << "error: no song with id " << rest.first() << Qt::endl;
        return 1;
    }
    Song song = *found;

    if (command == QLatin1String("crop")) {
        if (rest.size() < 3)
            parser.showHelp(1);
        bool okStart = false, okEnd = false;
        double start = rest.at(1).toDouble(&okStart);
        double end = rest.at(2).toDouble(&okEnd);
        if (!okStart || !okEnd) {
            QTextStream(stderr) << "error: crop offsets must be seconds" << Qt::endl;
            return 1;
        }
        return report(song.crop(start, end, AudioTrimmer(settings.trimToolProgram())));
    }

    if (command == QLatin1String("edit")) {
        const SongMetadata& m = song.metadata();
        return report(song.editMetadata(
            parser.isSet(titleOpt) ? parser.value(titleOpt) : m.title,
            parser.isSet(artistOpt) ? parser.value(artistOpt) : m.artist,
            parser.isSet(albumOpt) ? parser.value(albumOpt) : m.album));
    }

    if (command == QLatin1String("restore"))
        return report(song.restoreOriginalCopy());
    if (command == QLatin1String("delete"))
        return report(song.remove());
    if (command == QLatin1String("hide"))
        return report(song.hide());
    if (command == QLatin1String("unhide"))
        return report(song.unhide());

    QTextStream(stderr) << "error: unknown command " << command << Qt::endl;
    return 1;
}
