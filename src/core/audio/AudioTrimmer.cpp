#include "AudioTrimmer.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QProcess>

AudioTrimmer::AudioTrimmer(const QString& program)
    : m_program(program)
{
}

QStringList AudioTrimmer::arguments(const QString& inputPath, const QString& outputPath,
                                    double startSeconds, double endSeconds)
{
    return {
        QStringLiteral("-ss"), QString::number(startSeconds, 'f', 3),
        QStringLiteral("-to"), QString::number(endSeconds, 'f', 3),
        QStringLiteral("-i"), inputPath,
        QStringLiteral("-y"),
        QStringLiteral("-acodec"), QStringLiteral("copy"),
        // The output may be a staging name without an .mp3 suffix.
        QStringLiteral("-f"), QStringLiteral("mp3"),
        outputPath
    };
}

LibraryError AudioTrimmer::trim(const QString& inputPath, const QString& outputPath,
                                double startSeconds, double endSeconds) const
{
    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);

    QElapsedTimer timer; timer.start();
    qDebug() << "[Trim] Starting" << m_program << "for" << inputPath
             << "range" << startSeconds << "-" << endSeconds;

    process.start(m_program, arguments(inputPath, outputPath, startSeconds, endSeconds));
    if (!process.waitForStarted()) {
        qWarning() << "[Trim] Could not start" << m_program << ":" << process.errorString();
        return LibraryError::toolFailure(m_program, -1, process.errorString().toUtf8());
    }

    process.waitForFinished(-1);
    const QByteArray output = process.readAll();

    if (process.exitStatus() != QProcess::NormalExit) {
        qWarning() << "[Trim]" << m_program << "crashed";
        return LibraryError::toolFailure(m_program, -1, output);
    }
    if (process.exitCode() != 0) {
        qWarning() << "[Trim]" << m_program << "exited with" << process.exitCode();
        return LibraryError::toolFailure(m_program, process.exitCode(), output);
    }

    qDebug() << "[Trim] Done in" << timer.elapsed() << "ms";
    return {};
}
