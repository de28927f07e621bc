#pragma once

#include <QString>
#include <QStringList>

#include "../LibraryError.h"

// Runs the external trim tool (ffmpeg by default) to cut a time range out of
// an MP3 with stream copy. Only the exit status is inspected.
class AudioTrimmer {
public:
    explicit AudioTrimmer(const QString& program = QStringLiteral("ffmpeg"));

    QString program() const { return m_program; }

    LibraryError trim(const QString& inputPath, const QString& outputPath,
                      double startSeconds, double endSeconds) const;

    static QStringList arguments(const QString& inputPath, const QString& outputPath,
                                 double startSeconds, double endSeconds);

private:
    QString m_program;
};
