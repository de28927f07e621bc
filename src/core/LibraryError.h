#pragma once

#include <QByteArray>
#include <QMetaType>
#include <QString>

// Error value shared by the tag, library and download code.
// A default-constructed LibraryError means success.
class LibraryError {
public:
    enum Code {
        NoError,
        IoError,
        TagError,
        MissingRequiredField,
        InvalidArgument,
        ExternalToolFailure,
        DownloadMissing,
        ThumbnailMissing,
        ImageDecodeError,
        MalformedMetadata,
        MetadataTimeout
    };

    LibraryError() = default;
    LibraryError(Code code, const QString& message, const QString& path = {});

    static LibraryError toolFailure(const QString& tool, int exitCode,
                                    const QByteArray& output);

    Code code() const { return m_code; }
    bool isError() const { return m_code != NoError; }
    QString message() const { return m_message; }
    QString path() const { return m_path; }

    // Only set for ExternalToolFailure. -1 means the tool could not start
    // or crashed.
    int exitCode() const { return m_exitCode; }
    QByteArray toolOutput() const { return m_toolOutput; }

    QString toString() const;
    static QString codeName(Code code);

private:
    Code m_code = NoError;
    QString m_message;
    QString m_path;
    int m_exitCode = 0;
    QByteArray m_toolOutput;
};

Q_DECLARE_METATYPE(LibraryError)
