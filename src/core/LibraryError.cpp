#include "LibraryError.h"

LibraryError::LibraryError(Code code, const QString& message, const QString& path)
    : m_code(code)
    , m_message(message)
    , m_path(path)
{
}

LibraryError LibraryError::toolFailure(const QString& tool, int exitCode,
                                       const QByteArray& output)
{
    LibraryError err(ExternalToolFailure,
                     exitCode < 0
                         ? QStringLiteral("%1 failed to run").arg(tool)
                         : QStringLiteral("%1 exited with status %2").arg(tool).arg(exitCode));
    err.m_exitCode = exitCode;
    err.m_toolOutput = output;
    return err;
}

QString LibraryError::codeName(Code code)
{
    switch (code) {
    case NoError:              return QStringLiteral("NoError");
    case IoError:              return QStringLiteral("IoError");
    case TagError:             return QStringLiteral("TagError");
    case MissingRequiredField: return QStringLiteral("MissingRequiredField");
    case InvalidArgument:      return QStringLiteral("InvalidArgument");
    case ExternalToolFailure:  return QStringLiteral("ExternalToolFailure");
    case DownloadMissing:      return QStringLiteral("DownloadMissing");
    case ThumbnailMissing:     return QStringLiteral("ThumbnailMissing");
    case ImageDecodeError:     return QStringLiteral("ImageDecodeError");
    case MalformedMetadata:    return QStringLiteral("MalformedMetadata");
    case MetadataTimeout:      return QStringLiteral("MetadataTimeout");
    }
    return QStringLiteral("Unknown");
}

QString LibraryError::toString() const
{
    if (!isError())
        return QStringLiteral("no error");

    QString text = codeName(m_code) + QStringLiteral(": ") + m_message;
    if (!m_path.isEmpty())
        text += QStringLiteral(" (") + m_path + QStringLiteral(")");
    return text;
}
