#include "SourceId.h"

#include <QRegularExpression>

QString SourceId::extract(const QString& input)
{
    static const QRegularExpression watchPattern(
        QStringLiteral(R"((?:^|[/.])youtube\.com/watch\?(?:[^#]*&)?v=([A-Za-z0-9_-]+))"),
        QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression shortPattern(
        QStringLiteral(R"((?:^|[/.])youtu\.be/([A-Za-z0-9_-]+))"),
        QRegularExpression::CaseInsensitiveOption);

    const QString trimmed = input.trimmed();

    QRegularExpressionMatch match = watchPattern.match(trimmed);
    if (match.hasMatch())
        return match.captured(1);

    match = shortPattern.match(trimmed);
    if (match.hasMatch())
        return match.captured(1);

    return trimmed;
}

QString SourceId::watchUrl(const QString& sourceId)
{
    return QStringLiteral("https://youtube.com/watch?v=") + sourceId;
}
