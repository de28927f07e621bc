#include "TagCodec.h"

#include <QDebug>

#include <taglib/commentsframe.h>
#include <taglib/id3v2tag.h>

namespace {

std::optional<QString> encodeText(const QVariant& value)
{
    return value.toString();
}

QVariant decodeText(const QString& text)
{
    return text;
}

// Flags are encoded by presence alone; the frame text is left empty.
std::optional<QString> encodeFlag(const QVariant& value)
{
    if (value.toBool())
        return QString();
    return std::nullopt;
}

QVariant decodeFlag(const QString&)
{
    return true;
}

// 0 is the "never recorded" value, so it is stored as an absent frame.
std::optional<QString> encodeUnixTime(const QVariant& value)
{
    const qint64 unixTime = value.toLongLong();
    if (unixTime == 0)
        return std::nullopt;
    return QString::number(unixTime);
}

QVariant decodeUnixTime(const QString& text)
{
    bool ok = false;
    qint64 value = text.trimmed().toLongLong(&ok);
    if (!ok) {
        qWarning() << "[Tags] Unparseable download time" << text << "- using 0";
        return QVariant::fromValue<qint64>(0);
    }
    return QVariant::fromValue<qint64>(value);
}

const TagCodec::FieldDescriptor kFields[] = {
    { TagCodec::Field::SourceId,       "[CrossPlay] YouTube ID",
      encodeText,     decodeText,     QVariant() },
    { TagCodec::Field::Cropped,        "[CrossPlay] Cropped",
      encodeFlag,     decodeFlag,     QVariant(false) },
    { TagCodec::Field::MetadataEdited, "[CrossPlay] Metadata edited",
      encodeFlag,     decodeFlag,     QVariant(false) },
    { TagCodec::Field::DownloadTime,   "[CrossPlay] Download time",
      encodeUnixTime, decodeUnixTime, QVariant::fromValue<qint64>(0) },
};

TagLib::String toTagString(const QString& s)
{
    return TagLib::String(s.toStdString(), TagLib::String::UTF8);
}

QString fromTagString(const TagLib::String& s)
{
    return QString::fromStdString(s.to8Bit(true));
}

TagLib::ID3v2::CommentsFrame* findComment(const TagLib::ID3v2::Tag* tag, const QString& key)
{
    const TagLib::ID3v2::FrameList& frames = tag->frameList("COMM");
    for (auto* frame : frames) {
        auto* comment = dynamic_cast<TagLib::ID3v2::CommentsFrame*>(frame);
        if (comment && fromTagString(comment->description()) == key)
            return comment;
    }
    return nullptr;
}

} // namespace

const TagCodec::FieldDescriptor& TagCodec::descriptor(Field field)
{
    for (const auto& d : kFields) {
        if (d.field == field)
            return d;
    }
    // Every Field enumerator has a row above.
    Q_UNREACHABLE();
}

QString TagCodec::key(Field field)
{
    return QString::fromLatin1(descriptor(field).key);
}

// ═══════════════════════════════════════════════════════════════════════
//  write / read
// ═══════════════════════════════════════════════════════════════════════

void TagCodec::write(TagLib::ID3v2::Tag* tag, Field field, const QVariant& value)
{
    const FieldDescriptor& d = descriptor(field);
    const QString fieldKey = key(field);

    // Drop every existing entry for this key. The copy keeps the iteration
    // valid while frames are removed from the tag.
    const TagLib::ID3v2::FrameList frames = tag->frameList("COMM");
    for (auto* frame : frames) {
        auto* comment = dynamic_cast<TagLib::ID3v2::CommentsFrame*>(frame);
        if (comment && fromTagString(comment->description()) == fieldKey)
            tag->removeFrame(comment, true);
    }

    std::optional<QString> text = d.encode(value);
    if (!text)
        return;

    auto* comment = new TagLib::ID3v2::CommentsFrame(TagLib::String::UTF8);
    comment->setLanguage(TagLib::ByteVector("eng", 3));
    comment->setDescription(toTagString(fieldKey));
    comment->setText(toTagString(*text));
    tag->addFrame(comment);
}

std::optional<QVariant> TagCodec::read(const TagLib::ID3v2::Tag* tag, Field field,
                                       LibraryError* error)
{
    const FieldDescriptor& d = descriptor(field);

    if (auto* comment = findComment(tag, key(field)))
        return d.decode(fromTagString(comment->text()));

    if (d.missingValue.isValid())
        return d.missingValue;

    if (error) {
        *error = LibraryError(LibraryError::MissingRequiredField,
                              QStringLiteral("missing required metadata item: %1").arg(key(field)));
    }
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════
//  Typed accessors
// ═══════════════════════════════════════════════════════════════════════

void TagCodec::writeSourceId(TagLib::ID3v2::Tag* tag, const QString& sourceId)
{
    write(tag, Field::SourceId, sourceId);
}

std::optional<QString> TagCodec::readSourceId(const TagLib::ID3v2::Tag* tag, LibraryError* error)
{
    std::optional<QVariant> value = read(tag, Field::SourceId, error);
    if (!value)
        return std::nullopt;
    return value->toString();
}

void TagCodec::writeFlag(TagLib::ID3v2::Tag* tag, Field field, bool value)
{
    write(tag, field, value);
}

bool TagCodec::readFlag(const TagLib::ID3v2::Tag* tag, Field field)
{
    std::optional<QVariant> value = read(tag, field);
    return value && value->toBool();
}

void TagCodec::writeDownloadTime(TagLib::ID3v2::Tag* tag, qint64 unixTime)
{
    write(tag, Field::DownloadTime, QVariant::fromValue<qint64>(unixTime));
}

qint64 TagCodec::readDownloadTime(const TagLib::ID3v2::Tag* tag)
{
    std::optional<QVariant> value = read(tag, Field::DownloadTime);
    return value ? value->toLongLong() : 0;
}

int TagCodec::entryCount(const TagLib::ID3v2::Tag* tag, Field field)
{
    const QString fieldKey = key(field);
    int count = 0;
    const TagLib::ID3v2::FrameList& frames = tag->frameList("COMM");
    for (auto* frame : frames) {
        auto* comment = dynamic_cast<TagLib::ID3v2::CommentsFrame*>(frame);
        if (comment && fromTagString(comment->description()) == fieldKey)
            ++count;
    }
    return count;
}
