#pragma once

#include <QString>
#include <QVariant>
#include <optional>

#include "../LibraryError.h"

namespace TagLib { namespace ID3v2 { class Tag; } }

// Application state stored as ID3v2 comment frames. The frame description
// holds the field key and the frame text holds the encoded value.
//
// An absent frame means "unset": fields whose encoded form is empty (a
// false flag) are deleted instead of written, and reading an absent
// optional field yields its default. The source id has no default and
// reading it from a tag without the frame is a MissingRequiredField error.
class TagCodec {
public:
    enum class Field {
        SourceId,
        Cropped,
        MetadataEdited,
        DownloadTime
    };

    struct FieldDescriptor {
        Field field;
        const char* key;
        // std::nullopt means "delete the frame".
        std::optional<QString> (*encode)(const QVariant& value);
        QVariant (*decode)(const QString& text);
        // Invalid QVariant means the field is required.
        QVariant missingValue;
    };

    static const FieldDescriptor& descriptor(Field field);
    static QString key(Field field);

    static void write(TagLib::ID3v2::Tag* tag, Field field, const QVariant& value);
    static std::optional<QVariant> read(const TagLib::ID3v2::Tag* tag, Field field,
                                        LibraryError* error = nullptr);

    // Typed accessors over write()/read().
    static void writeSourceId(TagLib::ID3v2::Tag* tag, const QString& sourceId);
    static std::optional<QString> readSourceId(const TagLib::ID3v2::Tag* tag,
                                               LibraryError* error = nullptr);

    static void writeFlag(TagLib::ID3v2::Tag* tag, Field field, bool value);
    static bool readFlag(const TagLib::ID3v2::Tag* tag, Field field);

    static void writeDownloadTime(TagLib::ID3v2::Tag* tag, qint64 unixTime);
    static qint64 readDownloadTime(const TagLib::ID3v2::Tag* tag);

    // Number of comment frames carrying this field's key. Never more than
    // one after a write().
    static int entryCount(const TagLib::ID3v2::Tag* tag, Field field);
};
