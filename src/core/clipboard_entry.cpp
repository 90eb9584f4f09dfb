#include "core/clipboard_entry.hpp"
#include "crypto/hash.hpp"

#include <QFile>
#include <QFileInfo>

namespace cliped {

std::optional<ContentType> content_type_from_string(std::string_view str) {
    if (str == "text") return ContentType::Text;
    if (str == "image") return ContentType::Image;
    if (str == "file") return ContentType::File;
    return std::nullopt;
}

std::string derive_entry_id(ContentType type, std::string_view payload) {
    std::string material(content_type_to_string(type));
    material.push_back('\0');
    material.append(payload);
    return crypto::to_hex(crypto::hash(material, crypto::ENTRY_ID_HASH_SIZE));
}

ClipboardEntry create_text_entry(std::string text, Uuid origin, Timestamp at) {
    ClipboardEntry entry;
    entry.id = derive_entry_id(ContentType::Text, text);
    entry.content = std::move(text);
    entry.content_type = ContentType::Text;
    entry.timestamp = at;
    entry.origin_device = origin;
    return entry;
}

ClipboardEntry create_image_entry(std::string encoded_image, Uuid origin, Timestamp at) {
    ClipboardEntry entry;
    entry.id = derive_entry_id(ContentType::Image, encoded_image);
    entry.content = std::move(encoded_image);
    entry.content_type = ContentType::Image;
    entry.timestamp = at;
    entry.origin_device = origin;
    return entry;
}

ClipboardEntry create_file_entry(FileMetadata meta, Uuid origin, Timestamp at) {
    ClipboardEntry entry;
    entry.id = derive_entry_id(ContentType::File, meta.hash);
    entry.content = "File: " + meta.name;
    entry.content_type = ContentType::File;
    entry.timestamp = at;
    entry.origin_device = origin;
    entry.file = std::move(meta);
    return entry;
}

Result<ClipboardEntry, Error> validate_entry(ClipboardEntry entry) {
    if (entry.is_file() != entry.file.has_value()) {
        return Result<ClipboardEntry, Error>::err(
            Error{ErrorCode::Protocol, "file metadata does not match content type"});
    }
    const std::string_view payload = entry.is_file()
        ? std::string_view(entry.file->hash)
        : std::string_view(entry.content);
    if (derive_entry_id(entry.content_type, payload) != entry.id) {
        return Result<ClipboardEntry, Error>::err(
            Error{ErrorCode::IntegrityError, "entry id does not match its content"});
    }
    return Result<ClipboardEntry, Error>::ok(std::move(entry));
}

Result<FileMetadata, Error> describe_file(const std::string& path) {
    const QString qpath = QString::fromStdString(path);
    const QFileInfo info(qpath);
    if (!info.isFile()) {
        return Result<FileMetadata, Error>::err(
            Error{ErrorCode::NotFound, "not a readable file: " + path});
    }

    QFile file(qpath);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<FileMetadata, Error>::err(
            Error{ErrorCode::Io, "cannot open " + path + ": " + file.errorString().toStdString()});
    }

    crypto::Hasher hasher;
    constexpr qint64 kReadSize = 64 * 1024;
    while (!file.atEnd()) {
        const QByteArray block = file.read(kReadSize);
        if (block.isEmpty()) {
            if (file.error() != QFileDevice::NoError) {
                return Result<FileMetadata, Error>::err(
                    Error{ErrorCode::Io, "read failed: " + path + ": " +
                                             file.errorString().toStdString()});
            }
            break;
        }
        hasher.update(reinterpret_cast<const uint8_t*>(block.constData()),
                      static_cast<size_t>(block.size()));
    }

    FileMetadata meta;
    meta.name = info.fileName().toStdString();
    meta.size = hasher.bytes_hashed();
    meta.hash = hasher.finish_hex();
    meta.local_path = info.absoluteFilePath().toStdString();
    return Result<FileMetadata, Error>::ok(std::move(meta));
}

} // namespace cliped
