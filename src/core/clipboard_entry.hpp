#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cliped {

enum class ContentType {
    Text,
    Image,
    File,
};

[[nodiscard]] constexpr std::string_view content_type_to_string(ContentType type) {
    switch (type) {
        case ContentType::Text: return "text";
        case ContentType::Image: return "image";
        case ContentType::File: return "file";
    }
    return "text";
}

[[nodiscard]] std::optional<ContentType> content_type_from_string(std::string_view str);

/**
 * FileMetadata - Describes the bytes behind a file entry.
 *
 * local_path is where the bytes live on this device. It is never sent to
 * peers; a receiver fills it in after the transfer verifies.
 */
struct FileMetadata {
    std::string name;
    uint64_t size = 0;
    std::string hash;  // lowercase hex BLAKE2b-256
    std::string local_path;

    bool operator==(const FileMetadata&) const = default;
};

/**
 * ClipboardEntry - One immutable item of clipboard history.
 *
 * The id is derived from the content so that two devices recording the same
 * logical item agree on it, which is what makes remote appends idempotent.
 */
struct ClipboardEntry {
    std::string id;
    std::string content;
    ContentType content_type = ContentType::Text;
    Timestamp timestamp;
    Uuid origin_device;
    std::optional<FileMetadata> file;

    [[nodiscard]] bool is_file() const { return content_type == ContentType::File; }

    bool operator==(const ClipboardEntry&) const = default;
};

/**
 * Derive an entry id: hex BLAKE2b-128 over type, a NUL separator and the
 * payload. For file entries the payload is the content hash.
 */
[[nodiscard]] std::string derive_entry_id(ContentType type, std::string_view payload);

[[nodiscard]] ClipboardEntry create_text_entry(std::string text, Uuid origin,
                                               Timestamp at = Timestamp::now());

[[nodiscard]] ClipboardEntry create_image_entry(std::string encoded_image, Uuid origin,
                                                Timestamp at = Timestamp::now());

[[nodiscard]] ClipboardEntry create_file_entry(FileMetadata meta, Uuid origin,
                                               Timestamp at = Timestamp::now());

/**
 * Build an entry from its parts and check that the id matches the content.
 * Used for entries that arrive from peers.
 */
[[nodiscard]] Result<ClipboardEntry, Error> validate_entry(ClipboardEntry entry);

/**
 * Hash a file's bytes as hex BLAKE2b-256, streaming from disk.
 */
[[nodiscard]] Result<FileMetadata, Error> describe_file(const std::string& path);

} // namespace cliped
