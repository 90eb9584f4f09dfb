#pragma once

#include "core/clipboard_entry.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <QByteArray>
#include <QString>

#include <cstdint>
#include <string>

namespace cliped::network {

/**
 * Message types for the sync protocol.
 */
enum class MessageType : uint8_t {
    // Handshake
    ConnectionRequest = 0x10,
    ConnectionAccept = 0x11,
    ConnectionDeny = 0x12,
    ConnectionRemove = 0x13,

    // History
    ClipboardEntry = 0x20,

    // Files
    FileOffer = 0x30,
    FileChunk = 0x31,
    FileComplete = 0x32,
    FileAbort = 0x33,

    // Control
    Ping = 0x40,
    Pong = 0x41,
};

[[nodiscard]] bool is_known_message_type(uint8_t raw);
[[nodiscard]] const char* message_type_name(MessageType type);

/**
 * Frame header.
 *
 * Format:
 * - Magic (2 bytes): 0x43 0x50 ("CP")
 * - Version (1 byte)
 * - Type (1 byte)
 * - Length (4 bytes, big-endian)
 * - Payload (variable)
 */
struct MessageHeader {
    static constexpr uint8_t MAGIC[2] = {0x43, 0x50};
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 8;

    MessageType type;
    uint32_t length;
};

QByteArray serializeHeader(const MessageHeader& header);

/**
 * Parse a header. Bad magic, an unknown version or a length above
 * `max_length` is a Protocol error; the type byte is not checked here.
 */
Result<MessageHeader, Error> deserializeHeader(const QByteArray& data, uint32_t max_length);

QByteArray encode_frame(MessageType type, const QByteArray& payload);

// ============================================================================
// Payloads
// ============================================================================

/**
 * PeerHello - Identity carried by ConnectionRequest and ConnectionAccept.
 */
struct PeerHello {
    Uuid device_id;
    QString name;
    uint16_t port = 0;
};

QByteArray encode_peer_hello(const PeerHello& hello);
Result<PeerHello, Error> decode_peer_hello(const QByteArray& payload);

/**
 * Entry JSON. The local file path never leaves the device; decoding
 * checks that the id matches the content.
 */
QByteArray encode_entry(const cliped::ClipboardEntry& entry);
Result<cliped::ClipboardEntry, Error> decode_entry(const QByteArray& payload);

/**
 * FileOffer - Opens a chunked transfer.
 *
 * For a file entry the chunks carry the file and the metadata gives size
 * and hash. Any other entry too large for one frame travels with its
 * content stripped; the chunks carry the content, described by
 * content_size and content_hash.
 */
struct FileOffer {
    Uuid transfer_id;
    cliped::ClipboardEntry entry;
    uint32_t chunk_size = 0;
    uint64_t content_size = 0;
    std::string content_hash;  // lowercase hex BLAKE2b-256

    [[nodiscard]] bool carries_content() const { return !entry.is_file(); }
    [[nodiscard]] uint64_t payload_size() const {
        return entry.file ? entry.file->size : content_size;
    }
    [[nodiscard]] const std::string& payload_hash() const {
        return entry.file ? entry.file->hash : content_hash;
    }
};

QByteArray encode_file_offer(const FileOffer& offer);
Result<FileOffer, Error> decode_file_offer(const QByteArray& payload);

/**
 * Binary chunk: 16-byte transfer id, 8-byte big-endian offset, data.
 */
struct FileChunk {
    static constexpr int kPrefixSize = 16 + 8;

    Uuid transfer_id;
    uint64_t offset = 0;
    QByteArray data;
};

QByteArray encode_file_chunk(const FileChunk& chunk);
Result<FileChunk, Error> decode_file_chunk(const QByteArray& payload);

/**
 * FileComplete and FileAbort share this payload; reason is empty on complete.
 */
struct FileEnd {
    Uuid transfer_id;
    QString reason;
};

QByteArray encode_file_end(const FileEnd& end);
Result<FileEnd, Error> decode_file_end(const QByteArray& payload);

} // namespace cliped::network
