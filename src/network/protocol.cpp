#include "network/protocol.hpp"
#include "crypto/hash.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <optional>

namespace cliped::network {

namespace {

Error protocol_error(const std::string& what) {
    return Error{ErrorCode::Protocol, what};
}

std::optional<QJsonObject> parse_object(const QByteArray& payload) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(payload, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }
    return doc.object();
}

QByteArray to_bytes(const QJsonObject& obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

std::optional<Uuid> parse_uuid(const QJsonValue& value) {
    auto id = Uuid::parse(value.toString().toStdString());
    if (!id || id->is_nil()) return std::nullopt;
    return id;
}

QString uuid_string(const Uuid& id) {
    return QString::fromStdString(id.to_string());
}

QJsonObject entry_to_json(const cliped::ClipboardEntry& entry) {
    QJsonObject obj;
    obj["id"] = QString::fromStdString(entry.id);
    obj["content"] = QString::fromStdString(entry.content);
    obj["type"] = QString::fromLatin1(content_type_to_string(entry.content_type).data());
    obj["ts"] = static_cast<qint64>(entry.timestamp.millis());
    obj["origin"] = uuid_string(entry.origin_device);
    if (entry.file) {
        QJsonObject file;
        file["name"] = QString::fromStdString(entry.file->name);
        file["size"] = static_cast<qint64>(entry.file->size);
        file["hash"] = QString::fromStdString(entry.file->hash);
        obj["file"] = file;
    }
    return obj;
}

// Fields only; the id is not checked against the content.
Result<cliped::ClipboardEntry, Error> entry_fields_from_json(const QJsonObject& obj) {
    using R = Result<cliped::ClipboardEntry, Error>;

    auto type = content_type_from_string(obj["type"].toString().toStdString());
    if (!type) {
        return R::err(protocol_error("entry: unknown content type"));
    }
    auto origin = parse_uuid(obj["origin"]);
    if (!origin) {
        return R::err(protocol_error("entry: invalid origin device"));
    }
    if (!obj["id"].isString() || !obj["content"].isString()) {
        return R::err(protocol_error("entry: missing fields"));
    }

    cliped::ClipboardEntry entry;
    entry.id = obj["id"].toString().toStdString();
    entry.content = obj["content"].toString().toStdString();
    entry.content_type = *type;
    entry.timestamp = Timestamp(obj["ts"].toInteger());
    entry.origin_device = *origin;

    if (obj.contains("file")) {
        const auto file = obj["file"].toObject();
        const auto size = file["size"].toInteger(-1);
        const auto name = file["name"].toString();
        if (size < 0 || name.isEmpty() || !file["hash"].isString()) {
            return R::err(protocol_error("entry: invalid file metadata"));
        }
        FileMetadata meta;
        meta.name = name.toStdString();
        meta.size = static_cast<uint64_t>(size);
        meta.hash = file["hash"].toString().toStdString();
        entry.file = std::move(meta);
    }
    if (entry.is_file() != entry.file.has_value()) {
        return R::err(protocol_error("entry: file metadata does not match content type"));
    }
    return R::ok(std::move(entry));
}

Result<cliped::ClipboardEntry, Error> entry_from_json(const QJsonObject& obj) {
    return entry_fields_from_json(obj).and_then(
        [](cliped::ClipboardEntry entry) { return validate_entry(std::move(entry)); });
}

bool is_content_hash(const QString& hex) {
    if (hex.size() != static_cast<qsizetype>(crypto::CONTENT_HASH_SIZE * 2)) return false;
    for (const QChar c : hex) {
        const auto u = c.unicode();
        if (!((u >= '0' && u <= '9') || (u >= 'a' && u <= 'f'))) return false;
    }
    return true;
}

} // namespace

bool is_known_message_type(uint8_t raw) {
    switch (static_cast<MessageType>(raw)) {
        case MessageType::ConnectionRequest:
        case MessageType::ConnectionAccept:
        case MessageType::ConnectionDeny:
        case MessageType::ConnectionRemove:
        case MessageType::ClipboardEntry:
        case MessageType::FileOffer:
        case MessageType::FileChunk:
        case MessageType::FileComplete:
        case MessageType::FileAbort:
        case MessageType::Ping:
        case MessageType::Pong:
            return true;
    }
    return false;
}

const char* message_type_name(MessageType type) {
    switch (type) {
        case MessageType::ConnectionRequest: return "ConnectionRequest";
        case MessageType::ConnectionAccept: return "ConnectionAccept";
        case MessageType::ConnectionDeny: return "ConnectionDeny";
        case MessageType::ConnectionRemove: return "ConnectionRemove";
        case MessageType::ClipboardEntry: return "ClipboardEntry";
        case MessageType::FileOffer: return "FileOffer";
        case MessageType::FileChunk: return "FileChunk";
        case MessageType::FileComplete: return "FileComplete";
        case MessageType::FileAbort: return "FileAbort";
        case MessageType::Ping: return "Ping";
        case MessageType::Pong: return "Pong";
    }
    return "Unknown";
}

// ============================================================================
// Framing
// ============================================================================

QByteArray serializeHeader(const MessageHeader& header) {
    QByteArray data(static_cast<qsizetype>(MessageHeader::HEADER_SIZE), '\0');
    data[0] = static_cast<char>(MessageHeader::MAGIC[0]);
    data[1] = static_cast<char>(MessageHeader::MAGIC[1]);
    data[2] = static_cast<char>(MessageHeader::VERSION);
    data[3] = static_cast<char>(header.type);
    data[4] = static_cast<char>((header.length >> 24) & 0xFF);
    data[5] = static_cast<char>((header.length >> 16) & 0xFF);
    data[6] = static_cast<char>((header.length >> 8) & 0xFF);
    data[7] = static_cast<char>(header.length & 0xFF);
    return data;
}

Result<MessageHeader, Error> deserializeHeader(const QByteArray& data, uint32_t max_length) {
    using R = Result<MessageHeader, Error>;

    if (data.size() < static_cast<qsizetype>(MessageHeader::HEADER_SIZE)) {
        return R::err(protocol_error("Header too short"));
    }
    const auto byte = [&](int i) { return static_cast<uint8_t>(data[i]); };

    if (byte(0) != MessageHeader::MAGIC[0] || byte(1) != MessageHeader::MAGIC[1]) {
        return R::err(protocol_error("Invalid magic"));
    }
    if (byte(2) != MessageHeader::VERSION) {
        return R::err(protocol_error("Unsupported version"));
    }

    MessageHeader header;
    header.type = static_cast<MessageType>(byte(3));
    header.length = (static_cast<uint32_t>(byte(4)) << 24) |
                    (static_cast<uint32_t>(byte(5)) << 16) |
                    (static_cast<uint32_t>(byte(6)) << 8) |
                    static_cast<uint32_t>(byte(7));
    if (header.length > max_length) {
        return R::err(protocol_error("Frame of " + std::to_string(header.length) +
                                     " bytes exceeds limit of " + std::to_string(max_length)));
    }
    return R::ok(header);
}

QByteArray encode_frame(MessageType type, const QByteArray& payload) {
    MessageHeader header{type, static_cast<uint32_t>(payload.size())};
    QByteArray frame = serializeHeader(header);
    frame.append(payload);
    return frame;
}

// ============================================================================
// Payloads
// ============================================================================

QByteArray encode_peer_hello(const PeerHello& hello) {
    QJsonObject obj;
    obj["id"] = uuid_string(hello.device_id);
    obj["name"] = hello.name;
    obj["port"] = static_cast<int>(hello.port);
    return to_bytes(obj);
}

Result<PeerHello, Error> decode_peer_hello(const QByteArray& payload) {
    using R = Result<PeerHello, Error>;

    const auto obj = parse_object(payload);
    if (!obj) {
        return R::err(protocol_error("hello: invalid json"));
    }
    auto id = parse_uuid((*obj)["id"]);
    if (!id) {
        return R::err(protocol_error("hello: invalid device id"));
    }
    const int port = (*obj)["port"].toInt(-1);
    if (port < 0 || port > 65535) {
        return R::err(protocol_error("hello: invalid port"));
    }

    PeerHello hello;
    hello.device_id = *id;
    hello.name = (*obj)["name"].toString();
    hello.port = static_cast<uint16_t>(port);
    return R::ok(std::move(hello));
}

QByteArray encode_entry(const cliped::ClipboardEntry& entry) {
    return to_bytes(entry_to_json(entry));
}

Result<cliped::ClipboardEntry, Error> decode_entry(const QByteArray& payload) {
    const auto obj = parse_object(payload);
    if (!obj) {
        return Result<cliped::ClipboardEntry, Error>::err(protocol_error("entry: invalid json"));
    }
    return entry_from_json(*obj);
}

QByteArray encode_file_offer(const FileOffer& offer) {
    QJsonObject obj;
    obj["transfer"] = uuid_string(offer.transfer_id);
    obj["chunk"] = static_cast<qint64>(offer.chunk_size);
    if (offer.carries_content()) {
        auto stripped = offer.entry;
        stripped.content.clear();
        obj["entry"] = entry_to_json(stripped);
        obj["content_size"] = static_cast<qint64>(offer.content_size);
        obj["content_hash"] = QString::fromStdString(offer.content_hash);
    } else {
        obj["entry"] = entry_to_json(offer.entry);
    }
    return to_bytes(obj);
}

Result<FileOffer, Error> decode_file_offer(const QByteArray& payload) {
    using R = Result<FileOffer, Error>;

    const auto obj = parse_object(payload);
    if (!obj) {
        return R::err(protocol_error("offer: invalid json"));
    }
    auto transfer = parse_uuid((*obj)["transfer"]);
    if (!transfer) {
        return R::err(protocol_error("offer: invalid transfer id"));
    }
    const auto chunk = (*obj)["chunk"].toInteger(0);
    if (chunk <= 0 || chunk > static_cast<qint64>(UINT32_MAX)) {
        return R::err(protocol_error("offer: invalid chunk size"));
    }

    const auto entry_obj = (*obj)["entry"].toObject();
    FileOffer offer;
    offer.transfer_id = *transfer;
    offer.chunk_size = static_cast<uint32_t>(chunk);

    auto fields = entry_fields_from_json(entry_obj);
    if (fields.is_err()) {
        return R::err(fields.unwrap_err());
    }
    if (fields.unwrap().is_file()) {
        auto entry = entry_from_json(entry_obj);
        if (entry.is_err()) {
            return R::err(entry.unwrap_err());
        }
        offer.entry = std::move(entry).unwrap();
        return R::ok(std::move(offer));
    }

    // The id is checked once the content has arrived.
    const auto size = (*obj)["content_size"].toInteger(-1);
    const auto hash = (*obj)["content_hash"].toString();
    if (size < 0 || !is_content_hash(hash)) {
        return R::err(protocol_error("offer: entry is not a file and carries no content digest"));
    }
    if (!fields.unwrap().content.empty()) {
        return R::err(protocol_error("offer: content must travel in chunks"));
    }
    offer.entry = std::move(fields).unwrap();
    offer.content_size = static_cast<uint64_t>(size);
    offer.content_hash = hash.toStdString();
    return R::ok(std::move(offer));
}

QByteArray encode_file_chunk(const FileChunk& chunk) {
    QByteArray out;
    out.reserve(FileChunk::kPrefixSize + chunk.data.size());
    const auto& id = chunk.transfer_id.bytes();
    out.append(reinterpret_cast<const char*>(id.data()), static_cast<qsizetype>(id.size()));
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.append(static_cast<char>((chunk.offset >> shift) & 0xFF));
    }
    out.append(chunk.data);
    return out;
}

Result<FileChunk, Error> decode_file_chunk(const QByteArray& payload) {
    if (payload.size() < FileChunk::kPrefixSize) {
        return Result<FileChunk, Error>::err(protocol_error("chunk: payload too short"));
    }

    Uuid::Bytes id{};
    for (size_t i = 0; i < id.size(); ++i) {
        id[i] = static_cast<uint8_t>(payload[static_cast<qsizetype>(i)]);
    }

    FileChunk chunk;
    chunk.transfer_id = Uuid(id);
    for (int i = 16; i < FileChunk::kPrefixSize; ++i) {
        chunk.offset = (chunk.offset << 8) | static_cast<uint8_t>(payload[i]);
    }
    chunk.data = payload.mid(FileChunk::kPrefixSize);
    return Result<FileChunk, Error>::ok(std::move(chunk));
}

QByteArray encode_file_end(const FileEnd& end) {
    QJsonObject obj;
    obj["transfer"] = uuid_string(end.transfer_id);
    if (!end.reason.isEmpty()) {
        obj["reason"] = end.reason;
    }
    return to_bytes(obj);
}

Result<FileEnd, Error> decode_file_end(const QByteArray& payload) {
    const auto obj = parse_object(payload);
    if (!obj) {
        return Result<FileEnd, Error>::err(protocol_error("file end: invalid json"));
    }
    auto transfer = parse_uuid((*obj)["transfer"]);
    if (!transfer) {
        return Result<FileEnd, Error>::err(protocol_error("file end: invalid transfer id"));
    }
    FileEnd end;
    end.transfer_id = *transfer;
    end.reason = (*obj)["reason"].toString();
    return Result<FileEnd, Error>::ok(std::move(end));
}

} // namespace cliped::network
