#include "network/file_transfer.hpp"
#include "network/handshake.hpp"
#include "storage/clipboard_store.hpp"
#include "core/logging.hpp"

#include <QDir>
#include <QFileInfo>

#include <algorithm>
#include <vector>

namespace cliped::network {

namespace {

Error protocol_error(std::string msg) {
    return Error{ErrorCode::Protocol, std::move(msg)};
}

Error io_error(std::string msg) {
    return Error{ErrorCode::Io, std::move(msg)};
}

QString file_name_of(const ClipboardEntry& entry) {
    return entry.file ? QString::fromStdString(entry.file->name) : QString::fromStdString(entry.id);
}

} // namespace

std::string sanitize_file_name(const std::string& name) {
    QString cleaned = QString::fromStdString(name);
    cleaned.replace(QLatin1Char('\\'), QLatin1Char('/'));
    cleaned = QFileInfo(cleaned).fileName().trimmed();
    if (cleaned.isEmpty() || cleaned == QLatin1String(".") || cleaned == QLatin1String("..")) {
        return "file";
    }
    return cleaned.toStdString();
}

std::string unique_download_path(const std::string& dir, const std::string& name) {
    const QDir target(QString::fromStdString(dir));
    const QString file_name = QString::fromStdString(name);

    QString candidate = target.filePath(file_name);
    if (!QFileInfo::exists(candidate)) {
        return candidate.toStdString();
    }

    const QFileInfo info(file_name);
    const QString base = info.completeBaseName().isEmpty() ? file_name : info.completeBaseName();
    const QString suffix = info.completeBaseName().isEmpty() || info.suffix().isEmpty()
                               ? QString()
                               : QStringLiteral(".") + info.suffix();
    for (int n = 1;; ++n) {
        candidate = target.filePath(QStringLiteral("%1 (%2)%3").arg(base).arg(n).arg(suffix));
        if (!QFileInfo::exists(candidate)) {
            return candidate.toStdString();
        }
    }
}

// ============================================================================
// FileReceiver
// ============================================================================

FileReceiver::FileReceiver(const FileOffer& offer, uint32_t chunk_limit)
    : transfer_id_(offer.transfer_id)
    , entry_(offer.entry)
    , expected_size_(offer.payload_size())
    , expected_hash_(offer.payload_hash())
    , chunk_limit_(chunk_limit)
{
}

Result<std::unique_ptr<FileReceiver>, Error> FileReceiver::begin(
    const FileOffer& offer, const std::string& staging_dir, uint32_t max_chunk_size)
{
    using R = Result<std::unique_ptr<FileReceiver>, Error>;

    if (offer.entry.is_file() != offer.entry.file.has_value()) {
        return R::err(protocol_error("offer does not describe a file"));
    }
    if (offer.carries_content() && offer.content_hash.size() != crypto::CONTENT_HASH_SIZE * 2) {
        return R::err(protocol_error("offer carries no content digest"));
    }
    if (offer.chunk_size == 0 || offer.chunk_size > max_chunk_size) {
        return R::err(protocol_error("offered chunk size " + std::to_string(offer.chunk_size) +
                                     " exceeds limit of " + std::to_string(max_chunk_size)));
    }

    const QString dir = staging_dir.empty() ? QDir::tempPath() : QString::fromStdString(staging_dir);
    if (!QDir().mkpath(dir)) {
        return R::err(io_error("cannot create staging directory " + dir.toStdString()));
    }

    std::unique_ptr<FileReceiver> receiver(new FileReceiver(offer, offer.chunk_size));
    receiver->file_.setFileName(
        QDir(dir).filePath(QString::fromStdString(offer.transfer_id.to_string()) + QStringLiteral(".part")));
    if (!receiver->file_.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        receiver->done_ = true;
        return R::err(io_error("cannot open staging file: " + receiver->file_.errorString().toStdString()));
    }
    return R::ok(std::move(receiver));
}

FileReceiver::~FileReceiver() {
    discard();
}

Result<void, Error> FileReceiver::write_chunk(const FileChunk& chunk) {
    if (done_) {
        return Result<void, Error>::err(Error{ErrorCode::InvalidState, "transfer already finished"});
    }
    if (chunk.offset != received_) {
        return Result<void, Error>::err(protocol_error(
            "out of order chunk at " + std::to_string(chunk.offset) +
            ", expected " + std::to_string(received_)));
    }
    const auto size = static_cast<uint64_t>(chunk.data.size());
    if (size > chunk_limit_) {
        return Result<void, Error>::err(protocol_error("chunk of " + std::to_string(size) +
                                                       " bytes exceeds chunk size"));
    }
    if (received_ + size > expected_size_) {
        return Result<void, Error>::err(protocol_error("chunk runs past advertised size"));
    }

    if (file_.write(chunk.data) != chunk.data.size()) {
        return Result<void, Error>::err(io_error("staging write failed: " + file_.errorString().toStdString()));
    }
    hasher_.update(reinterpret_cast<const uint8_t*>(chunk.data.constData()), static_cast<size_t>(size));
    received_ += size;
    return Result<void, Error>::ok();
}

Result<ClipboardEntry, Error> FileReceiver::finish(const std::string& download_dir) {
    using R = Result<ClipboardEntry, Error>;

    if (done_) {
        return R::err(Error{ErrorCode::InvalidState, "transfer already finished"});
    }
    if (received_ != expected_size_) {
        return R::err(protocol_error("transfer ended after " + std::to_string(received_) +
                                     " of " + std::to_string(expected_size_) + " bytes"));
    }
    const auto digest = hasher_.finish_hex();
    if (!crypto::digest_equals(digest, expected_hash_)) {
        return R::err(Error{ErrorCode::IntegrityError, "content hash mismatch for " +
                                                           (entry_.file ? entry_.file->name : entry_.id)});
    }

    if (!file_.flush()) {
        return R::err(io_error("staging flush failed: " + file_.errorString().toStdString()));
    }
    file_.close();

    if (!entry_.is_file()) {
        if (!file_.open(QIODevice::ReadOnly)) {
            return R::err(io_error("cannot reopen staging file: " + file_.errorString().toStdString()));
        }
        const QByteArray content = file_.readAll();
        file_.close();
        file_.remove();
        done_ = true;
        if (static_cast<uint64_t>(content.size()) != expected_size_) {
            return R::err(io_error("staging file changed under the transfer"));
        }
        entry_.content = content.toStdString();
        return validate_entry(entry_);
    }

    const QString dir = download_dir.empty() ? QDir::tempPath() : QString::fromStdString(download_dir);
    if (!QDir().mkpath(dir)) {
        return R::err(io_error("cannot create download directory " + dir.toStdString()));
    }
    const auto target = QString::fromStdString(
        unique_download_path(dir.toStdString(), sanitize_file_name(entry_.file->name)));

    // rename() fails across file systems; fall back to copying.
    if (!QFile::rename(file_.fileName(), target)) {
        if (!QFile::copy(file_.fileName(), target)) {
            return R::err(io_error("cannot move received file to " + target.toStdString()));
        }
        QFile::remove(file_.fileName());
    }

    done_ = true;
    entry_.file->local_path = QFileInfo(target).absoluteFilePath().toStdString();
    return R::ok(entry_);
}

void FileReceiver::discard() {
    if (done_) return;
    done_ = true;
    file_.close();
    if (!file_.fileName().isEmpty()) {
        file_.remove();
    }
}

// ============================================================================
// FileSender
// ============================================================================

FileSender::FileSender(Uuid transfer_id, Uuid peer, ClipboardEntry entry, uint32_t chunk_size)
    : transfer_id_(transfer_id)
    , peer_(peer)
    , entry_(std::move(entry))
    , chunk_size_(std::max<uint32_t>(chunk_size, 1))
{
}

Result<void, Error> FileSender::open() {
    if (!entry_.is_file()) {
        content_ = QByteArray::fromStdString(entry_.content);
        content_hash_ = crypto::to_hex(crypto::hash(entry_.content));
        return Result<void, Error>::ok();
    }
    if (!entry_.file || entry_.file->local_path.empty()) {
        return Result<void, Error>::err(io_error("file entry has no local path"));
    }
    file_.setFileName(QString::fromStdString(entry_.file->local_path));
    if (!file_.open(QIODevice::ReadOnly)) {
        return Result<void, Error>::err(io_error("cannot read " + entry_.file->local_path + ": " +
                                                 file_.errorString().toStdString()));
    }
    if (static_cast<uint64_t>(file_.size()) != entry_.file->size) {
        file_.close();
        return Result<void, Error>::err(io_error(entry_.file->local_path + " changed since it was copied"));
    }
    return Result<void, Error>::ok();
}

Result<std::optional<FileChunk>, Error> FileSender::next_chunk() {
    using R = Result<std::optional<FileChunk>, Error>;

    const uint64_t size = entry_.file ? entry_.file->size : static_cast<uint64_t>(content_.size());
    if (offset_ >= size) {
        return R::ok(std::nullopt);
    }

    const auto want = static_cast<qint64>(std::min<uint64_t>(chunk_size_, size - offset_));
    FileChunk chunk;
    chunk.transfer_id = transfer_id_;
    chunk.offset = offset_;
    if (entry_.file) {
        chunk.data = file_.read(want);
        if (chunk.data.size() != want) {
            return R::err(io_error("short read from " + entry_.file->local_path));
        }
    } else {
        chunk.data = content_.mid(static_cast<qsizetype>(offset_), want);
    }
    offset_ += static_cast<uint64_t>(want);
    return R::ok(std::move(chunk));
}

FileOffer FileSender::offer() const {
    FileOffer offer;
    offer.transfer_id = transfer_id_;
    offer.entry = entry_;
    offer.chunk_size = chunk_size_;
    if (offer.carries_content()) {
        offer.entry.content.clear();
        offer.content_size = static_cast<uint64_t>(content_.size());
        offer.content_hash = content_hash_;
    }
    return offer;
}

// ============================================================================
// FileTransferService
// ============================================================================

FileTransferService::FileTransferService(HandshakeService& handshake,
                                         storage::ClipboardStore& store,
                                         TransferOptions options,
                                         QObject* parent)
    : QObject(parent)
    , handshake_(handshake)
    , store_(store)
    , options_(std::move(options))
{
    connect(&handshake_, &HandshakeService::channelWritable,
            this, &FileTransferService::onChannelWritable);
    connect(&handshake_, &HandshakeService::channelClosed,
            this, &FileTransferService::onChannelClosed);
}

FileTransferService::~FileTransferService() = default;

bool FileTransferService::is_transfer_message(MessageType type) {
    switch (type) {
        case MessageType::FileOffer:
        case MessageType::FileChunk:
        case MessageType::FileComplete:
        case MessageType::FileAbort:
            return true;
        default:
            return false;
    }
}

Result<Uuid, Error> FileTransferService::send_entry(const Uuid& peer, const ClipboardEntry& entry) {
    using R = Result<Uuid, Error>;

    if (entry.is_file() && !entry.file) {
        return R::err(Error{ErrorCode::InvalidState, "file entry " + entry.id + " has no metadata"});
    }

    const auto transfer_id = Uuid::generate();
    auto sender = std::make_unique<FileSender>(transfer_id, peer, entry, options_.chunk_size);
    auto opened = sender->open();
    if (opened.is_err()) {
        qCWarning(clipedTransferLog) << "TRANSFER: cannot send" << file_name_of(entry)
                                     << QString::fromStdString(opened.unwrap_err().message);
        return R::err(opened.unwrap_err());
    }

    const auto offer = sender->offer();
    auto sent = handshake_.send_to(peer, MessageType::FileOffer, encode_file_offer(offer));
    if (sent.is_err()) {
        return R::err(sent.unwrap_err());
    }

    qCInfo(clipedTransferLog) << "TRANSFER: offering" << file_name_of(entry)
                              << "size=" << offer.payload_size() << "to" << qstr(peer)
                              << "transfer=" << qstr(transfer_id);
    outgoing_[transfer_id] = std::move(sender);
    pump(peer);
    return R::ok(transfer_id);
}

void FileTransferService::pump(const Uuid& peer) {
    std::vector<Uuid> ids;
    for (const auto& [id, sender] : outgoing_) {
        if (sender->peer() == peer) ids.push_back(id);
    }

    for (const auto& id : ids) {
        while (true) {
            if (handshake_.queued_bytes(peer) >= options_.pump_high_water) {
                return;
            }
            // A failed send may close the channel and clear outgoing_ under us.
            auto it = outgoing_.find(id);
            if (it == outgoing_.end()) {
                break;
            }
            auto& sender = *it->second;

            auto next = sender.next_chunk();
            if (next.is_err()) {
                failOutgoing(id, QString::fromStdString(next.unwrap_err().message), true);
                break;
            }
            if (!next.unwrap()) {
                const QString entry_id = QString::fromStdString(sender.entry().id);
                const uint64_t bytes = sender.sent();
                FileEnd end;
                end.transfer_id = id;
                auto done = handshake_.send_to(peer, MessageType::FileComplete, encode_file_end(end));
                outgoing_.erase(id);
                if (done.is_ok()) {
                    qCInfo(clipedTransferLog) << "TRANSFER: sent transfer=" << qstr(id)
                                              << "bytes=" << bytes;
                    emit transferSent(entry_id, peer);
                }
                break;
            }

            auto sent = handshake_.send_to(peer, MessageType::FileChunk, encode_file_chunk(*next.unwrap()));
            if (sent.is_err()) {
                failOutgoing(id, QString::fromStdString(sent.unwrap_err().message), false);
                return;
            }
        }
    }
}

void FileTransferService::handle_message(const Uuid& peer, MessageType type, const QByteArray& payload) {
    switch (type) {
        case MessageType::FileOffer: handleOffer(peer, payload); break;
        case MessageType::FileChunk: handleChunk(peer, payload); break;
        case MessageType::FileComplete: handleComplete(peer, payload); break;
        case MessageType::FileAbort: handleAbort(peer, payload); break;
        default: break;
    }
}

void FileTransferService::handleOffer(const Uuid& peer, const QByteArray& payload) {
    auto decoded = decode_file_offer(payload);
    if (decoded.is_err()) {
        qCWarning(clipedTransferLog) << "TRANSFER: malformed offer from" << qstr(peer)
                                     << QString::fromStdString(decoded.unwrap_err().message);
        return;
    }
    const auto offer = std::move(decoded).unwrap();

    const auto decline = [&](const QString& reason) {
        sendAbort(peer, offer.transfer_id, reason);
    };

    if (store_.contains(offer.entry.id)) {
        if (sync_debug_enabled()) {
            qCInfo(clipedTransferLog) << "TRANSFER: already have" << QString::fromStdString(offer.entry.id);
        }
        decline(QStringLiteral("duplicate"));
        return;
    }
    if (offer.carries_content() && offer.content_size > options_.max_content_bytes) {
        const auto reason = QStringLiteral("entry of %1 bytes exceeds limit of %2")
                                .arg(offer.content_size)
                                .arg(options_.max_content_bytes);
        qCWarning(clipedTransferLog) << "TRANSFER: refusing" << file_name_of(offer.entry) << reason;
        decline(reason);
        emit transferFailed(file_name_of(offer.entry), reason);
        return;
    }
    if (incoming_.count(offer.transfer_id) != 0) {
        qCWarning(clipedTransferLog) << "TRANSFER: repeated offer transfer=" << qstr(offer.transfer_id);
        return;
    }

    auto receiver = FileReceiver::begin(offer, options_.staging_dir, options_.max_chunk_size);
    if (receiver.is_err()) {
        const auto reason = QString::fromStdString(receiver.unwrap_err().message);
        qCWarning(clipedTransferLog) << "TRANSFER: refusing" << file_name_of(offer.entry) << reason;
        decline(reason);
        emit transferFailed(file_name_of(offer.entry), reason);
        return;
    }

    qCInfo(clipedTransferLog) << "TRANSFER: receiving" << file_name_of(offer.entry)
                              << "size=" << offer.payload_size() << "from" << qstr(peer);
    incoming_[offer.transfer_id] = Incoming{peer, std::move(receiver).unwrap()};
}

void FileTransferService::handleChunk(const Uuid& peer, const QByteArray& payload) {
    auto decoded = decode_file_chunk(payload);
    if (decoded.is_err()) {
        qCWarning(clipedTransferLog) << "TRANSFER: malformed chunk from" << qstr(peer);
        return;
    }
    const auto& chunk = decoded.unwrap();

    auto it = incoming_.find(chunk.transfer_id);
    if (it == incoming_.end() || it->second.peer != peer) {
        if (sync_debug_enabled()) {
            qCInfo(clipedTransferLog) << "TRANSFER: chunk for unknown transfer" << qstr(chunk.transfer_id);
        }
        return;
    }

    auto written = it->second.receiver->write_chunk(chunk);
    if (written.is_err()) {
        failIncoming(chunk.transfer_id, QString::fromStdString(written.unwrap_err().message), true);
    }
}

void FileTransferService::handleComplete(const Uuid& peer, const QByteArray& payload) {
    auto decoded = decode_file_end(payload);
    if (decoded.is_err()) {
        qCWarning(clipedTransferLog) << "TRANSFER: malformed completion from" << qstr(peer);
        return;
    }
    const auto transfer_id = decoded.unwrap().transfer_id;

    auto it = incoming_.find(transfer_id);
    if (it == incoming_.end() || it->second.peer != peer) {
        return;
    }

    auto finished = it->second.receiver->finish(options_.download_dir);
    if (finished.is_err()) {
        const auto& error = finished.unwrap_err();
        if (error.is(ErrorCode::IntegrityError)) {
            qCWarning(clipedTransferLog) << "TRANSFER: integrity check failed transfer=" << qstr(transfer_id);
        }
        failIncoming(transfer_id, QString::fromStdString(error.message), false);
        return;
    }
    incoming_.erase(it);

    const auto entry = std::move(finished).unwrap();
    auto appended = store_.append(entry);
    if (appended.is_err()) {
        if (entry.file) {
            QFile::remove(QString::fromStdString(entry.file->local_path));
        }
        if (appended.unwrap_err().is(ErrorCode::DuplicateEntry)) {
            return;
        }
        const auto reason = QString::fromStdString(appended.unwrap_err().message);
        qCWarning(clipedTransferLog) << "TRANSFER: cannot record" << file_name_of(entry) << reason;
        emit transferFailed(file_name_of(entry), reason);
        return;
    }

    qCInfo(clipedTransferLog) << "TRANSFER: received" << file_name_of(entry)
                              << "->" << (entry.file ? QString::fromStdString(entry.file->local_path)
                                                     : QStringLiteral("history"));
    emit transferCompleted(entry, peer);
}

void FileTransferService::handleAbort(const Uuid& peer, const QByteArray& payload) {
    auto decoded = decode_file_end(payload);
    if (decoded.is_err()) {
        qCWarning(clipedTransferLog) << "TRANSFER: malformed abort from" << qstr(peer);
        return;
    }
    const auto& end = decoded.unwrap();

    if (auto in = incoming_.find(end.transfer_id); in != incoming_.end() && in->second.peer == peer) {
        failIncoming(end.transfer_id, end.reason, false);
        return;
    }
    if (auto out = outgoing_.find(end.transfer_id); out != outgoing_.end() && out->second->peer() == peer) {
        if (end.reason == QLatin1String("duplicate")) {
            // The peer already holds this entry.
            outgoing_.erase(out);
            return;
        }
        failOutgoing(end.transfer_id, end.reason, false);
    }
}

void FileTransferService::failIncoming(const Uuid& transfer_id, const QString& reason, bool notify_peer) {
    auto it = incoming_.find(transfer_id);
    if (it == incoming_.end()) return;

    const auto peer = it->second.peer;
    const auto name = file_name_of(it->second.receiver->entry());
    // Destroying the receiver deletes the staged file.
    incoming_.erase(it);

    if (notify_peer) {
        sendAbort(peer, transfer_id, reason);
    }
    qCWarning(clipedTransferLog) << "TRANSFER: incoming" << name << "failed:" << reason;
    emit transferFailed(name, reason);
}

void FileTransferService::failOutgoing(const Uuid& transfer_id, const QString& reason, bool notify_peer) {
    auto it = outgoing_.find(transfer_id);
    if (it == outgoing_.end()) return;

    const auto peer = it->second->peer();
    const auto name = file_name_of(it->second->entry());
    outgoing_.erase(it);

    if (notify_peer) {
        sendAbort(peer, transfer_id, reason);
    }
    qCWarning(clipedTransferLog) << "TRANSFER: outgoing" << name << "failed:" << reason;
    emit transferFailed(name, reason);
}

void FileTransferService::sendAbort(const Uuid& peer, const Uuid& transfer_id, const QString& reason) {
    FileEnd end;
    end.transfer_id = transfer_id;
    end.reason = reason;
    auto sent = handshake_.send_to(peer, MessageType::FileAbort, encode_file_end(end));
    if (sent.is_err()) {
        qCWarning(clipedTransferLog) << "TRANSFER: abort not delivered transfer=" << qstr(transfer_id)
                                     << QString::fromStdString(sent.unwrap_err().message);
    }
}

void FileTransferService::onChannelWritable(const Uuid& peer) {
    pump(peer);
}

void FileTransferService::onChannelClosed(const Uuid& peer) {
    std::vector<Uuid> in_ids;
    for (const auto& [id, in] : incoming_) {
        if (in.peer == peer) in_ids.push_back(id);
    }
    std::vector<Uuid> out_ids;
    for (const auto& [id, sender] : outgoing_) {
        if (sender->peer() == peer) out_ids.push_back(id);
    }

    for (const auto& id : in_ids) failIncoming(id, QStringLiteral("channel closed"), false);
    for (const auto& id : out_ids) failOutgoing(id, QStringLiteral("channel closed"), false);
}

} // namespace cliped::network
