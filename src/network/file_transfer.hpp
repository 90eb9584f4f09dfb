#pragma once

#include "core/clipboard_entry.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "crypto/hash.hpp"
#include "network/protocol.hpp"

#include <QFile>
#include <QObject>
#include <QString>

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace cliped::storage {
class ClipboardStore;
}

namespace cliped::network {

class HandshakeService;

struct TransferOptions {
    std::string staging_dir;
    std::string download_dir;
    uint32_t chunk_size = 64 * 1024;
    // Largest chunk accepted from a peer.
    uint32_t max_chunk_size = 1024 * 1024 - FileChunk::kPrefixSize;
    // Stop reading from disk while a peer's queue holds this much.
    uint64_t pump_high_water = 4ull * 1024 * 1024;
    // Largest entry content accepted in chunks (files are not limited).
    uint64_t max_content_bytes = 64ull * 1024 * 1024;
};

/**
 * Reduce a peer-supplied name to a bare file name ("file" when nothing
 * usable is left).
 */
[[nodiscard]] std::string sanitize_file_name(const std::string& name);

/**
 * First free path for `name` inside `dir`: "name.ext", then "name (1).ext",
 * "name (2).ext" and so on.
 */
[[nodiscard]] std::string unique_download_path(const std::string& dir, const std::string& name);

/**
 * FileReceiver - One incoming transfer staged on disk.
 *
 * Chunks must arrive in order and never run past the advertised size.
 * The staged file is deleted unless finish() succeeds. A file entry ends
 * up in the download directory; any other entry gets the staged bytes as
 * its content.
 */
class FileReceiver {
public:
    [[nodiscard]] static Result<std::unique_ptr<FileReceiver>, Error> begin(
        const FileOffer& offer, const std::string& staging_dir, uint32_t max_chunk_size);

    ~FileReceiver();

    FileReceiver(const FileReceiver&) = delete;
    FileReceiver& operator=(const FileReceiver&) = delete;

    [[nodiscard]] Result<void, Error> write_chunk(const FileChunk& chunk);

    /**
     * Verify size and hash, then move the file into `download_dir` (the
     * returned entry carries the final local path) or load the content
     * into the entry and check its id.
     */
    [[nodiscard]] Result<ClipboardEntry, Error> finish(const std::string& download_dir);

    void discard();

    [[nodiscard]] const Uuid& transfer_id() const { return transfer_id_; }
    [[nodiscard]] const ClipboardEntry& entry() const { return entry_; }
    [[nodiscard]] uint64_t received() const { return received_; }
    [[nodiscard]] QString staging_path() const { return file_.fileName(); }

private:
    FileReceiver(const FileOffer& offer, uint32_t chunk_limit);

    Uuid transfer_id_;
    ClipboardEntry entry_;
    uint64_t expected_size_ = 0;
    std::string expected_hash_;
    uint32_t chunk_limit_ = 0;
    uint64_t received_ = 0;
    QFile file_;
    crypto::Hasher hasher_;
    bool done_ = false;
};

/**
 * FileSender - One outgoing transfer, reading lazily from disk or from the
 * entry's own content.
 */
class FileSender {
public:
    FileSender(Uuid transfer_id, Uuid peer, ClipboardEntry entry, uint32_t chunk_size);

    /**
     * Open the local file and check it still has the advertised size. For
     * other entries, take the content and hash it.
     */
    [[nodiscard]] Result<void, Error> open();

    /**
     * Next chunk, or nullopt once every byte has been read.
     */
    [[nodiscard]] Result<std::optional<FileChunk>, Error> next_chunk();

    [[nodiscard]] FileOffer offer() const;
    [[nodiscard]] const Uuid& transfer_id() const { return transfer_id_; }
    [[nodiscard]] const Uuid& peer() const { return peer_; }
    [[nodiscard]] const ClipboardEntry& entry() const { return entry_; }
    [[nodiscard]] uint64_t sent() const { return offset_; }

private:
    Uuid transfer_id_;
    Uuid peer_;
    ClipboardEntry entry_;
    uint32_t chunk_size_;
    uint64_t offset_ = 0;
    QFile file_;
    QByteArray content_;
    std::string content_hash_;
};

/**
 * FileTransferService - Moves file entries, and entries too large for one
 * frame, between Connected peers.
 *
 * Outgoing chunks are produced only while the peer's queue sits below the
 * high-water mark and resume on channelWritable. Incoming transfers are
 * appended to the store only after the hash checks out. A closed channel
 * aborts every transfer on it.
 */
class FileTransferService : public QObject {
    Q_OBJECT

public:
    FileTransferService(HandshakeService& handshake,
                        storage::ClipboardStore& store,
                        TransferOptions options,
                        QObject* parent = nullptr);
    ~FileTransferService() override;

    /**
     * Offer `entry` to `peer` as a chunked transfer. Returns the transfer id.
     */
    [[nodiscard]] Result<Uuid, Error> send_entry(const Uuid& peer, const ClipboardEntry& entry);

    /**
     * Route a FileOffer/FileChunk/FileComplete/FileAbort frame.
     */
    void handle_message(const Uuid& peer, MessageType type, const QByteArray& payload);

    [[nodiscard]] static bool is_transfer_message(MessageType type);

    [[nodiscard]] size_t outgoing_count() const { return outgoing_.size(); }
    [[nodiscard]] size_t incoming_count() const { return incoming_.size(); }
    [[nodiscard]] const TransferOptions& options() const { return options_; }

signals:
    void transferCompleted(const cliped::ClipboardEntry& entry, const cliped::Uuid& from);
    void transferSent(const QString& entryId, const cliped::Uuid& to);
    void transferFailed(const QString& fileName, const QString& reason);

private slots:
    void onChannelWritable(const cliped::Uuid& peer);
    void onChannelClosed(const cliped::Uuid& peer);

private:
    struct Incoming {
        Uuid peer;
        std::unique_ptr<FileReceiver> receiver;
    };

    void pump(const Uuid& peer);
    void handleOffer(const Uuid& peer, const QByteArray& payload);
    void handleChunk(const Uuid& peer, const QByteArray& payload);
    void handleComplete(const Uuid& peer, const QByteArray& payload);
    void handleAbort(const Uuid& peer, const QByteArray& payload);

    void failIncoming(const Uuid& transfer_id, const QString& reason, bool notify_peer);
    void failOutgoing(const Uuid& transfer_id, const QString& reason, bool notify_peer);
    void sendAbort(const Uuid& peer, const Uuid& transfer_id, const QString& reason);

    HandshakeService& handshake_;
    storage::ClipboardStore& store_;
    TransferOptions options_;

    std::map<Uuid, std::unique_ptr<FileSender>> outgoing_;
    std::map<Uuid, Incoming> incoming_;
};

} // namespace cliped::network
