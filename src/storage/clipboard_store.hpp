#pragma once

#include "core/clipboard_entry.hpp"
#include "core/result.hpp"
#include "storage/clipboard_repository.hpp"
#include "storage/database.hpp"

#include <QMetaType>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QStringList>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cliped::storage {

/**
 * ClipboardStore - Persistent, capped, deduplicated clipboard history.
 *
 * Every operation takes the store mutex, so the dedup check and the insert
 * are one step and a page read sees a single snapshot. Safe to call from
 * any thread; signals are emitted after the lock is released.
 */
class ClipboardStore : public QObject {
    Q_OBJECT

public:
    static constexpr int kDefaultCapacity = 100;

    /**
     * Open (or create) the history database and apply migrations.
     * `local_device` decides which file entries own staged bytes: entries
     * from other devices have their downloaded files removed on eviction.
     */
    [[nodiscard]] static Result<std::unique_ptr<ClipboardStore>, Error> open(
        const std::string& db_path,
        const Uuid& local_device,
        int capacity = kDefaultCapacity,
        QObject* parent = nullptr);

    ~ClipboardStore() override;

    /**
     * Insert at the head, then evict down to capacity.
     * DuplicateEntry when the id is already resident.
     */
    [[nodiscard]] Result<void, Error> append(const ClipboardEntry& entry);

    [[nodiscard]] Result<ClipboardEntry, Error> remove(const std::string& entry_id);

    /**
     * Remove everything. Returns the removed entries, most recent first.
     */
    [[nodiscard]] Result<std::vector<ClipboardEntry>, Error> clear();

    [[nodiscard]] Result<std::vector<ClipboardEntry>, Error> page(int offset, int limit) const;
    [[nodiscard]] Result<int, Error> count() const;
    [[nodiscard]] Result<std::optional<ClipboardEntry>, Error> get(const std::string& entry_id) const;
    [[nodiscard]] bool contains(const std::string& entry_id) const;

    /**
     * Change the cap and truncate immediately. Must be at least 1.
     */
    [[nodiscard]] Result<void, Error> set_capacity(int capacity);
    [[nodiscard]] int capacity() const;

signals:
    void entryAppended(const cliped::ClipboardEntry& entry);
    void entryRemoved(const QString& entryId);
    void historyCleared(int removedCount);
    void entriesEvicted(const QStringList& entryIds);

private:
    ClipboardStore(Database db, const Uuid& local_device, int capacity, QObject* parent);

    // Caller holds mutex_.
    [[nodiscard]] Result<std::vector<ClipboardEntry>, Error> evict_locked();
    void discard_received_files(const std::vector<ClipboardEntry>& evicted) const;
    void notify_evicted(const std::vector<ClipboardEntry>& evicted);

    mutable QMutex mutex_;
    Database db_;
    mutable ClipboardRepository repo_;
    Uuid local_device_;
    int capacity_;
};

} // namespace cliped::storage

Q_DECLARE_METATYPE(cliped::ClipboardEntry)
