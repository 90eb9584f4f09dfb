#include "storage/clipboard_store.hpp"
#include "storage/migrations.hpp"
#include "core/logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>

namespace cliped::storage {

Result<std::unique_ptr<ClipboardStore>, Error> ClipboardStore::open(
    const std::string& db_path,
    const Uuid& local_device,
    int capacity,
    QObject* parent
) {
    using StoreResult = Result<std::unique_ptr<ClipboardStore>, Error>;

    if (capacity < 1) {
        return StoreResult::err(Error{ErrorCode::InvalidState, "history cap must be at least 1"});
    }

    if (!db_path.empty() && db_path != ":memory:") {
        const QString dir = QFileInfo(QString::fromStdString(db_path)).absolutePath();
        if (!QDir().mkpath(dir)) {
            return StoreResult::err(Error{ErrorCode::Io, "cannot create " + dir.toStdString()});
        }
    }

    auto db_result = Database::open(db_path);
    if (db_result.is_err()) {
        return StoreResult::err(db_result.unwrap_err());
    }
    auto db = std::move(db_result).unwrap();

    auto migrated = initialize_database(db);
    if (migrated.is_err()) {
        return StoreResult::err(migrated.unwrap_err());
    }

    std::unique_ptr<ClipboardStore> store(
        new ClipboardStore(std::move(db), local_device, capacity, parent));

    // A cap lowered between runs applies at startup.
    {
        QMutexLocker lock(&store->mutex_);
        auto evicted = store->evict_locked();
        if (evicted.is_err()) {
            return StoreResult::err(evicted.unwrap_err());
        }
        store->discard_received_files(evicted.unwrap());
    }

    qCInfo(clipedStoreLog) << "STORE: opened"
                           << (db_path.empty() ? QStringLiteral(":memory:")
                                               : QString::fromStdString(db_path))
                           << "cap=" << capacity;
    return StoreResult::ok(std::move(store));
}

ClipboardStore::ClipboardStore(Database db, const Uuid& local_device, int capacity, QObject* parent)
    : QObject(parent)
    , db_(std::move(db))
    , repo_(db_)
    , local_device_(local_device)
    , capacity_(capacity)
{
    qRegisterMetaType<cliped::ClipboardEntry>("cliped::ClipboardEntry");
}

ClipboardStore::~ClipboardStore() = default;

Result<void, Error> ClipboardStore::append(const ClipboardEntry& entry) {
    std::vector<ClipboardEntry> evicted;
    {
        QMutexLocker lock(&mutex_);
        auto inserted = db_.transaction([&]() -> Result<void, Error> {
            auto result = repo_.insert(entry);
            if (result.is_err()) return result;

            auto trimmed = evict_locked();
            if (trimmed.is_err()) {
                return Result<void, Error>::err(trimmed.unwrap_err());
            }
            evicted = std::move(trimmed).unwrap();
            return Result<void, Error>::ok();
        });
        if (inserted.is_err()) {
            if (!inserted.unwrap_err().is(ErrorCode::DuplicateEntry)) {
                qCWarning(clipedStoreLog) << "STORE: append failed:"
                                          << QString::fromStdString(inserted.unwrap_err().message);
            }
            return inserted;
        }
    }

    discard_received_files(evicted);
    emit entryAppended(entry);
    notify_evicted(evicted);
    return Result<void, Error>::ok();
}

Result<ClipboardEntry, Error> ClipboardStore::remove(const std::string& entry_id) {
    Result<ClipboardEntry, Error> removed = [&] {
        QMutexLocker lock(&mutex_);
        return repo_.remove(entry_id);
    }();
    if (removed.is_ok()) {
        emit entryRemoved(QString::fromStdString(entry_id));
    }
    return removed;
}

Result<std::vector<ClipboardEntry>, Error> ClipboardStore::clear() {
    auto removed = [&] {
        QMutexLocker lock(&mutex_);
        return repo_.remove_all();
    }();
    if (removed.is_ok()) {
        emit historyCleared(static_cast<int>(removed.unwrap().size()));
    }
    return removed;
}

Result<std::vector<ClipboardEntry>, Error> ClipboardStore::page(int offset, int limit) const {
    if (offset < 0 || limit <= 0) {
        return Result<std::vector<ClipboardEntry>, Error>::ok({});
    }
    QMutexLocker lock(&mutex_);
    return repo_.page(offset, limit);
}

Result<int, Error> ClipboardStore::count() const {
    QMutexLocker lock(&mutex_);
    return repo_.count();
}

Result<std::optional<ClipboardEntry>, Error> ClipboardStore::get(const std::string& entry_id) const {
    QMutexLocker lock(&mutex_);
    return repo_.get(entry_id);
}

bool ClipboardStore::contains(const std::string& entry_id) const {
    auto found = get(entry_id);
    return found.is_ok() && found.unwrap().has_value();
}

Result<void, Error> ClipboardStore::set_capacity(int capacity) {
    if (capacity < 1) {
        return Result<void, Error>::err(
            Error{ErrorCode::InvalidState, "history cap must be at least 1"});
    }

    std::vector<ClipboardEntry> evicted;
    {
        QMutexLocker lock(&mutex_);
        capacity_ = capacity;
        auto trimmed = evict_locked();
        if (trimmed.is_err()) {
            return Result<void, Error>::err(trimmed.unwrap_err());
        }
        evicted = std::move(trimmed).unwrap();
    }

    discard_received_files(evicted);
    notify_evicted(evicted);
    return Result<void, Error>::ok();
}

int ClipboardStore::capacity() const {
    QMutexLocker lock(&mutex_);
    return capacity_;
}

Result<std::vector<ClipboardEntry>, Error> ClipboardStore::evict_locked() {
    return repo_.evict_beyond(capacity_);
}

void ClipboardStore::discard_received_files(const std::vector<ClipboardEntry>& evicted) const {
    for (const auto& entry : evicted) {
        if (!entry.file || entry.origin_device == local_device_ || entry.file->local_path.empty()) {
            continue;
        }
        QFile file(QString::fromStdString(entry.file->local_path));
        if (file.exists() && !file.remove()) {
            qCWarning(clipedStoreLog) << "STORE: could not remove evicted file"
                                      << file.fileName() << file.errorString();
        }
    }
}

void ClipboardStore::notify_evicted(const std::vector<ClipboardEntry>& evicted) {
    if (evicted.empty()) return;

    QStringList ids;
    ids.reserve(static_cast<qsizetype>(evicted.size()));
    for (const auto& entry : evicted) {
        ids.push_back(QString::fromStdString(entry.id));
    }
    qCDebug(clipedStoreLog) << "STORE: evicted" << ids.size() << "entries";
    emit entriesEvicted(ids);
}

} // namespace cliped::storage
