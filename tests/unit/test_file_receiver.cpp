#include <catch2/catch_test_macros.hpp>

#include "network/file_transfer.hpp"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

using namespace cliped;
using namespace cliped::network;

namespace {

constexpr uint32_t kMaxChunk = 1024;

FileOffer make_offer(const QByteArray& content, const std::string& name = "report.txt") {
    FileMetadata meta;
    meta.name = name;
    meta.size = static_cast<uint64_t>(content.size());
    meta.hash = crypto::to_hex(crypto::hash(std::string_view(content.constData(), content.size())));
    FileOffer offer;
    offer.transfer_id = Uuid::generate();
    offer.entry = create_file_entry(meta, Uuid::generate());
    offer.chunk_size = 4;
    return offer;
}

std::string digest_of(const QByteArray& content) {
    return crypto::to_hex(crypto::hash(std::string_view(content.constData(), content.size())));
}

FileOffer make_content_offer(const ClipboardEntry& entry) {
    const auto content = QByteArray::fromStdString(entry.content);
    FileOffer offer;
    offer.transfer_id = Uuid::generate();
    offer.entry = entry;
    offer.entry.content.clear();
    offer.chunk_size = 4;
    offer.content_size = static_cast<uint64_t>(content.size());
    offer.content_hash = digest_of(content);
    return offer;
}

FileChunk chunk_of(const FileOffer& offer, uint64_t offset, const QByteArray& data) {
    return FileChunk{offer.transfer_id, offset, data};
}

} // namespace

TEST_CASE("sanitize_file_name keeps only a bare name", "[transfer]") {
    REQUIRE(sanitize_file_name("photo.jpg") == "photo.jpg");
    REQUIRE(sanitize_file_name("../../etc/passwd") == "passwd");
    REQUIRE(sanitize_file_name("C:\\Users\\me\\doc.pdf") == "doc.pdf");
    REQUIRE(sanitize_file_name("..") == "file");
    REQUIRE(sanitize_file_name("dir/") == "file");
    REQUIRE(sanitize_file_name("") == "file");
}

TEST_CASE("unique_download_path never overwrites", "[transfer]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto root = dir.path().toStdString();

    const auto touch = [](const std::string& path) {
        QFile file(QString::fromStdString(path));
        REQUIRE(file.open(QIODevice::WriteOnly));
    };

    const auto first = unique_download_path(root, "notes.tar.gz");
    REQUIRE(QFileInfo(QString::fromStdString(first)).fileName() == QStringLiteral("notes.tar.gz"));
    touch(first);

    const auto second = unique_download_path(root, "notes.tar.gz");
    REQUIRE(QFileInfo(QString::fromStdString(second)).fileName() == QStringLiteral("notes.tar (1).gz"));
    touch(second);

    const auto third = unique_download_path(root, "notes.tar.gz");
    REQUIRE(QFileInfo(QString::fromStdString(third)).fileName() == QStringLiteral("notes.tar (2).gz"));

    touch(unique_download_path(root, "README"));
    REQUIRE(QFileInfo(QString::fromStdString(unique_download_path(root, "README"))).fileName() ==
            QStringLiteral("README (1)"));
}

TEST_CASE("FileReceiver: happy path", "[transfer]") {
    QTemporaryDir staging;
    QTemporaryDir downloads;
    REQUIRE(staging.isValid());
    REQUIRE(downloads.isValid());

    const QByteArray content("hello, file!");
    const auto offer = make_offer(content);

    auto begun = FileReceiver::begin(offer, staging.path().toStdString(), kMaxChunk);
    REQUIRE(begun.is_ok());
    auto receiver = std::move(begun).unwrap();
    const auto staged = receiver->staging_path();
    REQUIRE(QFile::exists(staged));

    for (qsizetype offset = 0; offset < content.size(); offset += 4) {
        REQUIRE(receiver->write_chunk(chunk_of(offer, offset, content.mid(offset, 4))).is_ok());
    }
    REQUIRE(receiver->received() == static_cast<uint64_t>(content.size()));

    auto finished = receiver->finish(downloads.path().toStdString());
    REQUIRE(finished.is_ok());
    const auto& entry = finished.unwrap();
    REQUIRE(entry.id == offer.entry.id);
    REQUIRE_FALSE(QFile::exists(staged));

    QFile saved(QString::fromStdString(entry.file->local_path));
    REQUIRE(saved.open(QIODevice::ReadOnly));
    REQUIRE(saved.readAll() == content);
    REQUIRE(QFileInfo(saved).fileName() == QStringLiteral("report.txt"));
}

TEST_CASE("FileReceiver: rejects bad streams", "[transfer]") {
    QTemporaryDir staging;
    QTemporaryDir downloads;
    REQUIRE(staging.isValid());
    REQUIRE(downloads.isValid());

    const QByteArray content("0123456789");
    auto offer = make_offer(content);
    auto receiver = FileReceiver::begin(offer, staging.path().toStdString(), kMaxChunk).unwrap();

    SECTION("Out of order chunk") {
        auto result = receiver->write_chunk(chunk_of(offer, 4, content.mid(4, 4)));
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().is(ErrorCode::Protocol));
        REQUIRE(receiver->received() == 0);
    }

    SECTION("Chunk larger than offered") {
        auto result = receiver->write_chunk(chunk_of(offer, 0, content.left(6)));
        REQUIRE(result.unwrap_err().is(ErrorCode::Protocol));
    }

    SECTION("Data past the advertised size") {
        REQUIRE(receiver->write_chunk(chunk_of(offer, 0, content.mid(0, 4))).is_ok());
        REQUIRE(receiver->write_chunk(chunk_of(offer, 4, content.mid(4, 4))).is_ok());
        auto result = receiver->write_chunk(chunk_of(offer, 8, QByteArray("89X")));
        REQUIRE(result.unwrap_err().is(ErrorCode::Protocol));
    }

    SECTION("Completion before every byte arrived") {
        REQUIRE(receiver->write_chunk(chunk_of(offer, 0, content.left(4))).is_ok());
        auto result = receiver->finish(downloads.path().toStdString());
        REQUIRE(result.unwrap_err().is(ErrorCode::Protocol));
    }

    SECTION("Hash mismatch keeps nothing") {
        const auto staged = receiver->staging_path();
        const QByteArray wrong("abcdefghij");
        for (qsizetype offset = 0; offset < wrong.size(); offset += 4) {
            REQUIRE(receiver->write_chunk(chunk_of(offer, offset, wrong.mid(offset, 4))).is_ok());
        }
        auto result = receiver->finish(downloads.path().toStdString());
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().is(ErrorCode::IntegrityError));
        REQUIRE(QDir(downloads.path()).isEmpty());

        receiver.reset();
        REQUIRE_FALSE(QFile::exists(staged));
    }
}

TEST_CASE("FileReceiver: offer checks", "[transfer]") {
    QTemporaryDir staging;
    REQUIRE(staging.isValid());

    SECTION("Chunk size above the local limit") {
        auto offer = make_offer("abc");
        offer.chunk_size = kMaxChunk + 1;
        auto result = FileReceiver::begin(offer, staging.path().toStdString(), kMaxChunk);
        REQUIRE(result.unwrap_err().is(ErrorCode::Protocol));
    }

    SECTION("Offer for a text entry") {
        FileOffer offer;
        offer.transfer_id = Uuid::generate();
        offer.entry = create_text_entry("text", Uuid::generate());
        offer.chunk_size = 4;
        REQUIRE(FileReceiver::begin(offer, staging.path().toStdString(), kMaxChunk).is_err());
    }

    SECTION("Discard removes the staging file") {
        auto receiver = FileReceiver::begin(make_offer("abc"), staging.path().toStdString(), kMaxChunk).unwrap();
        const auto staged = receiver->staging_path();
        receiver->discard();
        REQUIRE_FALSE(QFile::exists(staged));
    }
}

TEST_CASE("FileReceiver: entry content in chunks", "[transfer]") {
    QTemporaryDir staging;
    QTemporaryDir downloads;
    REQUIRE(staging.isValid());
    REQUIRE(downloads.isValid());

    const auto pasted = create_text_entry("a long clipboard text", Uuid::generate());
    const auto content = QByteArray::fromStdString(pasted.content);

    SECTION("The content lands in the entry, not on disk") {
        const auto offer = make_content_offer(pasted);
        auto receiver = FileReceiver::begin(offer, staging.path().toStdString(), kMaxChunk).unwrap();
        const auto staged = receiver->staging_path();
        for (qsizetype offset = 0; offset < content.size(); offset += 4) {
            REQUIRE(receiver->write_chunk(chunk_of(offer, offset, content.mid(offset, 4))).is_ok());
        }

        auto finished = receiver->finish(downloads.path().toStdString());
        REQUIRE(finished.is_ok());
        REQUIRE(finished.unwrap() == pasted);
        REQUIRE_FALSE(QFile::exists(staged));
        REQUIRE(QDir(downloads.path()).isEmpty());
    }

    SECTION("Content that does not match the entry id is refused") {
        const QByteArray other("not the advertised text");
        auto offer = make_content_offer(pasted);
        offer.content_size = static_cast<uint64_t>(other.size());
        offer.content_hash = digest_of(other);
        auto receiver = FileReceiver::begin(offer, staging.path().toStdString(), kMaxChunk).unwrap();
        const auto staged = receiver->staging_path();
        for (qsizetype offset = 0; offset < other.size(); offset += 4) {
            REQUIRE(receiver->write_chunk(chunk_of(offer, offset, other.mid(offset, 4))).is_ok());
        }

        auto finished = receiver->finish(downloads.path().toStdString());
        REQUIRE(finished.unwrap_err().is(ErrorCode::IntegrityError));
        REQUIRE_FALSE(QFile::exists(staged));
    }
}

TEST_CASE("FileSender slices entry content", "[transfer]") {
    const auto entry = create_text_entry("0123456789", Uuid::generate());
    FileSender sender(Uuid::generate(), Uuid::generate(), entry, 4);
    REQUIRE(sender.open().is_ok());

    const auto offer = sender.offer();
    REQUIRE(offer.carries_content());
    REQUIRE(offer.entry.content.empty());
    REQUIRE(offer.content_size == 10);
    REQUIRE(offer.content_hash == digest_of(QByteArray("0123456789")));

    QByteArray collected;
    while (true) {
        auto next = sender.next_chunk();
        REQUIRE(next.is_ok());
        if (!next.unwrap()) break;
        collected += next.unwrap()->data;
    }
    REQUIRE(collected == QByteArray("0123456789"));
    REQUIRE(sender.sent() == 10);
}

TEST_CASE("FileSender reads the file in chunks", "[transfer]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QByteArray content(10, 'z');
    const auto path = dir.filePath(QStringLiteral("src.bin"));
    {
        QFile file(path);
        REQUIRE(file.open(QIODevice::WriteOnly));
        file.write(content);
    }

    auto meta = describe_file(path.toStdString()).unwrap();
    const auto entry = create_file_entry(meta, Uuid::generate());

    SECTION("Chunks cover the file and then stop") {
        FileSender sender(Uuid::generate(), Uuid::generate(), entry, 4);
        REQUIRE(sender.open().is_ok());

        std::vector<qsizetype> sizes;
        while (true) {
            auto next = sender.next_chunk();
            REQUIRE(next.is_ok());
            if (!next.unwrap()) break;
            REQUIRE(next.unwrap()->offset == sender.sent() - static_cast<uint64_t>(next.unwrap()->data.size()));
            sizes.push_back(next.unwrap()->data.size());
        }
        REQUIRE(sizes == std::vector<qsizetype>{4, 4, 2});
        REQUIRE(sender.offer().entry.id == entry.id);
    }

    SECTION("A file that changed size is refused") {
        {
            QFile file(path);
            REQUIRE(file.open(QIODevice::Append));
            file.write("more");
        }
        FileSender sender(Uuid::generate(), Uuid::generate(), entry, 4);
        REQUIRE(sender.open().unwrap_err().is(ErrorCode::Io));
    }
}
