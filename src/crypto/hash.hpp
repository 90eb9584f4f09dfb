#pragma once

#include "core/result.hpp"

#include <sodium.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cliped::crypto {

// BLAKE2b output sizes used by the core.
constexpr size_t ENTRY_ID_HASH_SIZE = 16;
constexpr size_t CONTENT_HASH_SIZE = 32;

/**
 * Initialize libsodium. Safe to call more than once.
 */
[[nodiscard]] inline Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{"Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

/**
 * One-shot BLAKE2b.
 */
[[nodiscard]] inline std::vector<uint8_t> hash(const uint8_t* data, size_t len,
                                               size_t hash_size = CONTENT_HASH_SIZE) {
    std::vector<uint8_t> out(hash_size);
    crypto_generichash(out.data(), out.size(), data, len, nullptr, 0);
    return out;
}

[[nodiscard]] inline std::vector<uint8_t> hash(std::string_view data,
                                               size_t hash_size = CONTENT_HASH_SIZE) {
    return hash(reinterpret_cast<const uint8_t*>(data.data()), data.size(), hash_size);
}

/**
 * Lowercase hex encoding.
 */
[[nodiscard]] inline std::string to_hex(const std::vector<uint8_t>& bytes) {
    std::string out(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), bytes.data(), bytes.size());
    out.pop_back();
    return out;
}

/**
 * Constant-time comparison of two hex digests.
 */
[[nodiscard]] inline bool digest_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

/**
 * Hasher - Incremental BLAKE2b-256, used to verify streamed file payloads.
 */
class Hasher {
public:
    Hasher() { reset(); }

    void reset() {
        crypto_generichash_init(&state_, nullptr, 0, CONTENT_HASH_SIZE);
        bytes_ = 0;
    }

    void update(const uint8_t* data, size_t len) {
        crypto_generichash_update(&state_, data, len);
        bytes_ += len;
    }

    /**
     * Finish and return the hex digest. The hasher must be reset before reuse.
     */
    [[nodiscard]] std::string finish_hex() {
        std::vector<uint8_t> out(CONTENT_HASH_SIZE);
        crypto_generichash_final(&state_, out.data(), out.size());
        return to_hex(out);
    }

    [[nodiscard]] uint64_t bytes_hashed() const { return bytes_; }

private:
    crypto_generichash_state state_{};
    uint64_t bytes_ = 0;
};

} // namespace cliped::crypto
