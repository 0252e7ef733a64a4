#pragma once

#include "keel/utility.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace keel {

/** @brief A 160-bit SHA-1 digest. */
class Sha1HashCode {
public:
    static constexpr size_t size = 20;

    Sha1HashCode() = default;
    explicit Sha1HashCode(const std::array<std::uint8_t, size> &bytes) : bytes_(bytes) {
    }

    /** @brief Parses 40 hex digits; anything else is a Parse error. */
    static Result<Sha1HashCode> from_hex(std::string_view hex);

    std::string to_hex() const;
    const std::array<std::uint8_t, size> &bytes() const {
        return bytes_;
    }

    bool operator==(const Sha1HashCode &) const = default;
    std::strong_ordering operator<=>(const Sha1HashCode &) const = default;

private:
    std::array<std::uint8_t, size> bytes_{};
};

/**
 * @brief Incremental SHA-1 over OpenSSL's EVP interface.
 *
 * `digest()` finalizes a copy of the running state, so it can be called any
 * number of times and more data can still be fed afterwards.
 */
class Sha1Hasher {
public:
    Sha1Hasher();
    ~Sha1Hasher();

    Sha1Hasher(const Sha1Hasher &) = delete;
    Sha1Hasher &operator=(const Sha1Hasher &) = delete;

    void update(std::string_view data);
    void update(const void *data, size_t len);
    Sha1HashCode digest() const;

private:
    EVP_MD_CTX *ctx_;
};

Sha1HashCode sha1_of(std::string_view data);

/** @brief Hashes the content of a file, IO error if it can't be read. */
Result<Sha1HashCode> hash_file(const std::filesystem::path &path);

/**
 * @brief Per-run memo of file content hashes.
 *
 * A file referenced by many rules is read once per engine run. Entries are
 * kept sorted by path; lookups take a shared lock and only a miss upgrades
 * to the exclusive one.
 */
class FileHashCache {
public:
    Result<Sha1HashCode> get_or_hash(const std::filesystem::path &p);
    size_t size() const;

private:
    struct Entry {
        std::filesystem::path path;
        Result<Sha1HashCode> hash;

        bool operator<(const std::filesystem::path &other_path) const;
    };

    std::vector<Entry> cache;
    mutable std::shared_mutex cache_mtx;
};

} // namespace keel
