#include "keel/hash.hpp"

#include "mmap.hpp"

#include <algorithm>
#include <mutex>
#include <openssl/evp.h>
#include <stdexcept>

namespace keel {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

Result<Sha1HashCode> Sha1HashCode::from_hex(std::string_view hex) {
    if (hex.size() != size * 2) {
        return fail(ErrorKind::Parse, "Expected 40 hex digits, got: " + std::string(hex));
    }
    std::array<std::uint8_t, size> bytes{};
    for (size_t i = 0; i < size; ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return fail(ErrorKind::Parse, "Invalid hex digit in: " + std::string(hex));
        }
        bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return Sha1HashCode(bytes);
}

std::string Sha1HashCode::to_hex() const {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::uint8_t b : bytes_) {
        out += digits[b >> 4];
        out += digits[b & 0xf];
    }
    return out;
}

Sha1Hasher::Sha1Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha1(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("Failed to initialize SHA-1 context");
    }
}

Sha1Hasher::~Sha1Hasher() {
    EVP_MD_CTX_free(ctx_);
}

void Sha1Hasher::update(std::string_view data) {
    update(data.data(), data.size());
}

void Sha1Hasher::update(const void *data, size_t len) {
    if (len == 0)
        return;
    if (EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("SHA-1 update failed");
    }
}

Sha1HashCode Sha1Hasher::digest() const {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> copy(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!copy || EVP_MD_CTX_copy_ex(copy.get(), ctx_) != 1) {
        throw std::runtime_error("Failed to copy SHA-1 context");
    }

    std::array<std::uint8_t, Sha1HashCode::size> bytes{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(copy.get(), bytes.data(), &len) != 1 || len != Sha1HashCode::size) {
        throw std::runtime_error("SHA-1 finalization failed");
    }
    return Sha1HashCode(bytes);
}

Sha1HashCode sha1_of(std::string_view data) {
    Sha1Hasher hasher;
    hasher.update(data);
    return hasher.digest();
}

Result<Sha1HashCode> hash_file(const std::filesystem::path &path) {
    auto file = MappedFile::open(path);
    if (!file)
        return std::unexpected(file.error());
    return sha1_of((*file)->content());
}

bool FileHashCache::Entry::operator<(const std::filesystem::path &other_path) const {
    return path < other_path;
}

Result<Sha1HashCode> FileHashCache::get_or_hash(const std::filesystem::path &p) {
    {
        std::shared_lock read_lock(cache_mtx);

        auto it = std::lower_bound(cache.begin(), cache.end(), p);
        if (it != cache.end() && it->path == p) {
            return it->hash;
        }
    }

    // Hash outside the lock; two racing workers may both read the file, the
    // first insert wins.
    auto hash = hash_file(p);

    std::lock_guard write_lock(cache_mtx);
    auto it = std::lower_bound(cache.begin(), cache.end(), p);
    if (it != cache.end() && it->path == p) {
        return it->hash;
    }
    cache.insert(it, {p, hash});
    return hash;
}

size_t FileHashCache::size() const {
    std::shared_lock read_lock(cache_mtx);
    return cache.size();
}

} // namespace keel
