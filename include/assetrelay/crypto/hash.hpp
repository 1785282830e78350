#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace assetrelay::crypto {

constexpr size_t CONTENT_HASH_SIZE = 32;

using ContentHash = std::array<std::uint8_t, CONTENT_HASH_SIZE>;

// Incremental BLAKE2b-256 (libsodium generichash) over part contents.
class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();

    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;

    ContentHasher(ContentHasher&& other) noexcept;
    ContentHasher& operator=(ContentHasher&& other) noexcept;

    void update(std::span<const std::uint8_t> data);

    // Consumes the running state; call reset() before reusing the hasher.
    ContentHash finalize();

    void reset();

    std::uint64_t bytes_hashed() const { return bytes_hashed_; }

    static ContentHash hash(std::span<const std::uint8_t> data);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::uint64_t bytes_hashed_;
};

namespace hash_utils {

std::string hash_to_hex(const ContentHash& hash);
std::optional<ContentHash> hash_from_hex(const std::string& hex_string);
ContentHash hash_string(const std::string& str);

}

} // namespace assetrelay::crypto
