#include "assetrelay/crypto/hash.hpp"
#include <sodium.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace assetrelay::crypto {

namespace {

void ensure_sodium() {
    static const int status = sodium_init();
    if (status < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }
}

}

struct ContentHasher::Impl {
    crypto_generichash_state state;
};

ContentHasher::ContentHasher()
    : impl_(std::make_unique<Impl>())
    , bytes_hashed_(0) {
    ensure_sodium();
    reset();
}

ContentHasher::~ContentHasher() = default;

ContentHasher::ContentHasher(ContentHasher&& other) noexcept = default;
ContentHasher& ContentHasher::operator=(ContentHasher&& other) noexcept = default;

void ContentHasher::update(std::span<const std::uint8_t> data) {
    if (data.empty()) {
        return;
    }
    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        throw std::runtime_error("Failed to update content hash");
    }
    bytes_hashed_ += data.size();
}

ContentHash ContentHasher::finalize() {
    ContentHash result;
    if (crypto_generichash_final(&impl_->state, result.data(), result.size()) != 0) {
        throw std::runtime_error("Failed to finalize content hash");
    }
    return result;
}

void ContentHasher::reset() {
    if (crypto_generichash_init(&impl_->state, nullptr, 0, CONTENT_HASH_SIZE) != 0) {
        throw std::runtime_error("Failed to initialize content hash");
    }
    bytes_hashed_ = 0;
}

ContentHash ContentHasher::hash(std::span<const std::uint8_t> data) {
    ensure_sodium();
    ContentHash result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0);
    return result;
}

namespace hash_utils {

std::string hash_to_hex(const ContentHash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::optional<ContentHash> hash_from_hex(const std::string& hex_string) {
    if (hex_string.length() != CONTENT_HASH_SIZE * 2) {
        return std::nullopt;
    }

    ContentHash hash;
    for (size_t i = 0; i < CONTENT_HASH_SIZE; ++i) {
        std::string byte_str = hex_string.substr(i * 2, 2);
        if (!std::isxdigit(static_cast<unsigned char>(byte_str[0])) ||
            !std::isxdigit(static_cast<unsigned char>(byte_str[1]))) {
            return std::nullopt;
        }
        hash[i] = static_cast<std::uint8_t>(std::stoul(byte_str, nullptr, 16));
    }

    return hash;
}

ContentHash hash_string(const std::string& str) {
    std::span<const std::uint8_t> data(reinterpret_cast<const std::uint8_t*>(str.data()), str.size());
    return ContentHasher::hash(data);
}

}

}
