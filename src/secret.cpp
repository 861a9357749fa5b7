#include "secret.h"

#include <openssl/crypto.h>

#include <utility>

Secret::Secret(std::vector<unsigned char> bytes)
    : bytes_(std::move(bytes)) {}

Secret::Secret(const unsigned char* data, std::size_t len)
    : bytes_(data, data + len) {}

Secret Secret::from_string(const std::string& raw) {
    return Secret(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
}

Secret::Secret(const Secret& other)
    : bytes_(other.bytes_) {}

Secret& Secret::operator=(const Secret& other) {
    if (this == &other) return *this;
    wipe();
    bytes_ = other.bytes_;
    return *this;
}

Secret::Secret(Secret&& other) noexcept
    : bytes_(std::move(other.bytes_)) {
    other.wipe();
}

Secret& Secret::operator=(Secret&& other) noexcept {
    if (this == &other) return *this;
    wipe();
    bytes_ = std::move(other.bytes_);
    other.wipe();
    return *this;
}

Secret::~Secret() {
    wipe();
}

void Secret::wipe() noexcept {
    if (!bytes_.empty()) {
        OPENSSL_cleanse(bytes_.data(), bytes_.size());
    }
    bytes_.clear();
}

bool Secret::operator==(const Secret& other) const {
    if (bytes_.size() != other.bytes_.size()) return false;
    return CRYPTO_memcmp(bytes_.data(), other.bytes_.data(), bytes_.size()) == 0;
}
