// include/secret.h
#pragma once
#include <cstddef>
#include <string>
#include <vector>

// Shared TOTP key. The buffer is wiped on destruction and when moved from.
class Secret {
public:
    Secret() = default;
    explicit Secret(std::vector<unsigned char> bytes);
    Secret(const unsigned char* data, std::size_t len);

    static Secret from_string(const std::string& raw);

    Secret(const Secret& other);
    Secret& operator=(const Secret& other);
    Secret(Secret&& other) noexcept;
    Secret& operator=(Secret&& other) noexcept;
    ~Secret();

    const unsigned char* data() const noexcept { return bytes_.data(); }
    std::size_t size() const noexcept { return bytes_.size(); }
    bool empty() const noexcept { return bytes_.empty(); }
    const std::vector<unsigned char>& bytes() const noexcept { return bytes_; }

    void wipe() noexcept;

    bool operator==(const Secret& other) const;
    bool operator!=(const Secret& other) const { return !(*this == other); }

private:
    std::vector<unsigned char> bytes_;
};
