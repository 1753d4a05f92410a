#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace devscope::crypto {

// Incremental SHA-256 over OpenSSL EVP; digests are lowercase hex
class SHA256Hasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init();
    void update(std::string_view data);
    // Returns the digest and resets the hasher for reuse
    std::string finalize();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

std::string sha256Hex(std::string_view data);

} // namespace devscope::crypto
