#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Streaming checksums fed one chunk at a time.

// Additive 16-bit sum of every byte.
class Sum16 {
public:
    void update(const char* data, std::size_t len);
    std::uint32_t value() const { return sum_; }
    std::uint64_t size() const { return size_; }
private:
    std::uint32_t sum_ = 0;
    std::uint64_t size_ = 0;
};

// POSIX cksum: CRC-32 (poly 0x04C11DB7, MSB first) over the data followed by
// its length in as few bytes as needed, complemented.
class Crc32 {
public:
    void update(const char* data, std::size_t len);
    std::uint32_t value() const;
    std::uint64_t size() const { return size_; }
private:
    std::uint32_t crc_ = 0;
    std::uint64_t size_ = 0;
};

enum class DigestKind { Md5, Sha1, Sha256 };

// Cryptographic digest through libcrypto's EVP interface.
class Digest {
public:
    explicit Digest(DigestKind kind);
    ~Digest();
    Digest(const Digest&) = delete;
    Digest& operator=(const Digest&) = delete;

    void update(const char* data, std::size_t len);
    // Lowercase hex. The digest cannot be updated afterwards.
    std::string hex();

    static const char* name(DigestKind kind);
private:
    struct Ctx;
    std::unique_ptr<Ctx> ctx_;
    bool finished_ = false;
};
