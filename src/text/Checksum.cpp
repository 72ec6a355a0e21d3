#include "Checksum.hpp"
#include "../core/Errors.hpp"

#include <array>
#include <cstdio>
#include <openssl/evp.h>

namespace {

std::array<std::uint32_t, 256> make_crc_table() {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint32_t c = i << 24;
        for (int k = 0; k < 8; ++k) {
            c = (c & 0x80000000u) ? (c << 1) ^ 0x04C11DB7u : (c << 1);
        }
        table[i] = c;
    }
    return table;
}

const std::array<std::uint32_t, 256>& crc_table() {
    static const auto table = make_crc_table();
    return table;
}

std::uint32_t crc_step(std::uint32_t crc, unsigned char byte) {
    return (crc << 8) ^ crc_table()[((crc >> 24) ^ byte) & 0xFF];
}

const EVP_MD* evp_for(DigestKind kind) {
    switch (kind) {
        case DigestKind::Md5: return EVP_md5();
        case DigestKind::Sha1: return EVP_sha1();
        case DigestKind::Sha256: return EVP_sha256();
    }
    return EVP_sha256();
}

}

void Sum16::update(const char* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        sum_ = (sum_ + static_cast<unsigned char>(data[i])) & 0xFFFF;
    }
    size_ += len;
}

void Crc32::update(const char* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        crc_ = crc_step(crc_, static_cast<unsigned char>(data[i]));
    }
    size_ += len;
}

std::uint32_t Crc32::value() const {
    std::uint32_t crc = crc_;
    for (std::uint64_t n = size_; n != 0; n >>= 8) {
        crc = crc_step(crc, static_cast<unsigned char>(n & 0xFF));
    }
    return ~crc;
}

struct Digest::Ctx {
    EVP_MD_CTX* md = nullptr;
    ~Ctx() { if (md) EVP_MD_CTX_free(md); }
};

Digest::Digest(DigestKind kind) : ctx_(std::make_unique<Ctx>()) {
    ctx_->md = EVP_MD_CTX_new();
    if (!ctx_->md) throw IoError("cannot allocate digest context");
    if (EVP_DigestInit_ex(ctx_->md, evp_for(kind), nullptr) != 1) {
        throw IoError(std::string("cannot initialise ") + name(kind));
    }
}

Digest::~Digest() = default;

void Digest::update(const char* data, std::size_t len) {
    if (finished_) throw IoError("digest already finalised");
    if (EVP_DigestUpdate(ctx_->md, data, len) != 1) throw IoError("digest update failed");
}

std::string Digest::hex() {
    if (finished_) throw IoError("digest already finalised");
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_->md, md, &len) != 1) throw IoError("digest finalisation failed");
    finished_ = true;
    std::string out;
    out.reserve(len * 2);
    char buf[3];
    for (unsigned int i = 0; i < len; ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", md[i]);
        out += buf;
    }
    return out;
}

const char* Digest::name(DigestKind kind) {
    switch (kind) {
        case DigestKind::Md5: return "md5";
        case DigestKind::Sha1: return "sha1";
        case DigestKind::Sha256: return "sha256";
    }
    return "digest";
}
