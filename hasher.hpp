#ifndef HASHER_HPP
#define HASHER_HPP

#include <array>
#include <cstdint>
#include <string>
#include "utils.hpp"

using Digest = std::array<uint8_t, 32>;

// One-shot SHA-256 of a buffer.
Digest sha256(const uint8_t* data, size_t size);
Digest sha256(const Bytes& data);
std::string sha256_hex(const Bytes& data);
std::string sha256_hex(const uint8_t* data, size_t size);

// Incremental SHA-256, used for the whole-file digest.
class Sha256 {
public:
    Sha256();
    ~Sha256();
    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const uint8_t* data, size_t size);
    void update(const Bytes& data) { update(data.data(), data.size()); }

    // Finishes the context; further updates are not allowed.
    Digest digest();
    std::string hex_digest();

private:
    struct evp_md_ctx_st* ctx;
    bool finalized = false;
};

#endif // HASHER_HPP
