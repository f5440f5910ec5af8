#include "hasher.hpp"
#include <openssl/evp.h>
#include <stdexcept>

Sha256::Sha256() : ctx(EVP_MD_CTX_new()) {
    if (!ctx) {
        throw std::runtime_error("Error creating EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("Error initializing SHA-256 digest");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx);
}

void Sha256::update(const uint8_t* data, size_t size) {
    if (finalized) {
        throw std::logic_error("SHA-256 context already finalized");
    }
    if (size == 0) return;
    if (EVP_DigestUpdate(ctx, data, size) != 1) {
        throw std::runtime_error("Error updating SHA-256 digest");
    }
}

Digest Sha256::digest() {
    if (finalized) {
        throw std::logic_error("SHA-256 context already finalized");
    }
    Digest out{};
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx, out.data(), &md_len) != 1 || md_len != out.size()) {
        throw std::runtime_error("Error finalizing SHA-256 digest");
    }
    finalized = true;
    return out;
}

std::string Sha256::hex_digest() {
    Digest d = digest();
    return bytes_to_hex(d.data(), d.size());
}

Digest sha256(const uint8_t* data, size_t size) {
    Sha256 hasher;
    hasher.update(data, size);
    return hasher.digest();
}

Digest sha256(const Bytes& data) {
    return sha256(data.data(), data.size());
}

std::string sha256_hex(const uint8_t* data, size_t size) {
    Digest d = sha256(data, size);
    return bytes_to_hex(d.data(), d.size());
}

std::string sha256_hex(const Bytes& data) {
    return sha256_hex(data.data(), data.size());
}
