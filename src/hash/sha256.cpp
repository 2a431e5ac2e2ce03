#include "hash/sha256.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace merkle_stream {

void Sha256Hasher::CtxDeleter::operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
}

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    reset();
}

Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::reset() {
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

void Sha256Hasher::write(const uint8_t* data, size_t len) {
    if (len == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

Digest Sha256Hasher::sum() {
    Digest out(DIGEST_SIZE);
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &out_len) != 1 || out_len != DIGEST_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return out;
}

std::unique_ptr<Hasher> Sha256Hasher::clone() const {
    return std::make_unique<Sha256Hasher>();
}

Digest Sha256Hasher::hash(const Bytes& data) {
    Sha256Hasher hasher;
    hasher.write(data);
    return hasher.sum();
}

} // namespace merkle_stream
