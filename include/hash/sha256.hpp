#pragma once

#include "hash/hasher.hpp"
#include <memory>

// Forward declaration from <openssl/evp.h>, keeps OpenSSL out of the public headers
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace merkle_stream {

/**
 * Sha256Hasher - SHA-256 through OpenSSL's EVP digest interface.
 */
class Sha256Hasher : public Hasher {
public:
    static constexpr size_t DIGEST_SIZE = 32;

    Sha256Hasher();
    ~Sha256Hasher() override;

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    void reset() override;
    void write(const uint8_t* data, size_t len) override;
    using Hasher::write;
    Digest sum() override;

    size_t digest_size() const override { return DIGEST_SIZE; }
    std::string name() const override { return "sha256"; }
    std::unique_ptr<Hasher> clone() const override;

    // One-shot SHA-256 of a byte string
    static Digest hash(const Bytes& data);

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const;
    };

    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
};

} // namespace merkle_stream
