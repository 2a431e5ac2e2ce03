#pragma once

#include "types/digest.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace merkle_stream {

/**
 * Hasher - the hash primitive the trees and the verifier are built on.
 *
 * A Hasher accumulates bytes with write() and produces a fixed-length digest
 * with sum(). sum() finalizes the running computation: reset() must be called
 * before the instance is used for the next message. The same input must always
 * produce the same digest.
 */
class Hasher {
public:
    virtual ~Hasher() = default;

    // Start a new message
    virtual void reset() = 0;

    // Append bytes to the current message
    virtual void write(const uint8_t* data, size_t len) = 0;

    void write(const Bytes& data) { write(data.data(), data.size()); }

    // Finalize the current message and return its digest
    virtual Digest sum() = 0;

    // Length in bytes of every digest returned by sum()
    virtual size_t digest_size() const = 0;

    virtual std::string name() const = 0;

    // Fresh, reset instance of the same algorithm
    virtual std::unique_ptr<Hasher> clone() const = 0;
};

} // namespace merkle_stream
