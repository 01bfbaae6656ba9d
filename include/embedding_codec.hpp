#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace voicecache {

// A speaker embedding. Opaque to the cache apart from its length.
using Embedding = std::vector<float>;

// Stored bytes that do not decode to an embedding of the expected shape.
class CorruptPayload : public std::runtime_error {
public:
    explicit CorruptPayload(const std::string& what)
        : std::runtime_error("corrupt embedding payload: " + what) {}
};

/**
 * Converts embeddings to and from the stored byte format.
 *
 * Layout (little-endian):
 *   "VEMB" | version u8 | element type u8 | reserved u16 | count u32 |
 *   count * float32 bits | first 8 bytes of SHA-256 over everything before
 *
 * Float bits are copied verbatim, so decode(encode(e)) is bit-identical to e,
 * NaN payloads and negative zero included.
 */
class EmbeddingCodec {
public:
    static constexpr uint8_t kFormatVersion = 1;
    static constexpr uint8_t kTypeFloat32 = 1;
    static constexpr size_t kHeaderSize = 12;
    static constexpr size_t kChecksumSize = 8;

    // expected_dim == 0 accepts any element count.
    explicit EmbeddingCodec(size_t expected_dim = 0) : expected_dim_(expected_dim) {}

    std::string encode(const Embedding& embedding) const;

    // Throws CorruptPayload.
    Embedding decode(const std::string& bytes) const;

    size_t expected_dim() const { return expected_dim_; }

private:
    size_t expected_dim_;

    static std::string checksum(const std::string& bytes, size_t length);
};

}
