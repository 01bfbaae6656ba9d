#include "embedding_codec.hpp"

#include <cstring>
#include <limits>
#include <openssl/sha.h>

namespace voicecache {

namespace {

const char kMagic[4] = {'V', 'E', 'M', 'B'};

void put_u32(std::string& out, uint32_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
    out.push_back(static_cast<char>((v >> 16) & 0xFF));
    out.push_back(static_cast<char>((v >> 24) & 0xFF));
}

uint32_t get_u32(const std::string& in, size_t offset) {
    const auto* p = reinterpret_cast<const unsigned char*>(in.data() + offset);
    return static_cast<uint32_t>(p[0])
         | (static_cast<uint32_t>(p[1]) << 8)
         | (static_cast<uint32_t>(p[2]) << 16)
         | (static_cast<uint32_t>(p[3]) << 24);
}

}

std::string EmbeddingCodec::checksum(const std::string& bytes, size_t length) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(bytes.data()), length, hash);
    return std::string(reinterpret_cast<const char*>(hash), kChecksumSize);
}

std::string EmbeddingCodec::encode(const Embedding& embedding) const {
    if (expected_dim_ != 0 && embedding.size() != expected_dim_) {
        throw std::invalid_argument("embedding has " + std::to_string(embedding.size()) +
                                    " elements, expected " + std::to_string(expected_dim_));
    }
    if (embedding.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("embedding too large to encode");
    }

    std::string out;
    out.reserve(kHeaderSize + embedding.size() * 4 + kChecksumSize);
    out.append(kMagic, sizeof(kMagic));
    out.push_back(static_cast<char>(kFormatVersion));
    out.push_back(static_cast<char>(kTypeFloat32));
    out.push_back('\0');
    out.push_back('\0');
    put_u32(out, static_cast<uint32_t>(embedding.size()));

    for (float f : embedding) {
        uint32_t bits;
        std::memcpy(&bits, &f, sizeof(bits));
        put_u32(out, bits);
    }

    out += checksum(out, out.size());
    return out;
}

Embedding EmbeddingCodec::decode(const std::string& bytes) const {
    if (bytes.size() < kHeaderSize + kChecksumSize) {
        throw CorruptPayload("truncated (" + std::to_string(bytes.size()) + " bytes)");
    }
    if (std::memcmp(bytes.data(), kMagic, sizeof(kMagic)) != 0) {
        throw CorruptPayload("bad magic");
    }
    if (static_cast<uint8_t>(bytes[4]) != kFormatVersion) {
        throw CorruptPayload("unsupported version " + std::to_string(static_cast<uint8_t>(bytes[4])));
    }
    if (static_cast<uint8_t>(bytes[5]) != kTypeFloat32) {
        throw CorruptPayload("unsupported element type " + std::to_string(static_cast<uint8_t>(bytes[5])));
    }

    if (bytes[6] != '\0' || bytes[7] != '\0') {
        throw CorruptPayload("reserved header bytes are not zero");
    }

    uint32_t count = get_u32(bytes, 8);
    size_t expected_size = kHeaderSize + static_cast<size_t>(count) * 4 + kChecksumSize;
    if (bytes.size() != expected_size) {
        throw CorruptPayload("length " + std::to_string(bytes.size()) +
                             " does not match element count " + std::to_string(count));
    }

    size_t body_end = bytes.size() - kChecksumSize;
    if (checksum(bytes, body_end) != bytes.substr(body_end)) {
        throw CorruptPayload("checksum mismatch");
    }

    if (expected_dim_ != 0 && count != expected_dim_) {
        throw CorruptPayload("dimension " + std::to_string(count) +
                             " does not match expected " + std::to_string(expected_dim_));
    }

    Embedding embedding(count);
    for (uint32_t i = 0; i < count; ++i) {
        uint32_t bits = get_u32(bytes, kHeaderSize + static_cast<size_t>(i) * 4);
        std::memcpy(&embedding[i], &bits, sizeof(bits));
    }
    return embedding;
}

}
