#include <gtest/gtest.h>
#include "embedding_codec.hpp"
#include <cmath>
#include <cstring>
#include <limits>
#include <openssl/sha.h>

using namespace voicecache;

namespace {

uint32_t bits_of(float f) {
    uint32_t b;
    std::memcpy(&b, &f, sizeof(b));
    return b;
}

// Rewrites the trailing checksum so only the deliberate edit makes the payload invalid.
void reseal(std::string& bytes) {
    size_t body_end = bytes.size() - EmbeddingCodec::kChecksumSize;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(bytes.data()), body_end, hash);
    bytes.replace(body_end, EmbeddingCodec::kChecksumSize,
                  reinterpret_cast<const char*>(hash), EmbeddingCodec::kChecksumSize);
}

}

TEST(EmbeddingCodecTest, RoundTripPreservesBits) {
    EmbeddingCodec codec;
    Embedding e = {0.25f, -1.5f, 3.1415927f, 1e-38f, -0.0f,
                   std::numeric_limits<float>::quiet_NaN(),
                   std::numeric_limits<float>::infinity()};

    Embedding out = codec.decode(codec.encode(e));
    ASSERT_EQ(out.size(), e.size());
    for (size_t i = 0; i < e.size(); ++i) {
        EXPECT_EQ(bits_of(out[i]), bits_of(e[i])) << "index " << i;
    }
    EXPECT_TRUE(std::signbit(out[4]));
    EXPECT_TRUE(std::isnan(out[5]));
}

TEST(EmbeddingCodecTest, EncodeIsDeterministic) {
    EmbeddingCodec codec;
    Embedding e(192, 0.125f);
    EXPECT_EQ(codec.encode(e), codec.encode(e));
    EXPECT_EQ(codec.encode(e).size(), EmbeddingCodec::kHeaderSize + 192 * 4 + EmbeddingCodec::kChecksumSize);
}

TEST(EmbeddingCodecTest, HeaderLayout) {
    EmbeddingCodec codec;
    std::string bytes = codec.encode({1.0f, 2.0f});
    EXPECT_EQ(bytes.substr(0, 4), "VEMB");
    EXPECT_EQ(static_cast<uint8_t>(bytes[4]), EmbeddingCodec::kFormatVersion);
    EXPECT_EQ(static_cast<uint8_t>(bytes[5]), EmbeddingCodec::kTypeFloat32);
    EXPECT_EQ(static_cast<uint8_t>(bytes[8]), 2);
    EXPECT_EQ(static_cast<uint8_t>(bytes[9]), 0);
}

TEST(EmbeddingCodecTest, EmptyEmbedding) {
    EmbeddingCodec codec;
    EXPECT_TRUE(codec.decode(codec.encode({})).empty());
}

TEST(EmbeddingCodecTest, FlippedByteIsCorrupt) {
    EmbeddingCodec codec;
    std::string bytes = codec.encode({1.0f, 2.0f, 3.0f});

    std::string tampered = bytes;
    tampered[EmbeddingCodec::kHeaderSize + 1] ^= 0x40;
    EXPECT_THROW(codec.decode(tampered), CorruptPayload);

    tampered = bytes;
    tampered[tampered.size() - 1] ^= 0x01;
    EXPECT_THROW(codec.decode(tampered), CorruptPayload);
}

TEST(EmbeddingCodecTest, TruncatedIsCorrupt) {
    EmbeddingCodec codec;
    std::string bytes = codec.encode({1.0f, 2.0f, 3.0f});

    EXPECT_THROW(codec.decode(bytes.substr(0, bytes.size() - 1)), CorruptPayload);
    EXPECT_THROW(codec.decode(bytes.substr(0, 5)), CorruptPayload);
    EXPECT_THROW(codec.decode(""), CorruptPayload);
    EXPECT_THROW(codec.decode(bytes + "x"), CorruptPayload);
}

TEST(EmbeddingCodecTest, BadMagicIsCorrupt) {
    EmbeddingCodec codec;
    std::string bytes = codec.encode({1.0f});
    bytes[0] = 'X';
    EXPECT_THROW(codec.decode(bytes), CorruptPayload);

    EXPECT_THROW(codec.decode("this is not an embedding at all"), CorruptPayload);
}

TEST(EmbeddingCodecTest, NonZeroReservedIsCorrupt) {
    EmbeddingCodec codec;
    std::string bytes = codec.encode({1.0f, 2.0f});
    std::string resealed = bytes;
    reseal(resealed);
    ASSERT_EQ(resealed, bytes);

    bytes[6] = 0x01;
    reseal(bytes);
    EXPECT_THROW(codec.decode(bytes), CorruptPayload);

    bytes[6] = 0x00;
    bytes[7] = static_cast<char>(0x80);
    reseal(bytes);
    EXPECT_THROW(codec.decode(bytes), CorruptPayload);
}

TEST(EmbeddingCodecTest, DimensionMismatch) {
    EmbeddingCodec any;
    EmbeddingCodec fixed(4);

    std::string three = any.encode({1.0f, 2.0f, 3.0f});
    EXPECT_THROW(fixed.decode(three), CorruptPayload);
    EXPECT_THROW(fixed.encode({1.0f, 2.0f, 3.0f}), std::invalid_argument);

    Embedding four = {1.0f, 2.0f, 3.0f, 4.0f};
    EXPECT_EQ(fixed.decode(fixed.encode(four)), four);
}
