#include <gtest/gtest.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "codec/decoder.hpp"
#include "codec/encoder.hpp"
#include "entropy/bitstream.hpp"
#include "format/hz_format.hpp"

using namespace hufzip;

const std::string MockInputString =
    "Nulla pulvinar lectus et felis sodales maximus. Nulla pulvinar lectus et felis sodales maximus."
    "Nulla pulvinar lectus et felis sodales maximus. Nulla pulvinar lectus et felis sodales maximus."
    "Nulla pulvinar lectus et felis sodales maximus. Nulla pulvinar lectus et felis sodales maximus.";

const std::vector<uint8_t> MockInput(MockInputString.begin(), MockInputString.end());

static std::vector<uint8_t> genRandomBytes(int size, unsigned seed)
{
    srand(seed);
    std::vector<uint8_t> res;
    for (int i = 0; i < size; i++) {
        res.push_back(static_cast<uint8_t>(rand() % 256));
    }
    return res;
}

static std::vector<uint8_t> roundTrip(const std::vector<uint8_t>& input)
{
    std::vector<uint8_t> decoded;
    EXPECT_EQ(Status::Ok, decode_bytes(encode_bytes(input), decoded));
    return decoded;
}

TEST(CodecTest, RoundTrip_EmptyInput)
{
    EXPECT_TRUE(roundTrip({}).empty());
}

TEST(CodecTest, RoundTrip_SingleRepeatedByte)
{
    const std::vector<uint8_t> input(1000, 'z');
    EXPECT_EQ(input, roundTrip(input));
}

TEST(CodecTest, RoundTrip_Text)
{
    std::vector<uint8_t> decoded = roundTrip(MockInput);
    std::string decodedString(decoded.begin(), decoded.end());
    EXPECT_EQ(MockInputString, decodedString);
}

TEST(CodecTest, RoundTrip_AllByteValues)
{
    std::vector<uint8_t> input;
    for (int b = 255; b >= 0; --b) input.push_back(static_cast<uint8_t>(b));
    EXPECT_EQ(input, roundTrip(input));
}

TEST(CodecTest, RoundTrip_RandomInputs)
{
    for (unsigned seed = 1; seed <= 5; ++seed) {
        const std::vector<uint8_t> input = genRandomBytes(static_cast<int>(seed) * 997, seed);
        EXPECT_EQ(input, roundTrip(input)) << "seed " << seed;
    }
}

TEST(CodecTest, Encode_Text_ReturnsSmallerSize)
{
    std::vector<uint8_t> compressed = encode_bytes(MockInput);
    std::cout << "Compression ratio: " << (double)MockInput.size() / compressed.size() << std::endl;
    EXPECT_LT(compressed.size(), MockInput.size());
}

TEST(CodecTest, Encode_Aab_ExactBitstream)
{
    const std::vector<uint8_t> input = {97, 97, 98};
    CodecStats stats;
    const std::vector<uint8_t> encoded = encode_bytes(input, &stats);

    // magic | tree 0 1(97) 0 1(98) 1(256) | body 0 0 10 11 | pad
    const std::vector<uint8_t> expected = {0xFA, 0xCE, 0x82, 0x01, 0x4C, 0x29, 0x8B, 0x00, 0x2C};
    EXPECT_EQ(expected, encoded);

    EXPECT_EQ(3u, stats.raw_bytes);
    EXPECT_EQ(64u, stats.header_bits);
    EXPECT_EQ(6u, stats.body_bits);
    EXPECT_EQ(9u, stats.compressed_bytes);
    EXPECT_EQ(3, stats.used_symbols);
}

TEST(CodecTest, Decode_Aab_StopsAtEof)
{
    const std::vector<uint8_t> stream = {0xFA, 0xCE, 0x82, 0x01, 0x4C, 0x29, 0x8B, 0x00, 0x2C};
    std::vector<uint8_t> decoded;
    CodecStats stats;
    ASSERT_EQ(Status::Ok, decode_bytes(stream, decoded, &stats));
    const std::vector<uint8_t> expected = {97, 97, 98};
    EXPECT_EQ(expected, decoded);
    EXPECT_EQ(6u, stats.body_bits);
    EXPECT_EQ(3, stats.used_symbols);
}

TEST(CodecTest, Encode_EmptyInput_HeaderOnlyNoBodyBits)
{
    CodecStats stats;
    const std::vector<uint8_t> encoded = encode_bytes({}, &stats);
    const std::vector<uint8_t> expected = {0xFA, 0xCE, 0x82, 0x01, 0xC0, 0x00};
    EXPECT_EQ(expected, encoded);
    EXPECT_EQ(0u, stats.body_bits);
    EXPECT_EQ(42u, stats.header_bits);
    EXPECT_EQ(1, stats.used_symbols);
}

TEST(CodecTest, Encode_SameInput_IsDeterministic)
{
    const std::vector<uint8_t> input = genRandomBytes(5000, 99);
    EXPECT_EQ(encode_bytes(input), encode_bytes(input));
}

TEST(CodecTest, EncodeStream_ReaderIsRestartedForSecondPass)
{
    BitReader r(MockInput);
    BitWriter w;
    encode_stream(r, w);
    EXPECT_EQ(0u, r.bits_remaining());
    EXPECT_EQ(encode_bytes(MockInput), w.data());
}

TEST(CodecTest, Decode_FlippedMagic_BadMagic)
{
    std::vector<uint8_t> encoded = encode_bytes(MockInput);
    encoded[0] ^= 0x01;
    std::vector<uint8_t> decoded = {1, 2, 3};
    EXPECT_EQ(Status::BadMagic, decode_bytes(encoded, decoded));
    const std::vector<uint8_t> untouched = {1, 2, 3};
    EXPECT_EQ(untouched, decoded);
}

TEST(CodecTest, Decode_ShorterThanMagic_BadMagic)
{
    std::vector<uint8_t> decoded;
    EXPECT_EQ(Status::BadMagic, decode_bytes({0xFA, 0xCE}, decoded));
    EXPECT_EQ(Status::BadMagic, decode_bytes({}, decoded));
}

TEST(CodecTest, Decode_TruncatedMidHeader_MalformedHeader)
{
    const std::vector<uint8_t> encoded = encode_bytes(MockInput);
    const std::vector<uint8_t> cut(encoded.begin(), encoded.begin() + 6);
    std::vector<uint8_t> decoded;
    EXPECT_EQ(Status::MalformedHeader, decode_bytes(cut, decoded));
}

TEST(CodecTest, Decode_TruncatedMidBody_TruncatedStream)
{
    CodecStats stats;
    const std::vector<uint8_t> encoded = encode_bytes(MockInput, &stats);
    ASSERT_GT(stats.body_bits, 64u);

    const size_t keep = static_cast<size_t>((stats.header_bits + 7) / 8 + 2);
    const std::vector<uint8_t> cut(encoded.begin(), encoded.begin() + keep);
    std::vector<uint8_t> decoded;
    EXPECT_EQ(Status::TruncatedStream, decode_bytes(cut, decoded));

    const std::vector<uint8_t> lastByteDropped(encoded.begin(), encoded.end() - 1);
    EXPECT_EQ(Status::TruncatedStream, decode_bytes(lastByteDropped, decoded));
}

TEST(CodecTest, Decode_LeafRootWithByteSymbol_MalformedHeader)
{
    // magic | 1 | 001000001 ('A') | pad
    const std::vector<uint8_t> stream = {0xFA, 0xCE, 0x82, 0x01, 0x90, 0x40};
    std::vector<uint8_t> decoded;
    EXPECT_EQ(Status::MalformedHeader, decode_bytes(stream, decoded));
}

TEST(CodecTest, Decode_TrailingGarbage_Ignored)
{
    std::vector<uint8_t> encoded = encode_bytes(MockInput);
    encoded.push_back(0xFF);
    encoded.push_back(0x00);
    encoded.push_back(0xA5);
    std::vector<uint8_t> decoded;
    ASSERT_EQ(Status::Ok, decode_bytes(encoded, decoded));
    EXPECT_EQ(MockInput, decoded);
}

TEST(CodecTest, StatusMessage_DistinctPerKind)
{
    const std::string bad = status_message(Status::BadMagic);
    const std::string header = status_message(Status::MalformedHeader);
    const std::string truncated = status_message(Status::TruncatedStream);
    EXPECT_NE(bad, header);
    EXPECT_NE(header, truncated);
    EXPECT_NE(bad, truncated);
    EXPECT_EQ(std::string("ok"), status_message(Status::Ok));
}
