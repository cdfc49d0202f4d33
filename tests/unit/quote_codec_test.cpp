/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, 🍀☀🌕🌥 🌊
All rights reserved.
*****************************************************************************/

#include "kcenon/qotd/codec/quote_codec.h"
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace kcenon::qotd::codec;

/**
 * @file quote_codec_test.cpp
 * @brief Unit tests for quote_codec
 *
 * Tests validate:
 * - Text that fits is encoded in full and decodes back unchanged
 * - Oversized text is truncated on a character boundary
 * - Characters outside the encoding reject the whole text
 * - Strict decoding of invalid byte sequences
 * - Encoding name parsing
 */

namespace
{
	auto decode_prefix(const quote_codec& codec, const std::vector<uint8_t>& buffer, size_t bytes)
	{
		return codec.decode(std::span<const uint8_t>(buffer.data(), bytes));
	}
} // namespace

// ============================================================================
// Encode Tests
// ============================================================================

TEST(QuoteCodecEncodeTest, AsciiFitsExactly)
{
	quote_codec codec(text_encoding::ascii);
	std::vector<uint8_t> buffer(32);

	auto result = codec.encode("Test Quote", buffer);

	EXPECT_EQ(result.status, encode_status::ok);
	EXPECT_EQ(result.bytes, 10);
	EXPECT_EQ(decode_prefix(codec, buffer, result.bytes), "Test Quote");
}

TEST(QuoteCodecEncodeTest, EmptyTextEncodesToNothing)
{
	quote_codec codec;
	std::vector<uint8_t> buffer(8);

	auto result = codec.encode("", buffer);

	EXPECT_EQ(result.status, encode_status::ok);
	EXPECT_EQ(result.bytes, 0);
}

TEST(QuoteCodecEncodeTest, LongAsciiIsTruncatedToCapacity)
{
	quote_codec codec(text_encoding::ascii);
	std::vector<uint8_t> buffer(5);

	auto result = codec.encode("Hello, world", buffer);

	EXPECT_EQ(result.status, encode_status::truncated);
	EXPECT_EQ(result.bytes, 5);
	EXPECT_EQ(decode_prefix(codec, buffer, result.bytes), "Hello");
}

TEST(QuoteCodecEncodeTest, Utf8TruncationKeepsWholeCharacters)
{
	quote_codec codec(text_encoding::utf8);
	std::vector<uint8_t> buffer(4);

	// "a" + U+00E9 (2 bytes) + U+20AC (3 bytes)
	auto result = codec.encode("a\xC3\xA9\xE2\x82\xAC", buffer);

	EXPECT_EQ(result.status, encode_status::truncated);
	EXPECT_EQ(result.bytes, 3);
	EXPECT_EQ(decode_prefix(codec, buffer, result.bytes), "a\xC3\xA9");
}

TEST(QuoteCodecEncodeTest, AsciiRejectsNonAsciiCharacter)
{
	quote_codec codec(text_encoding::ascii);
	std::vector<uint8_t> buffer(64);

	auto result = codec.encode("caf\xC3\xA9", buffer);

	EXPECT_EQ(result.status, encode_status::unrepresentable);
	EXPECT_EQ(result.offset, 3);
}

TEST(QuoteCodecEncodeTest, TruncationWinsWhenBadCharacterIsPastCapacity)
{
	quote_codec codec(text_encoding::ascii);
	std::vector<uint8_t> buffer(3);

	auto result = codec.encode("abcd\xC3\xA9", buffer);

	EXPECT_EQ(result.status, encode_status::truncated);
	EXPECT_EQ(result.bytes, 3);
}

TEST(QuoteCodecEncodeTest, Latin1EncodesOneBytePerCharacter)
{
	quote_codec codec(text_encoding::latin1);
	std::vector<uint8_t> buffer(8);

	auto result = codec.encode("caf\xC3\xA9", buffer);

	ASSERT_EQ(result.status, encode_status::ok);
	ASSERT_EQ(result.bytes, 4);
	EXPECT_EQ(buffer[3], 0xE9);
	EXPECT_EQ(decode_prefix(codec, buffer, result.bytes), "caf\xC3\xA9");
}

TEST(QuoteCodecEncodeTest, Latin1RejectsCharactersAboveU00FF)
{
	quote_codec codec(text_encoding::latin1);
	std::vector<uint8_t> buffer(8);

	auto result = codec.encode("\xE2\x82\xAC", buffer);

	EXPECT_EQ(result.status, encode_status::unrepresentable);
}

TEST(QuoteCodecEncodeTest, MalformedUtf8InputIsRejected)
{
	quote_codec codec(text_encoding::utf8);
	std::vector<uint8_t> buffer(8);

	auto result = codec.encode("ab\xC3", buffer);

	EXPECT_EQ(result.status, encode_status::unrepresentable);
	EXPECT_EQ(result.bytes, 2);
}

// ============================================================================
// Decode Tests
// ============================================================================

TEST(QuoteCodecDecodeTest, AsciiRejectsHighBytes)
{
	quote_codec codec(text_encoding::ascii);
	std::vector<uint8_t> bytes{ 'o', 'k', 0xFF };

	EXPECT_FALSE(codec.decode(bytes).has_value());
}

TEST(QuoteCodecDecodeTest, Utf8RejectsOverlongSequence)
{
	quote_codec codec(text_encoding::utf8);
	std::vector<uint8_t> bytes{ 0xC0, 0xAF };

	EXPECT_FALSE(codec.decode(bytes).has_value());
}

TEST(QuoteCodecDecodeTest, Utf8RejectsSurrogate)
{
	quote_codec codec(text_encoding::utf8);
	std::vector<uint8_t> bytes{ 0xED, 0xA0, 0x80 };

	EXPECT_FALSE(codec.decode(bytes).has_value());
}

TEST(QuoteCodecDecodeTest, Utf8AcceptsFourByteSequence)
{
	quote_codec codec(text_encoding::utf8);
	std::vector<uint8_t> bytes{ 0xF0, 0x9F, 0x8D, 0x80 };

	auto text = codec.decode(bytes);
	ASSERT_TRUE(text.has_value());
	EXPECT_EQ(text->size(), 4);
}

TEST(QuoteCodecDecodeTest, Latin1AcceptsEveryByte)
{
	quote_codec codec(text_encoding::latin1);
	std::vector<uint8_t> bytes{ 0x41, 0xFF };

	EXPECT_EQ(codec.decode(bytes), "A\xC3\xBF");
}

// ============================================================================
// Name Tests
// ============================================================================

TEST(QuoteCodecNameTest, ParsesKnownNames)
{
	EXPECT_EQ(parse_text_encoding("ASCII"), text_encoding::ascii);
	EXPECT_EQ(parse_text_encoding("utf-8"), text_encoding::utf8);
	EXPECT_EQ(parse_text_encoding("ISO-8859-1"), text_encoding::latin1);
	EXPECT_FALSE(parse_text_encoding("ebcdic").has_value());
}

TEST(QuoteCodecNameTest, NamesRoundTrip)
{
	for (auto encoding : { text_encoding::ascii, text_encoding::utf8, text_encoding::latin1 })
	{
		EXPECT_EQ(parse_text_encoding(to_string(encoding)), encoding);
	}
}
