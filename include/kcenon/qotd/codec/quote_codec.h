/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2024, 🍀☀🌕🌥 🌊
All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions are met:

1. Redistributions of source code must retain the above copyright notice, this
   list of conditions and the following disclaimer.

2. Redistributions in binary form must reproduce the above copyright notice,
   this list of conditions and the following disclaimer in the documentation
   and/or other materials provided with the distribution.

3. Neither the name of the copyright holder nor the names of its
   contributors may be used to endorse or promote products derived from
   this software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*****************************************************************************/

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::qotd::codec
{
	/*!
	 * \brief Character encodings a host can put on the wire.
	 *
	 * Text handed to and returned from the codec is always UTF-8.
	 */
	enum class text_encoding
	{
		ascii,  ///< 7-bit US-ASCII, strict
		utf8,   ///< UTF-8, strict validation
		latin1  ///< ISO-8859-1, one byte per code point up to U+00FF
	};

	auto to_string(text_encoding encoding) -> std::string_view;

	/*!
	 * \brief Parses "ascii", "utf-8"/"utf8" or "latin1"/"iso-8859-1" (case-insensitive).
	 */
	auto parse_text_encoding(std::string_view name) -> std::optional<text_encoding>;

	enum class encode_status
	{
		ok,
		truncated,        ///< text did not fit, a whole-character prefix was written
		unrepresentable   ///< text holds a character the encoding cannot express
	};

	struct encode_result
	{
		encode_status status;
		std::size_t bytes;   ///< bytes written to the output buffer
		std::size_t offset;  ///< byte offset in the input of the offending or first unwritten character
	};

	/*!
	 * \class quote_codec
	 * \brief Bounded conversion between UTF-8 text and wire bytes.
	 *
	 * encode() walks the input one code point at a time. A character the
	 * encoding cannot represent rejects the whole text; running out of room
	 * first stops at the last complete character and reports truncation.
	 * Multi-byte sequences are never split.
	 *
	 * ### Thread Safety
	 * Stateless apart from the encoding; safe to share between threads.
	 */
	class quote_codec
	{
	public:
		explicit quote_codec(text_encoding encoding = text_encoding::ascii) noexcept
			: encoding_(encoding)
		{
		}

		auto encoding() const noexcept -> text_encoding { return encoding_; }

		auto encode(std::string_view text, std::span<std::uint8_t> out) const -> encode_result;

		/*!
		 * \brief Decodes \p bytes into UTF-8 text.
		 * \return std::nullopt when the bytes are not valid in the encoding.
		 */
		auto decode(std::span<const std::uint8_t> bytes) const -> std::optional<std::string>;

	private:
		text_encoding encoding_;
	};

} // namespace kcenon::qotd::codec
