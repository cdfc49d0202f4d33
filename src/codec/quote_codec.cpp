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

#include "kcenon/qotd/codec/quote_codec.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace kcenon::qotd::codec
{
	namespace
	{
		constexpr char32_t invalid_code_point = 0xFFFFFFFF;

		// Reads one UTF-8 sequence starting at text[pos]. Returns the code point
		// and advances len, or invalid_code_point for malformed input.
		auto next_code_point(std::string_view text, std::size_t pos, std::size_t& len) -> char32_t
		{
			const auto lead = static_cast<std::uint8_t>(text[pos]);
			char32_t cp = 0;
			char32_t min_value = 0;

			if (lead < 0x80)
			{
				len = 1;
				return lead;
			}
			if ((lead & 0xE0) == 0xC0)
			{
				len = 2;
				cp = lead & 0x1F;
				min_value = 0x80;
			}
			else if ((lead & 0xF0) == 0xE0)
			{
				len = 3;
				cp = lead & 0x0F;
				min_value = 0x800;
			}
			else if ((lead & 0xF8) == 0xF0)
			{
				len = 4;
				cp = lead & 0x07;
				min_value = 0x10000;
			}
			else
			{
				len = 1;
				return invalid_code_point;
			}

			if (pos + len > text.size())
			{
				len = text.size() - pos;
				return invalid_code_point;
			}

			for (std::size_t i = 1; i < len; ++i)
			{
				const auto byte = static_cast<std::uint8_t>(text[pos + i]);
				if ((byte & 0xC0) != 0x80)
				{
					len = i;
					return invalid_code_point;
				}
				cp = (cp << 6) | (byte & 0x3F);
			}

			// overlong forms, UTF-16 surrogates and values past U+10FFFF
			if (cp < min_value || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
			{
				return invalid_code_point;
			}
			return cp;
		}

		auto append_utf8(std::string& out, char32_t cp) -> void
		{
			if (cp < 0x80)
			{
				out.push_back(static_cast<char>(cp));
			}
			else if (cp < 0x800)
			{
				out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
				out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
			}
			else if (cp < 0x10000)
			{
				out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
				out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
				out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
			}
			else
			{
				out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
				out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
				out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
				out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
			}
		}

		auto lower(std::string_view name) -> std::string
		{
			std::string result(name);
			std::transform(result.begin(), result.end(), result.begin(),
						   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
			return result;
		}
	} // namespace

	auto to_string(text_encoding encoding) -> std::string_view
	{
		switch (encoding)
		{
		case text_encoding::ascii:
			return "ascii";
		case text_encoding::utf8:
			return "utf-8";
		case text_encoding::latin1:
			return "latin1";
		}
		return "unknown";
	}

	auto parse_text_encoding(std::string_view name) -> std::optional<text_encoding>
	{
		const auto key = lower(name);
		if (key == "ascii" || key == "us-ascii")
		{
			return text_encoding::ascii;
		}
		if (key == "utf-8" || key == "utf8")
		{
			return text_encoding::utf8;
		}
		if (key == "latin1" || key == "iso-8859-1")
		{
			return text_encoding::latin1;
		}
		return std::nullopt;
	}

	auto quote_codec::encode(std::string_view text, std::span<std::uint8_t> out) const
		-> encode_result
	{
		std::size_t written = 0;
		std::size_t pos = 0;

		while (pos < text.size())
		{
			std::size_t len = 0;
			const auto cp = next_code_point(text, pos, len);
			if (cp == invalid_code_point)
			{
				return { encode_status::unrepresentable, written, pos };
			}

			std::size_t needed = 0;
			switch (encoding_)
			{
			case text_encoding::ascii:
				if (cp >= 0x80)
				{
					return { encode_status::unrepresentable, written, pos };
				}
				needed = 1;
				break;
			case text_encoding::latin1:
				if (cp > 0xFF)
				{
					return { encode_status::unrepresentable, written, pos };
				}
				needed = 1;
				break;
			case text_encoding::utf8:
				needed = len;
				break;
			}

			if (written + needed > out.size())
			{
				return { encode_status::truncated, written, pos };
			}

			if (encoding_ == text_encoding::utf8)
			{
				std::memcpy(out.data() + written, text.data() + pos, len);
			}
			else
			{
				out[written] = static_cast<std::uint8_t>(cp);
			}
			written += needed;
			pos += len;
		}

		return { encode_status::ok, written, pos };
	}

	auto quote_codec::decode(std::span<const std::uint8_t> bytes) const
		-> std::optional<std::string>
	{
		std::string result;
		result.reserve(bytes.size());

		switch (encoding_)
		{
		case text_encoding::ascii:
			for (auto byte : bytes)
			{
				if (byte >= 0x80)
				{
					return std::nullopt;
				}
				result.push_back(static_cast<char>(byte));
			}
			break;

		case text_encoding::latin1:
			for (auto byte : bytes)
			{
				append_utf8(result, byte);
			}
			break;

		case text_encoding::utf8:
		{
			const std::string_view view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
			std::size_t pos = 0;
			while (pos < view.size())
			{
				std::size_t len = 0;
				if (next_code_point(view, pos, len) == invalid_code_point)
				{
					return std::nullopt;
				}
				pos += len;
			}
			result.assign(view);
			break;
		}
		}

		return result;
	}

} // namespace kcenon::qotd::codec
