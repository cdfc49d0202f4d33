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

#include "kcenon/qotd/core/host_base.h"

#include "kcenon/qotd/integration/logger_integration.h"

#include <exception>

namespace kcenon::qotd::core
{
	namespace
	{
		auto validated(const config::host_options& options) -> const config::host_options&
		{
			config::validate(options);
			return options;
		}
	} // namespace

	auto to_string(diagnostic_kind kind) -> std::string_view
	{
		switch (kind)
		{
		case diagnostic_kind::quote_truncated:
			return "quote_truncated";
		case diagnostic_kind::unrepresentable_character:
			return "unrepresentable_character";
		case diagnostic_kind::invalid_response_encoding:
			return "invalid_response_encoding";
		case diagnostic_kind::provider_failure:
			return "provider_failure";
		case diagnostic_kind::transport_error:
			return "transport_error";
		}
		return "unknown";
	}

	host_base::host_base(std::string host_id, const config::host_options& options)
		: host_id_(std::move(host_id))
		, pool_(validated(options).maximum_quote_length, options.maximum_pooled_buffers)
		, encoding_(options.encoding)
	{
	}

	host_base::~host_base() { dispose(); }

	auto host_base::apply_options(const config::host_options& options) -> void
	{
		config::validate(options);

		pool_.set_buffer_length(options.maximum_quote_length);
		pool_.set_max_pooled(options.maximum_pooled_buffers);
		encoding_.store(options.encoding);
	}

	auto host_base::maximum_quote_length() const -> std::size_t { return pool_.buffer_length(); }

	auto host_base::encoding() const -> codec::text_encoding { return encoding_.load(); }

	auto host_base::rent_buffer() -> std::vector<uint8_t> { return pool_.rent(); }

	auto host_base::return_buffer(std::vector<uint8_t>&& buffer) -> void
	{
		pool_.give_back(std::move(buffer));
	}

	auto host_base::encode_quote(std::string_view text) -> std::optional<encoded_quote>
	{
		const codec::quote_codec codec(encoding());
		auto buffer = rent_buffer();
		const auto result = codec.encode(text, buffer);

		switch (result.status)
		{
		case codec::encode_status::ok:
			break;

		case codec::encode_status::truncated:
			report(diagnostic_kind::quote_truncated,
				   "quote truncated to " + std::to_string(result.bytes) + " of " +
					   std::to_string(text.size()) + " bytes");
			break;

		case codec::encode_status::unrepresentable:
			return_buffer(std::move(buffer));
			report(diagnostic_kind::unrepresentable_character,
				   "unexpected character at byte " + std::to_string(result.offset) +
					   " for encoding " + std::string(codec::to_string(codec.encoding())));
			return std::nullopt;
		}

		return encoded_quote{ std::move(buffer), result.bytes };
	}

	auto host_base::decode_quote(std::span<const uint8_t> bytes) -> std::optional<std::string>
	{
		return decode_quote(bytes, encoding());
	}

	auto host_base::decode_quote(std::span<const uint8_t> bytes, codec::text_encoding encoding)
		-> std::optional<std::string>
	{
		const codec::quote_codec codec(encoding);
		auto text = codec.decode(bytes);
		if (!text)
		{
			report(diagnostic_kind::invalid_response_encoding,
				   "received " + std::to_string(bytes.size()) +
					   " bytes that are not valid " +
					   std::string(codec::to_string(codec.encoding())));
		}
		return text;
	}

	auto host_base::dispose() -> bool
	{
		// true only for the caller that made the request
		return disposal_.request_stop();
	}

	auto host_base::set_diagnostic_callback(diagnostic_callback callback) -> void
	{
		std::lock_guard<std::mutex> lock(callback_mutex_);
		callback_ = std::move(callback);
	}

	auto host_base::report(diagnostic_kind kind, const std::string& message) -> void
	{
		const auto line = "[" + host_id_ + "] " + message;
		switch (kind)
		{
		case diagnostic_kind::quote_truncated:
		case diagnostic_kind::unrepresentable_character:
		case diagnostic_kind::invalid_response_encoding:
			QOTD_LOG_WARN(line);
			break;
		case diagnostic_kind::provider_failure:
		case diagnostic_kind::transport_error:
			QOTD_LOG_ERROR(line);
			break;
		}

		diagnostic_callback callback;
		{
			std::lock_guard<std::mutex> lock(callback_mutex_);
			callback = callback_;
		}
		if (!callback)
		{
			return;
		}

		try
		{
			callback(diagnostic{ kind, host_id_, message });
		}
		catch (const std::exception& e)
		{
			QOTD_LOG_ERROR("[" + host_id_ + "] diagnostic callback threw: " + std::string(e.what()));
		}
	}

} // namespace kcenon::qotd::core
