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

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/qotd/codec/quote_codec.h"
#include "kcenon/qotd/config/qotd_config.h"
#include "kcenon/qotd/utils/buffer_pool.h"

namespace kcenon::qotd::core
{
	/*!
	 * \brief Non-fatal conditions a host reports while serving or requesting.
	 */
	enum class diagnostic_kind
	{
		quote_truncated,
		unrepresentable_character,
		invalid_response_encoding,
		provider_failure,
		transport_error
	};

	auto to_string(diagnostic_kind kind) -> std::string_view;

	struct diagnostic
	{
		diagnostic_kind kind;
		std::string host_id;
		std::string message;
	};

	using diagnostic_callback = std::function<void(const diagnostic&)>;

	/*!
	 * \brief A quote encoded into a pooled buffer, ready to be written.
	 *
	 * Only the first \c size bytes of \c buffer are payload. The buffer goes
	 * back to the pool through host_base::return_buffer().
	 */
	struct encoded_quote
	{
		std::vector<uint8_t> buffer;
		std::size_t size = 0;

		auto bytes() const -> std::span<const uint8_t>
		{
			return std::span<const uint8_t>(buffer.data(), size);
		}
	};

	/*!
	 * \class host_base
	 * \brief State and behaviour shared by qotd_server and qotd_client.
	 *
	 * Owns the buffer pool, the active encoding, the disposal signal and the
	 * diagnostic sink. Servers and clients hold one as a member.
	 *
	 * ### Thread Safety
	 * - All methods are thread-safe.
	 * - apply_options() changes take effect for buffers rented afterwards.
	 * - The diagnostic callback runs on whichever thread reported the
	 *   condition, usually the host's I/O thread; it must not block.
	 */
	class host_base
	{
	public:
		/*!
		 * \param host_id Name used as log prefix and in diagnostics
		 * \param options Validated host options
		 * \throws std::invalid_argument if \p options fails validation
		 */
		host_base(std::string host_id, const config::host_options& options);

		~host_base();

		host_base(const host_base&) = delete;
		host_base& operator=(const host_base&) = delete;

		auto host_id() const -> const std::string& { return host_id_; }

		/*!
		 * \brief Applies length, pooling and encoding settings.
		 *
		 * A new maximum quote length empties the buffer pool.
		 * \throws std::invalid_argument if \p options fails validation
		 */
		auto apply_options(const config::host_options& options) -> void;

		auto maximum_quote_length() const -> std::size_t;

		auto encoding() const -> codec::text_encoding;

		auto rent_buffer() -> std::vector<uint8_t>;

		auto return_buffer(std::vector<uint8_t>&& buffer) -> void;

		/*!
		 * \brief Encodes \p text into a rented buffer.
		 *
		 * Too long text is truncated at a character boundary and reported as
		 * quote_truncated. Text containing a character the active encoding
		 * cannot represent is reported as unrepresentable_character; the
		 * buffer goes back to the pool and std::nullopt is returned.
		 */
		auto encode_quote(std::string_view text) -> std::optional<encoded_quote>;

		/*!
		 * \brief Decodes received bytes with the active encoding.
		 *
		 * Invalid input is reported as invalid_response_encoding and yields
		 * std::nullopt.
		 */
		auto decode_quote(std::span<const uint8_t> bytes) -> std::optional<std::string>;

		/*!
		 * \brief Decodes with \p encoding instead of the active one, for
		 * requests that captured their encoding before a reconfiguration.
		 */
		auto decode_quote(std::span<const uint8_t> bytes, codec::text_encoding encoding)
			-> std::optional<std::string>;

		auto pool() -> utils::buffer_pool& { return pool_; }

		/*!
		 * \brief Token fired once by dispose(); passed to providers and requests.
		 */
		auto disposal_token() const -> std::stop_token { return disposal_.get_token(); }

		/*!
		 * \brief Fires the disposal signal.
		 * \return true for the call that performed the disposal, false afterwards.
		 */
		auto dispose() -> bool;

		auto is_disposed() const -> bool { return disposal_.stop_requested(); }

		auto set_diagnostic_callback(diagnostic_callback callback) -> void;

		/*!
		 * \brief Logs \p message and forwards it to the diagnostic callback.
		 */
		auto report(diagnostic_kind kind, const std::string& message) -> void;

	private:
		std::string host_id_;
		utils::buffer_pool pool_;
		std::atomic<codec::text_encoding> encoding_;
		std::stop_source disposal_;

		std::mutex callback_mutex_;
		diagnostic_callback callback_;
	};

} // namespace kcenon::qotd::core
