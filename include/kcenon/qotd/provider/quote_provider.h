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

#include <asio.hpp>

#include <functional>
#include <stop_token>
#include <string>

#include "kcenon/qotd/utils/result_types.h"

namespace kcenon::qotd::provider
{
	/*!
	 * \brief Receives the outcome of one quote lookup.
	 */
	using quote_handler = std::function<void(Result<std::string>)>;

	/*!
	 * \class quote_provider
	 * \brief Source of the text a server sends for each request.
	 *
	 * get_quote() may invoke \p handler before returning or later from any
	 * thread, and must invoke it at most once. An error result, a thrown
	 * exception or a handler that is dropped without being called all mean
	 * that no response is sent for that request.
	 *
	 * \p token is the server's disposal signal; a provider doing slow work
	 * should stop early when it fires.
	 */
	class quote_provider
	{
	public:
		virtual ~quote_provider() = default;

		virtual auto get_quote(const asio::ip::address& remote,
							   std::stop_token token,
							   quote_handler handler) -> void = 0;
	};

	/*!
	 * \class fixed_quote_provider
	 * \brief Answers every request with the same text, synchronously.
	 */
	class fixed_quote_provider : public quote_provider
	{
	public:
		explicit fixed_quote_provider(std::string quote) : quote_(std::move(quote)) {}

		auto get_quote(const asio::ip::address&, std::stop_token, quote_handler handler)
			-> void override
		{
			handler(Result<std::string>(quote_));
		}

	private:
		std::string quote_;
	};

} // namespace kcenon::qotd::provider
