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

#include "kcenon/qotd/provider/daily_quote_provider.h"

#include "kcenon/qotd/integration/logger_integration.h"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace kcenon::qotd::provider
{
	namespace
	{
		auto checked_quotes(std::vector<std::string> quotes) -> std::vector<std::string>
		{
			if (quotes.empty())
			{
				throw std::invalid_argument("daily_quote_provider: quote pool cannot be empty");
			}
			if (std::any_of(quotes.begin(), quotes.end(),
							[](const std::string& quote) { return quote.empty(); }))
			{
				throw std::invalid_argument("daily_quote_provider: quotes cannot be empty");
			}
			return quotes;
		}

		auto normalized_rollover(std::chrono::seconds rollover) -> std::chrono::seconds
		{
			if (rollover < std::chrono::seconds{ 0 } || rollover >= std::chrono::hours{ 24 })
			{
				return std::chrono::seconds{ 0 };
			}
			return rollover;
		}
	} // namespace

	daily_quote_provider::daily_quote_provider(std::vector<std::string> quotes,
											   std::chrono::seconds rollover,
											   std::chrono::minutes utc_offset,
											   clock_function clock,
											   std::optional<std::uint32_t> seed)
		: quotes_(checked_quotes(std::move(quotes)))
		, rollover_(normalized_rollover(rollover))
		, utc_offset_(utc_offset)
		, clock_(clock ? std::move(clock) : clock_function([] { return std::chrono::system_clock::now(); }))
		, random_(seed ? *seed : std::random_device{}())
	{
	}

	auto daily_quote_provider::get_quote() -> std::string
	{
		std::lock_guard<std::mutex> lock(mutex_);
		try_generate_new_quote();
		return quotes_[*current_index_];
	}

	auto daily_quote_provider::get_quote(const asio::ip::address&,
										 std::stop_token token,
										 quote_handler handler) -> void
	{
		if (token.stop_requested())
		{
			handler(error<std::string>(error_codes::common_errors::cancelled,
									   "quote request cancelled", "daily_quote_provider"));
			return;
		}
		handler(Result<std::string>(get_quote()));
	}

	auto daily_quote_provider::try_generate_new_quote() -> void
	{
		const auto local = std::chrono::floor<std::chrono::seconds>(clock_()) + utc_offset_;
		const auto date = std::chrono::floor<std::chrono::days>(local);
		const auto time_of_day = std::chrono::duration_cast<std::chrono::seconds>(local - date);

		if (last_quote_date_ && *last_quote_date_ >= date)
		{
			return;
		}
		if (current_index_ && time_of_day < rollover_)
		{
			return;
		}

		update_quote(date, time_of_day);
	}

	auto daily_quote_provider::update_quote(std::chrono::sys_days date,
											std::chrono::seconds time_of_day) -> void
	{
		// Draw among the entries whose text differs from the current quote;
		// a pool of identical texts keeps the current entry.
		std::vector<std::size_t> candidates;
		candidates.reserve(quotes_.size());
		for (std::size_t i = 0; i < quotes_.size(); ++i)
		{
			if (!current_index_ || quotes_[i] != quotes_[*current_index_])
			{
				candidates.push_back(i);
			}
		}
		if (candidates.empty())
		{
			candidates.push_back(*current_index_);
		}

		std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
		const auto index = candidates[pick(random_)];
		current_index_ = index;

		// Picked before today's rollover: the quote belongs to yesterday and
		// is replaced once the rollover passes.
		last_quote_date_ = (time_of_day >= rollover_) ? date : date - std::chrono::days{ 1 };

		QOTD_LOG_DEBUG("[daily_quote_provider] Selected quote " + std::to_string(index) + " of " +
					   std::to_string(quotes_.size()));
	}

} // namespace kcenon::qotd::provider
