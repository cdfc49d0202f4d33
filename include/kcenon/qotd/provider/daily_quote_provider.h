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

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "kcenon/qotd/provider/quote_provider.h"

namespace kcenon::qotd::provider
{
	/*!
	 * \class daily_quote_provider
	 * \brief Rotates through a quote pool, changing the quote once per day.
	 *
	 * The day starts at the rollover time of day, measured in a fixed UTC
	 * offset zone. The first call picks a quote immediately; later calls
	 * switch to a different random quote once the next rollover has passed.
	 * A pool of one quote always yields that quote.
	 *
	 * ### Thread Safety
	 * All methods are thread-safe.
	 */
	class daily_quote_provider : public quote_provider
	{
	public:
		using clock_function = std::function<std::chrono::system_clock::time_point()>;

		/*!
		 * \param quotes Non-empty pool of non-empty quotes
		 * \param rollover Time of day the quote changes; values outside [0, 24h) mean midnight
		 * \param utc_offset Offset of the zone the rollover is measured in
		 * \param clock Time source, std::chrono::system_clock::now when empty
		 * \param seed Seed for quote selection, random when not given
		 * \throws std::invalid_argument if the pool or one of its quotes is empty
		 */
		explicit daily_quote_provider(std::vector<std::string> quotes,
									  std::chrono::seconds rollover = std::chrono::seconds{ 0 },
									  std::chrono::minutes utc_offset = std::chrono::minutes{ 0 },
									  clock_function clock = {},
									  std::optional<std::uint32_t> seed = std::nullopt);

		/*!
		 * \brief Returns today's quote, rolling over first if a new day began.
		 */
		auto get_quote() -> std::string;

		auto get_quote(const asio::ip::address& remote,
					   std::stop_token token,
					   quote_handler handler) -> void override;

		auto rollover() const -> std::chrono::seconds { return rollover_; }

		auto quote_count() const -> std::size_t { return quotes_.size(); }

	private:
		auto try_generate_new_quote() -> void;

		auto update_quote(std::chrono::sys_days date, std::chrono::seconds time_of_day) -> void;

		const std::vector<std::string> quotes_;
		const std::chrono::seconds rollover_;
		const std::chrono::minutes utc_offset_;
		clock_function clock_;

		std::mutex mutex_;
		std::mt19937 random_;
		std::optional<std::size_t> current_index_;
		std::optional<std::chrono::sys_days> last_quote_date_;
	};

} // namespace kcenon::qotd::provider
