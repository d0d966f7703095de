/*
 *
 * ---
 *
 *  Copyright (C) 2021 Anselm Schmidt (ans[ät]ohai.su)
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version in addition to the terms of any
 *  licences already herein identified.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program. If not, see <https://www.gnu.org/licenses/>.
 *
 * ---
 *
 * DateTime.hpp
 *
 * Namespace for global date/time helper functions.
 *
 *  Created on: Mar 1, 2021
 *      Author: ans
 */

#ifndef HELPER_DATETIME_HPP_
#define HELPER_DATETIME_HPP_

#include "Strings.hpp"

#include <date/date.h>

#include <algorithm>	// std::all_of
#include <array>		// std::array
#include <cctype>		// std::isdigit, std::ispunct, std::isspace
#include <chrono>		// std::chrono::seconds, std::chrono::system_clock
#include <cstddef>		// std::size_t
#include <optional>		// std::optional, std::nullopt
#include <sstream>		// std::istringstream
#include <string>		// std::stoll, std::string
#include <string_view>	// std::string_view, std::string_view_literals

//! Namespace for global date/time helper functions.
namespace reviewlens::Helper::DateTime {

	/*
	 * CONSTANTS
	 */

	using std::string_view_literals::operator""sv;

	///@name Constants
	///@{

	//! The ISO format for dates (@c YYYY-MM-DD).
	inline constexpr auto isoDate{"%F"};

	//! The length of a date in valid ISO Format (@c YYYY-MM-DD).
	inline constexpr auto isoDateLength{10};

	//! An array containing English ordinal suffixes to be stripped from numbers.
	inline constexpr std::array englishOrdinalSuffixes{"st"sv, "nd"sv, "rd"sv, "th"sv};

	//! The formats tried, in this order, when parsing the date of a review.
	/*!
	 * Numeric dates with slashes are
	 *  interpreted as US dates
	 *  (month first).
	 */
	inline constexpr std::array reviewDateFormats{
		"%Y-%m-%d"sv,
		"%Y-%m-%dT%H:%M:%S"sv,
		"%Y-%m-%dT%H:%M:%SZ"sv,
		"%Y-%m-%d %H:%M:%S"sv,
		"%m %d, %Y"sv,			// "01 5, 2018" (Amazon review dumps)
		"%b %d, %Y"sv,			// "Jan 5, 2018", "January 5, 2018"
		"%d %b %Y"sv,			// "5 January 2018"
		"%m/%d/%Y"sv,
		"%Y/%m/%d"sv,
		"%d.%m.%Y"sv
	};

	//! The minimum number of digits of a UNIX time stamp to be accepted as review date.
	inline constexpr auto unixTimeMinDigits{9};

	//! The maximum number of digits of a UNIX time stamp to be accepted as review date.
	inline constexpr auto unixTimeMaxDigits{10};

	///@}

	/*
	 * DECLARATION
	 */

	///@name Conversion
	///@{

	[[nodiscard]] std::optional<std::string> toIsoDate(std::string_view dateString);

	///@}
	///@name Verification
	///@{

	[[nodiscard]] bool isValidISODate(const std::string& isoDate);

	///@}
	///@name Helpers
	///@{

	template<std::size_t N>
	void removeOrdinals(
			const std::array<std::string_view, N>& suffixes,
			std::string& strInOut
	);
	[[nodiscard]] bool isUnixTime(std::string_view str);

	///@}

	/*
	 * IMPLEMENTATION
	 */

	/*
	 * CONVERSION
	 */

	//! Converts the date of a review into an ISO date.
	/*!
	 * Accepts the formats listed in
	 *  reviewDateFormats, as well as UNIX
	 *  time stamps (in seconds).
	 *
	 * English ordinal suffixes (e.g.
	 *  "5th") will be ignored. The whole
	 *  string needs to be consumed by the
	 *  format, otherwise the next format
	 *  will be tried.
	 *
	 * \param dateString View of the string
	 *   containing the date to be converted.
	 *
	 * \returns The date in ISO format
	 *   (@c YYYY-MM-DD), or an empty optional
	 *   if the string could not be parsed.
	 */
	inline std::optional<std::string> toIsoDate(std::string_view dateString) {
		std::string dateCopy(dateString);

		Strings::trim(dateCopy);

		if(dateCopy.empty()) {
			return std::nullopt;
		}

		if(isUnixTime(dateCopy)) {
			const std::chrono::seconds seconds{std::stoll(dateCopy)};

			return date::format(
					isoDate,
					date::floor<date::days>(
							std::chrono::system_clock::time_point(seconds)
					)
			);
		}

		removeOrdinals(englishOrdinalSuffixes, dateCopy);

		for(const auto format : reviewDateFormats) {
			std::istringstream in(dateCopy);
			date::sys_seconds tp;

			in >> date::parse(std::string(format), tp);

			if(!in) {
				continue;
			}

			if(in.peek() != std::istringstream::traits_type::eof()) {
				// not the whole string has been consumed
				continue;
			}

			return date::format(isoDate, date::floor<date::days>(tp));
		}

		return std::nullopt;
	}

	/*
	 * VERIFICATION
	 */

	//! Checks whether the given string contains a valid date in ISO format (@c YYYY-MM-DD).
	inline bool isValidISODate(const std::string& isoDate) {
		if(isoDate.length() != isoDateLength) {
			return false;
		}

		std::istringstream in(isoDate);
		date::sys_days tp;

		in >> date::parse("%F", tp);

		return bool(in);
	}

	/*
	 * HELPERS
	 */

	//! Removes ordinal suffixes directly following a number.
	/*!
	 * \param suffixes Constant reference to an
	 *   array of suffixes to remove.
	 * \param strInOut Reference to the string
	 *   from which the suffixes will be removed
	 *   in-situ.
	 */
	template<std::size_t N> void removeOrdinals(
			const std::array<std::string_view, N>& suffixes,
			std::string& strInOut
	) {
		std::size_t pos{0};

		while(pos < strInOut.length()) {
			auto next{std::string::npos};
			std::size_t len{0};

			for(const auto& suffix : suffixes) {
				const auto search{strInOut.find(suffix, pos)};

				if(search < next) {
					next = search;
					len = suffix.length();
				}
			}

			pos = next;

			if(pos == std::string::npos) {
				break;
			}

			const auto end{pos + len};

			if(
					pos > 0
					&& std::isdigit(static_cast<unsigned char>(strInOut.at(pos - 1))) != 0
					&& (
							end == strInOut.length()
							|| std::isspace(static_cast<unsigned char>(strInOut.at(end))) != 0
							|| std::ispunct(static_cast<unsigned char>(strInOut.at(end))) != 0
					)
			) {
				// remove st, nd, rd or th
				strInOut.erase(pos, len);
			}
			else {
				pos += len;
			}
		}
	}

	//! Checks whether a string looks like a UNIX time stamp in seconds.
	inline bool isUnixTime(std::string_view str) {
		if(str.length() < unixTimeMinDigits || str.length() > unixTimeMaxDigits) {
			return false;
		}

		return std::all_of(str.cbegin(), str.cend(), [](const char c) {
			return std::isdigit(static_cast<unsigned char>(c)) != 0;
		});
	}

} /* namespace reviewlens::Helper::DateTime */

#endif /* HELPER_DATETIME_HPP_ */
