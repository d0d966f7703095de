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
 * Math.hpp
 *
 * Namespace for global math functions.
 *
 *  Created on: Mar 1, 2021
 *      Author: ans
 */

#ifndef HELPER_MATH_HPP_
#define HELPER_MATH_HPP_

#include <cmath>		// std::pow, std::round
#include <cstdint>		// std::uint64_t
#include <optional>		// std::optional

//! Namespace for global math functions.
namespace reviewlens::Helper::Math {

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! The factor for converting a fraction into a percentage.
	inline constexpr auto percentageFactor{100.};

	///@}

	/*
	 * DECLARATION
	 */

	///@name Rounding
	///@{

	[[nodiscard]] double round(double value, unsigned int decimals);

	///@}
	///@name Shares
	///@{

	[[nodiscard]] std::optional<double> percentage(
			std::uint64_t count,
			std::uint64_t total,
			unsigned int decimals
	);

	///@}

	/*
	 * IMPLEMENTATION
	 */

	//! Rounds a value to the given number of decimal places, half away from zero.
	inline double round(double value, unsigned int decimals) {
		const auto factor{std::pow(10., decimals)};
		const auto result{std::round(value * factor) / factor};

		// avoid negative zero
		if(result == 0.) {
			return 0.;
		}

		return result;
	}

	//! Calculates a rounded percentage.
	/*!
	 * \param count The number of matching elements.
	 * \param total The total number of elements.
	 * \param decimals The number of decimal places
	 *   to round the result to.
	 *
	 * \returns The share of @c count in @c total in
	 *   percent, rounded to the given number of
	 *   decimal places, or an empty optional if
	 *   @c total is zero.
	 */
	inline std::optional<double> percentage(
			std::uint64_t count,
			std::uint64_t total,
			unsigned int decimals
	) {
		if(total == 0) {
			return std::nullopt;
		}

		return Math::round(
				static_cast<double>(count) / static_cast<double>(total) * percentageFactor,
				decimals
		);
	}

} /* namespace reviewlens::Helper::Math */

#endif /* HELPER_MATH_HPP_ */
