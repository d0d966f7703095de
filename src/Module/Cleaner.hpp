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
 * Cleaner.hpp
 *
 * Normalizes and filters the raw reviews of a product.
 *
 *  Created on: Mar 8, 2021
 *      Author: ans
 */

#ifndef MODULE_CLEANER_HPP_
#define MODULE_CLEANER_HPP_

#include "../Helper/DateTime.hpp"
#include "../Helper/Strings.hpp"
#include "../Helper/Utf8.hpp"
#include "../Struct/PipelineSettings.hpp"
#include "../Struct/RawReview.hpp"
#include "../Struct/Review.hpp"
#include "../Struct/Summary.hpp"

#include <boost/lexical_cast.hpp>

#include <cstddef>			// std::size_t
#include <cstdint>			// std::uint8_t
#include <optional>			// std::optional
#include <string>			// std::string
#include <string_view>		// std::string_view
#include <vector>			// std::vector

namespace reviewlens::Module {

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! The lowest valid rating.
	inline constexpr auto minRating{1.};

	//! The highest valid rating.
	inline constexpr auto maxRating{5.};

	///@}

	/*
	 * DECLARATION
	 */

	//! The cleaned reviews of one product.
	struct CleanedReviews {
		//! The ID of the product.
		std::string productId;

		//! The cleaned reviews, in the order of their source.
		std::vector<Struct::Review> reviews;

		//! The counts collected while cleaning.
		Struct::CleaningCounts counts;
	};

	//! Normalizes and filters the raw reviews of a product.
	/*!
	 * Malformed reviews are dropped and
	 *  counted, but never abort cleaning.
	 *  Cleaning already cleaned reviews
	 *  does not change them.
	 *
	 * Does not change after construction,
	 *  and can be used by multiple threads
	 *  at once.
	 */
	class Cleaner {
	public:
		///@name Construction
		///@{

		explicit Cleaner(std::size_t minLength);

		///@}
		///@name Cleaning
		///@{

		[[nodiscard]] CleanedReviews clean(const Struct::RawReviewSet& source) const;

		///@}
		///@name Normalization
		///@{

		[[nodiscard]] static std::string normalizeText(std::string_view text);
		[[nodiscard]] static std::optional<std::uint8_t> parseRating(std::string_view rating);
		[[nodiscard]] static std::string makeReviewId(const std::string& productId, std::size_t row);

		///@}

	private:
		std::size_t minTextLength{Struct::defaultMinLength};
	};

} /* namespace reviewlens::Module */

#endif /* MODULE_CLEANER_HPP_ */
