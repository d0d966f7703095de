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
 * Review.hpp
 *
 * Cleaned (and possibly labeled) review.
 *
 *  Created on: Mar 3, 2021
 *      Author: ans
 */

#ifndef STRUCT_REVIEW_HPP_
#define STRUCT_REVIEW_HPP_

#include "Sentiment.hpp"

#include <cstdint>	// std::uint8_t
#include <optional>	// std::optional
#include <string>	// std::string

namespace reviewlens::Struct {

	//! A cleaned review.
	/*!
	 * Produced by Module::Cleaner. The
	 *  sentiment is attached by
	 *  Module::SentimentScorer.
	 */
	struct Review {
		///@name Properties
		///@{

		//! The ID of the review, unique among the reviews of its product.
		std::string reviewId;

		//! The ID of the product the review belongs to.
		std::string productId;

		//! The rating, from one to five stars.
		std::uint8_t rating{0};

		//! The normalized text of the review.
		std::string text;

		//! Whether the purchase has been verified.
		bool verified{false};

		//! The date of the review in ISO format, if it could be parsed.
		std::optional<std::string> date;

		//! The compound polarity score, from -1 to 1, once scored.
		std::optional<double> sentimentScore;

		//! The sentiment label, once scored.
		std::optional<SentimentLabel> sentimentLabel;

		///@}
	};

} /* namespace reviewlens::Struct */

#endif /* STRUCT_REVIEW_HPP_ */
