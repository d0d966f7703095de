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
 * ComparisonRecord.hpp
 *
 * Per-product record of the comparison table.
 *
 *  Created on: Mar 4, 2021
 *      Author: ans
 */

#ifndef STRUCT_COMPARISONRECORD_HPP_
#define STRUCT_COMPARISONRECORD_HPP_

#include "KeywordEntry.hpp"
#include "Product.hpp"
#include "Sentiment.hpp"

#include <array>	// std::array
#include <cstdint>	// std::uint64_t
#include <optional>	// std::optional
#include <string>	// std::string
#include <utility>	// std::pair
#include <vector>	// std::vector

namespace reviewlens::Struct {

	//! The number of different ratings (one to five stars).
	inline constexpr auto numRatings{5};

	//! A keyword as attached to a comparison record.
	using RecordKeyword = std::pair<std::string, double>;

	//! The comparison of one product, the final output of the pipeline.
	/*!
	 * All percentages are rounded to the same
	 *  number of decimal places. They are
	 *  empty if the product has no reviews.
	 */
	struct ComparisonRecord {
		///@name Product
		///@{

		//! The product the record belongs to.
		Product product;

		///@}
		///@name Metrics
		///@{

		//! The number of cleaned reviews of the product.
		std::uint64_t reviewCount{0};

		//! The number of reviews per rating, from one (index 0) to five stars (index 4).
		std::array<std::uint64_t, numRatings> ratingDistribution{};

		//! The share of reviews per rating in percent, from one (index 0) to five stars (index 4).
		std::array<std::optional<double>, numRatings> ratingPercentages{};

		//! The mean rating.
		std::optional<double> avgRating;

		//! The share of positive reviews in percent.
		std::optional<double> pctPositive;

		//! The share of neutral reviews in percent.
		std::optional<double> pctNeutral;

		//! The share of negative reviews in percent.
		std::optional<double> pctNegative;

		//! The share of reviews with verified purchase in percent.
		std::optional<double> pctVerified;

		//! The mean length of the normalized review texts, in characters.
		std::optional<double> avgLength;

		//! The composite score, i.e. the share of positive minus the share of negative reviews.
		std::optional<double> score;

		///@}
		///@name Keywords
		///@{

		//! The top keywords with their scores, per bucket (in the order of Struct::allBuckets).
		std::array<std::vector<RecordKeyword>, numBuckets> keywords;

		///@}
	};

} /* namespace reviewlens::Struct */

#endif /* STRUCT_COMPARISONRECORD_HPP_ */
