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
 * Sentiment.hpp
 *
 * Sentiment labels and keyword buckets.
 *
 *  Created on: Mar 3, 2021
 *      Author: ans
 */

#ifndef STRUCT_SENTIMENT_HPP_
#define STRUCT_SENTIMENT_HPP_

#include <array>		// std::array
#include <cstdint>		// std::uint8_t
#include <string_view>	// std::string_view, std::string_view_literals

namespace reviewlens::Struct {

	using std::string_view_literals::operator""sv;

	//! The categorical sentiment of a review.
	enum class SentimentLabel : std::uint8_t {
		positive = 0,
		neutral,
		negative
	};

	//! A group of reviews of the same product, used for keyword extraction.
	/*!
	 * The order of the enumerators is the
	 *  order in which buckets are written.
	 */
	enum class Bucket : std::uint8_t {
		overall = 0,
		positive,
		neutral,
		negative
	};

	//! All buckets, in output order.
	inline constexpr std::array allBuckets{
		Bucket::overall,
		Bucket::positive,
		Bucket::neutral,
		Bucket::negative
	};

	//! The number of buckets.
	inline constexpr auto numBuckets{allBuckets.size()};

	//! Gets the name of a sentiment label.
	inline constexpr std::string_view toString(SentimentLabel label) {
		switch(label) {
		case SentimentLabel::positive:
			return "positive"sv;

		case SentimentLabel::neutral:
			return "neutral"sv;

		case SentimentLabel::negative:
			return "negative"sv;
		}

		return ""sv;
	}

	//! Gets the name of a bucket.
	inline constexpr std::string_view toString(Bucket bucket) {
		switch(bucket) {
		case Bucket::overall:
			return "overall"sv;

		case Bucket::positive:
			return "positive"sv;

		case Bucket::neutral:
			return "neutral"sv;

		case Bucket::negative:
			return "negative"sv;
		}

		return ""sv;
	}

	//! Gets the bucket of reviews with the given sentiment label.
	inline constexpr Bucket toBucket(SentimentLabel label) {
		switch(label) {
		case SentimentLabel::positive:
			return Bucket::positive;

		case SentimentLabel::neutral:
			return Bucket::neutral;

		case SentimentLabel::negative:
			return Bucket::negative;
		}

		return Bucket::overall;
	}

} /* namespace reviewlens::Struct */

#endif /* STRUCT_SENTIMENT_HPP_ */
