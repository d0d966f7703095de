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
 * KeywordEntry.hpp
 *
 * Entry in the keyword table.
 *
 *  Created on: Mar 4, 2021
 *      Author: ans
 */

#ifndef STRUCT_KEYWORDENTRY_HPP_
#define STRUCT_KEYWORDENTRY_HPP_

#include "Sentiment.hpp"

#include <cstddef>	// std::size_t
#include <string>	// std::string

namespace reviewlens::Struct {

	//! A discriminative term of a product in a specific bucket.
	struct KeywordEntry {
		//! The ID of the product.
		std::string productId;

		//! The bucket of reviews the term has been extracted from.
		Bucket bucket{Bucket::overall};

		//! The term, i.e. a token or an n-gram of tokens separated by spaces.
		std::string term;

		//! The TF-IDF weight of the term.
		double score{0.};

		//! The position of the term inside its bucket, starting with one.
		std::size_t rank{0};
	};

} /* namespace reviewlens::Struct */

#endif /* STRUCT_KEYWORDENTRY_HPP_ */
