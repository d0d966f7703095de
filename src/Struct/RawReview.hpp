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
 * RawReview.hpp
 *
 * Raw review as read from its source, before cleaning.
 *
 *  Created on: Mar 3, 2021
 *      Author: ans
 */

#ifndef STRUCT_RAWREVIEW_HPP_
#define STRUCT_RAWREVIEW_HPP_

#include <cstddef>	// std::size_t
#include <optional>	// std::optional
#include <string>	// std::string
#include <vector>	// std::vector

namespace reviewlens::Struct {

	//! A raw review, with all fields as found in its source.
	/*!
	 * Missing fields are represented by
	 *  empty optionals. No field has been
	 *  validated yet.
	 */
	struct RawReview {
		//! The number of the row in its source, starting with one.
		std::size_t row{0};

		//! The ID of the review, if given.
		std::optional<std::string> reviewId;

		//! The rating of the review, if given.
		std::optional<std::string> rating;

		//! The text of the review, if given.
		std::optional<std::string> text;

		//! The verified purchase flag of the review, if given.
		std::optional<std::string> verified;

		//! The date of the review, if given.
		std::optional<std::string> date;
	};

	//! All raw reviews of one product.
	struct RawReviewSet {
		//! The ID of the product the reviews belong to.
		std::string productId;

		//! The name of the source the reviews have been read from.
		std::string source;

		//! The error that occured while reading the source, if any.
		/*!
		 * If set, the source could not be
		 *  read, and the set contains no
		 *  reviews.
		 */
		std::optional<std::string> error;

		//! The raw reviews, in the order of their source.
		std::vector<RawReview> reviews;
	};

} /* namespace reviewlens::Struct */

#endif /* STRUCT_RAWREVIEW_HPP_ */
