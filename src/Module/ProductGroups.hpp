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
 * ProductGroups.hpp
 *
 * Groups reviews by the products of the product table.
 *
 *  Created on: Mar 9, 2021
 *      Author: ans
 */

#ifndef MODULE_PRODUCTGROUPS_HPP_
#define MODULE_PRODUCTGROUPS_HPP_

#include "../Struct/Product.hpp"
#include "../Struct/Review.hpp"

#include <cstddef>			// std::size_t
#include <cstdint>			// std::uint64_t
#include <map>				// std::map
#include <string>			// std::string
#include <unordered_map>	// std::unordered_map
#include <vector>			// std::vector

namespace reviewlens::Module {

	/*
	 * DECLARATION
	 */

	//! Reviews grouped by the products of the product table.
	struct ProductGroups {
		//! The reviews of each product, in the order of the product table.
		std::vector<std::vector<Struct::Review>> reviews;

		//! The number of reviews per unknown product ID, sorted by ID.
		std::map<std::string, std::uint64_t> orphans;
	};

	[[nodiscard]] ProductGroups groupByProduct(
			const std::vector<Struct::Product>& products,
			const std::vector<Struct::Review>& reviews
	);

	/*
	 * IMPLEMENTATION
	 */

	//! Groups reviews by the products of the product table.
	/*!
	 * Reviews keep their relative order.
	 *  Reviews referencing a product that is
	 *  not part of the product table are
	 *  counted as orphaned.
	 *
	 * \param products Constant reference to the
	 *   product table.
	 * \param reviews Constant reference to the
	 *   reviews of all products.
	 *
	 * \returns The grouped reviews.
	 */
	inline ProductGroups groupByProduct(
			const std::vector<Struct::Product>& products,
			const std::vector<Struct::Review>& reviews
	) {
		ProductGroups result;
		std::unordered_map<std::string, std::size_t> indices;

		result.reviews.resize(products.size());

		for(std::size_t index{0}; index < products.size(); ++index) {
			indices.emplace(products[index].productId, index);
		}

		for(const auto& review : reviews) {
			const auto it{indices.find(review.productId)};

			if(it == indices.end()) {
				++result.orphans[review.productId];

				continue;
			}

			result.reviews[it->second].push_back(review);
		}

		return result;
	}

} /* namespace reviewlens::Module */

#endif /* MODULE_PRODUCTGROUPS_HPP_ */
