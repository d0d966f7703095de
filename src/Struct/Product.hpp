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
 * Product.hpp
 *
 * Product reference data.
 *
 *  Created on: Mar 3, 2021
 *      Author: ans
 */

#ifndef STRUCT_PRODUCT_HPP_
#define STRUCT_PRODUCT_HPP_

#include <string>	// std::string

namespace reviewlens::Struct {

	//! A product from the product table, i.e. the static reference data of a pipeline run.
	struct Product {
		///@name Properties
		///@{

		//! The unique ID of the product.
		std::string productId;

		//! The brand of the product.
		std::string brand;

		//! The name of the product.
		std::string productName;

		//! The flavor of the product.
		std::string flavor;

		//! The size of the product.
		std::string size;

		//! Free-text notes.
		std::string notes;

		///@}
		///@name Getter
		///@{

		//! Gets the name to be shown for the product.
		/*!
		 * \returns The brand of the product, or
		 *   its ID if no brand has been set.
		 */
		[[nodiscard]] std::string displayName() const {
			const auto begin{this->brand.find_first_not_of(" \t")};

			if(begin == std::string::npos) {
				return this->productId;
			}

			const auto end{this->brand.find_last_not_of(" \t")};

			return this->brand.substr(begin, end - begin + 1);
		}

		///@}
	};

} /* namespace reviewlens::Struct */

#endif /* STRUCT_PRODUCT_HPP_ */
