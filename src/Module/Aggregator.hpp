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
 * Aggregator.hpp
 *
 * Joins reviews, keywords and product metadata into the comparison table.
 *
 *  Created on: Mar 10, 2021
 *      Author: ans
 */

#ifndef MODULE_AGGREGATOR_HPP_
#define MODULE_AGGREGATOR_HPP_

#include "../Struct/ComparisonRecord.hpp"
#include "../Struct/KeywordEntry.hpp"
#include "../Struct/PipelineSettings.hpp"
#include "../Struct/Product.hpp"
#include "../Struct/Review.hpp"
#include "../Struct/Summary.hpp"

#include <cstddef>	// std::size_t
#include <vector>	// std::vector

namespace reviewlens::Module {

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! The number of decimals of percentages and averages.
	inline constexpr auto aggregateDecimals{2U};

	///@}

	/*
	 * DECLARATION
	 */

	//! Joins reviews, keywords and product metadata into the comparison table.
	/*!
	 * Creates one record per product of the
	 *  product table, including products
	 *  without any reviews.
	 */
	class Aggregator {
	public:
		///@name Construction
		///@{

		explicit Aggregator(std::size_t recordKeywords);

		///@}
		///@name Aggregation
		///@{

		[[nodiscard]] Struct::ComparisonRecord aggregate(
				const Struct::Product& product,
				const std::vector<Struct::Review>& reviews,
				const std::vector<Struct::KeywordEntry>& keywords
		) const;
		[[nodiscard]] std::vector<Struct::ComparisonRecord> aggregateAll(
				const std::vector<Struct::Product>& products,
				const std::vector<Struct::Review>& reviews,
				const std::vector<Struct::KeywordEntry>& keywords,
				Struct::StageSummary& summaryTo
		) const;

		///@}
		///@name Sorting
		///@{

		static void sort(std::vector<Struct::ComparisonRecord>& records);
		[[nodiscard]] static bool isBefore(
				const Struct::ComparisonRecord& record1,
				const Struct::ComparisonRecord& record2
		);

		///@}

	private:
		std::size_t keywordsPerBucket{Struct::defaultRecordKeywords};
	};

} /* namespace reviewlens::Module */

#endif /* MODULE_AGGREGATOR_HPP_ */
