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
 * Summary.hpp
 *
 * Counts reported by the stages of the pipeline.
 *
 *  Created on: Mar 4, 2021
 *      Author: ans
 */

#ifndef STRUCT_SUMMARY_HPP_
#define STRUCT_SUMMARY_HPP_

#include <cstdint>	// std::uint64_t
#include <map>		// std::map
#include <optional>	// std::optional
#include <string>	// std::string
#include <utility>	// std::pair
#include <vector>	// std::vector

namespace reviewlens::Struct {

	//! Counts collected while cleaning the reviews of one product.
	struct CleaningCounts {
		///@name Properties
		///@{

		//! The number of raw reviews read from the source.
		std::uint64_t input{0};

		//! The number of reviews that survived cleaning.
		std::uint64_t kept{0};

		//! The number of reviews dropped because of missing or too short text.
		std::uint64_t droppedShort{0};

		//! The number of reviews dropped because of a missing or invalid rating.
		std::uint64_t droppedRating{0};

		//! The number of reviews dropped because their ID had already been used.
		std::uint64_t droppedDuplicateId{0};

		//! The number of reviews dropped because their text had already been used.
		std::uint64_t droppedDuplicateText{0};

		//! The number of kept reviews whose date could not be parsed.
		std::uint64_t nullDates{0};

		//! Whether the source of the product could not be read, or was empty.
		bool unreadableSource{false};

		//! The reason why the source could not be read, if any.
		std::optional<std::string> sourceError;

		///@}
		///@name Getter
		///@{

		//! Gets the total number of dropped reviews.
		[[nodiscard]] std::uint64_t dropped() const {
			return this->droppedShort
					+ this->droppedRating
					+ this->droppedDuplicateId
					+ this->droppedDuplicateText;
		}

		///@}
	};

	//! Counts of one stage for one product.
	struct StageCounts {
		//! The number of records kept by the stage.
		std::uint64_t kept{0};

		//! The number of records dropped by the stage.
		std::uint64_t dropped{0};
	};

	//! Summary of one stage of the pipeline.
	struct StageSummary {
		//! The name of the stage.
		std::string stage;

		//! The counts per product, in the order of the product table.
		std::vector<std::pair<std::string, StageCounts>> products;

		//! The number of orphaned records per (unknown) product ID, sorted by ID.
		std::map<std::string, std::uint64_t> orphans;
	};

} /* namespace reviewlens::Struct */

#endif /* STRUCT_SUMMARY_HPP_ */
