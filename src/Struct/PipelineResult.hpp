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
 * PipelineResult.hpp
 *
 * Results of a pipeline run.
 *
 *  Created on: Mar 11, 2021
 *      Author: ans
 */

#ifndef STRUCT_PIPELINERESULT_HPP_
#define STRUCT_PIPELINERESULT_HPP_

#include "ComparisonRecord.hpp"
#include "KeywordEntry.hpp"
#include "Product.hpp"
#include "Review.hpp"
#include "Summary.hpp"

#include <vector>	// std::vector

namespace reviewlens::Struct {

	//! Results of a pipeline run, recomputed on every run.
	struct PipelineResult {
		//! The product table.
		std::vector<Product> products;

		//! The counts of the cleaning stage, in the order of the product table.
		std::vector<CleaningCounts> cleaning;

		//! The cleaned and labeled reviews, in the order of the product table.
		std::vector<Review> reviews;

		//! The keyword table, in the order of the product table.
		std::vector<KeywordEntry> keywords;

		//! The comparison table, sorted by descending score.
		std::vector<ComparisonRecord> comparison;

		//! The summaries of all stages, in the order they were run.
		std::vector<StageSummary> stages;
	};

} /* namespace reviewlens::Struct */

#endif /* STRUCT_PIPELINERESULT_HPP_ */
