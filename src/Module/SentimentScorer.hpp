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
 * SentimentScorer.hpp
 *
 * Attaches sentiment scores and labels to cleaned reviews.
 *
 *  Created on: Mar 9, 2021
 *      Author: ans
 */

#ifndef MODULE_SENTIMENTSCORER_HPP_
#define MODULE_SENTIMENTSCORER_HPP_

#include "../Data/Scorer.hpp"
#include "../Struct/Review.hpp"

#include <vector>	// std::vector

namespace reviewlens::Module {

	/*
	 * DECLARATION
	 */

	//! Attaches sentiment scores and labels to cleaned reviews.
	/*!
	 * Uses any implementation of Data::Scorer.
	 *  The scorer is not owned and needs to
	 *  outlive the sentiment scorer.
	 */
	class SentimentScorer {
	public:
		///@name Construction
		///@{

		explicit SentimentScorer(const Data::Scorer& scorerToUse);

		///@}
		///@name Scoring
		///@{

		void score(Struct::Review& review) const;
		void score(std::vector<Struct::Review>& reviews) const;

		///@}

	private:
		const Data::Scorer& scorer;
	};

} /* namespace reviewlens::Module */

#endif /* MODULE_SENTIMENTSCORER_HPP_ */
