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
 * SentimentScorer.cpp
 *
 * Attaches sentiment scores and labels to cleaned reviews.
 *
 *  Created on: Mar 9, 2021
 *      Author: ans
 */

#include "SentimentScorer.hpp"

#include "../Data/Sentiment.hpp"

namespace reviewlens::Module {

	//! Constructor setting the scorer to be used.
	/*!
	 * \param scorerToUse Constant reference to
	 *   the scorer to be used.
	 */
	SentimentScorer::SentimentScorer(const Data::Scorer& scorerToUse) : scorer(scorerToUse) {}

	//! Scores a single review.
	/*!
	 * Reviews without text, or with text the
	 *  scorer cannot process (e.g. invalid
	 *  UTF-8), are scored neutral, with a
	 *  score of zero.
	 *
	 * \param review Reference to the review to
	 *   which the score and label will be
	 *   attached.
	 */
	void SentimentScorer::score(Struct::Review& review) const {
		review.sentimentScore = 0.;
		review.sentimentLabel = Struct::SentimentLabel::neutral;

		if(review.text.empty()) {
			return;
		}

		try {
			const auto polarity{this->scorer.score(review.text)};

			review.sentimentScore = polarity.score;
			review.sentimentLabel = polarity.label;
		}
		catch(const Data::Sentiment::Exception&) {
			// malformed text: keep the neutral score
		}
	}

	//! Scores all the given reviews.
	void SentimentScorer::score(std::vector<Struct::Review>& reviews) const {
		for(auto& review : reviews) {
			this->score(review);
		}
	}

} /* namespace reviewlens::Module */
