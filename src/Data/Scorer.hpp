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
 * Scorer.hpp
 *
 * Interface for sentiment scorers and the VADER-based scorer.
 *
 *  Created on: Mar 6, 2021
 *      Author: ans
 */

#ifndef DATA_SCORER_HPP_
#define DATA_SCORER_HPP_

#include "Sentiment.hpp"

#include "../Struct/Sentiment.hpp"

#include <string>		// std::string
#include <string_view>	// std::string_view

namespace reviewlens::Data {

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! The minimum compound score of a positive text.
	inline constexpr auto positiveThreshold{0.05};

	//! The maximum compound score of a negative text.
	inline constexpr auto negativeThreshold{-0.05};

	///@}

	/*
	 * DECLARATION
	 */

	//! The polarity of a text, as determined by a scorer.
	struct Polarity {
		//! The compound polarity score, from -1 to 1.
		double score{0.};

		//! The sentiment label derived from the score.
		Struct::SentimentLabel label{Struct::SentimentLabel::neutral};
	};

	//! Abstract class for sentiment scorers.
	/*!
	 * Implementations need to be stateless
	 *  while scoring, so that they can be
	 *  used by multiple threads at once.
	 */
	class Scorer {
	public:
		///@name Construction and Destruction
		///@{

		//! Default constructor.
		Scorer() = default;

		//! Default destructor.
		virtual ~Scorer() = default;

		///@}
		///@name Scoring
		///@{

		//! Scores the given text.
		[[nodiscard]] virtual Polarity score(std::string_view text) const = 0;

		///@}
		///@name Labeling
		///@{

		[[nodiscard]] static Struct::SentimentLabel label(double score);

		///@}
		/**@name Copy and Move
		 * The class is neither copyable, nor moveable.
		 */
		///@{

		//! Deleted copy constructor.
		Scorer(Scorer&) = delete;

		//! Deleted copy assignment operator.
		Scorer& operator=(Scorer&) = delete;

		//! Deleted move constructor.
		Scorer(Scorer&&) = delete;

		//! Deleted move assignment operator.
		Scorer& operator=(Scorer&&) = delete;

		///@}
	};

	//! Sentiment scorer using the VADER algorithm.
	class VaderScorer final : public Scorer {
	public:
		///@name Construction
		///@{

		VaderScorer(const std::string& dictionaryFile, const std::string& emojiFile);

		///@}
		///@name Getter
		///@{

		[[nodiscard]] const Sentiment& getAnalyzer() const;

		///@}
		///@name Implemented Scoring
		///@{

		[[nodiscard]] Polarity score(std::string_view text) const override;

		///@}

	private:
		Sentiment analyzer;
	};

	/*
	 * IMPLEMENTATION
	 */

	//! Derives the sentiment label from a compound score.
	/*!
	 * \param score The compound score.
	 *
	 * \returns Positive, if the score is at least
	 *   0.05, negative if it is at most -0.05,
	 *   neutral otherwise.
	 */
	inline Struct::SentimentLabel Scorer::label(double score) {
		if(score >= positiveThreshold) {
			return Struct::SentimentLabel::positive;
		}

		if(score <= negativeThreshold) {
			return Struct::SentimentLabel::negative;
		}

		return Struct::SentimentLabel::neutral;
	}

	//! Constructor loading the dictionaries.
	/*!
	 * \param dictionaryFile Constant reference
	 *   to a string containing the file name of
	 *   the VADER sentiment dictionary.
	 * \param emojiFile Constant reference to a
	 *   string containing the file name of the
	 *   emoji dictionary, or to an empty string
	 *   if no emoji dictionary should be used.
	 *
	 * \throws Sentiment::Exception if one of the
	 *   dictionaries could not be read.
	 */
	inline VaderScorer::VaderScorer(const std::string& dictionaryFile, const std::string& emojiFile)
			: analyzer(dictionaryFile, emojiFile) {}

	//! Gets the underlying analyzer.
	inline const Sentiment& VaderScorer::getAnalyzer() const {
		return this->analyzer;
	}

	//! Scores a text using its VADER compound score.
	/*!
	 * Empty texts are scored neutral,
	 *  with a score of zero.
	 */
	inline Polarity VaderScorer::score(std::string_view text) const {
		Polarity result;

		result.score = this->analyzer.analyze(text).compound;
		result.label = Scorer::label(result.score);

		return result;
	}

} /* namespace reviewlens::Data */

#endif /* DATA_SCORER_HPP_ */
