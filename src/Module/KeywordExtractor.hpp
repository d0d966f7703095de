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
 * KeywordExtractor.hpp
 *
 * Extracts the discriminative terms of a product per sentiment bucket.
 *
 *  Created on: Mar 9, 2021
 *      Author: ans
 */

#ifndef MODULE_KEYWORDEXTRACTOR_HPP_
#define MODULE_KEYWORDEXTRACTOR_HPP_

#include "../Data/KeywordFilter.hpp"
#include "../Data/TfIdf.hpp"
#include "../Data/Tokenizer.hpp"
#include "../Main/Exception.hpp"
#include "../Struct/KeywordEntry.hpp"
#include "../Struct/PipelineSettings.hpp"
#include "../Struct/Product.hpp"
#include "../Struct/Review.hpp"
#include "../Struct/Sentiment.hpp"
#include "../Struct/Summary.hpp"

#include <cstddef>	// std::size_t
#include <string>	// std::string
#include <vector>	// std::vector

namespace reviewlens::Module {

	/*
	 * DECLARATION
	 */

	//! Settings of the keyword extraction.
	struct KeywordSettings {
		//! The minimum number of documents a term needs to occur in.
		std::size_t minDf{Struct::defaultMinDf};

		//! The maximum number of keywords per product and bucket.
		std::size_t topK{Struct::defaultTopK};

		//! The maximum size of the vocabulary of a bucket, or zero for no limit.
		std::size_t maxFeatures{Struct::defaultMaxFeatures};

		//! The maximum number of tokens in a keyword.
		std::size_t nGramMax{Struct::defaultNGramMax};
	};

	//! Extracts the discriminative terms of a product per sentiment bucket.
	/*!
	 * Every review is a document. The overall
	 *  bucket contains all reviews of the
	 *  product, the other buckets the reviews
	 *  with the corresponding sentiment label.
	 *
	 * The filter is not owned and needs to
	 *  outlive the extractor. Neither changes
	 *  after construction, so that the
	 *  extractor can be used by multiple
	 *  threads at once.
	 */
	class KeywordExtractor {
	public:
		///@name Construction
		///@{

		KeywordExtractor(const Data::KeywordFilter& keywordFilter, const KeywordSettings& keywordSettings);

		///@}
		///@name Extraction
		///@{

		[[nodiscard]] std::vector<Struct::KeywordEntry> extract(
				const std::string& productId,
				const std::vector<Struct::Review>& reviews
		) const;
		[[nodiscard]] std::vector<Struct::KeywordEntry> extractAll(
				const std::vector<Struct::Product>& products,
				const std::vector<Struct::Review>& reviews,
				Struct::StageSummary& summaryTo
		) const;

		///@}
		///@name Helper
		///@{

		[[nodiscard]] std::vector<std::string> document(
				const std::string& productId,
				const std::string& text
		) const;

		///@}

		//! Class for keyword extraction exceptions.
		/*!
		 * Will be thrown when the settings
		 *  are invalid.
		 */
		MAIN_EXCEPTION_CLASS();

	private:
		const Data::KeywordFilter& filter;
		KeywordSettings settings;
	};

} /* namespace reviewlens::Module */

#endif /* MODULE_KEYWORDEXTRACTOR_HPP_ */
