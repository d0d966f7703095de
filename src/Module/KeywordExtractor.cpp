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
 * KeywordExtractor.cpp
 *
 * Extracts the discriminative terms of a product per sentiment bucket.
 *
 *  Created on: Mar 9, 2021
 *      Author: ans
 */

#include "KeywordExtractor.hpp"

#include "ProductGroups.hpp"

#include <array>	// std::array
#include <utility>	// std::move

namespace reviewlens::Module {

	//! Constructor.
	/*!
	 * \param keywordFilter Constant reference to
	 *   the immutable configuration of the tokens
	 *   to be removed.
	 * \param keywordSettings Constant reference to
	 *   the settings of the keyword extraction.
	 *
	 * \throws KeywordExtractor::Exception if the
	 *   number of keywords per bucket or the
	 *   maximum number of tokens in a keyword
	 *   is zero.
	 */
	KeywordExtractor::KeywordExtractor(
			const Data::KeywordFilter& keywordFilter,
			const KeywordSettings& keywordSettings
	) : filter(keywordFilter), settings(keywordSettings) {
		if(this->settings.topK == 0) {
			throw Exception("KeywordExtractor(): The number of keywords per bucket is zero");
		}

		if(this->settings.nGramMax == 0) {
			throw Exception("KeywordExtractor(): The maximum number of tokens in a keyword is zero");
		}
	}

	//! Extracts the keywords of a product.
	/*!
	 * \param productId Constant reference to a
	 *   string containing the ID of the product.
	 * \param reviews Constant reference to a
	 *   vector containing the labeled reviews
	 *   of the product.
	 *
	 * \returns The keywords, ordered by bucket
	 *   (overall, positive, neutral, negative)
	 *   and rank. Buckets without reviews or
	 *   qualifying terms have no keywords.
	 */
	std::vector<Struct::KeywordEntry> KeywordExtractor::extract(
			const std::string& productId,
			const std::vector<Struct::Review>& reviews
	) const {
		std::array<std::vector<std::vector<std::string>>, Struct::numBuckets> corpora;

		for(const auto& review : reviews) {
			auto terms{this->document(productId, review.text)};

			if(review.sentimentLabel.has_value()) {
				corpora[static_cast<std::size_t>(Struct::toBucket(review.sentimentLabel.value()))].push_back(terms);
			}

			corpora[static_cast<std::size_t>(Struct::Bucket::overall)].emplace_back(std::move(terms));
		}

		const Data::TfIdf tfIdf(this->settings.minDf, this->settings.maxFeatures);
		std::vector<Struct::KeywordEntry> result;

		for(const auto bucket : Struct::allBuckets) {
			const auto& corpus{corpora[static_cast<std::size_t>(bucket)]};

			if(corpus.empty()) {
				continue;
			}

			std::size_t rank{0};

			for(auto& termWeight : tfIdf.top(corpus, this->settings.topK)) {
				Struct::KeywordEntry entry;

				entry.productId = productId;
				entry.bucket = bucket;
				entry.term = std::move(termWeight.term);
				entry.score = termWeight.weight;
				entry.rank = ++rank;

				result.emplace_back(std::move(entry));
			}
		}

		return result;
	}

	//! Extracts the keywords of all products in the product table.
	/*!
	 * \param products Constant reference to a
	 *   vector containing the product table.
	 * \param reviews Constant reference to a
	 *   vector containing the labeled reviews
	 *   of all products.
	 * \param summaryTo Reference to the summary
	 *   of the stage, to which the number of
	 *   documents per product and the orphaned
	 *   reviews will be written.
	 *
	 * \returns The keywords, ordered by product
	 *   (in the order of the product table),
	 *   bucket and rank.
	 */
	std::vector<Struct::KeywordEntry> KeywordExtractor::extractAll(
			const std::vector<Struct::Product>& products,
			const std::vector<Struct::Review>& reviews,
			Struct::StageSummary& summaryTo
	) const {
		auto groups{groupByProduct(products, reviews)};
		std::vector<Struct::KeywordEntry> result;

		summaryTo.orphans = std::move(groups.orphans);

		for(std::size_t index{0}; index < products.size(); ++index) {
			Struct::StageCounts counts;

			counts.kept = groups.reviews[index].size();

			summaryTo.products.emplace_back(products[index].productId, counts);

			for(auto& entry : this->extract(products[index].productId, groups.reviews[index])) {
				result.emplace_back(std::move(entry));
			}
		}

		return result;
	}

	//! Converts the text of a review into the terms of a document.
	/*!
	 * Splits the text into word tokens, removes
	 *  excluded tokens, and builds the n-grams
	 *  of the remaining tokens.
	 *
	 * \param productId Constant reference to a
	 *   string containing the ID of the product
	 *   the review belongs to.
	 * \param text Constant reference to a string
	 *   containing the text of the review.
	 *
	 * \returns The terms of the document.
	 */
	std::vector<std::string> KeywordExtractor::document(
			const std::string& productId,
			const std::string& text
	) const {
		return Data::Tokenizer::nGrams(
				this->filter.filter(Data::Tokenizer::wordTokens(text), productId),
				this->settings.nGramMax
		);
	}

} /* namespace reviewlens::Module */
