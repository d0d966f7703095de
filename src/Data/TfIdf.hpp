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
 * TfIdf.hpp
 *
 * Term weighting by TF-IDF over a corpus of documents.
 *
 *  Created on: Mar 7, 2021
 *      Author: ans
 */

#ifndef DATA_TFIDF_HPP_
#define DATA_TFIDF_HPP_

#include <algorithm>	// std::min, std::sort
#include <cmath>		// std::log, std::sqrt
#include <cstddef>		// std::size_t
#include <map>			// std::map
#include <string>		// std::string
#include <utility>		// std::move, std::pair
#include <vector>		// std::vector

namespace reviewlens::Data {

	/*
	 * DECLARATION
	 */

	//! A term with its accumulated weight.
	struct TermWeight {
		//! The term.
		std::string term;

		//! The sum of the normalized TF-IDF weights of the term over all documents.
		double weight{0.};
	};

	//! Term weighting by TF-IDF over a corpus of documents.
	/*!
	 * Each document is a list of terms. The
	 *  inverse document frequency of a term is
	 *  smoothed as @c ln((1+n)/(1+df))+1, and
	 *  the weights of each document are
	 *  L2-normalized before they are summed up.
	 *
	 * Iteration is ordered, so that the result
	 *  does not depend on the order of hashing.
	 */
	class TfIdf {
	public:
		///@name Construction
		///@{

		TfIdf(std::size_t minDf, std::size_t maxFeatures);

		///@}
		///@name Computation
		///@{

		[[nodiscard]] std::vector<TermWeight> top(
				const std::vector<std::vector<std::string>>& documents,
				std::size_t k
		) const;
		[[nodiscard]] std::vector<std::string> vocabulary(
				const std::vector<std::vector<std::string>>& documents
		) const;

		///@}

	private:
		std::size_t minDocs{0};
		std::size_t maxTerms{0};
	};

	/*
	 * IMPLEMENTATION
	 */

	//! Constructor.
	/*!
	 * \param minDf The minimum number of
	 *   documents a term needs to occur in.
	 * \param maxFeatures The maximum number
	 *   of terms kept in the vocabulary, or
	 *   zero for no limit.
	 */
	inline TfIdf::TfIdf(std::size_t minDf, std::size_t maxFeatures)
			: minDocs(minDf), maxTerms(maxFeatures) {}

	//! Gets the vocabulary of a corpus.
	/*!
	 * Terms occuring in fewer documents than
	 *  required are removed. If the vocabulary
	 *  is still too large, only the terms with
	 *  the highest frequency in the corpus are
	 *  kept, ties broken by lexical order.
	 *
	 * \param documents Constant reference to a
	 *   vector containing the terms of each
	 *   document.
	 *
	 * \returns The terms of the vocabulary,
	 *   sorted lexically.
	 */
	inline std::vector<std::string> TfIdf::vocabulary(
			const std::vector<std::vector<std::string>>& documents
	) const {
		std::map<std::string, std::pair<std::size_t, std::size_t>> counts; // term -> [df, cf]

		for(const auto& document : documents) {
			std::map<std::string, std::size_t> inDocument;

			for(const auto& term : document) {
				++inDocument[term];
			}

			for(const auto& [term, count] : inDocument) {
				auto& termCounts{counts[term]};

				++termCounts.first;

				termCounts.second += count;
			}
		}

		std::vector<std::pair<std::string, std::size_t>> candidates;

		for(const auto& [term, termCounts] : counts) {
			if(termCounts.first >= this->minDocs) {
				candidates.emplace_back(term, termCounts.second);
			}
		}

		if(this->maxTerms > 0 && candidates.size() > this->maxTerms) {
			std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
				if(a.second != b.second) {
					return a.second > b.second;
				}

				return a.first < b.first;
			});

			candidates.resize(this->maxTerms);
		}

		std::vector<std::string> result;

		result.reserve(candidates.size());

		for(auto& candidate : candidates) {
			result.emplace_back(std::move(candidate.first));
		}

		std::sort(result.begin(), result.end());

		return result;
	}

	//! Gets the terms with the highest weight in a corpus.
	/*!
	 * \param documents Constant reference to a
	 *   vector containing the terms of each
	 *   document.
	 * \param k The maximum number of terms
	 *   to return.
	 *
	 * \returns Up to @c k terms, sorted by
	 *   descending weight, ties broken by
	 *   lexical order. Empty if the corpus
	 *   does not contain any term that
	 *   occurs in enough documents.
	 */
	inline std::vector<TermWeight> TfIdf::top(
			const std::vector<std::vector<std::string>>& documents,
			std::size_t k
	) const {
		const auto terms{this->vocabulary(documents)};

		if(terms.empty() || k == 0) {
			return {};
		}

		// document frequencies of the vocabulary
		std::map<std::string, std::size_t> df;

		for(const auto& term : terms) {
			df.emplace(term, 0);
		}

		for(const auto& document : documents) {
			std::map<std::string, std::size_t> inDocument;

			for(const auto& term : document) {
				if(df.count(term) > 0) {
					++inDocument[term];
				}
			}

			for(const auto& entry : inDocument) {
				++df[entry.first];
			}
		}

		const auto n{static_cast<double>(documents.size())};
		std::map<std::string, double> weights;

		for(const auto& term : terms) {
			weights.emplace(term, 0.);
		}

		for(const auto& document : documents) {
			std::map<std::string, double> vector;

			for(const auto& term : document) {
				if(df.count(term) > 0) {
					vector[term] += 1.;
				}
			}

			double squares{0.};

			for(auto& [term, value] : vector) {
				value *= std::log((1. + n) / (1. + static_cast<double>(df[term]))) + 1.;

				squares += value * value;
			}

			if(squares <= 0.) {
				continue;
			}

			const auto norm{std::sqrt(squares)};

			for(const auto& [term, value] : vector) {
				weights[term] += value / norm;
			}
		}

		std::vector<TermWeight> result;

		result.reserve(weights.size());

		for(const auto& [term, weight] : weights) {
			result.push_back(TermWeight{term, weight});
		}

		std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
			if(a.weight != b.weight) {
				return a.weight > b.weight;
			}

			return a.term < b.term;
		});

		result.resize(std::min(result.size(), k));

		return result;
	}

} /* namespace reviewlens::Data */

#endif /* DATA_TFIDF_HPP_ */
