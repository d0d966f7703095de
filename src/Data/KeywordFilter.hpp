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
 * KeywordFilter.hpp
 *
 * Immutable configuration of the tokens to be removed before keyword extraction.
 *
 *  Created on: Mar 6, 2021
 *      Author: ans
 */

#ifndef DATA_KEYWORDFILTER_HPP_
#define DATA_KEYWORDFILTER_HPP_

#include "StopWords.hpp"
#include "Tokenizer.hpp"

#include "../Helper/Strings.hpp"
#include "../Struct/Product.hpp"

#include <algorithm>			// std::remove_if, std::sort
#include <initializer_list>	// std::initializer_list
#include <string>			// std::string
#include <unordered_map>	// std::unordered_map
#include <unordered_set>	// std::unordered_set
#include <utility>			// std::move
#include <vector>			// std::vector

namespace reviewlens::Data {

	/*
	 * DECLARATION
	 */

	//! Immutable configuration of the tokens to be removed before keyword extraction.
	/*!
	 * Removes the standard English stopwords,
	 *  additional stopwords, and the tokens of
	 *  the brand and product name of the
	 *  product the keywords are extracted for.
	 *
	 * If brands are filtered globally, the
	 *  brand and product name tokens of all
	 *  products will be removed instead.
	 *
	 * Not changed after construction, so that
	 *  it can be shared by multiple threads.
	 */
	class KeywordFilter {
	public:
		///@name Construction
		///@{

		KeywordFilter(
				const std::vector<std::string>& extraStopWords,
				const std::vector<Struct::Product>& products,
				bool filterAllBrands
		);

		///@}
		///@name Getters
		///@{

		[[nodiscard]] bool isStopWord(const std::string& token) const;
		[[nodiscard]] bool isBrandToken(const std::string& token, const std::string& productId) const;
		[[nodiscard]] bool isExcluded(const std::string& token, const std::string& productId) const;
		[[nodiscard]] std::vector<std::string> getBrandTokens(const std::string& productId) const;

		///@}
		///@name Filtering
		///@{

		[[nodiscard]] std::vector<std::string> filter(
				std::vector<std::string> tokens,
				const std::string& productId
		) const;

		///@}

	private:
		std::unordered_set<std::string> extra;
		std::unordered_map<std::string, std::unordered_set<std::string>> brands;
		std::unordered_set<std::string> allBrands;
		bool all{false};
	};

	/*
	 * IMPLEMENTATION
	 */

	/*
	 * CONSTRUCTION
	 */

	//! Constructor.
	/*!
	 * \param extraStopWords Constant reference to a
	 *   vector containing additional stopwords.
	 *   They will be trimmed and converted to
	 *   lower case.
	 * \param products Constant reference to a
	 *   vector containing the product table.
	 * \param filterAllBrands Set whether to remove
	 *   the brand and product name tokens of all
	 *   products from the keywords of every
	 *   product.
	 */
	inline KeywordFilter::KeywordFilter(
			const std::vector<std::string>& extraStopWords,
			const std::vector<Struct::Product>& products,
			bool filterAllBrands
	) : all(filterAllBrands) {
		for(const auto& word : extraStopWords) {
			auto lower{Helper::Strings::toLowerCopy(word)};

			Helper::Strings::trim(lower);

			if(!lower.empty()) {
				this->extra.emplace(std::move(lower));
			}
		}

		for(const auto& product : products) {
			auto& tokens{this->brands[product.productId]};

			for(const auto& name : { product.brand, product.productName }) {
				// names like "fancy-feast" are also split the way review texts are
				for(const auto& split : { Tokenizer::nameTokens(name), Tokenizer::wordTokens(name) }) {
					for(const auto& token : split) {
						this->allBrands.emplace(token);

						tokens.emplace(token);
					}
				}
			}
		}
	}

	/*
	 * GETTERS
	 */

	//! Checks whether a lower-case token is a standard English or an additional stopword.
	inline bool KeywordFilter::isStopWord(const std::string& token) const {
		return StopWords::isEnglishStopWord(token) || this->extra.count(token) > 0;
	}

	//! Checks whether a lower-case token belongs to a brand or product name to be removed.
	/*!
	 * \param token Constant reference to the token.
	 * \param productId Constant reference to the ID
	 *   of the product the keywords are extracted
	 *   for.
	 */
	inline bool KeywordFilter::isBrandToken(const std::string& token, const std::string& productId) const {
		if(this->all) {
			return this->allBrands.count(token) > 0;
		}

		const auto it{this->brands.find(productId)};

		return it != this->brands.end() && it->second.count(token) > 0;
	}

	//! Checks whether a lower-case token needs to be removed before extracting the keywords of a product.
	inline bool KeywordFilter::isExcluded(const std::string& token, const std::string& productId) const {
		return this->isStopWord(token) || this->isBrandToken(token, productId);
	}

	//! Gets the sorted brand and product name tokens of a product.
	inline std::vector<std::string> KeywordFilter::getBrandTokens(const std::string& productId) const {
		std::vector<std::string> result;
		const auto it{this->brands.find(productId)};

		if(it != this->brands.end()) {
			result.assign(it->second.begin(), it->second.end());

			std::sort(result.begin(), result.end());
		}

		return result;
	}

	/*
	 * FILTERING
	 */

	//! Removes all excluded tokens.
	/*!
	 * \param tokens Vector containing the
	 *   lower-case tokens to be filtered.
	 * \param productId Constant reference to
	 *   the ID of the product the keywords are
	 *   extracted for.
	 *
	 * \returns The remaining tokens, in their
	 *   original order.
	 */
	inline std::vector<std::string> KeywordFilter::filter(
			std::vector<std::string> tokens,
			const std::string& productId
	) const {
		tokens.erase(
				std::remove_if(
						tokens.begin(),
						tokens.end(),
						[this, &productId](const auto& token) {
							return this->isExcluded(token, productId);
						}
				),
				tokens.end()
		);

		return tokens;
	}

} /* namespace reviewlens::Data */

#endif /* DATA_KEYWORDFILTER_HPP_ */
