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
 * Tokenizer.hpp
 *
 * Namespace for splitting review texts into keyword tokens and n-grams.
 *
 *  Created on: Mar 6, 2021
 *      Author: ans
 */

#ifndef DATA_TOKENIZER_HPP_
#define DATA_TOKENIZER_HPP_

#include "../Helper/Strings.hpp"

#include <cctype>		// std::isalnum, std::ispunct, std::isspace
#include <cstddef>		// std::size_t
#include <string>		// std::string
#include <string_view>	// std::string_view
#include <utility>		// std::move
#include <vector>		// std::vector

//! Namespace for splitting review texts into keyword tokens and n-grams.
namespace reviewlens::Data::Tokenizer {

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! The minimum length of a word token, in bytes.
	inline constexpr auto minTokenLength{2};

	//! The first byte that is not part of the ASCII range.
	inline constexpr auto firstNonAscii{0x80};

	///@}

	/*
	 * DECLARATION
	 */

	///@name Tokenization
	///@{

	[[nodiscard]] bool isWordByte(unsigned char c);
	[[nodiscard]] std::vector<std::string> wordTokens(std::string_view text);
	[[nodiscard]] std::vector<std::string> nameTokens(std::string_view name);

	///@}
	///@name N-Grams
	///@{

	[[nodiscard]] std::vector<std::string> nGrams(
			const std::vector<std::string>& tokens,
			std::size_t nMax
	);

	///@}

	/*
	 * IMPLEMENTATION
	 */

	/*
	 * TOKENIZATION
	 */

	//! Checks whether a byte belongs to a word.
	/*!
	 * ASCII letters and digits, the underscore,
	 *  and all bytes of multi-byte UTF-8
	 *  characters belong to words.
	 */
	inline bool isWordByte(unsigned char c) {
		return c >= firstNonAscii || std::isalnum(c) != 0 || c == '_';
	}

	//! Splits a text into lower-case word tokens of at least two bytes.
	/*!
	 * \param text View of the text to be split.
	 *
	 * \returns The tokens, in the order in which
	 *   they appear in the text.
	 */
	inline std::vector<std::string> wordTokens(std::string_view text) {
		std::vector<std::string> result;
		std::size_t pos{0};

		while(pos < text.length()) {
			while(pos < text.length() && !isWordByte(static_cast<unsigned char>(text[pos]))) {
				++pos;
			}

			const auto begin{pos};

			while(pos < text.length() && isWordByte(static_cast<unsigned char>(text[pos]))) {
				++pos;
			}

			if(pos - begin >= minTokenLength) {
				result.emplace_back(Helper::Strings::toLowerCopy(text.substr(begin, pos - begin)));
			}
		}

		return result;
	}

	//! Splits a brand or product name into lower-case tokens.
	/*!
	 * Splits at whitespaces and strips the
	 *  surrounding punctuation of each token.
	 *  Tokens that consist of punctuation
	 *  only are ignored.
	 *
	 * \param name View of the name to be split.
	 *
	 * \returns The tokens of the name.
	 */
	inline std::vector<std::string> nameTokens(std::string_view name) {
		std::vector<std::string> result;
		std::size_t pos{0};

		while(pos < name.length()) {
			while(pos < name.length() && std::isspace(static_cast<unsigned char>(name[pos])) != 0) {
				++pos;
			}

			auto begin{pos};

			while(pos < name.length() && std::isspace(static_cast<unsigned char>(name[pos])) == 0) {
				++pos;
			}

			auto end{pos};

			while(begin < end && std::ispunct(static_cast<unsigned char>(name[begin])) != 0) {
				++begin;
			}

			while(end > begin && std::ispunct(static_cast<unsigned char>(name[end - 1])) != 0) {
				--end;
			}

			if(end > begin) {
				result.emplace_back(Helper::Strings::toLowerCopy(name.substr(begin, end - begin)));
			}
		}

		return result;
	}

	/*
	 * N-GRAMS
	 */

	//! Builds all n-grams of consecutive tokens, from one up to the given number of tokens.
	/*!
	 * The tokens of an n-gram are separated
	 *  by single spaces.
	 *
	 * \param tokens Constant reference to a
	 *   vector containing the tokens.
	 * \param nMax The maximum number of tokens
	 *   in an n-gram.
	 *
	 * \returns All unigrams, followed by all
	 *   bigrams, and so on.
	 */
	inline std::vector<std::string> nGrams(
			const std::vector<std::string>& tokens,
			std::size_t nMax
	) {
		std::vector<std::string> result(tokens);

		for(std::size_t n{2}; n <= nMax && n <= tokens.size(); ++n) {
			for(std::size_t first{0}; first + n <= tokens.size(); ++first) {
				std::string nGram(tokens[first]);

				for(std::size_t index{first + 1}; index < first + n; ++index) {
					nGram.push_back(' ');

					nGram += tokens[index];
				}

				result.emplace_back(std::move(nGram));
			}
		}

		return result;
	}

} /* namespace reviewlens::Data::Tokenizer */

#endif /* DATA_TOKENIZER_HPP_ */
