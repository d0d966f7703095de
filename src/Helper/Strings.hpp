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
 * Strings.hpp
 *
 * Namespace for global string helper functions.
 *
 *  Created on: Feb 27, 2021
 *      Author: ans
 */

#ifndef HELPER_STRINGS_HPP_
#define HELPER_STRINGS_HPP_

#include <boost/algorithm/string.hpp>

#include <algorithm>	// std::find, std::find_if, std::remove_if, std::replace, std::transform, std::unique
#include <array>		// std::array
#include <cctype>		// std::isalpha, std::iscntrl, std::isspace, std::tolower
#include <cstddef>		// std::size_t
#include <string>		// std::string
#include <string_view>	// std::string_view, std::string_view_literals
#include <utility>		// std::pair
#include <vector>		// std::vector

//! Namespace for global string helper functions.
namespace reviewlens::Helper::Strings {

	/*
	 * CONSTANTS
	 */

	using std::string_view_literals::operator""sv;

	///@name Constants
	///@{

	//! UTF-8 whitespaces used by utfTidy().
	inline constexpr std::array utfWhitespaces {
		"\u0085"sv, // next line (NEL)
		"\u00a0"sv, // no-break space
		"\u1680"sv, // Ogham space mark
		"\u2000"sv, // en quad
		"\u2001"sv, // em quad
		"\u2002"sv, // en space
		"\u2003"sv, // em space
		"\u2004"sv, // three-per-em space
		"\u2005"sv, // four-per-em space
		"\u2006"sv, // six-per-em space
		"\u2007"sv, // figure space
		"\u2008"sv, // punctuation space
		"\u2009"sv, // thin space
		"\u200a"sv, // hair space
		"\u2028"sv, // line separator
		"\u2029"sv, // paragraph separator
		"\u202f"sv, // narrow no-break space
		"\u205f"sv, // medium mathematical space
		"\u3000"sv, // ideographic space
	};

	//! UTF-8 characters without width that are removed by utfTidy().
	inline constexpr std::array utfInvisibles {
		"\u200b"sv, // zero width space
		"\u200c"sv, // zero width non-joiner
		"\u200d"sv, // zero width joiner
		"\u2060"sv, // word joiner
		"\ufeff"sv, // byte order mark
	};

	//! Typographic punctuation and its ASCII replacement, used by asciiPunctuation().
	inline constexpr std::array<std::pair<std::string_view, std::string_view>, 12> typographicPunctuation {{
		{ "\u2018"sv, "'"sv },		// left single quotation mark
		{ "\u2019"sv, "'"sv },		// right single quotation mark
		{ "\u201a"sv, "'"sv },		// single low-9 quotation mark
		{ "\u201b"sv, "'"sv },		// single high-reversed-9 quotation mark
		{ "\u201c"sv, "\""sv },		// left double quotation mark
		{ "\u201d"sv, "\""sv },		// right double quotation mark
		{ "\u201e"sv, "\""sv },		// double low-9 quotation mark
		{ "\u2010"sv, "-"sv },		// hyphen
		{ "\u2013"sv, "-"sv },		// en dash
		{ "\u2014"sv, "-"sv },		// em dash
		{ "\u2026"sv, "..."sv },	// horizontal ellipsis
		{ "\u00b4"sv, "'"sv }		// acute accent
	}};

	//! HTML entities decoded by decodeHtmlEntities().
	inline constexpr std::array<std::pair<std::string_view, std::string_view>, 9> htmlEntities {{
		{ "&quot;"sv, "\""sv },
		{ "&#34;"sv, "\""sv },
		{ "&apos;"sv, "'"sv },
		{ "&#39;"sv, "'"sv },
		{ "&lt;"sv, "<"sv },
		{ "&gt;"sv, ">"sv },
		{ "&nbsp;"sv, " "sv },
		{ "&#160;"sv, " "sv },
		{ "&amp;"sv, "&"sv }		// needs to be decoded last
	}};

	//! Strings that will be interpreted as @c true by stringToBool().
	inline constexpr std::array trueStrings{"true"sv, "1"sv, "yes"sv, "y"sv, "t"sv, "1.0"sv};

	///@}

	/*
	 * DECLARATION
	 */

	///@name Replacing
	///@{

	void replaceAll(
			std::string& strInOut,
			std::string_view needle,
			std::string_view replacement
	);

	///@}
	///@name Conversion
	///@{

	[[nodiscard]] bool stringToBool(std::string inputString);
	void toLower(std::string& strInOut);
	[[nodiscard]] std::string toLowerCopy(std::string_view str);

	///@}
	///@name Trimming
	///@{

	void trim(std::string& stringToTrim);

	///@}
	///@name Joining
	///@{

	[[nodiscard]] std::string join(
			const std::vector<std::string>& strings,
			std::string_view delimiter,
			bool ignoreEmpty
	);

	///@}
	///@name Splitting
	///@{

	[[nodiscard]] std::vector<std::string> split(const std::string& str, char delimiter);
	[[nodiscard]] std::vector<std::string> splitAndTrim(const std::string& str, char delimiter);

	///@}
	///@name Tidying
	///@{

	void utfTidy(std::string& stringToTidy);
	void removeControlCharacters(std::string& strInOut);
	void asciiPunctuation(std::string& strInOut);

	///@}
	///@name Markup
	///@{

	void stripHtmlTags(std::string& strInOut);
	void decodeHtmlEntities(std::string& strInOut);

	///@}

	/*
	 * IMPLEMENTATION
	 */

	/*
	 * REPLACING
	 */

	//! Replaces all occurences within a string with another string.
	/*!
	 * \param strInOut Reference to the string in which
	 *   the replacement will take place.
	 * \param needle A string view defining the string
	 *   to be replaced.
	 * \param replacement A string view defining the
	 *   string to be inserted instead of the needle.
	 */
	inline void replaceAll(
			std::string& strInOut,
			std::string_view needle,
			std::string_view replacement
	) {
		std::size_t startPos{0};

		if(needle.empty()) {
			return;
		}

		while((startPos = strInOut.find(needle, startPos)) != std::string::npos) {
			strInOut.replace(startPos, needle.length(), replacement);

			startPos += replacement.length();
		}
	}

	/*
	 * CONVERSION
	 */

	//! Converts a string into a boolean value.
	/*!
	 * Case-insensitive. Surrounding whitespaces
	 *  are ignored.
	 *
	 * \param inputString The string to convert.
	 *
	 * \returns True, if the string equals one of
	 *   the strings in trueStrings. False otherwise,
	 *   including unknown values.
	 */
	inline bool stringToBool(std::string inputString) {
		trim(inputString);
		toLower(inputString);

		return std::find(
				trueStrings.cbegin(),
				trueStrings.cend(),
				inputString
		) != trueStrings.cend();
	}

	//! Converts all ASCII characters in a string to lower case, in-situ.
	/*!
	 * Multi-byte UTF-8 characters remain untouched.
	 */
	inline void toLower(std::string& strInOut) {
		std::transform(
				strInOut.begin(),
				strInOut.end(),
				strInOut.begin(),
				[](const unsigned char c) {
					if(c > 127) {
						return static_cast<char>(c);
					}

					return static_cast<char>(std::tolower(c));
				}
		);
	}

	//! Returns a copy of a string with all ASCII characters converted to lower case.
	inline std::string toLowerCopy(std::string_view str) {
		std::string result(str);

		toLower(result);

		return result;
	}

	/*
	 * TRIMMING
	 */

	//! Removes whitespaces around a string.
	/*!
	 * \warning Only ASCII whitespaces will be processed.
	 *
	 * \param stringToTrim Reference to the string to be trimmed in-situ.
	 *
	 * \sa utfTidy
	 */
	inline void trim(std::string& stringToTrim) {
		stringToTrim.erase(
				stringToTrim.begin(),
				std::find_if(
						stringToTrim.begin(),
						stringToTrim.end(),
						[](unsigned char ch) {
							return std::isspace(ch) == 0;
						}
				)
		);

		stringToTrim.erase(
				std::find_if(
						stringToTrim.rbegin(),
						stringToTrim.rend(),
						[](unsigned char ch) {
							return std::isspace(ch) == 0;
						}
		).base(), stringToTrim.end());
	}

	/*
	 * JOINING
	 */

	//! Concatenates all elements of a vector into a single string.
	/*!
	 * \param strings Constant reference to a vector
	 *   containing the strings to be concatenated.
	 * \param delimiter A string view to be inserted
	 *   inbetween the concatenated strings.
	 * \param ignoreEmpty Ignore empty strings when
	 *   concatenating the given elements.
	 *
	 * \returns The string containing the concatenated
	 *   elements, separated by the given delimiter,
	 *   or an empty string if no elements have been
	 *   concatenated.
	 */
	inline std::string join(
			const std::vector<std::string>& strings,
			std::string_view delimiter,
			bool ignoreEmpty
	) {
		std::string result;
		std::size_t size{0};

		// calculate and reserve needed memory
		for(const auto& string : strings) {
			if(!ignoreEmpty || !string.empty()) {
				size += string.size() + delimiter.size();
			}
		}

		result.reserve(size);

		// create string
		bool first{true};

		for(const auto& string : strings) {
			if(ignoreEmpty && string.empty()) {
				continue;
			}

			if(first) {
				first = false;
			}
			else {
				result += delimiter;
			}

			result += string;
		}

		return result;
	}

	/*
	 * SPLITTING
	 */

	//! Splits a string into a vector of strings using the given delimiter.
	/*!
	 * \param str A const reference to the string
	 *   to be split up.
	 * \param delimiter The character around which
	 *   the resulting elements will be split.
	 *
	 * \returns A new vector containing the split
	 *   elements.
	 */
	inline std::vector<std::string> split(const std::string& str, char delimiter) {
		std::vector<std::string> result;

		boost::split(result, str, [&delimiter](char c) {
			return c == delimiter;
		});

		return result;
	}

	//! Splits a string, trims the elements and removes the empty ones.
	inline std::vector<std::string> splitAndTrim(const std::string& str, char delimiter) {
		auto result{split(str, delimiter)};

		for(auto& element : result) {
			boost::algorithm::trim(element);
		}

		result.erase(
				std::remove_if(
						result.begin(),
						result.end(),
						[](const auto& element) {
							return element.empty();
						}
				),
				result.end()
		);

		return result;
	}

	/*
	 * TIDYING
	 */

	//! Replaces all UTF-8 and special ASCII whitespaces with simple spaces and collapses them.
	/*!
	 * Removes invisible characters, replaces
	 *  all whitespaces with simple spaces,
	 *  removes double spaces and trims the
	 *  result.
	 *
	 * \param stringToTidy Reference to the
	 *   string to be tidied in-situ.
	 */
	inline void utfTidy(std::string& stringToTidy) {
		// remove characters without width
		for(const auto invisible : utfInvisibles) {
			replaceAll(stringToTidy, invisible, "");
		}

		// replace Unicode white spaces with spaces
		for(const auto whitespace : utfWhitespaces) {
			replaceAll(stringToTidy, whitespace, " ");
		}

		// replace special ASCII characters with spaces
		std::replace(stringToTidy.begin(), stringToTidy.end(), '\t', ' '); // horizontal tab
		std::replace(stringToTidy.begin(), stringToTidy.end(), '\n', ' '); // line feed
		std::replace(stringToTidy.begin(), stringToTidy.end(), '\v', ' '); // vertical tab
		std::replace(stringToTidy.begin(), stringToTidy.end(), '\f', ' '); // form feed
		std::replace(stringToTidy.begin(), stringToTidy.end(), '\r', ' '); // carriage return

		// replace double spaces
		stringToTidy.erase(
				std::unique(
						stringToTidy.begin(),
						stringToTidy.end(),
						[](const char a, const char b) {
							return a == ' ' && b == ' ';
						}
				),
				stringToTidy.end()
		);

		// trim result
		trim(stringToTidy);
	}

	//! Removes ASCII control characters except whitespaces.
	inline void removeControlCharacters(std::string& strInOut) {
		strInOut.erase(
				std::remove_if(
						strInOut.begin(),
						strInOut.end(),
						[](const unsigned char c) {
							return c < 128 && std::iscntrl(c) != 0 && std::isspace(c) == 0;
						}
				),
				strInOut.end()
		);
	}

	//! Replaces typographic quotes, dashes, and ellipses with their ASCII counterparts.
	inline void asciiPunctuation(std::string& strInOut) {
		for(const auto& [typographic, ascii] : typographicPunctuation) {
			replaceAll(strInOut, typographic, ascii);
		}
	}

	/*
	 * MARKUP
	 */

	//! Replaces HTML tags like @c <br /> with spaces.
	/*!
	 * Only sequences starting with @c < followed
	 *  by a letter, @c / or @c ! and ending with
	 *  @c > are regarded as tags, so that
	 *  comparisons like "3 < 5" are kept.
	 */
	inline void stripHtmlTags(std::string& strInOut) {
		std::string result;
		std::size_t pos{0};

		result.reserve(strInOut.size());

		while(pos < strInOut.size()) {
			const auto c{strInOut[pos]};

			if(c == '<' && pos + 1 < strInOut.size()) {
				const auto next{static_cast<unsigned char>(strInOut[pos + 1])};

				if(std::isalpha(next) != 0 || next == '/' || next == '!') {
					const auto end{strInOut.find('>', pos + 1)};

					if(end != std::string::npos) {
						result.push_back(' ');

						pos = end + 1;

						continue;
					}
				}
			}

			result.push_back(c);

			++pos;
		}

		strInOut.swap(result);
	}

	//! Decodes the most common HTML entities.
	inline void decodeHtmlEntities(std::string& strInOut) {
		if(strInOut.find('&') == std::string::npos) {
			return;
		}

		for(const auto& [entity, replacement] : htmlEntities) {
			replaceAll(strInOut, entity, replacement);
		}
	}

} /* namespace reviewlens::Helper::Strings */

#endif /* HELPER_STRINGS_HPP_ */
