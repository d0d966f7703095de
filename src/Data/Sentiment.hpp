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
 * Sentiment.hpp
 *
 * Implementation of the VADER sentiment analysis algorithm.
 *
 * Hutto, C.J. & Gilbert, E.E. (2014). VADER: A Parsimonious Rule-based Model for
 * Sentiment Analysis of Social Media Text. Eighth International Conference on
 * Weblogs and Social Media (ICWSM-14). Ann Arbor, MI, June 2014.
 *
 * !!! FOR ENGLISH LANGUAGE ONLY !!!
 *
 *  Created on: Dec 29, 2020
 *      Author: ans
 */

#ifndef DATA_SENTIMENT_HPP_
#define DATA_SENTIMENT_HPP_

#include "../Helper/FileSystem.hpp"
#include "../Helper/Math.hpp"
#include "../Helper/Strings.hpp"
#include "../Main/Exception.hpp"

#include <utf8.h>

#include <algorithm>		// std::any_of, std::count, std::count_if, std::find, std::min, std::none_of
#include <array>			// std::array
#include <cctype>			// std::islower, std::ispunct, std::isupper
#include <cmath>			// std::fabs, std::sqrt
#include <cstddef>			// std::ptrdiff_t, std::size_t
#include <cstdint>			// std::uint8_t
#include <exception>		// std::exception
#include <numeric>			// std::accumulate
#include <string>			// std::stod, std::string, std::to_string
#include <string_view>		// std::string_view
#include <unordered_map>	// std::unordered_map
#include <unordered_set>	// std::unordered_set
#include <vector>			// std::vector

namespace reviewlens::Data {

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! Zero.
	inline constexpr auto VaderZero{0};

	//! One.
	inline constexpr auto VaderOne{1};

	//! Two.
	inline constexpr auto VaderTwo{2};

	//! Three.
	inline constexpr auto VaderThree{3};

	//! Four.
	inline constexpr auto VaderFour{4};

	//! Factor of One.
	inline constexpr auto VaderFOne{1.};

	//! Factor by which the scalar modifier of tokens two positions before the item is dampened.
	inline constexpr auto VaderDampOne{0.95};

	//! Factor by which the scalar modifier of tokens three positions before the item is dampened.
	inline constexpr auto VaderDampTwo{0.9};

	//! Factor by which the modifier is dampened before a "but".
	inline constexpr auto VaderButFactorBefore{0.5};

	//! Factor by which the modifier is heightened after a "but".
	inline constexpr auto VaderButFactorAfter{1.5};

	//! Factor by which the modifier is heightened after a "never".
	inline constexpr auto VaderNeverFactor{1.25};

	//! Empirically derived mean sentiment intensity rating increase for exclamation marks.
	inline constexpr auto VaderEPFactor{0.292};

	//! Empirically derived mean sentiment intensity rating increase for each question mark.
	inline constexpr auto VaderQMFactor{0.18};

	//! Maximum sentiment intensity rating increase for question marks.
	inline constexpr auto VaderQMFactorMax{0.96};

	//! Empirically derived mean sentiment intensity rating increase for booster tokens.
	inline constexpr auto VaderB_INCR{0.293};

	//! Empirically derived mean sentiment intensity rating decrease for negative booster tokens.
	inline constexpr auto VaderB_DECR{-0.293};

	//! Empirically derived mean sentiment intensity rating increase for using ALLCAPs to emphasize a token.
	inline constexpr auto VaderC_INCR{0.733};

	//! Negation factor.
	inline constexpr auto VaderN_SCALAR{-0.74};

	//! Alpha approximating the maximum expected value when normalizing the compound score.
	inline constexpr auto VaderAlpha{15.};

	//! The number of decimal places the compound score will be rounded to.
	inline constexpr auto VaderCompoundDecimals{4U};

	//! The minimum length of a stripped token to keep it stripped of punctuation.
	inline constexpr auto VaderMinStripped{3};

	//! The number of fields in a line of the dictionary before the value.
	inline constexpr auto VaderDictValueField{1};

	///@}

	/*
	 * DECLARATION
	 */

	//! Structure for VADER sentiment scores.
	struct SentimentScores {
		//! Positive sentiment.
		/*!
		 * The positive, neutral, and negative
		 *  scores are ratios for proportions of
		 *  text that fall in each category (so
		 *  these should all add up to be 1...
		 *  or close to it with floating-point
		 *  operations).
		 *
		 *  \sa neutral, negative
		 */
		double positive{};

		//! Neutral sentiment.
		/*!
		 *  \sa positive, negative
		 */
		double neutral{};

		//! Negative sentiment.
		/*!
		 *  \sa positive, neutral
		 */
		double negative{};

		//! Compound score.
		/*!
		 * This score is computed by summing the
		 *  valence scores of each token in the
		 *  lexicon, adjusted according to the rules,
		 *  and then normalized to be between -1
		 *  (most extreme negative) and +1 (most
		 *  extreme positive). It is rounded to
		 *  four decimal places.
		 *
		 * This is the most useful metric if you want
		 *  a single unidimensional measure of
		 *  sentiment for a given text.
		 */
		double compound{};
	};

	//! Implementation of the VADER sentiment analysis algorithm.
	/*!
	 * See:
	 *
	 * Hutto, C.J. & Gilbert, E.E. (2014). VADER: A Parsimonious Rule-based Model for
	 * Sentiment Analysis of Social Media Text. Eighth International Conference on
	 * Weblogs and Social Media (ICWSM-14). Ann Arbor, MI, June 2014.
	 *
	 * The dictionaries are read once on
	 *  construction. Afterwards, the
	 *  analyzer does not change, and can be
	 *  used by multiple threads at once.
	 *
	 * \warning For English language only!
	 */
	class Sentiment {
		// for convenience
		using Tokens = std::vector<std::string>;

		/*
		 * CONSTANTS
		 */

		inline static const std::unordered_set<std::string_view> NEGATE{
			"aint",
			"arent",
			"cannot",
			"cant",
			"couldnt",
			"darent",
			"didnt",
			"doesnt",
			"ain't",
			"aren't",
			"can't",
			"couldn't",
			"daren't",
			"didn't",
			"doesn't",
			"dont",
			"hadnt",
			"hasnt",
			"havent",
			"isnt",
			"mightnt",
			"mustnt",
			"neither",
			"don't",
			"hadn't",
			"hasn't",
			"haven't",
			"isn't",
			"mightn't",
			"mustn't",
			"neednt",
			"needn't",
			"never",
			"none",
			"nope",
			"nor",
			"not",
			"nothing",
			"nowhere",
			"oughtnt",
			"shant",
			"shouldnt",
			"uhuh",
			"wasnt",
			"werent",
			"oughtn't",
			"shan't",
			"shouldn't",
			"uh-uh",
			"wasn't",
			"weren't",
			"without",
			"wont",
			"wouldnt",
			"won't",
			"wouldn't",
			"rarely",
			"seldom",
			"despite"
		};

		// booster/dampener 'intensifiers' or 'degree adverbs'
		// http://en.wiktionary.org/wiki/Category:English_degree_adverbs
		inline static const std::unordered_map<std::string_view, double> BOOSTER_DICT{
			{ "absolutely", VaderB_INCR },
			{ "amazingly", VaderB_INCR },
			{ "awfully", VaderB_INCR },
			{ "completely", VaderB_INCR },
			{ "considerable", VaderB_INCR },
			{ "considerably", VaderB_INCR },
			{ "decidedly", VaderB_INCR },
			{ "deeply", VaderB_INCR },
			{ "effing", VaderB_INCR },
			{ "enormous", VaderB_INCR },
			{ "enormously", VaderB_INCR },
			{ "entirely", VaderB_INCR },
			{ "especially", VaderB_INCR },
			{ "exceptional", VaderB_INCR },
			{ "exceptionally", VaderB_INCR },
			{ "extreme", VaderB_INCR },
			{ "extremely", VaderB_INCR },
			{ "fabulously", VaderB_INCR },
			{ "flipping", VaderB_INCR },
			{ "flippin", VaderB_INCR },
			{ "frackin", VaderB_INCR },
			{ "fracking", VaderB_INCR },
			{ "fricking", VaderB_INCR },
			{ "frickin", VaderB_INCR },
			{ "frigging", VaderB_INCR },
			{ "friggin", VaderB_INCR },
			{ "fully", VaderB_INCR },
			{ "fuckin", VaderB_INCR },
			{ "fucking", VaderB_INCR },
			{ "fuggin", VaderB_INCR },
			{ "fugging", VaderB_INCR },
			{ "greatly", VaderB_INCR },
			{ "hella", VaderB_INCR },
			{ "highly", VaderB_INCR },
			{ "hugely", VaderB_INCR },
			{ "incredible", VaderB_INCR },
			{ "incredibly", VaderB_INCR },
			{ "intensely", VaderB_INCR },
			{ "major", VaderB_INCR },
			{ "majorly", VaderB_INCR },
			{ "more", VaderB_INCR },
			{ "most", VaderB_INCR },
			{ "particularly", VaderB_INCR },
			{ "purely", VaderB_INCR },
			{ "quite", VaderB_INCR },
			{ "really", VaderB_INCR },
			{ "remarkably", VaderB_INCR },
			{ "so", VaderB_INCR },
			{ "substantially", VaderB_INCR },
			{ "thoroughly", VaderB_INCR },
			{ "total", VaderB_INCR },
			{ "totally", VaderB_INCR },
			{ "tremendous", VaderB_INCR },
			{ "tremendously", VaderB_INCR },
			{ "uber", VaderB_INCR },
			{ "unbelievably", VaderB_INCR },
			{ "unusually", VaderB_INCR },
			{ "utter", VaderB_INCR },
			{ "utterly", VaderB_INCR },
			{ "very", VaderB_INCR },
			{ "almost", VaderB_DECR },
			{ "barely", VaderB_DECR },
			{ "hardly", VaderB_DECR },
			{ "just enough", VaderB_DECR },
			{ "kind of", VaderB_DECR },
			{ "kinda", VaderB_DECR },
			{ "kindof", VaderB_DECR },
			{ "kind-of", VaderB_DECR },
			{ "less", VaderB_DECR },
			{ "little", VaderB_DECR },
			{ "marginal", VaderB_DECR },
			{ "marginally", VaderB_DECR },
			{ "occasional", VaderB_DECR },
			{ "occasionally", VaderB_DECR },
			{ "partly", VaderB_DECR },
			{ "scarce", VaderB_DECR },
			{ "scarcely", VaderB_DECR },
			{ "slight", VaderB_DECR },
			{ "slightly", VaderB_DECR },
			{ "somewhat", VaderB_DECR },
			{ "sort of", VaderB_DECR },
			{ "sorta", VaderB_DECR },
			{ "sortof", VaderB_DECR },
			{ "sort-of", VaderB_DECR}
		};

		// check for special case idioms and phrases containing lexicon tokens
		inline static const std::unordered_map<std::string_view, double> SPECIAL_CASES{
			{ "the shit", 3. },
			{ "the bomb", 3. },
			{ "bad ass", 1.5 },
			{ "badass", 1.5 },
			{ "bus stop", 0. },
			{ "yeah right", -2. },
			{ "kiss of death", -1.5 },
			{ "to die for", 3. },
			{ "beating heart", 3.1 },
			{ "broken heart", -2.9 }
		};

	public:
		///@name Construction
		///@{

		Sentiment(const std::string& dictionaryFile, const std::string& emojiFile);

		///@}
		///@name Getters
		///@{

		[[nodiscard]] std::size_t getDictSize() const;
		[[nodiscard]] std::size_t getEmojiNum() const;

		///@}
		///@name Sentiment Analysis
		///@{

		[[nodiscard]] SentimentScores analyze(std::string_view text) const;

		///@}
		///@name Tokenization
		///@{

		[[nodiscard]] static Tokens tokenize(std::string_view text);

		///@}

		//! Class for sentiment analysis exceptions.
		/*!
		 * Will be thrown when a dictionary
		 *  could not be read or contains an
		 *  invalid entry.
		 */
		MAIN_EXCEPTION_CLASS();

	private:
		// dictionaries
		std::unordered_map<std::string, double> dictMap;
		std::unordered_map<std::string, std::string> emojiMap;

		// internal helper functions
		[[nodiscard]] std::string replaceEmojis(std::string_view text) const;
		[[nodiscard]] bool isInDict(const std::string& tokenLower) const;
		void sentimentValence(
				const Tokens& tokens,
				const Tokens& tokensLower,
				std::size_t index,
				std::vector<double>& sentiments,
				bool isCapDifference
		) const;
		void leastCheck(double& valence, const Tokens& tokensLower, std::size_t index) const;

		// internal static helper functions
		[[nodiscard]] static SentimentScores scoreValence(
				const std::vector<double>& sentiments,
				std::string_view text
		);
		[[nodiscard]] static Tokens toLower(const Tokens& tokens);
		[[nodiscard]] static bool isNegated(const std::string& tokenLower);
		[[nodiscard]] static double normalize(double score);
		[[nodiscard]] static bool isAllCaps(const std::string& token);
		[[nodiscard]] static bool isAllCapDifferential(const Tokens& tokens);
		[[nodiscard]] static double scalarIncDec(
				const std::string& token,
				const std::string& tokenLower,
				double valence,
				bool isCapDiff
		);
		[[nodiscard]] static double punctuationEmphasis(std::string_view text);
		[[nodiscard]] static double amplifyEP(std::string_view text);
		[[nodiscard]] static double amplifyQM(std::string_view text);

		static void butCheck(const Tokens& tokensLower, std::vector<double>& sentiments);
		static void negationCheck(
				double& valence,
				const Tokens& tokensLower,
				std::uint8_t startIndex,
				std::size_t index
		);
		static void specialIdiomsCheck(double& valence, const Tokens& tokensLower, std::size_t index);
		static void siftSentimentScores(
				const std::vector<double>& sentiments,
				double& positiveSumTo,
				double& negativeSumTo,
				std::size_t& neutralCountTo
		);
	};

	/*
	 * IMPLEMENTATION
	 */

	/*
	 * CONSTRUCTION
	 */

	//! Constructor.
	/*!
	 * Creates the dictionaries from the given files.
	 *
	 * Each line of the sentiment dictionary
	 *  consists of a token, its mean valence,
	 *  and optional additional fields, all
	 *  separated by tabulators. Each line of the
	 *  emoji dictionary consists of an emoji and
	 *  its textual description, separated by a
	 *  tabulator.
	 *
	 * \param dictionaryFile Constant reference
	 *   to a string containing the file name
	 *   of the dictionary to be used.
	 * \param emojiFile Constant reference to a
	 *   string containing the file name of the
	 *   emoji dictionary to be used, or to an
	 *   empty string if emojis should not be
	 *   replaced.
	 *
	 * \throws Sentiment::Exception if one of the
	 *   files could not be read, or a valence in
	 *   the sentiment dictionary is invalid.
	 */
	inline Sentiment::Sentiment(const std::string& dictionaryFile, const std::string& emojiFile) {
		std::string content;

		try {
			content = Helper::FileSystem::readFile(dictionaryFile);
		}
		catch(const Main::Exception& e) {
			throw Exception("Could not read dictionary file: " + std::string(e.view()));
		}

		std::size_t lineNumber{0};

		for(const auto& line : Helper::Strings::split(content, '\n')) {
			++lineNumber;

			const auto fields{Helper::Strings::split(line, '\t')};

			if(fields.size() <= VaderDictValueField || fields[0].empty()) {
				continue;
			}

			try {
				this->dictMap.emplace(fields[0], std::stod(fields[VaderDictValueField]));
			}
			catch(const std::exception& e) {
				throw Exception(
						"Invalid valence in line "
						+ std::to_string(lineNumber)
						+ " of dictionary file '"
						+ dictionaryFile
						+ "': '"
						+ fields[VaderDictValueField]
						+ "'"
				);
			}
		}

		if(this->dictMap.empty()) {
			throw Exception("Dictionary file '" + dictionaryFile + "' is empty");
		}

		if(emojiFile.empty()) {
			return;
		}

		try {
			content = Helper::FileSystem::readFile(emojiFile);
		}
		catch(const Main::Exception& e) {
			throw Exception("Could not read emoji file: " + std::string(e.view()));
		}

		for(auto line : Helper::Strings::split(content, '\n')) {
			if(!line.empty() && line.back() == '\r') {
				line.pop_back();
			}

			const auto tab{line.find('\t')};

			if(tab != std::string::npos && tab > 0) {
				this->emojiMap.emplace(line.substr(0, tab), line.substr(tab + 1));
			}
		}
	}

	/*
	 * GETTERS
	 */

	//! Gets the number of dictionary entries.
	/*!
	 * \returns Number of entries in the dictionary.
	 */
	inline std::size_t Sentiment::getDictSize() const {
		return this->dictMap.size();
	}

	//! Gets the number of entries in the emoji dictionary.
	/*!
	 * \returns Number of emojis in the dictionary.
	 */
	inline std::size_t Sentiment::getEmojiNum() const {
		return this->emojiMap.size();
	}

	/*
	 * SENTIMENT ANALYSIS
	 */

	//! Gets the sentiment strength of the given text.
	/*!
	 * \param text View of the text to analyze,
	 *   which needs to be valid UTF-8.
	 *
	 * \returns The sentiment scores of the text.
	 *   All scores are zero if the text does
	 *   not contain any tokens.
	 */
	inline SentimentScores Sentiment::analyze(std::string_view text) const {
		const auto textWithoutEmojis{this->replaceEmojis(text)};
		const auto tokens{Sentiment::tokenize(textWithoutEmojis)};
		const bool isCapDifference{Sentiment::isAllCapDifferential(tokens)};

		// create copy with lower-case tokens
		const auto tokensLower{Sentiment::toLower(tokens)};

		// calculate sentiments
		std::vector<double> sentiments;

		sentiments.reserve(tokens.size());

		for(std::size_t index{}; index < tokens.size(); ++index) {
			if(BOOSTER_DICT.find(tokensLower[index]) != BOOSTER_DICT.end()) {
				sentiments.push_back(0.);

				continue;
			}

			if(
					index < tokens.size() - VaderOne
					&& tokensLower[index] == "kind"
					&& tokensLower[index + VaderOne] == "of"
			) {
				sentiments.push_back(0.);

				continue;
			}

			this->sentimentValence(tokens, tokensLower, index, sentiments, isCapDifference);
		}

		Sentiment::butCheck(tokensLower, sentiments);

		return Sentiment::scoreValence(sentiments, textWithoutEmojis);
	}

	/*
	 * TOKENIZATION
	 */

	//! Splits a text into tokens.
	/*!
	 * Splits the text at whitespaces and strips
	 *  surrounding punctuation from each token,
	 *  unless fewer than three characters would
	 *  remain, which keeps emoticons like @c :)
	 *  intact.
	 *
	 * \param text View of the text to tokenize.
	 *
	 * \returns The tokens of the text.
	 */
	inline Sentiment::Tokens Sentiment::tokenize(std::string_view text) {
		Tokens tokens;
		std::size_t pos{0};

		while(pos < text.length()) {
			const auto begin{text.find_first_not_of(" \t\n\v\f\r", pos)};

			if(begin == std::string_view::npos) {
				break;
			}

			auto end{text.find_first_of(" \t\n\v\f\r", begin)};

			if(end == std::string_view::npos) {
				end = text.length();
			}

			const auto token{text.substr(begin, end - begin)};

			pos = end;

			// strip punctuation
			std::size_t first{0};
			std::size_t last{token.length()};

			while(first < last && std::ispunct(static_cast<unsigned char>(token[first])) != 0) {
				++first;
			}

			while(last > first && std::ispunct(static_cast<unsigned char>(token[last - VaderOne])) != 0) {
				--last;
			}

			if(last - first < VaderMinStripped) {
				tokens.emplace_back(token);
			}
			else {
				tokens.emplace_back(token.substr(first, last - first));
			}
		}

		return tokens;
	}

	/*
	 * INTERNAL HELPER FUNCTIONS (private)
	 */

	// replace emojis with their textual descriptions
	inline std::string Sentiment::replaceEmojis(std::string_view text) const {
		if(this->emojiMap.empty()) {
			return std::string(text);
		}

		std::string result;
		bool prevSpace{true};
		auto it{text.cbegin()};

		result.reserve(text.length());

		try {
			while(it != text.cend()) {
				const auto begin{it};

				utf8::next(it, text.cend());

				const std::string character(begin, it);
				const auto emoji{this->emojiMap.find(character)};

				if(emoji != this->emojiMap.end()) {
					if(!prevSpace) {
						result.push_back(' ');
					}

					result += emoji->second;

					prevSpace = false;
				}
				else {
					result += character;

					prevSpace = character == " ";
				}
			}
		}
		catch(const utf8::exception& e) {
			throw Exception("Invalid UTF-8 in text to analyze: " + std::string(e.what()));
		}

		Helper::Strings::trim(result);

		return result;
	}

	// check whether a (lower-case) token is part of the dictionary
	inline bool Sentiment::isInDict(const std::string& tokenLower) const {
		return this->dictMap.find(tokenLower) != this->dictMap.end();
	}

	// calculate sentiment valence
	inline void Sentiment::sentimentValence(
				const Tokens& tokens,
				const Tokens& tokensLower,
				std::size_t index,
				std::vector<double>& sentiments,
				bool isCapDifference
	) const {
		double valence{};

		// get the sentiment valence
		const auto it{this->dictMap.find(tokensLower[index])};

		if(it != this->dictMap.end()) {
			valence = it->second;

			// check for "no" as negation for an adjacent lexicon item vs "no" as its own stand-alone lexicon item
			if(
					tokensLower[index] == "no"
					&& index < tokens.size() - VaderOne
					&& this->isInDict(tokensLower[index + VaderOne])
			) {
				// don't use valence of "no" as a lexicon item. Instead set it's valence to 0.0 and negate the next item
				valence = 0.;
			}

			if(
					(index > 0 && tokensLower[index - VaderOne] == "no")
					|| (index > 1 && tokensLower[index - VaderTwo] == "no")
					|| (
							index > 2
							&& tokensLower[index - VaderThree] == "no"
							&& (
									tokensLower[index - VaderOne] == "or"
									|| tokensLower[index - VaderOne] == "nor"
							)
					)
			) {
				valence = it->second * VaderN_SCALAR;
			}

			// check if sentiment-laden token is in ALL CAPS (while others aren't)
			if(Sentiment::isAllCaps(tokens[index]) && isCapDifference) {
				if(valence > 0.) {
					valence += VaderC_INCR;
				}
				else {
					valence -= VaderC_INCR;
				}
			}

			for(std::uint8_t startIndex{}; startIndex < VaderThree; ++startIndex) {
				// dampen the scalar modifier of preceding tokens and emoticons
				// (excluding the ones that immediately preceed the item) based
				// on their distance from the current item.
				if(index > startIndex) {
					const auto& precToken{tokens[index - (startIndex + VaderOne)]};
					const auto& precTokenLower{tokensLower[index - (startIndex + VaderOne)]};

					if(!(this->isInDict(precTokenLower))) {
						double s{
							Sentiment::scalarIncDec(
									precToken,
									precTokenLower,
									valence,
									isCapDifference
							)
						};

						if(s != 0.) {
							if(startIndex == VaderOne) {
								s *= VaderDampOne;
							}
							else if(startIndex == VaderTwo) {
								s *= VaderDampTwo;
							}
						}

						valence += s;

						Sentiment::negationCheck(valence, tokensLower, startIndex, index);

						if(startIndex == VaderTwo) {
							Sentiment::specialIdiomsCheck(valence, tokensLower, index);
						}
					}
				}
			}

			this->leastCheck(valence, tokensLower, index);
		}

		sentiments.push_back(valence);
	}

	// check for negation case using "least"
	inline void Sentiment::leastCheck(double& valence, const Tokens& tokensLower, std::size_t index) const {
		if(
				index > VaderOne
				&& !(this->isInDict(tokensLower[index - VaderOne]))
				&& tokensLower[index - VaderOne] == "least"
		) {
			if(
					tokensLower[index - VaderTwo] != "at"
					&& tokensLower[index - VaderTwo] != "very"
			) {
				valence *= VaderN_SCALAR;
			}
		}
		else if(
			index > VaderZero
			&& !(this->isInDict(tokensLower[index - VaderOne]))
			&& tokensLower[index - VaderOne] == "least"
		) {
			valence *= VaderN_SCALAR;
		}
	}

	/*
	 * INTERNAL STATIC HELPER FUNCTIONS (private)
	 */

	// calculate valence score
	inline SentimentScores Sentiment::scoreValence(
			const std::vector<double>& sentiments,
			std::string_view text
	) {
		if(sentiments.empty()) {
			return SentimentScores{};
		}

		auto sum{std::accumulate(sentiments.begin(), sentiments.end(), 0.)};

		const auto punctEmphAmp{Sentiment::punctuationEmphasis(text)};

		// compute and add emphasis from punctuation in text
		if(sum > 0.) {
			sum += punctEmphAmp;
		}
		else if(sum < 0.) {
			sum -= punctEmphAmp;
		}

		SentimentScores result;
		std::size_t neuCount{};

		result.compound = Helper::Math::round(Sentiment::normalize(sum), VaderCompoundDecimals);

		Sentiment::siftSentimentScores(sentiments, result.positive, result.negative, neuCount);

		if(result.positive > std::fabs(result.negative)) {
			result.positive += punctEmphAmp;
		}
		else if(result.positive < std::fabs(result.negative)) {
			result.negative -= punctEmphAmp;
		}

		const auto total{result.positive + std::fabs(result.negative) + static_cast<double>(neuCount)};

		result.positive = std::fabs(result.positive / total);
		result.negative = std::fabs(result.negative / total);
		result.neutral = std::fabs(static_cast<double>(neuCount) / total);

		return result;
	}

	// create lower-case copies of given tokens
	inline Sentiment::Tokens Sentiment::toLower(const Tokens& tokens) {
		Tokens tokensLower;

		tokensLower.reserve(tokens.size());

		for(const auto& token : tokens) {
			tokensLower.emplace_back(Helper::Strings::toLowerCopy(token));
		}

		return tokensLower;
	}

	// return whether a token is a negation token
	inline bool Sentiment::isNegated(const std::string& tokenLower) {
		if(Sentiment::NEGATE.find(tokenLower) != Sentiment::NEGATE.end()) {
			return true;
		}

		return tokenLower.find("n't") != std::string::npos;
	}

	// normalize the score to be between -1 and 1 using an alpha that approximates the max expected value
	inline double Sentiment::normalize(double score) {
		const double normScore{score / std::sqrt((score * score) + VaderAlpha)};

		if(normScore < -VaderFOne) {
			return -VaderFOne;
		}

		if(normScore > VaderFOne) {
			return VaderFOne;
		}

		return normScore;
	}

	// check whether a token is ALL CAPS, i.e. contains upper-case, but no lower-case letters
	inline bool Sentiment::isAllCaps(const std::string& token) {
		return std::any_of(token.begin(), token.end(), [](const unsigned char c) {
			return std::isupper(c) != 0;
		}) && std::none_of(token.begin(), token.end(), [](const unsigned char c) {
			return std::islower(c) != 0;
		});
	}

	// check whether just some tokens in the input are ALL CAPS,
	//  return false if ALL or NONE of the tokens are ALL CAPS
	inline bool Sentiment::isAllCapDifferential(const Tokens& tokens) {
		const auto allCapTokens{
			static_cast<std::size_t>(
					std::count_if(tokens.begin(), tokens.end(), [](const auto& token) {
						return Sentiment::isAllCaps(token);
					})
			)
		};

		return allCapTokens > 0 && allCapTokens < tokens.size();
	}

	// check if the preceding tokens increase, decrease, or negate/nullify the valence
	inline double Sentiment::scalarIncDec(
				const std::string& token,
				const std::string& tokenLower,
				double valence,
				bool isCapDiff
	) {
		double scalar{};

		const auto it{Sentiment::BOOSTER_DICT.find(tokenLower)};

		if(it != Sentiment::BOOSTER_DICT.end()) {
			scalar = it->second;

			if(valence < 0.) {
				scalar *= -VaderFOne;
			}

			if(isAllCaps(token) && isCapDiff) {
				if(valence > 0.) {
					scalar += VaderC_INCR;
				}
				else {
					scalar -= VaderC_INCR;
				}
			}
		}

		return scalar;
	}

	// add emphasis from exclamation points and question marks
	inline double Sentiment::punctuationEmphasis(std::string_view text) {
		return Sentiment::amplifyEP(text) + Sentiment::amplifyQM(text);
	}

	// emphasis from up to four exclamation points
	inline double Sentiment::amplifyEP(std::string_view text) {
		const auto epCount{
			std::min<std::ptrdiff_t>(std::count(text.begin(), text.end(), '!'), VaderFour)
		};

		return VaderEPFactor * static_cast<double>(epCount);
	}

	// emphasis from more than one question mark
	inline double Sentiment::amplifyQM(std::string_view text) {
		const auto qmCount{std::count(text.begin(), text.end(), '?')};

		if(qmCount > VaderOne) {
			if(qmCount <= VaderThree) {
				return VaderQMFactor * static_cast<double>(qmCount);
			}

			return VaderQMFactorMax;
		}

		return 0.;
	}

	// check for modification in sentiment due to contrastive conjunction 'but'
	inline void Sentiment::butCheck(const Tokens& tokensLower, std::vector<double>& sentiments) {
		const auto it{std::find(tokensLower.cbegin(), tokensLower.cend(), "but")};

		if(it != tokensLower.cend()) {
			const auto butIndex{static_cast<std::size_t>(it - tokensLower.begin())};

			for(std::size_t index{}; index < sentiments.size(); ++index) {
				if(index < butIndex) {
					sentiments[index] *= VaderButFactorBefore;
				}
				else if(index > butIndex) {
					sentiments[index] *= VaderButFactorAfter;
				}
			}
		}
	}

	// check for negation (either by "never so/this" or by "without doubt")
	inline void Sentiment::negationCheck(
			double& valence,
			const Tokens& tokensLower,
			std::uint8_t startIndex,
			std::size_t index
	) {
		switch(startIndex) {
		case VaderZero:
			if(Sentiment::isNegated(tokensLower[index - VaderOne])) {
				// 1 token preceding lexicon token (without stopwords)
				valence *= VaderN_SCALAR;
			}

			break;

		case VaderOne:
			if(
					tokensLower[index - VaderTwo] == "never"
					&& (
							tokensLower[index - VaderOne] == "so"
							|| tokensLower[index - VaderOne] == "this"
					)
			) {
				valence *= VaderNeverFactor;
			}
			else if(
					tokensLower[index - VaderTwo] == "without"
					&& tokensLower[index - VaderOne] == "doubt"
			) {
				// (ignore)
			}
			else if(Sentiment::isNegated(tokensLower[index - VaderTwo])) {
				// 2 tokens preceding the lexicon token position
				valence *= VaderN_SCALAR;
			}

			break;

		case VaderTwo:
			if(
					tokensLower[index - VaderThree] == "never"
					&& (
							tokensLower[index - VaderTwo] == "so"
							|| tokensLower[index - VaderTwo] == "this"
							|| tokensLower[index - VaderOne] == "so"
							|| tokensLower[index - VaderOne] == "this"
					)
			) {
				valence *= VaderNeverFactor;
			}
			else if(
					tokensLower[index - VaderThree] == "without"
					&& (
							tokensLower[index - VaderTwo] == "doubt"
							|| tokensLower[index - VaderOne] == "doubt"
					)
			) {
				// (ignore)
			}
			else if(Sentiment::isNegated(tokensLower[index - VaderThree])) {
				// 3 tokens preceding the lexicon token position
				valence *= VaderN_SCALAR;
			}

			break;

		default:
			break;
		}
	}

	// check for special idioms
	inline void Sentiment::specialIdiomsCheck(double& valence, const Tokens& tokensLower, std::size_t index) {
		const auto oneZero{
			tokensLower[index - VaderOne]
			+ " "
			+ tokensLower[index]
		};

		const auto twoOneZero{
			tokensLower[index - VaderTwo]
			+ " "
			+ tokensLower[index - VaderOne]
			+ " "
			+ tokensLower[index]
		};

		const auto twoOne{
			tokensLower[index - VaderTwo]
			+ " "
			+ tokensLower[index - VaderOne]
		};

		const auto threeTwoOne{
			tokensLower[index - VaderThree]
			+ " "
			+ tokensLower[index - VaderTwo]
			+ " "
			+ tokensLower[index - VaderOne]
		};

		const auto threeTwo{
			tokensLower[index - VaderThree]
			+ " "
			+ tokensLower[index - VaderTwo]
		};

		const std::array sequences{oneZero, twoOneZero, twoOne, threeTwoOne, threeTwo};

		for(const auto& sequence : sequences) {
			const auto it{Sentiment::SPECIAL_CASES.find(sequence)};

			if(it != Sentiment::SPECIAL_CASES.end()) {
				valence = it->second;

				break;
			}
		}

		if(tokensLower.size() - VaderOne > index) {
			const auto zeroOne{
				tokensLower[index]
				+ " "
				+ tokensLower[index + VaderOne]
			};

			const auto it{Sentiment::SPECIAL_CASES.find(zeroOne)};

			if(it != Sentiment::SPECIAL_CASES.end()) {
				valence = it->second;
			}
		}

		if(tokensLower.size() - VaderOne > index + VaderOne) {
			const auto zeroOneTwo{
				tokensLower[index]
				+ " "
				+ tokensLower[index + VaderOne]
				+ " "
				+ tokensLower[index + VaderTwo]
			};

			const auto it{Sentiment::SPECIAL_CASES.find(zeroOneTwo)};

			if(it != Sentiment::SPECIAL_CASES.end()) {
				valence = it->second;
			}
		}

		// check for booster/dampener bi-grams such as 'sort of' or 'kind of'
		const std::array nGrams{threeTwoOne, threeTwo, twoOne};

		for(const auto& nGram : nGrams) {
			const auto it{Sentiment::BOOSTER_DICT.find(nGram)};

			if(it != Sentiment::BOOSTER_DICT.end()) {
				valence += it->second;
			}
		}
	}

	// calculate final sentiment scores
	inline void Sentiment::siftSentimentScores(
				const std::vector<double>& sentiments,
				double& positiveSumTo,
				double& negativeSumTo,
				std::size_t& neutralCountTo
	) {
		for(const auto sentiment : sentiments) {
			if(sentiment > 0.) {
				// compensate for neutral tokens that are counted as 1
				positiveSumTo += sentiment + VaderFOne;
			}
			else if(sentiment < 0.) {
				// when used with fabs(), compensate for neutrals
				negativeSumTo += sentiment - VaderFOne;
			}
			else {
				++neutralCountTo;
			}
		}
	}

} /* namespace reviewlens::Data */

#endif /* DATA_SENTIMENT_HPP_ */
