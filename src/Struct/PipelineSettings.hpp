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
 * PipelineSettings.hpp
 *
 * Settings of the review analysis pipeline.
 *
 *  Created on: Mar 4, 2021
 *      Author: ans
 */

#ifndef STRUCT_PIPELINESETTINGS_HPP_
#define STRUCT_PIPELINESETTINGS_HPP_

#include <cstdint>	// std::uint16_t
#include <cstddef>	// std::size_t
#include <string>	// std::string
#include <vector>	// std::vector

namespace reviewlens::Struct {

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! The default minimum length of a normalized review text, in characters.
	inline constexpr auto defaultMinLength{20};

	//! The default minimum number of documents a keyword needs to occur in.
	inline constexpr auto defaultMinDf{2};

	//! The default number of keywords kept per product and bucket.
	inline constexpr auto defaultTopK{20};

	//! The default maximum size of the vocabulary of a corpus.
	inline constexpr auto defaultMaxFeatures{2000};

	//! The default maximum number of tokens in a keyword.
	inline constexpr auto defaultNGramMax{2};

	//! The default number of keywords per bucket attached to a comparison record.
	inline constexpr auto defaultRecordKeywords{10};

	///@}

	/*
	 * DECLARATION
	 */

	//! Settings of the review analysis pipeline.
	/*!
	 * Read from the configuration file by
	 *  Main::ConfigFile.
	 */
	struct PipelineSettings {
		///@name Input and Output
		///@{

		//! Path to the CSV file containing the product table.
		std::string products;

		//! Path to the CSV file or directory containing the raw reviews.
		std::string reviews;

		//! Path to the directory to which the outputs will be written.
		std::string outputDir{"output"};

		//! Path to the VADER-format sentiment dictionary.
		std::string sentimentDictionary;

		//! Path to the emoji dictionary, or empty if no emoji dictionary is used.
		std::string sentimentEmojis;

		//! Whether to write the cleaned and labeled reviews.
		bool writeClean{true};

		///@}
		///@name Cleaning
		///@{

		//! The minimum length of a normalized review text, in characters.
		std::size_t minLength{defaultMinLength};

		///@}
		///@name Keywords
		///@{

		//! The minimum number of documents a keyword needs to occur in.
		std::size_t minDf{defaultMinDf};

		//! The maximum number of keywords per product and bucket.
		std::size_t topK{defaultTopK};

		//! The maximum size of the vocabulary of a corpus, or zero for no limit.
		std::size_t maxFeatures{defaultMaxFeatures};

		//! The maximum number of consecutive tokens in a keyword.
		std::size_t nGramMax{defaultNGramMax};

		//! Additional stopwords, removed in addition to the standard English stopwords.
		std::vector<std::string> extraStopwords{
			"cat", "cats", "kitty", "kitten", "kittens", "feline",
			"pet", "pets", "food", "bag", "bags",
			"pound", "pounds", "lb", "lbs", "ounce", "ounces",
			"like", "buy", "bought", "purchase", "product", "brand"
		};

		//! Path to a file containing additional stopwords, one per line, or empty.
		std::string extraStopwordsFile;

		//! Whether to remove the brand and product names of all products, not only of the own one.
		bool filterAllBrands{false};

		///@}
		///@name Aggregation
		///@{

		//! The number of keywords per bucket attached to a comparison record.
		std::size_t recordKeywords{defaultRecordKeywords};

		///@}
		///@name Execution
		///@{

		//! The number of worker threads, or zero to use the number of hardware threads.
		std::uint16_t threads{0};

		//! Whether to log details for each product.
		bool verbose{false};

		///@}
	};

} /* namespace reviewlens::Struct */

#endif /* STRUCT_PIPELINESETTINGS_HPP_ */
