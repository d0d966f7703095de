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
 * Pipeline.hpp
 *
 * Runs all stages of the review analysis over all products.
 *
 *  Created on: Mar 12, 2021
 *      Author: ans
 */

#ifndef MODULE_PIPELINE_HPP_
#define MODULE_PIPELINE_HPP_

#include "Aggregator.hpp"
#include "Cleaner.hpp"
#include "KeywordExtractor.hpp"
#include "SentimentScorer.hpp"

#include "../Data/KeywordFilter.hpp"
#include "../Data/Scorer.hpp"
#include "../Data/ImportExport/Results.hpp"
#include "../Data/ImportExport/Tables.hpp"
#include "../Data/ImportExport/Text.hpp"
#include "../Helper/FileSystem.hpp"
#include "../Helper/Strings.hpp"
#include "../Main/Exception.hpp"
#include "../Struct/PipelineResult.hpp"
#include "../Struct/PipelineSettings.hpp"
#include "../Struct/Product.hpp"
#include "../Struct/RawReview.hpp"
#include "../Struct/StatusSetter.hpp"

#include <cstddef>		// std::size_t
#include <memory>		// std::unique_ptr
#include <string>		// std::string
#include <string_view>	// std::string_view_literals
#include <vector>		// std::vector

namespace reviewlens::Module {

	using std::string_view_literals::operator""sv;

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! The file name of the cleaned and labeled reviews.
	inline constexpr auto cleanReviewsFile{"clean_reviews.csv"sv};

	//! The file name of the keyword table in CSV format.
	inline constexpr auto keywordsCsvFile{"keywords.csv"sv};

	//! The file name of the keyword table in JSON format.
	inline constexpr auto keywordsJsonFile{"keywords.json"sv};

	//! The file name of the comparison table in CSV format.
	inline constexpr auto comparisonCsvFile{"comparison.csv"sv};

	//! The file name of the comparison table in JSON format.
	inline constexpr auto comparisonJsonFile{"comparison.json"sv};

	//! The file name of the run summary.
	inline constexpr auto summaryFile{"summary.json"sv};

	///@}

	/*
	 * DECLARATION
	 */

	//! Runs all stages of the review analysis over all products.
	/*!
	 * The stages (cleaning, sentiment,
	 *  keywords, aggregation) are run one
	 *  after another. Inside each stage,
	 *  the products are distributed among
	 *  a pool of worker threads. Every
	 *  worker writes into the result slot
	 *  of the product it is processing, so
	 *  that the results do not depend on
	 *  the number of threads.
	 *
	 * Log messages are reported by the
	 *  main thread only, after a stage
	 *  has been completed.
	 */
	class Pipeline {
		// for convenience
		using CleaningCounts = Struct::CleaningCounts;
		using LogLevel = Struct::LogLevel;
		using PipelineResult = Struct::PipelineResult;
		using PipelineSettings = Struct::PipelineSettings;
		using Product = Struct::Product;
		using RawReviewSet = Struct::RawReviewSet;
		using StageSummary = Struct::StageSummary;
		using StatusSetter = Struct::StatusSetter;

	public:
		///@name Construction
		///@{

		Pipeline(const PipelineSettings& pipelineSettings, StatusSetter& statusSetter);

		///@}
		///@name Getters
		///@{

		[[nodiscard]] std::size_t getThreads() const;
		[[nodiscard]] const Data::Scorer& getScorer() const;

		///@}
		///@name Input
		///@{

		[[nodiscard]] std::vector<Product> loadProducts() const;
		[[nodiscard]] std::vector<RawReviewSet> loadReviews() const;
		[[nodiscard]] std::vector<std::string> loadStopWords() const;

		///@}
		///@name Execution
		///@{

		[[nodiscard]] PipelineResult run();
		[[nodiscard]] PipelineResult process(
				std::vector<Product> products,
				std::vector<RawReviewSet> rawReviews
		);

		///@}
		///@name Output
		///@{

		void write(const PipelineResult& result);

		///@}

		//! Class for pipeline exceptions.
		/*!
		 * Will be thrown when the settings
		 *  are invalid, or when an input
		 *  needed by all products could not
		 *  be read.
		 */
		MAIN_EXCEPTION_CLASS();

		/**@name Copy and Move
		 * The class is neither copyable, nor moveable.
		 */
		///@{

		//! Deleted copy constructor.
		Pipeline(Pipeline&) = delete;

		//! Deleted copy assignment operator.
		Pipeline& operator=(Pipeline&) = delete;

		//! Deleted move constructor.
		Pipeline(Pipeline&&) = delete;

		//! Deleted move assignment operator.
		Pipeline& operator=(Pipeline&&) = delete;

		///@}

	private:
		PipelineSettings settings;
		StatusSetter& status;
		std::unique_ptr<Data::Scorer> scorer;

		// internal helper functions
		template<typename Function> void forEachProduct(std::size_t count, Function function) const;
		void logCleaning(
				const std::vector<Product>& products,
				const std::vector<CleaningCounts>& counts,
				const StageSummary& summary
		) const;

		// static internal helper function
		static void addRawReviews(RawReviewSet& to, RawReviewSet& from);
	};

} /* namespace reviewlens::Module */

#endif /* MODULE_PIPELINE_HPP_ */
