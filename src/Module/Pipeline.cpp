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
 * Pipeline.cpp
 *
 * Runs all stages of the review analysis over all products.
 *
 *  Created on: Mar 12, 2021
 *      Author: ans
 */

#include "Pipeline.hpp"

#include <algorithm>		// std::min
#include <array>			// std::array
#include <atomic>			// std::atomic
#include <exception>		// std::current_exception, std::exception_ptr, std::rethrow_exception
#include <iterator>			// std::make_move_iterator
#include <memory>			// std::make_unique
#include <string>			// std::string, std::to_string
#include <thread>			// std::thread
#include <unordered_map>	// std::unordered_map
#include <utility>			// std::move

namespace reviewlens::Module {

	//! Constructor.
	/*!
	 * Checks the settings and loads the
	 *  sentiment dictionaries.
	 *
	 * \param pipelineSettings Constant reference
	 *   to the settings of the pipeline, which
	 *   will be copied.
	 * \param statusSetter Reference to the
	 *   status setter used for logging, which
	 *   needs to outlive the pipeline.
	 *
	 * \throws Pipeline::Exception if the
	 *   settings are invalid.
	 * \throws Data::Sentiment::Exception if
	 *   a sentiment dictionary could not be
	 *   read.
	 */
	Pipeline::Pipeline(const PipelineSettings& pipelineSettings, StatusSetter& statusSetter)
			: settings(pipelineSettings), status(statusSetter) {
		if(this->settings.sentimentDictionary.empty()) {
			throw Exception("Pipeline(): No sentiment dictionary specified");
		}

		if(this->settings.topK == 0) {
			throw Exception("Pipeline(): The number of keywords per bucket (top_k) is zero");
		}

		if(this->settings.nGramMax == 0) {
			throw Exception("Pipeline(): The maximum number of tokens in a keyword (ngram_max) is zero");
		}

		if(this->settings.minDf == 0) {
			throw Exception("Pipeline(): The minimum document frequency (min_df) is zero");
		}

		this->scorer = std::make_unique<Data::VaderScorer>(
				this->settings.sentimentDictionary,
				this->settings.sentimentEmojis
		);
	}

	//! Gets the number of worker threads to be used.
	/*!
	 * \returns The number of threads set in
	 *   the settings, or the number of
	 *   hardware threads if it is zero. At
	 *   least one thread will be used.
	 */
	std::size_t Pipeline::getThreads() const {
		if(this->settings.threads > 0) {
			return this->settings.threads;
		}

		const auto hardwareThreads{std::thread::hardware_concurrency()};

		if(hardwareThreads == 0) {
			return 1;
		}

		return hardwareThreads;
	}

	//! Gets the scorer used to attach sentiment scores.
	const Data::Scorer& Pipeline::getScorer() const {
		return *(this->scorer);
	}

	//! Loads the product table.
	/*!
	 * \throws Pipeline::Exception if the product
	 *   table could not be read or parsed.
	 */
	std::vector<Struct::Product> Pipeline::loadProducts() const {
		if(this->settings.products.empty()) {
			throw Exception("Pipeline::loadProducts(): No product table specified");
		}

		try {
			return Data::ImportExport::Tables::importProducts(
					Helper::FileSystem::readFile(this->settings.products)
			);
		}
		catch(const Main::Exception& e) {
			throw Exception(
					"Pipeline::loadProducts(): '"
					+ this->settings.products
					+ "': "
					+ e.what()
			);
		}
	}

	//! Loads the raw reviews.
	/*!
	 * The reviews are either read from a
	 *  single CSV file containing a column
	 *  @c product_id, or from all files named
	 *  @c reviews_<product_id>.csv inside a
	 *  directory.
	 *
	 * A file inside the directory that cannot
	 *  be read or parsed results in a set of
	 *  raw reviews containing the error.
	 *
	 * \returns The raw reviews, grouped by
	 *   product.
	 *
	 * \throws Pipeline::Exception if no reviews
	 *   have been specified, or the specified
	 *   file could not be read or parsed.
	 */
	std::vector<Struct::RawReviewSet> Pipeline::loadReviews() const {
		const auto& path{this->settings.reviews};

		if(path.empty()) {
			throw Exception("Pipeline::loadReviews(): No reviews specified");
		}

		std::vector<RawReviewSet> result;

		try {
			if(Helper::FileSystem::isValidDirectory(path)) {
				const auto files{
					Helper::FileSystem::listFilesInDirectory(
							path,
							Data::ImportExport::Tables::reviewFilePrefix,
							Data::ImportExport::Tables::reviewFileExtension
					)
				};

				for(const auto& file : files) {
					const auto fileName{Helper::FileSystem::getFileName(file)};
					const auto productId{Data::ImportExport::Tables::productIdFromFileName(fileName)};

					if(productId.empty()) {
						continue;
					}

					try {
						auto sets{
							Data::ImportExport::Tables::importReviews(
									Helper::FileSystem::readFile(file),
									fileName,
									productId
							)
						};

						result.insert(
								result.end(),
								std::make_move_iterator(sets.begin()),
								std::make_move_iterator(sets.end())
						);
					}
					catch(const Main::Exception& e) {
						RawReviewSet failed;

						failed.productId = productId;
						failed.source = fileName;
						failed.error = e.what();

						result.emplace_back(std::move(failed));
					}
				}

				return result;
			}

			if(!Helper::FileSystem::isValidFile(path)) {
				throw Exception("'" + path + "' is neither a file nor a directory");
			}

			return Data::ImportExport::Tables::importReviews(
					Helper::FileSystem::readFile(path),
					Helper::FileSystem::getFileName(path),
					""
			);
		}
		catch(const Exception& e) {
			throw Exception("Pipeline::loadReviews(): " + std::string(e.view()));
		}
		catch(const Main::Exception& e) {
			throw Exception("Pipeline::loadReviews(): '" + path + "': " + e.what());
		}
	}

	//! Loads the additional stopwords.
	/*!
	 * \returns The additional stopwords set in
	 *   the settings, followed by the words in
	 *   the additional stopword file, if set.
	 *
	 * \throws Pipeline::Exception if the
	 *   additional stopword file could not be
	 *   read.
	 */
	std::vector<std::string> Pipeline::loadStopWords() const {
		auto result{this->settings.extraStopwords};

		if(this->settings.extraStopwordsFile.empty()) {
			return result;
		}

		try {
			auto fromFile{
				Data::ImportExport::Text::importList(
						Helper::FileSystem::readFile(this->settings.extraStopwordsFile),
						false,
						true
				)
			};

			result.insert(
					result.end(),
					std::make_move_iterator(fromFile.begin()),
					std::make_move_iterator(fromFile.end())
			);
		}
		catch(const Helper::FileSystem::Exception& e) {
			throw Exception("Pipeline::loadStopWords(): " + std::string(e.view()));
		}

		return result;
	}

	//! Loads all inputs and processes them.
	/*!
	 * \returns The results of all stages.
	 *
	 * \throws Pipeline::Exception if one of the
	 *   inputs needed by all products could not
	 *   be read.
	 *
	 * \sa process
	 */
	Struct::PipelineResult Pipeline::run() {
		this->status.change("Loading products...");

		auto products{this->loadProducts()};

		this->status.log(LogLevel::info, "Loaded " + std::to_string(products.size()) + " product(s).");

		this->status.change("Loading reviews...");

		auto rawReviews{this->loadReviews()};

		std::size_t numRawReviews{0};

		for(const auto& set : rawReviews) {
			numRawReviews += set.reviews.size();
		}

		this->status.log(LogLevel::info, "Loaded " + std::to_string(numRawReviews) + " raw review(s).");

		return this->process(std::move(products), std::move(rawReviews));
	}

	//! Processes the given product table and raw reviews.
	/*!
	 * Raw reviews referencing products that
	 *  are not part of the product table are
	 *  counted as orphaned and not processed
	 *  any further.
	 *
	 * \param products The product table.
	 * \param rawReviews The raw reviews, grouped
	 *   by product.
	 *
	 * \returns The results of all stages.
	 *
	 * \throws Pipeline::Exception if a product ID
	 *   is empty or not unique.
	 */
	Struct::PipelineResult Pipeline::process(
			std::vector<Product> products,
			std::vector<RawReviewSet> rawReviews
	) {
		PipelineResult result;
		std::unordered_map<std::string, std::size_t> indices;

		result.products = std::move(products);

		const auto& table{result.products};
		const auto numProducts{table.size()};

		for(std::size_t index{0}; index < numProducts; ++index) {
			if(table[index].productId.empty()) {
				throw Exception("Pipeline::process(): Empty product ID in the product table");
			}

			if(!(indices.emplace(table[index].productId, index).second)) {
				throw Exception(
						"Pipeline::process(): Duplicate product ID '"
						+ table[index].productId
						+ "' in the product table"
				);
			}
		}

		// assign raw reviews to products
		StageSummary cleaningSummary;
		std::vector<RawReviewSet> sources(numProducts);
		std::vector<bool> hasSource(numProducts, false);

		cleaningSummary.stage = "cleaning";

		for(auto& set : rawReviews) {
			const auto it{indices.find(set.productId)};

			if(it == indices.end()) {
				cleaningSummary.orphans[set.productId] += set.reviews.size();

				continue;
			}

			if(hasSource[it->second]) {
				Pipeline::addRawReviews(sources[it->second], set);
			}
			else {
				sources[it->second] = std::move(set);
				hasSource[it->second] = true;
			}
		}

		// cleaning
		const Cleaner cleaner(this->settings.minLength);
		std::vector<CleanedReviews> cleaned(numProducts);

		this->status.change("Cleaning reviews...");

		this->forEachProduct(numProducts, [&](std::size_t index) {
			if(hasSource[index]) {
				cleaned[index] = cleaner.clean(sources[index]);
			}
			else {
				cleaned[index].productId = table[index].productId;
			}
		});

		for(const auto& set : cleaned) {
			Struct::StageCounts counts;

			counts.kept = set.counts.kept;
			counts.dropped = set.counts.dropped();

			cleaningSummary.products.emplace_back(set.productId, counts);

			result.cleaning.push_back(set.counts);
		}

		this->logCleaning(table, result.cleaning, cleaningSummary);

		result.stages.emplace_back(std::move(cleaningSummary));

		// sentiment
		const SentimentScorer sentimentScorer(*(this->scorer));
		StageSummary sentimentSummary;

		sentimentSummary.stage = "sentiment";

		this->status.change("Scoring sentiments...");

		this->forEachProduct(numProducts, [&](std::size_t index) {
			sentimentScorer.score(cleaned[index].reviews);
		});

		for(const auto& set : cleaned) {
			Struct::StageCounts counts;
			std::array<std::size_t, Struct::numBuckets> labels{};

			counts.kept = set.reviews.size();

			for(const auto& review : set.reviews) {
				if(review.sentimentLabel.has_value()) {
					++labels[static_cast<std::size_t>(Struct::toBucket(review.sentimentLabel.value()))];
				}
			}

			sentimentSummary.products.emplace_back(set.productId, counts);

			this->status.log(
					LogLevel::detail,
					set.productId
					+ ": "
					+ std::to_string(labels[static_cast<std::size_t>(Struct::Bucket::positive)])
					+ " positive, "
					+ std::to_string(labels[static_cast<std::size_t>(Struct::Bucket::neutral)])
					+ " neutral, "
					+ std::to_string(labels[static_cast<std::size_t>(Struct::Bucket::negative)])
					+ " negative."
			);
		}

		result.stages.emplace_back(std::move(sentimentSummary));

		// keywords
		const Data::KeywordFilter filter(
				this->loadStopWords(),
				table,
				this->settings.filterAllBrands
		);

		KeywordSettings keywordSettings;

		keywordSettings.minDf = this->settings.minDf;
		keywordSettings.topK = this->settings.topK;
		keywordSettings.maxFeatures = this->settings.maxFeatures;
		keywordSettings.nGramMax = this->settings.nGramMax;

		const KeywordExtractor extractor(filter, keywordSettings);
		std::vector<std::vector<Struct::KeywordEntry>> keywords(numProducts);
		StageSummary keywordSummary;

		keywordSummary.stage = "keywords";

		this->status.change("Extracting keywords...");

		this->forEachProduct(numProducts, [&](std::size_t index) {
			keywords[index] = extractor.extract(table[index].productId, cleaned[index].reviews);
		});

		for(std::size_t index{0}; index < numProducts; ++index) {
			Struct::StageCounts counts;

			counts.kept = cleaned[index].reviews.size();

			keywordSummary.products.emplace_back(table[index].productId, counts);

			this->status.log(
					LogLevel::detail,
					table[index].productId
					+ ": "
					+ std::to_string(keywords[index].size())
					+ " keyword(s), excluding ["
					+ Helper::Strings::join(filter.getBrandTokens(table[index].productId), ", ", false)
					+ "]."
			);
		}

		result.stages.emplace_back(std::move(keywordSummary));

		// aggregation
		const Aggregator aggregator(this->settings.recordKeywords);
		StageSummary aggregationSummary;

		aggregationSummary.stage = "aggregation";

		result.comparison.resize(numProducts);

		this->status.change("Aggregating results...");

		this->forEachProduct(numProducts, [&](std::size_t index) {
			result.comparison[index] = aggregator.aggregate(
					table[index],
					cleaned[index].reviews,
					keywords[index]
			);
		});

		for(const auto& record : result.comparison) {
			Struct::StageCounts counts;

			counts.kept = record.reviewCount;

			aggregationSummary.products.emplace_back(record.product.productId, counts);
		}

		Aggregator::sort(result.comparison);

		result.stages.emplace_back(std::move(aggregationSummary));

		// collect reviews and keywords in the order of the product table
		for(std::size_t index{0}; index < numProducts; ++index) {
			result.reviews.insert(
					result.reviews.end(),
					std::make_move_iterator(cleaned[index].reviews.begin()),
					std::make_move_iterator(cleaned[index].reviews.end())
			);
			result.keywords.insert(
					result.keywords.end(),
					std::make_move_iterator(keywords[index].begin()),
					std::make_move_iterator(keywords[index].end())
			);
		}

		this->status.log(
				LogLevel::info,
				"Processed "
				+ std::to_string(result.reviews.size())
				+ " review(s) of "
				+ std::to_string(numProducts)
				+ " product(s)."
		);

		return result;
	}

	//! Writes the results to the output directory.
	/*!
	 * All files are replaced only after all
	 *  of them have been written successfully.
	 *
	 * \param result Constant reference to the
	 *   results to be written.
	 *
	 * \throws Pipeline::Exception if the output
	 *   directory could not be created, or one
	 *   of the files could not be written.
	 */
	void Pipeline::write(const PipelineResult& result) {
		const auto& dir{this->settings.outputDir};
		std::vector<std::pair<std::string, std::string>> files;

		this->status.change("Writing results...");

		if(this->settings.writeClean) {
			files.emplace_back(
					Helper::FileSystem::join(dir, cleanReviewsFile),
					Data::ImportExport::Results::exportReviews(result.reviews)
			);
		}

		files.emplace_back(
				Helper::FileSystem::join(dir, keywordsCsvFile),
				Data::ImportExport::Results::exportKeywordsCsv(result.keywords)
		);
		files.emplace_back(
				Helper::FileSystem::join(dir, keywordsJsonFile),
				Data::ImportExport::Results::exportKeywordsJson(result.products, result.keywords)
		);
		files.emplace_back(
				Helper::FileSystem::join(dir, comparisonCsvFile),
				Data::ImportExport::Results::exportComparisonCsv(result.comparison)
		);
		files.emplace_back(
				Helper::FileSystem::join(dir, comparisonJsonFile),
				Data::ImportExport::Results::exportComparisonJson(result.comparison)
		);
		files.emplace_back(
				Helper::FileSystem::join(dir, summaryFile),
				Data::ImportExport::Results::exportSummary(result.cleaning, result.products, result.stages)
		);

		try {
			Helper::FileSystem::createDirectoryIfNotExists(dir);
			Helper::FileSystem::writeFilesAtomically(files);
		}
		catch(const Helper::FileSystem::Exception& e) {
			throw Exception("Pipeline::write(): " + std::string(e.view()));
		}

		this->status.log(
				LogLevel::info,
				"Wrote "
				+ std::to_string(files.size())
				+ " file(s) to '"
				+ dir
				+ "'."
		);
	}

	// run a function for every product index on the worker threads, rethrows the first exception (by index)
	template<typename Function> void Pipeline::forEachProduct(std::size_t count, Function function) const {
		std::atomic<std::size_t> next{0};
		std::vector<std::exception_ptr> errors(count);

		const auto work{
			[&next, &errors, &function, count]() {
				for(auto index{next.fetch_add(1)}; index < count; index = next.fetch_add(1)) {
					try {
						function(index);
					}
					catch(...) {
						errors[index] = std::current_exception();
					}
				}
			}
		};

		const auto numThreads{std::min(this->getThreads(), count)};

		if(numThreads <= 1) {
			work();
		}
		else {
			std::vector<std::thread> workers;

			workers.reserve(numThreads);

			for(std::size_t n{0}; n < numThreads; ++n) {
				workers.emplace_back(work);
			}

			for(auto& worker : workers) {
				worker.join();
			}
		}

		for(const auto& error : errors) {
			if(error) {
				std::rethrow_exception(error);
			}
		}
	}

	// log the results of the cleaning stage
	void Pipeline::logCleaning(
			const std::vector<Product>& products,
			const std::vector<CleaningCounts>& counts,
			const StageSummary& summary
	) const {
		for(std::size_t index{0}; index < products.size() && index < counts.size(); ++index) {
			const auto& productCounts{counts[index]};

			if(productCounts.unreadableSource) {
				this->status.log(
						LogLevel::warning,
						products[index].productId
						+ ": "
						+ productCounts.sourceError.value_or("Unreadable source")
				);
			}

			this->status.log(
					LogLevel::detail,
					products[index].productId
					+ ": kept "
					+ std::to_string(productCounts.kept)
					+ " of "
					+ std::to_string(productCounts.input)
					+ " review(s) ["
					+ std::to_string(productCounts.droppedShort)
					+ " too short, "
					+ std::to_string(productCounts.droppedRating)
					+ " invalid rating, "
					+ std::to_string(productCounts.droppedDuplicateId)
					+ " duplicate ID, "
					+ std::to_string(productCounts.droppedDuplicateText)
					+ " duplicate text; "
					+ std::to_string(productCounts.nullDates)
					+ " without date]."
			);
		}

		for(const auto& [productId, count] : summary.orphans) {
			this->status.log(
					LogLevel::warning,
					"Ignored "
					+ std::to_string(count)
					+ " review(s) of unknown product '"
					+ productId
					+ "'."
			);
		}
	}

	// append the raw reviews of a second source for the same product
	void Pipeline::addRawReviews(RawReviewSet& to, RawReviewSet& from) {
		if(from.error.has_value() && !to.error.has_value()) {
			to.error = std::move(from.error);
		}

		to.source += ", " + from.source;

		for(auto& review : from.reviews) {
			review.row = to.reviews.size() + 1;

			to.reviews.emplace_back(std::move(review));
		}
	}

} /* namespace reviewlens::Module */
