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
 * PipelineTest.cpp
 *
 * End-to-end tests for the review analysis pipeline.
 *
 *  Created on: Mar 16, 2021
 *      Author: ans
 */

#include "TemporaryDirectory.hpp"

#include "Data/Sentiment.hpp"
#include "Helper/FileSystem.hpp"
#include "Module/Pipeline.hpp"

#include <gtest/gtest.h>

#include <algorithm>	// std::any_of
#include <cstddef>		// std::size_t
#include <optional>		// std::nullopt
#include <string>		// std::string, std::to_string
#include <utility>		// std::pair
#include <vector>		// std::vector

namespace reviewlens::Module {

	namespace {

		const std::string products{
			"product_id,brand,product_name,flavor\n"
			"X,Acme,Crunchies,Chicken\n"
			"Y,Zed,Nibbles,Tuna\n"
		};

		const std::string reviews{
			"product_id,review_id,rating,text,verified,date\n"
			"X,,5,\"Great food, my cat loves it!\",true,2018-01-05\n"
			"X,,1,Cat refused to eat it.,false,\n"
			"X,,5,\"great food,   my cat loves it!\",true,\n"
			"Q,,3,a review of an unknown product,false,\n"
		};

		Struct::PipelineSettings makeSettings(const Tests::TemporaryDirectory& dir) {
			Struct::PipelineSettings settings;

			settings.products = dir.file("products.csv");
			settings.reviews = dir.file("reviews.csv");
			settings.outputDir = dir.file("output");
			settings.sentimentDictionary = REVIEWLENS_TEST_DATA_DIR "/vader_lexicon_test.txt";
			settings.minDf = 1;
			settings.topK = 3;
			settings.nGramMax = 1;
			settings.threads = 1;

			return settings;
		}

		// all outputs of a run, as they would be written
		std::vector<std::string> exportAll(const Struct::PipelineResult& result) {
			namespace Results = Data::ImportExport::Results;

			return {
				Results::exportReviews(result.reviews),
				Results::exportKeywordsCsv(result.keywords),
				Results::exportKeywordsJson(result.products, result.keywords),
				Results::exportComparisonCsv(result.comparison),
				Results::exportComparisonJson(result.comparison),
				Results::exportSummary(result.cleaning, result.products, result.stages)
			};
		}

	} /* namespace */

	TEST(PipelineTest, EndToEnd) {
		const Tests::TemporaryDirectory dir;

		dir.write("products.csv", products);
		dir.write("reviews.csv", reviews);

		Struct::StatusSetter status;
		Pipeline pipeline(makeSettings(dir), status);

		const auto result{pipeline.run()};

		// cleaning
		ASSERT_EQ(result.cleaning.size(), 2U);
		EXPECT_EQ(result.cleaning[0].input, 3U);
		EXPECT_EQ(result.cleaning[0].kept, 2U);
		EXPECT_EQ(result.cleaning[0].droppedDuplicateText, 1U);
		EXPECT_EQ(result.cleaning[0].nullDates, 1U);
		EXPECT_FALSE(result.cleaning[0].unreadableSource);
		EXPECT_EQ(result.cleaning[1].input, 0U);
		EXPECT_FALSE(result.cleaning[1].unreadableSource);

		// sentiment
		ASSERT_EQ(result.reviews.size(), 2U);
		EXPECT_EQ(result.reviews[0].reviewId, "X-1");
		EXPECT_EQ(result.reviews[0].text, "great food, my cat loves it!");
		EXPECT_EQ(result.reviews[0].date, "2018-01-05");
		EXPECT_EQ(result.reviews[0].sentimentLabel, Struct::SentimentLabel::positive);
		EXPECT_EQ(result.reviews[1].reviewId, "X-2");
		EXPECT_EQ(result.reviews[1].sentimentLabel, Struct::SentimentLabel::negative);

		// keywords
		EXPECT_FALSE(result.keywords.empty());

		for(const auto& keyword : result.keywords) {
			EXPECT_EQ(keyword.productId, "X");
			EXPECT_NE(keyword.term, "cat");
			EXPECT_NE(keyword.term, "food");
			EXPECT_NE(keyword.term, "acme");
		}

		// aggregation
		ASSERT_EQ(result.comparison.size(), 2U);

		const auto& x{result.comparison[0]};

		EXPECT_EQ(x.product.productId, "X");
		EXPECT_EQ(x.reviewCount, 2U);
		EXPECT_EQ(x.pctPositive, 50.);
		EXPECT_EQ(x.pctNeutral, 0.);
		EXPECT_EQ(x.pctNegative, 50.);
		EXPECT_EQ(x.score, 0.);

		const auto& y{result.comparison[1]};

		EXPECT_EQ(y.product.productId, "Y");
		EXPECT_EQ(y.reviewCount, 0U);
		EXPECT_EQ(y.pctPositive, std::nullopt);
		EXPECT_EQ(y.pctNeutral, std::nullopt);
		EXPECT_EQ(y.pctNegative, std::nullopt);
		EXPECT_EQ(y.score, std::nullopt);

		for(const auto& bucket : y.keywords) {
			EXPECT_TRUE(bucket.empty());
		}

		// summaries
		ASSERT_EQ(result.stages.size(), 4U);
		EXPECT_EQ(result.stages[0].stage, "cleaning");
		EXPECT_EQ(result.stages[1].stage, "sentiment");
		EXPECT_EQ(result.stages[2].stage, "keywords");
		EXPECT_EQ(result.stages[3].stage, "aggregation");
		ASSERT_EQ(result.stages[0].orphans.size(), 1U);
		EXPECT_EQ(result.stages[0].orphans.at("Q"), 1U);
		ASSERT_EQ(result.stages[0].products.size(), 2U);
		EXPECT_EQ(result.stages[0].products[0].second.kept, 2U);
		EXPECT_EQ(result.stages[0].products[0].second.dropped, 1U);

		for(const auto& stage : result.stages) {
			ASSERT_EQ(stage.products.size(), 2U);
		}

		EXPECT_EQ(result.stages[3].products[0].first, "X");
		EXPECT_EQ(result.stages[3].products[0].second.kept, 2U);
	}

	TEST(PipelineTest, ThreadsDoNotChangeResults) {
		const Tests::TemporaryDirectory dir;
		std::string productTable{"product_id,brand\n"};
		std::string reviewTable{"product_id,rating,text,verified,date\n"};
		const std::vector<std::string> texts{
			"great taste and my cat loves the smell",
			"terrible smell, the cat refused it twice",
			"good value but the bag arrived torn open",
			"happy cat, happy owner, great crunchy kibble",
			"made my cat sick, bad batch this time",
			"crunchy kibble with a fresh smell every time"
		};

		for(std::size_t product{0}; product < 9; ++product) {
			const auto id{"P" + std::to_string(product)};

			productTable += id + ",Brand" + std::to_string(product) + "\n";

			for(std::size_t review{0}; review <= product % texts.size(); ++review) {
				reviewTable += id
						+ ","
						+ std::to_string(1 + (product + review) % 5)
						+ ",\""
						+ texts[(product + review) % texts.size()]
						+ "\",true,2021-03-0"
						+ std::to_string(1 + review)
						+ "\n";
			}
		}

		dir.write("products.csv", productTable);
		dir.write("reviews.csv", reviewTable);

		auto settings{makeSettings(dir)};
		Struct::StatusSetter status;

		Pipeline sequential(settings, status);

		settings.threads = 4;

		Pipeline parallel(settings, status);

		EXPECT_EQ(sequential.getThreads(), 1U);
		EXPECT_EQ(parallel.getThreads(), 4U);
		EXPECT_EQ(exportAll(sequential.run()), exportAll(parallel.run()));
	}

	TEST(PipelineTest, ReadsReviewDirectory) {
		const Tests::TemporaryDirectory dir;

		dir.write("products.csv", "product_id\nX\nY\nW\n");
		dir.write("reviews/reviews_X.csv", "review_id,rating,text\nr1,5,Great food and my cat loves it a lot\n");
		dir.write("reviews/reviews_Y.csv", "review_id,rating,text\nr1,4,\"broken quote\n");
		dir.write("reviews/reviews_Z.csv", "review_id,rating,text\nz1,3,some review text that is long enough\n");
		dir.write("reviews/notes.txt", "not a review file");

		auto settings{makeSettings(dir)};

		settings.reviews = dir.file("reviews");

		Struct::StatusSetter status;
		Pipeline pipeline(settings, status);

		const auto sets{pipeline.loadReviews()};

		ASSERT_EQ(sets.size(), 3U);
		EXPECT_EQ(sets[0].productId, "X");
		EXPECT_EQ(sets[0].source, "reviews_X.csv");
		EXPECT_FALSE(sets[0].error.has_value());
		EXPECT_EQ(sets[1].productId, "Y");
		EXPECT_TRUE(sets[1].error.has_value());
		EXPECT_EQ(sets[2].productId, "Z");

		const auto result{pipeline.run()};

		ASSERT_EQ(result.cleaning.size(), 3U);
		EXPECT_EQ(result.cleaning[0].kept, 1U);
		EXPECT_TRUE(result.cleaning[1].unreadableSource);
		EXPECT_TRUE(result.cleaning[1].sourceError.has_value());
		EXPECT_EQ(result.cleaning[2].input, 0U);
		EXPECT_FALSE(result.cleaning[2].unreadableSource);
		EXPECT_EQ(result.stages[0].orphans.at("Z"), 1U);

		ASSERT_EQ(result.comparison.size(), 3U);
		EXPECT_EQ(result.comparison[0].product.productId, "X");
		EXPECT_EQ(result.comparison[0].reviewCount, 1U);
	}

	TEST(PipelineTest, MergesSourcesOfTheSameProduct) {
		const Tests::TemporaryDirectory dir;
		Struct::StatusSetter status;
		Pipeline pipeline(makeSettings(dir), status);

		Struct::Product product;
		Struct::RawReviewSet first;
		Struct::RawReviewSet second;
		Struct::RawReview review;

		product.productId = "X";

		review.row = 1;
		review.rating = "5";
		review.text = "great food, my cat loves it!";

		first.productId = "X";
		first.source = "a.csv";
		first.reviews = {review};

		second = first;
		second.source = "b.csv";
		second.reviews[0].text = "cat refused to eat it.";

		const auto result{pipeline.process({product}, {first, second})};

		// rows are renumbered, so that generated review IDs stay unique
		ASSERT_EQ(result.reviews.size(), 2U);
		EXPECT_EQ(result.reviews[0].reviewId, "X-1");
		EXPECT_EQ(result.reviews[1].reviewId, "X-2");
		EXPECT_EQ(result.cleaning[0].input, 2U);
	}

	TEST(PipelineTest, WritesOutputs) {
		const Tests::TemporaryDirectory dir;

		dir.write("products.csv", products);
		dir.write("reviews.csv", reviews);

		auto settings{makeSettings(dir)};
		Struct::StatusSetter status;

		Pipeline pipeline(settings, status);

		const auto result{pipeline.run()};

		pipeline.write(result);

		for(const auto * file : {
				"clean_reviews.csv",
				"keywords.csv",
				"keywords.json",
				"comparison.csv",
				"comparison.json",
				"summary.json"
		}) {
			EXPECT_TRUE(Helper::FileSystem::isValidFile(dir.file("output/" + std::string(file)))) << file;
			EXPECT_FALSE(Helper::FileSystem::exists(dir.file("output/" + std::string(file) + ".tmp"))) << file;
		}

		EXPECT_EQ(
				Helper::FileSystem::readFile(dir.file("output/comparison.csv")),
				Data::ImportExport::Results::exportComparisonCsv(result.comparison)
		);

		settings.writeClean = false;
		settings.outputDir = dir.file("output2");

		Pipeline withoutReviews(settings, status);

		withoutReviews.write(result);

		EXPECT_TRUE(Helper::FileSystem::exists(dir.file("output2/summary.json")));
		EXPECT_FALSE(Helper::FileSystem::exists(dir.file("output2/clean_reviews.csv")));
	}

	TEST(PipelineTest, LogsWarnings) {
		const Tests::TemporaryDirectory dir;
		std::vector<std::pair<Struct::LogLevel, std::string>> messages;

		dir.write("products.csv", products);
		dir.write("reviews.csv", reviews);

		Struct::StatusSetter status(
				false,
				[&messages](Struct::LogLevel level, const std::string& message) {
					messages.emplace_back(level, message);
				}
		);

		Pipeline pipeline(makeSettings(dir), status);

		static_cast<void>(pipeline.run());

		EXPECT_TRUE(
				std::any_of(messages.cbegin(), messages.cend(), [](const auto& message) {
					return message.first == Struct::LogLevel::warning
							&& message.second.find("'Q'") != std::string::npos;
				})
		);

		// details are only logged in verbose mode
		EXPECT_FALSE(
				std::any_of(messages.cbegin(), messages.cend(), [](const auto& message) {
					return message.first == Struct::LogLevel::detail;
				})
		);
	}

	TEST(PipelineTest, LoadsStopWords) {
		const Tests::TemporaryDirectory dir;
		auto settings{makeSettings(dir)};
		Struct::StatusSetter status;

		settings.extraStopwords = {"chow"};
		settings.extraStopwordsFile = dir.write("stopwords.txt", "kibble\n# comment\n\n  nom \n");

		const Pipeline pipeline(settings, status);

		EXPECT_EQ(pipeline.loadStopWords(), (std::vector<std::string>{"chow", "kibble", "nom"}));

		settings.extraStopwordsFile = dir.file("missing.txt");

		const Pipeline missing(settings, status);

		EXPECT_THROW(static_cast<void>(missing.loadStopWords()), Pipeline::Exception);
	}

	TEST(PipelineTest, UsesVaderScorer) {
		const Tests::TemporaryDirectory dir;
		Struct::StatusSetter status;
		const Pipeline pipeline(makeSettings(dir), status);

		const auto polarity{pipeline.getScorer().score("great")};

		EXPECT_DOUBLE_EQ(polarity.score, 0.6249);
		EXPECT_EQ(polarity.label, Struct::SentimentLabel::positive);
	}

	TEST(PipelineTest, InvalidSettingsThrow) {
		const Tests::TemporaryDirectory dir;
		Struct::StatusSetter status;
		const auto valid{makeSettings(dir)};
		auto settings{valid};

		settings.sentimentDictionary.clear();

		EXPECT_THROW(Pipeline(settings, status), Pipeline::Exception);

		settings = valid;
		settings.topK = 0;

		EXPECT_THROW(Pipeline(settings, status), Pipeline::Exception);

		settings = valid;
		settings.nGramMax = 0;

		EXPECT_THROW(Pipeline(settings, status), Pipeline::Exception);

		settings = valid;
		settings.minDf = 0;

		EXPECT_THROW(Pipeline(settings, status), Pipeline::Exception);

		settings = valid;
		settings.sentimentDictionary = dir.file("missing.txt");

		EXPECT_THROW(Pipeline(settings, status), Data::Sentiment::Exception);
	}

	TEST(PipelineTest, MissingInputsThrow) {
		const Tests::TemporaryDirectory dir;
		Struct::StatusSetter status;
		Pipeline pipeline(makeSettings(dir), status);

		EXPECT_THROW(static_cast<void>(pipeline.run()), Pipeline::Exception);

		dir.write("products.csv", "product_id\nX\nX\n");

		EXPECT_THROW(static_cast<void>(pipeline.loadProducts()), Pipeline::Exception);
		EXPECT_THROW(static_cast<void>(pipeline.loadReviews()), Pipeline::Exception);

		Struct::Product product;

		product.productId = "X";

		EXPECT_THROW(static_cast<void>(pipeline.process({product, product}, {})), Pipeline::Exception);
	}

} /* namespace reviewlens::Module */
