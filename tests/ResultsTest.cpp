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
 * ResultsTest.cpp
 *
 * Tests for exporting the results to CSV and JSON.
 *
 *  Created on: Mar 16, 2021
 *      Author: ans
 */

#include "Data/ImportExport/Results.hpp"

#include <rapidjson/document.h>

#include <gtest/gtest.h>

#include <cstddef>	// std::size_t
#include <locale>	// std::locale, std::numpunct
#include <optional>	// std::nullopt
#include <string>	// std::string
#include <vector>	// std::vector

namespace reviewlens::Data::ImportExport {

	namespace {

		// decimal comma and digit grouping, as in many European locales
		class CommaDecimalPoint : public std::numpunct<char> {
		protected:
			char do_decimal_point() const override {
				return ',';
			}

			char do_thousands_sep() const override {
				return '.';
			}

			std::string do_grouping() const override {
				return "\3";
			}
		};

		Struct::KeywordEntry makeKeyword(
				const std::string& productId,
				Struct::Bucket bucket,
				const std::string& term,
				double score,
				std::size_t rank
		) {
			Struct::KeywordEntry keyword;

			keyword.productId = productId;
			keyword.bucket = bucket;
			keyword.term = term;
			keyword.score = score;
			keyword.rank = rank;

			return keyword;
		}

		std::vector<Struct::ComparisonRecord> makeRecords() {
			Struct::ComparisonRecord x;
			Struct::ComparisonRecord y;

			x.product.productId = "X";
			x.product.brand = "Acme";
			x.product.productName = "Crunchies, Original";
			x.reviewCount = 2;
			x.ratingDistribution = {1, 0, 0, 0, 1};
			x.ratingPercentages = {50., 0., 0., 0., 50.};
			x.avgRating = 3.;
			x.pctPositive = 50.;
			x.pctNeutral = 0.;
			x.pctNegative = 50.;
			x.pctVerified = 50.;
			x.avgLength = 25.;
			x.score = 0.;
			x.keywords[static_cast<std::size_t>(Struct::Bucket::overall)] = {{"tasty", 0.5}, {"dry kibble", 0.25}};

			y.product.productId = "Y";

			return { x, y };
		}

	} /* namespace */

	TEST(ResultsTest, FormatNumber) {
		EXPECT_EQ(Results::formatNumber(0.125, 2), "0.13");
		EXPECT_EQ(Results::formatNumber(3., 2), "3.00");
		EXPECT_EQ(Results::formatNumber(-0.0001, 2), "0.00");
		EXPECT_EQ(Results::formatNumber(-0.29604, 4), "-0.2960");
		EXPECT_EQ(Results::formatNullable(std::nullopt, 2), "");
		EXPECT_EQ(Results::formatNullable(66.666, 2), "66.67");
	}

	TEST(ResultsTest, FormatNumberIgnoresGlobalLocale) {
		const auto previous{
			std::locale::global(std::locale(std::locale::classic(), new CommaDecimalPoint))
		};

		const auto formatted{Results::formatNumber(12345.678, 2)};
		const auto csv{Results::exportComparisonCsv(makeRecords())};

		std::locale::global(previous);

		EXPECT_EQ(formatted, "12345.68");
		EXPECT_NE(csv.find(",50.00,"), std::string::npos);
		EXPECT_EQ(csv.find("50,00"), std::string::npos);
	}

	TEST(ResultsTest, FlattenKeywords) {
		EXPECT_EQ(
				Results::flattenKeywords({{"tasty", 0.5}, {"dry kibble", 0.25}}),
				"tasty:0.500000;dry kibble:0.250000"
		);
		EXPECT_EQ(Results::flattenKeywords({}), "");
	}

	TEST(ResultsTest, ExportReviews) {
		Struct::Review scored;
		Struct::Review unscored;

		scored.reviewId = "X-1";
		scored.productId = "X";
		scored.rating = 5;
		scored.text = "great food, my cat loves it!";
		scored.verified = true;
		scored.sentimentScore = 0.8439;
		scored.sentimentLabel = Struct::SentimentLabel::positive;

		unscored.reviewId = "r2";
		unscored.productId = "X";
		unscored.rating = 1;
		unscored.text = "say \"no\"";
		unscored.date = "2018-01-05";

		EXPECT_EQ(
				Results::exportReviews({scored, unscored}),
				"review_id,product_id,rating,text,verified,date,sentiment_score,sentiment_label\n"
				"X-1,X,5,\"great food, my cat loves it!\",true,,0.8439,positive\n"
				"r2,X,1,\"say \"\"no\"\"\",false,2018-01-05,,\n"
		);
	}

	TEST(ResultsTest, ExportKeywordsCsv) {
		EXPECT_EQ(
				Results::exportKeywordsCsv({
					makeKeyword("X", Struct::Bucket::overall, "tasty", 1.4644231380558226, 1),
					makeKeyword("X", Struct::Bucket::negative, "stale smell", 0.5, 1)
				}),
				"product_id,bucket,rank,term,score\n"
				"X,overall,1,tasty,1.464423\n"
				"X,negative,1,stale smell,0.500000\n"
		);
	}

	TEST(ResultsTest, ExportKeywordsJson) {
		Struct::Product x;
		Struct::Product y;

		x.productId = "X";
		y.productId = "Y";

		const auto json{
			Results::exportKeywordsJson(
					{x, y},
					{
						makeKeyword("X", Struct::Bucket::overall, "tasty", 0.75, 1),
						makeKeyword("X", Struct::Bucket::overall, "fresh", 0.5, 2),
						makeKeyword("Z", Struct::Bucket::overall, "ignored", 0.5, 1)
					}
			)
		};

		rapidjson::Document document;

		ASSERT_FALSE(document.Parse(json.c_str()).HasParseError());
		ASSERT_TRUE(document.IsObject());
		EXPECT_EQ(document.MemberCount(), 2U);

		const auto& overall{document["X"]["overall"]};

		ASSERT_EQ(overall.Size(), 2U);
		EXPECT_STREQ(overall[0]["term"].GetString(), "tasty");
		EXPECT_DOUBLE_EQ(overall[0]["score"].GetDouble(), 0.75);
		EXPECT_EQ(overall[1]["rank"].GetUint64(), 2U);

		for(const auto * bucket : {"overall", "positive", "neutral", "negative"}) {
			ASSERT_TRUE(document["Y"].HasMember(bucket));
			EXPECT_EQ(document["Y"][bucket].Size(), 0U);
		}
	}

	TEST(ResultsTest, ExportComparisonCsv) {
		const auto rows{Csv::importRows(Results::exportComparisonCsv(makeRecords()))};

		ASSERT_EQ(rows.size(), 3U);
		ASSERT_EQ(rows[0].size(), 29U);
		EXPECT_EQ(rows[0][8], "rating_1");
		EXPECT_EQ(rows[0][13], "rating_pct_1");
		EXPECT_EQ(rows[0][18], "avg_rating");
		EXPECT_EQ(rows[0][24], "score");
		EXPECT_EQ(rows[0][25], "keywords_overall");
		EXPECT_EQ(rows[0][28], "keywords_negative");

		const auto& x{rows[1]};

		ASSERT_EQ(x.size(), 29U);
		EXPECT_EQ(x[0], "X");
		EXPECT_EQ(x[1], "Acme");
		EXPECT_EQ(x[3], "Crunchies, Original");
		EXPECT_EQ(x[7], "2");
		EXPECT_EQ(x[8], "1");
		EXPECT_EQ(x[13], "50.00");
		EXPECT_EQ(x[18], "3.00");
		EXPECT_EQ(x[24], "0.00");
		EXPECT_EQ(x[25], "tasty:0.500000;dry kibble:0.250000");
		EXPECT_EQ(x[26], "");

		const auto& y{rows[2]};

		ASSERT_EQ(y.size(), 29U);
		EXPECT_EQ(y[0], "Y");
		EXPECT_EQ(y[1], "Y");
		EXPECT_EQ(y[7], "0");
		EXPECT_EQ(y[8], "0");
		EXPECT_EQ(y[13], "");
		EXPECT_EQ(y[18], "");
		EXPECT_EQ(y[24], "");
	}

	TEST(ResultsTest, ExportComparisonJson) {
		const auto json{Results::exportComparisonJson(makeRecords())};

		rapidjson::Document document;

		ASSERT_FALSE(document.Parse(json.c_str()).HasParseError());
		ASSERT_TRUE(document.IsArray());
		ASSERT_EQ(document.Size(), 2U);

		const auto& x{document[0]};

		EXPECT_STREQ(x["product_id"].GetString(), "X");
		EXPECT_EQ(x["review_count"].GetUint64(), 2U);
		EXPECT_EQ(x["rating_distribution"]["5"].GetUint64(), 1U);
		EXPECT_DOUBLE_EQ(x["rating_pct"]["1"].GetDouble(), 50.);
		EXPECT_DOUBLE_EQ(x["score"].GetDouble(), 0.);
		ASSERT_EQ(x["keywords"]["overall"].Size(), 2U);
		EXPECT_STREQ(x["keywords"]["overall"][1]["term"].GetString(), "dry kibble");

		const auto& y{document[1]};

		EXPECT_STREQ(y["display_name"].GetString(), "Y");
		EXPECT_EQ(y["review_count"].GetUint64(), 0U);
		EXPECT_TRUE(y["rating_pct"]["3"].IsNull());
		EXPECT_TRUE(y["avg_rating"].IsNull());
		EXPECT_TRUE(y["pct_positive"].IsNull());
		EXPECT_TRUE(y["score"].IsNull());
		EXPECT_EQ(y["keywords"]["positive"].Size(), 0U);
	}

	TEST(ResultsTest, ExportSummary) {
		Struct::Product x;
		Struct::CleaningCounts counts;
		Struct::StageSummary stage;

		x.productId = "X";

		counts.input = 3;
		counts.kept = 2;
		counts.droppedDuplicateText = 1;
		counts.nullDates = 2;

		stage.stage = "cleaning";
		stage.products.emplace_back("X", Struct::StageCounts{2, 1});
		stage.orphans["Q"] = 4;

		const auto json{Results::exportSummary({counts}, {x}, {stage})};

		rapidjson::Document document;

		ASSERT_FALSE(document.Parse(json.c_str()).HasParseError());
		ASSERT_EQ(document["cleaning"].Size(), 1U);

		const auto& cleaning{document["cleaning"][0]};

		EXPECT_STREQ(cleaning["product_id"].GetString(), "X");
		EXPECT_EQ(cleaning["input"].GetUint64(), 3U);
		EXPECT_EQ(cleaning["kept"].GetUint64(), 2U);
		EXPECT_EQ(cleaning["dropped_duplicate_text"].GetUint64(), 1U);
		EXPECT_EQ(cleaning["null_dates"].GetUint64(), 2U);
		EXPECT_FALSE(cleaning["unreadable_source"].GetBool());
		EXPECT_TRUE(cleaning["source_error"].IsNull());

		ASSERT_EQ(document["stages"].Size(), 1U);

		const auto& cleaningStage{document["stages"][0]};

		EXPECT_STREQ(cleaningStage["stage"].GetString(), "cleaning");
		EXPECT_EQ(cleaningStage["products"][0]["dropped"].GetUint64(), 1U);
		EXPECT_EQ(cleaningStage["orphans"]["Q"].GetUint64(), 4U);
	}

} /* namespace reviewlens::Data::ImportExport */
