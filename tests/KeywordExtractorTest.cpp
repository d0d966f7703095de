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
 * KeywordExtractorTest.cpp
 *
 * Tests for the extraction of keywords per product and bucket.
 *
 *  Created on: Mar 15, 2021
 *      Author: ans
 */

#include "Module/KeywordExtractor.hpp"

#include <gtest/gtest.h>

#include <cstddef>	// std::size_t
#include <string>	// std::string, std::to_string
#include <vector>	// std::vector

namespace reviewlens::Module {

	namespace {

		Struct::Review makeReview(
				const std::string& productId,
				const std::string& text,
				Struct::SentimentLabel label
		) {
			Struct::Review review;

			review.reviewId = productId + "-" + std::to_string(text.size());
			review.productId = productId;
			review.rating = 3;
			review.text = text;
			review.sentimentLabel = label;

			return review;
		}

	} /* namespace */

	class KeywordExtractorTest : public ::testing::Test {
	protected:
		KeywordExtractorTest() : filter({}, KeywordExtractorTest::makeProducts(), false) {
			this->settings.minDf = 2;
			this->settings.topK = 3;
			this->settings.maxFeatures = 0;
			this->settings.nGramMax = 2;

			this->reviews = {
				makeReview("P1", "Purrfect salmon pate smells fresh", Struct::SentimentLabel::positive),
				makeReview("P1", "pate smells fresh every time", Struct::SentimentLabel::positive),
				makeReview("P1", "pate arrived crushed, smells off", Struct::SentimentLabel::negative)
			};
		}

		static std::vector<Struct::Product> makeProducts() {
			Struct::Product first;
			Struct::Product second;

			first.productId = "P1";
			first.brand = "Purrfect";
			first.productName = "Salmon Feast";

			second.productId = "P2";
			second.brand = "Other";

			return { first, second };
		}

		Data::KeywordFilter filter;
		KeywordSettings settings;
		std::vector<Struct::Review> reviews;
	};

	TEST_F(KeywordExtractorTest, Document) {
		const KeywordExtractor extractor(this->filter, this->settings);

		EXPECT_EQ(
				extractor.document("P1", "Purrfect salmon pate smells fresh"),
				(std::vector<std::string>{"pate", "smells", "fresh", "pate smells", "smells fresh"})
		);

		// the brand of another product is kept
		EXPECT_EQ(
				extractor.document("P2", "Purrfect pate"),
				(std::vector<std::string>{"purrfect", "pate", "purrfect pate"})
		);
	}

	TEST_F(KeywordExtractorTest, ExtractsPerBucket) {
		const KeywordExtractor extractor(this->filter, this->settings);
		const auto keywords{extractor.extract("P1", this->reviews)};

		// the negative bucket has only one document, no neutral reviews exist
		ASSERT_EQ(keywords.size(), 6U);

		EXPECT_EQ(keywords[0].bucket, Struct::Bucket::overall);
		EXPECT_EQ(keywords[0].term, "pate");
		EXPECT_EQ(keywords[0].rank, 1U);
		EXPECT_NEAR(keywords[0].score, 1.4644231380558226, 1e-12);
		EXPECT_EQ(keywords[1].term, "smells");
		EXPECT_EQ(keywords[1].rank, 2U);
		EXPECT_EQ(keywords[2].term, "fresh");
		EXPECT_EQ(keywords[2].rank, 3U);
		EXPECT_NEAR(keywords[2].score, 0.9751826959150606, 1e-12);

		EXPECT_EQ(keywords[3].bucket, Struct::Bucket::positive);
		EXPECT_EQ(keywords[3].term, "fresh");
		EXPECT_EQ(keywords[3].rank, 1U);
		EXPECT_EQ(keywords[4].term, "pate");
		EXPECT_EQ(keywords[5].term, "pate smells");
		EXPECT_EQ(keywords[5].rank, 3U);

		for(const auto& keyword : keywords) {
			EXPECT_EQ(keyword.productId, "P1");
			EXPECT_EQ(keyword.term.find("purrfect"), std::string::npos);
			EXPECT_EQ(keyword.term.find("salmon"), std::string::npos);
		}

		for(std::size_t index{1}; index < keywords.size(); ++index) {
			if(keywords[index].bucket == keywords[index - 1].bucket) {
				EXPECT_LE(keywords[index].score, keywords[index - 1].score);
				EXPECT_EQ(keywords[index].rank, keywords[index - 1].rank + 1);
			}
		}
	}

	TEST_F(KeywordExtractorTest, NoReviewsNoKeywords) {
		const KeywordExtractor extractor(this->filter, this->settings);

		EXPECT_TRUE(extractor.extract("P2", {}).empty());
	}

	TEST_F(KeywordExtractorTest, ExtractAll) {
		const KeywordExtractor extractor(this->filter, this->settings);
		auto allReviews{this->reviews};
		Struct::StageSummary summary;

		allReviews.push_back(makeReview("ZZ", "orphaned review", Struct::SentimentLabel::neutral));

		const auto keywords{extractor.extractAll(KeywordExtractorTest::makeProducts(), allReviews, summary)};

		EXPECT_EQ(keywords.size(), 6U);

		ASSERT_EQ(summary.products.size(), 2U);
		EXPECT_EQ(summary.products[0].first, "P1");
		EXPECT_EQ(summary.products[0].second.kept, 3U);
		EXPECT_EQ(summary.products[1].first, "P2");
		EXPECT_EQ(summary.products[1].second.kept, 0U);
		ASSERT_EQ(summary.orphans.size(), 1U);
		EXPECT_EQ(summary.orphans.at("ZZ"), 1U);
	}

	TEST_F(KeywordExtractorTest, InvalidSettingsThrow) {
		auto invalid{this->settings};

		invalid.topK = 0;

		EXPECT_THROW(KeywordExtractor(this->filter, invalid), KeywordExtractor::Exception);

		invalid = this->settings;
		invalid.nGramMax = 0;

		EXPECT_THROW(KeywordExtractor(this->filter, invalid), KeywordExtractor::Exception);
	}

} /* namespace reviewlens::Module */
