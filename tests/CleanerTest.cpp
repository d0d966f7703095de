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
 * CleanerTest.cpp
 *
 * Tests for the cleaning of raw reviews.
 *
 *  Created on: Mar 14, 2021
 *      Author: ans
 */

#include "Module/Cleaner.hpp"
#include "Struct/RawReview.hpp"

#include <gtest/gtest.h>

#include <cstddef>	// std::size_t
#include <cstdint>	// std::uint8_t
#include <optional>	// std::optional, std::nullopt
#include <string>	// std::string, std::to_string
#include <utility>	// std::move
#include <vector>	// std::vector

namespace reviewlens::Module {

	namespace {

		Struct::RawReview makeRaw(
				std::size_t row,
				std::optional<std::string> id,
				std::optional<std::string> rating,
				std::optional<std::string> text
		) {
			Struct::RawReview raw;

			raw.row = row;
			raw.reviewId = std::move(id);
			raw.rating = std::move(rating);
			raw.text = std::move(text);

			return raw;
		}

		Struct::RawReviewSet makeSet(const std::string& productId, std::vector<Struct::RawReview> reviews) {
			Struct::RawReviewSet set;

			set.productId = productId;
			set.source = "reviews_" + productId + ".csv";
			set.reviews = std::move(reviews);

			return set;
		}

	} /* namespace */

	TEST(CleanerTest, DropsDuplicateText) {
		const Cleaner cleaner(20);
		const auto result{
			cleaner.clean(makeSet("X", {
				makeRaw(1, std::nullopt, "5", "Great food, my cat loves it!"),
				makeRaw(2, std::nullopt, "1", "Cat refused to eat it."),
				makeRaw(3, std::nullopt, "5", "great food, my cat loves it!")
			}))
		};

		ASSERT_EQ(result.reviews.size(), 2U);
		EXPECT_EQ(result.productId, "X");
		EXPECT_EQ(result.reviews[0].reviewId, "X-1");
		EXPECT_EQ(result.reviews[0].text, "great food, my cat loves it!");
		EXPECT_EQ(result.reviews[0].rating, 5);
		EXPECT_EQ(result.reviews[1].reviewId, "X-2");
		EXPECT_EQ(result.reviews[1].text, "cat refused to eat it.");
		EXPECT_EQ(result.reviews[1].rating, 1);
		EXPECT_EQ(result.counts.input, 3U);
		EXPECT_EQ(result.counts.kept, 2U);
		EXPECT_EQ(result.counts.droppedDuplicateText, 1U);
		EXPECT_EQ(result.counts.dropped(), 1U);
		EXPECT_EQ(result.counts.nullDates, 2U);
		EXPECT_FALSE(result.counts.unreadableSource);
	}

	TEST(CleanerTest, DropsShortTexts) {
		const Cleaner cleaner(20);
		const auto result{
			cleaner.clean(makeSet("X", {
				makeRaw(1, "a", "5", "good"),
				makeRaw(2, "b", "5", std::nullopt),
				makeRaw(3, "c", "5", "   <b>tiny</b>   "),
				makeRaw(4, "d", "4", "exactly twenty chars")
			}))
		};

		ASSERT_EQ(result.reviews.size(), 1U);
		EXPECT_EQ(result.reviews[0].reviewId, "d");
		EXPECT_EQ(result.counts.droppedShort, 3U);
	}

	TEST(CleanerTest, LengthCountsCharacters) {
		const Cleaner cleaner(5);
		const auto result{
			cleaner.clean(makeSet("X", {
				makeRaw(1, "a", "5", "\xC3\xA4\xC3\xB6\xC3\xBC\xC3\x9F"),
				makeRaw(2, "b", "5", "\xC3\xA4\xC3\xB6\xC3\xBC\xC3\x9F!")
			}))
		};

		ASSERT_EQ(result.reviews.size(), 1U);
		EXPECT_EQ(result.reviews[0].reviewId, "b");
	}

	TEST(CleanerTest, DropsInvalidRatings) {
		const Cleaner cleaner(0);
		const auto result{
			cleaner.clean(makeSet("X", {
				makeRaw(1, "a", "6", "text number one"),
				makeRaw(2, "b", "0", "text number two"),
				makeRaw(3, "c", "five", "text number three"),
				makeRaw(4, "d", std::nullopt, "text number four"),
				makeRaw(5, "e", "4.6", "text number five"),
				makeRaw(6, "f", " 3 ", "text number six")
			}))
		};

		ASSERT_EQ(result.reviews.size(), 2U);
		EXPECT_EQ(result.reviews[0].rating, 5);
		EXPECT_EQ(result.reviews[1].rating, 3);
		EXPECT_EQ(result.counts.droppedRating, 4U);
	}

	TEST(CleanerTest, ParseRating) {
		EXPECT_EQ(Cleaner::parseRating("1"), std::optional<std::uint8_t>(1));
		EXPECT_EQ(Cleaner::parseRating("5.0"), std::optional<std::uint8_t>(5));
		EXPECT_EQ(Cleaner::parseRating("2.5"), std::optional<std::uint8_t>(3));
		EXPECT_EQ(Cleaner::parseRating("0.99"), std::nullopt);
		EXPECT_EQ(Cleaner::parseRating("5.01"), std::nullopt);
		EXPECT_EQ(Cleaner::parseRating("nan"), std::nullopt);
		EXPECT_EQ(Cleaner::parseRating("inf"), std::nullopt);
		EXPECT_EQ(Cleaner::parseRating(""), std::nullopt);
		EXPECT_EQ(Cleaner::parseRating("4 stars"), std::nullopt);
	}

	TEST(CleanerTest, DropsDuplicateIdsBeforeTexts) {
		const Cleaner cleaner(0);
		const auto result{
			cleaner.clean(makeSet("X", {
				makeRaw(1, "a", "5", "the first text"),
				makeRaw(2, "a", "4", "the second text"),
				makeRaw(3, "b", "3", "the first text"),
				makeRaw(4, "b", "2", "the third text"),
				makeRaw(5, " ", "1", "the fourth text")
			}))
		};

		ASSERT_EQ(result.reviews.size(), 2U);
		EXPECT_EQ(result.reviews[0].reviewId, "a");
		EXPECT_EQ(result.reviews[0].text, "the first text");
		EXPECT_EQ(result.reviews[1].reviewId, "X-5");
		EXPECT_EQ(result.counts.droppedDuplicateId, 2U);
		EXPECT_EQ(result.counts.droppedDuplicateText, 1U);
	}

	TEST(CleanerTest, VerifiedAndDates) {
		const Cleaner cleaner(0);
		auto set{
			makeSet("X", {
				makeRaw(1, "a", "5", "first review"),
				makeRaw(2, "b", "5", "second review"),
				makeRaw(3, "c", "5", "third review")
			})
		};

		set.reviews[0].verified = "Y";
		set.reviews[0].date = "January 5th, 2018";
		set.reviews[1].verified = "false";
		set.reviews[1].date = "not a date";
		set.reviews[2].date = "2018-01-05";

		const auto result{cleaner.clean(set)};

		ASSERT_EQ(result.reviews.size(), 3U);
		EXPECT_TRUE(result.reviews[0].verified);
		EXPECT_EQ(result.reviews[0].date, std::optional<std::string>("2018-01-05"));
		EXPECT_FALSE(result.reviews[1].verified);
		EXPECT_EQ(result.reviews[1].date, std::nullopt);
		EXPECT_FALSE(result.reviews[2].verified);
		EXPECT_EQ(result.reviews[2].date, std::optional<std::string>("2018-01-05"));
		EXPECT_EQ(result.counts.nullDates, 1U);
	}

	TEST(CleanerTest, NormalizeText) {
		EXPECT_EQ(
				Cleaner::normalizeText(
						"  Great&amp;Tasty<br/>Food \xE2\x80\x94 \xE2\x80\x9Cyum\xE2\x80\x9D\t\tnow  "
				),
				"great&tasty food - \"yum\" now"
		);
		EXPECT_EQ(Cleaner::normalizeText("Line\r\nbreak\x07"), "line break");
		EXPECT_EQ(Cleaner::normalizeText(""), "");
	}

	TEST(CleanerTest, NormalizeTextDecodesNestedEntities) {
		EXPECT_EQ(Cleaner::normalizeText("I &amp;amp;lt;3 it"), "i <3 it");
		EXPECT_EQ(Cleaner::normalizeText("&AMP;LT;i&amp;GT;Soft&amp;lt;/I&gt; pate"), "soft pate");
		EXPECT_EQ(
				Cleaner::normalizeText("x &amp;amp; y"),
				Cleaner::normalizeText("x &amp; y")
		);
		EXPECT_EQ(Cleaner::normalizeText("said &amp;#34;yum&amp;#34;"), "said \"yum\"");
	}

	TEST(CleanerTest, CleaningIsIdempotent) {
		const Cleaner cleaner(10);
		const auto first{
			cleaner.clean(makeSet("X", {
				makeRaw(1, "a", "4.4", "  Tasty <i>AND</i> healthy\xE2\x80\xA6  "),
				makeRaw(2, std::nullopt, "2", "My cat   didn\xE2\x80\x99t like it"),
				makeRaw(3, "c", "3", "short"),
				makeRaw(4, "d", "5", "My cat loves it &amp;lt;3 so much!!"),
				makeRaw(5, "e", "5", "She ate it &amp;lt;b&amp;gt;fast&amp;lt;/b&amp;gt; every day"),
				makeRaw(6, "f", "4", "Great food &amp;amp; my cat loves it")
			}))
		};

		ASSERT_EQ(first.reviews.size(), 5U);
		EXPECT_EQ(first.reviews[2].text, "my cat loves it <3 so much!!");
		EXPECT_EQ(first.reviews[3].text, "she ate it fast every day");
		EXPECT_EQ(first.reviews[4].text, "great food & my cat loves it");

		std::vector<Struct::RawReview> again;

		for(const auto& review : first.reviews) {
			Struct::RawReview raw;

			raw.row = again.size() + 1;
			raw.reviewId = review.reviewId;
			raw.rating = std::to_string(review.rating);
			raw.text = review.text;
			raw.verified = review.verified ? "true" : "false";
			raw.date = review.date;

			again.emplace_back(std::move(raw));
		}

		const auto second{cleaner.clean(makeSet("X", again))};

		ASSERT_EQ(second.reviews.size(), first.reviews.size());

		for(std::size_t index{0}; index < first.reviews.size(); ++index) {
			EXPECT_EQ(second.reviews[index].reviewId, first.reviews[index].reviewId);
			EXPECT_EQ(second.reviews[index].text, first.reviews[index].text);
			EXPECT_EQ(second.reviews[index].rating, first.reviews[index].rating);
			EXPECT_EQ(second.reviews[index].verified, first.reviews[index].verified);
			EXPECT_EQ(second.reviews[index].date, first.reviews[index].date);
		}

		EXPECT_EQ(second.counts.dropped(), 0U);
	}

	TEST(CleanerTest, UnreadableSource) {
		const Cleaner cleaner(20);
		auto failed{makeSet("X", {})};

		failed.error = "Could not open 'reviews_X.csv' for reading";

		const auto result{cleaner.clean(failed)};

		EXPECT_TRUE(result.reviews.empty());
		EXPECT_TRUE(result.counts.unreadableSource);
		EXPECT_EQ(result.counts.sourceError, failed.error);

		const auto empty{cleaner.clean(makeSet("Y", {}))};

		EXPECT_TRUE(empty.counts.unreadableSource);
		EXPECT_EQ(empty.counts.kept, 0U);
	}

} /* namespace reviewlens::Module */
