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
 * SentimentTest.cpp
 *
 * Tests for the VADER sentiment analyzer and the scorer interface.
 *
 *  Created on: Mar 14, 2021
 *      Author: ans
 */

#include "Data/Scorer.hpp"
#include "Data/Sentiment.hpp"
#include "Module/SentimentScorer.hpp"
#include "Struct/Review.hpp"

#include <gtest/gtest.h>

#include <string>	// std::string
#include <vector>	// std::vector

namespace reviewlens::Data {

	namespace {

		const std::string dictionaryFile{REVIEWLENS_TEST_DATA_DIR "/vader_lexicon_test.txt"};
		const std::string emojiFile{REVIEWLENS_TEST_DATA_DIR "/emoji_test.txt"};

		double compound(const std::string& text) {
			static const Sentiment analyzer(dictionaryFile, emojiFile);

			return analyzer.analyze(text).compound;
		}

	} /* namespace */

	TEST(SentimentTest, LoadsDictionaries) {
		const Sentiment analyzer(dictionaryFile, emojiFile);

		EXPECT_EQ(analyzer.getDictSize(), 11U);
		EXPECT_EQ(analyzer.getEmojiNum(), 2U);
	}

	TEST(SentimentTest, MissingDictionaryThrows) {
		EXPECT_THROW(Sentiment(REVIEWLENS_TEST_DATA_DIR "/does_not_exist.txt", ""), Sentiment::Exception);
	}

	TEST(SentimentTest, InvalidValenceThrows) {
		EXPECT_THROW(Sentiment(REVIEWLENS_TEST_DATA_DIR "/vader_lexicon_invalid.txt", ""), Sentiment::Exception);
	}

	TEST(SentimentTest, SingleWord) {
		EXPECT_DOUBLE_EQ(compound("great"), 0.6249);
		EXPECT_DOUBLE_EQ(compound("terrible"), -0.5423);
	}

	TEST(SentimentTest, NoSentimentWords) {
		const Sentiment analyzer(dictionaryFile, "");
		const auto scores{analyzer.analyze("the bowl is blue")};

		EXPECT_DOUBLE_EQ(scores.compound, 0.);
		EXPECT_DOUBLE_EQ(scores.neutral, 1.);
		EXPECT_DOUBLE_EQ(scores.positive, 0.);
		EXPECT_DOUBLE_EQ(scores.negative, 0.);
	}

	TEST(SentimentTest, EmptyText) {
		EXPECT_DOUBLE_EQ(compound(""), 0.);
		EXPECT_DOUBLE_EQ(compound("   "), 0.);
	}

	TEST(SentimentTest, ExclamationMarks) {
		EXPECT_DOUBLE_EQ(compound("great food, my cat loves it!"), 0.8439);
		EXPECT_DOUBLE_EQ(compound("great!!"), 0.6892);
	}

	TEST(SentimentTest, Negation) {
		EXPECT_DOUBLE_EQ(compound("not great"), -0.5096);
		EXPECT_DOUBLE_EQ(compound("isn't great"), -0.5096);
		EXPECT_DOUBLE_EQ(compound("not bad"), 0.431);
	}

	TEST(SentimentTest, Booster) {
		EXPECT_DOUBLE_EQ(compound("very great"), 0.659);
	}

	TEST(SentimentTest, CapsDifferential) {
		EXPECT_DOUBLE_EQ(compound("GREAT food"), 0.7034);

		// all tokens in capitals are not emphasized
		EXPECT_DOUBLE_EQ(compound("GREAT"), 0.6249);
	}

	TEST(SentimentTest, ContrastiveConjunction) {
		EXPECT_DOUBLE_EQ(compound("great but refused"), -0.0644);
	}

	TEST(SentimentTest, Emojis) {
		EXPECT_DOUBLE_EQ(compound("\xF0\x9F\x98\x80"), 0.4215);
	}

	TEST(SentimentTest, ProportionsSumToOne) {
		const Sentiment analyzer(dictionaryFile, "");
		const auto scores{analyzer.analyze("great food but my cat got sick")};

		EXPECT_NEAR(scores.positive + scores.neutral + scores.negative, 1., 1e-9);
		EXPECT_GT(scores.negative, 0.);
		EXPECT_GT(scores.positive, 0.);
	}

	TEST(SentimentTest, TokenizeStripsPunctuation) {
		const auto tokens{Sentiment::tokenize("  great, food!  :) it!")};

		ASSERT_EQ(tokens.size(), 4U);
		EXPECT_EQ(tokens[0], "great");
		EXPECT_EQ(tokens[1], "food");
		EXPECT_EQ(tokens[2], ":)");
		EXPECT_EQ(tokens[3], "it!");
	}

	TEST(ScorerTest, Thresholds) {
		EXPECT_EQ(Scorer::label(0.05), Struct::SentimentLabel::positive);
		EXPECT_EQ(Scorer::label(0.0499), Struct::SentimentLabel::neutral);
		EXPECT_EQ(Scorer::label(0.), Struct::SentimentLabel::neutral);
		EXPECT_EQ(Scorer::label(-0.0499), Struct::SentimentLabel::neutral);
		EXPECT_EQ(Scorer::label(-0.05), Struct::SentimentLabel::negative);
	}

	TEST(ScorerTest, VaderScorer) {
		const VaderScorer scorer(dictionaryFile, "");

		EXPECT_EQ(scorer.getAnalyzer().getDictSize(), 11U);
		EXPECT_EQ(scorer.getAnalyzer().getEmojiNum(), 0U);

		const auto positive{scorer.score("great food, my cat loves it!")};
		const auto negative{scorer.score("cat refused to eat it.")};

		EXPECT_DOUBLE_EQ(positive.score, 0.8439);
		EXPECT_EQ(positive.label, Struct::SentimentLabel::positive);
		EXPECT_DOUBLE_EQ(negative.score, -0.296);
		EXPECT_EQ(negative.label, Struct::SentimentLabel::negative);
	}

	TEST(SentimentScorerTest, AttachesScoresAndLabels) {
		const VaderScorer scorer(dictionaryFile, "");
		const Module::SentimentScorer sentimentScorer(scorer);
		std::vector<Struct::Review> reviews(3);

		reviews[0].text = "great food, my cat loves it!";
		reviews[1].text = "cat refused to eat it.";

		sentimentScorer.score(reviews);

		ASSERT_TRUE(reviews[0].sentimentLabel.has_value());
		EXPECT_EQ(reviews[0].sentimentLabel.value(), Struct::SentimentLabel::positive);
		EXPECT_EQ(reviews[1].sentimentLabel.value(), Struct::SentimentLabel::negative);

		// empty text
		ASSERT_TRUE(reviews[2].sentimentScore.has_value());
		EXPECT_DOUBLE_EQ(reviews[2].sentimentScore.value(), 0.);
		EXPECT_EQ(reviews[2].sentimentLabel.value(), Struct::SentimentLabel::neutral);
	}

	TEST(SentimentScorerTest, MalformedTextScoresNeutral) {
		const VaderScorer scorer(dictionaryFile, emojiFile);
		const Module::SentimentScorer sentimentScorer(scorer);
		std::vector<Struct::Review> reviews(2);

		reviews[0].text = "good \xC3";
		reviews[1].text = "great food, my cat loves it!";

		EXPECT_THROW(static_cast<void>(scorer.score(reviews[0].text)), Sentiment::Exception);
		EXPECT_NO_THROW(sentimentScorer.score(reviews));

		ASSERT_TRUE(reviews[0].sentimentScore.has_value());
		EXPECT_DOUBLE_EQ(reviews[0].sentimentScore.value(), 0.);
		EXPECT_EQ(reviews[0].sentimentLabel.value(), Struct::SentimentLabel::neutral);

		// the following review is scored as usual
		EXPECT_DOUBLE_EQ(reviews[1].sentimentScore.value(), 0.8439);
		EXPECT_EQ(reviews[1].sentimentLabel.value(), Struct::SentimentLabel::positive);
	}

} /* namespace reviewlens::Data */
