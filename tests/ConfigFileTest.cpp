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
 * ConfigFileTest.cpp
 *
 * Tests for reading the configuration file.
 *
 *  Created on: Mar 14, 2021
 *      Author: ans
 */

#include "TemporaryDirectory.hpp"

#include "Main/App.hpp"
#include "Main/ConfigFile.hpp"

#include <gtest/gtest.h>

#include <cstddef>	// std::size_t
#include <cstdint>	// std::uint16_t
#include <string>	// std::string
#include <vector>	// std::vector

namespace reviewlens::Main {

	TEST(ConfigFileTest, ReadsEntries) {
		const Tests::TemporaryDirectory dir;
		const ConfigFile config(
				dir.write(
						"config.txt",
						"# comment\n"
						"  Products = data/products.csv \n"
						"top_k=5\n"
						"top_k=7\n"
						"\n"
						"verbose\n"
				)
		);

		std::string products;
		std::size_t topK{0};
		std::string verbose{"unchanged"};
		std::string missing{"unchanged"};

		EXPECT_TRUE(config.getValue("products", products));
		EXPECT_EQ(products, "data/products.csv");

		// the last occurrence wins
		EXPECT_TRUE(config.getValue("TOP_K", topK));
		EXPECT_EQ(topK, 7U);

		EXPECT_TRUE(config.getValue("verbose", verbose));
		EXPECT_EQ(verbose, "");

		EXPECT_FALSE(config.getValue("missing", missing));
		EXPECT_EQ(missing, "unchanged");
	}

	TEST(ConfigFileTest, ReadsBooleans) {
		const Tests::TemporaryDirectory dir;
		const ConfigFile config(
				dir.write(
						"config.txt",
						"a=yes\nb=0\nc=F\nd=\ne=maybe\n"
				)
		);

		bool a{false};
		bool b{true};
		bool c{true};
		bool d{true};
		bool e{false};

		EXPECT_TRUE(config.getValue("a", a));
		EXPECT_TRUE(a);
		EXPECT_TRUE(config.getValue("b", b));
		EXPECT_FALSE(b);
		EXPECT_TRUE(config.getValue("c", c));
		EXPECT_FALSE(c);
		EXPECT_FALSE(config.getValue("d", d));
		EXPECT_TRUE(d);
		EXPECT_THROW(config.getValue("e", e), ConfigFile::Exception);
	}

	TEST(ConfigFileTest, ReadsLists) {
		const Tests::TemporaryDirectory dir;
		const ConfigFile config(dir.write("config.txt", "words = chicken, , salmon ,tuna\nnone=\n"));

		std::vector<std::string> words;
		std::vector<std::string> none{"default"};

		EXPECT_TRUE(config.getList("words", words));
		EXPECT_EQ(words, (std::vector<std::string>{"chicken", "salmon", "tuna"}));

		// an empty entry clears the list
		EXPECT_TRUE(config.getList("none", none));
		EXPECT_TRUE(none.empty());
	}

	TEST(ConfigFileTest, InvalidNumbersThrow) {
		const Tests::TemporaryDirectory dir;
		const ConfigFile config(dir.write("config.txt", "text=abc\nnegative=-1\nhuge=70000\n"));

		std::size_t number{0};
		std::uint16_t threads{0};

		EXPECT_THROW(config.getValue("text", number), ConfigFile::Exception);
		EXPECT_THROW(config.getValue("negative", number), ConfigFile::Exception);
		EXPECT_THROW(config.getValue("huge", threads), ConfigFile::Exception);
		EXPECT_EQ(number, 0U);
	}

	TEST(ConfigFileTest, MissingFileThrows) {
		const Tests::TemporaryDirectory dir;

		EXPECT_THROW(ConfigFile(dir.file("missing.txt")), ConfigFile::Exception);
	}

	TEST(ConfigFileTest, LoadsPipelineSettings) {
		const Tests::TemporaryDirectory dir;
		const auto fileName{
			dir.write(
					"reviewlens.conf",
					"products=products.csv\n"
					"reviews=reviews/\n"
					"output_dir=out\n"
					"sentiment_dictionary=vader_lexicon.txt\n"
					"write_clean=false\n"
					"min_length=10\n"
					"min_df=1\n"
					"top_k=3\n"
					"ngram_max=1\n"
					"extra_stopwords=chow\n"
					"filter_all_brands=true\n"
					"threads=4\n"
			)
		};

		Struct::PipelineSettings settings;

		App::loadConfig(fileName, settings);

		EXPECT_EQ(settings.products, "products.csv");
		EXPECT_EQ(settings.reviews, "reviews/");
		EXPECT_EQ(settings.outputDir, "out");
		EXPECT_EQ(settings.sentimentDictionary, "vader_lexicon.txt");
		EXPECT_TRUE(settings.sentimentEmojis.empty());
		EXPECT_FALSE(settings.writeClean);
		EXPECT_EQ(settings.minLength, 10U);
		EXPECT_EQ(settings.minDf, 1U);
		EXPECT_EQ(settings.topK, 3U);
		EXPECT_EQ(settings.nGramMax, 1U);
		EXPECT_EQ(settings.extraStopwords, (std::vector<std::string>{"chow"}));
		EXPECT_TRUE(settings.filterAllBrands);
		EXPECT_EQ(settings.threads, 4U);

		// not configured
		EXPECT_EQ(settings.maxFeatures, static_cast<std::size_t>(Struct::defaultMaxFeatures));
		EXPECT_EQ(settings.recordKeywords, static_cast<std::size_t>(Struct::defaultRecordKeywords));
		EXPECT_FALSE(settings.verbose);
	}

	TEST(ConfigFileTest, LoadingInvalidSettingsThrows) {
		const Tests::TemporaryDirectory dir;
		const auto fileName{dir.write("reviewlens.conf", "top_k=-3\n")};

		Struct::PipelineSettings settings;

		EXPECT_THROW(App::loadConfig(fileName, settings), ConfigFile::Exception);
	}

} /* namespace reviewlens::Main */
