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
 * DateTimeTest.cpp
 *
 * Tests for the parsing of review dates.
 *
 *  Created on: Mar 14, 2021
 *      Author: ans
 */

#include "Helper/DateTime.hpp"

#include <gtest/gtest.h>

#include <optional>	// std::optional, std::nullopt
#include <string>	// std::string

namespace reviewlens::Helper::DateTime {

	TEST(DateTimeTest, IsoDates) {
		EXPECT_EQ(toIsoDate("2018-01-05"), std::optional<std::string>("2018-01-05"));
		EXPECT_EQ(toIsoDate(" 2018-01-05 "), std::optional<std::string>("2018-01-05"));
		EXPECT_EQ(toIsoDate("2018-01-05T13:45:00"), std::optional<std::string>("2018-01-05"));
		EXPECT_EQ(toIsoDate("2018-01-05 13:45:00"), std::optional<std::string>("2018-01-05"));
	}

	TEST(DateTimeTest, EnglishDates) {
		EXPECT_EQ(toIsoDate("January 5, 2018"), std::optional<std::string>("2018-01-05"));
		EXPECT_EQ(toIsoDate("Jan 5, 2018"), std::optional<std::string>("2018-01-05"));
		EXPECT_EQ(toIsoDate("March 3rd, 2020"), std::optional<std::string>("2020-03-03"));
		EXPECT_EQ(toIsoDate("5 January 2018"), std::optional<std::string>("2018-01-05"));
	}

	TEST(DateTimeTest, NumericDates) {
		EXPECT_EQ(toIsoDate("01 5, 2018"), std::optional<std::string>("2018-01-05"));
		EXPECT_EQ(toIsoDate("01/05/2018"), std::optional<std::string>("2018-01-05"));
		EXPECT_EQ(toIsoDate("2018/01/05"), std::optional<std::string>("2018-01-05"));
		EXPECT_EQ(toIsoDate("05.01.2018"), std::optional<std::string>("2018-01-05"));
	}

	TEST(DateTimeTest, UnixTime) {
		EXPECT_TRUE(isUnixTime("1515110400"));
		EXPECT_FALSE(isUnixTime("2018"));
		EXPECT_EQ(toIsoDate("1515110400"), std::optional<std::string>("2018-01-05"));
	}

	TEST(DateTimeTest, InvalidDates) {
		EXPECT_EQ(toIsoDate(""), std::nullopt);
		EXPECT_EQ(toIsoDate("yesterday"), std::nullopt);
		EXPECT_EQ(toIsoDate("2018-13-45"), std::nullopt);
		EXPECT_EQ(toIsoDate("2018-01-05 and more"), std::nullopt);
	}

	TEST(DateTimeTest, IsValidIsoDate) {
		EXPECT_TRUE(isValidISODate("2020-02-29"));
		EXPECT_FALSE(isValidISODate("2020-2-29"));
		EXPECT_FALSE(isValidISODate("05.01.2018"));
	}

} /* namespace reviewlens::Helper::DateTime */
