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
 * FileSystemTest.cpp
 *
 * Tests for replacing a set of output files.
 *
 *  Created on: Mar 21, 2021
 *      Author: ans
 */

#include "TemporaryDirectory.hpp"

#include "Helper/FileSystem.hpp"

#include <gtest/gtest.h>

#include <string>	// std::string
#include <utility>	// std::pair
#include <vector>	// std::vector

namespace reviewlens::Helper {

	TEST(FileSystemTest, WritesAndReplacesFiles) {
		const Tests::TemporaryDirectory dir;
		const auto first{dir.write("first.csv", "old first")};
		const auto second{dir.file("second.json")};

		FileSystem::writeFilesAtomically({{first, "new first"}, {second, "new second"}});

		EXPECT_EQ(FileSystem::readFile(first), "new first");
		EXPECT_EQ(FileSystem::readFile(second), "new second");
		EXPECT_FALSE(FileSystem::exists(first + FileSystem::tmpFileExtension));
		EXPECT_FALSE(FileSystem::exists(first + FileSystem::backupFileExtension));
		EXPECT_FALSE(FileSystem::exists(second + FileSystem::tmpFileExtension));
	}

	TEST(FileSystemTest, RestoresFilesIfOneCannotBeReplaced) {
		const Tests::TemporaryDirectory dir;
		const auto first{dir.write("first.csv", "old first")};
		const auto second{dir.write("second.csv", "old second")};

		// a non-empty directory where the backup of the second file would go
		dir.write(std::string("second.csv") + FileSystem::backupFileExtension + "/keep.txt", "keep");

		const std::vector<std::pair<std::string, std::string>> files{
			{first, "new first"},
			{second, "new second"}
		};

		EXPECT_THROW(FileSystem::writeFilesAtomically(files), FileSystem::Exception);

		EXPECT_EQ(FileSystem::readFile(first), "old first");
		EXPECT_EQ(FileSystem::readFile(second), "old second");
		EXPECT_FALSE(FileSystem::exists(first + FileSystem::tmpFileExtension));
		EXPECT_FALSE(FileSystem::exists(first + FileSystem::backupFileExtension));
		EXPECT_FALSE(FileSystem::exists(second + FileSystem::tmpFileExtension));
	}

	TEST(FileSystemTest, NothingIsWrittenIfADirectoryIsMissing) {
		const Tests::TemporaryDirectory dir;
		const auto first{dir.write("first.csv", "old first")};

		const std::vector<std::pair<std::string, std::string>> files{
			{first, "new first"},
			{dir.file("missing/second.csv"), "new second"}
		};

		EXPECT_THROW(FileSystem::writeFilesAtomically(files), FileSystem::Exception);

		EXPECT_EQ(FileSystem::readFile(first), "old first");
		EXPECT_FALSE(FileSystem::exists(first + FileSystem::tmpFileExtension));
	}

} /* namespace reviewlens::Helper */
