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
 * FileSystem.hpp
 *
 * Namespace for global file system helper functions.
 *
 *  Created on: Feb 27, 2021
 *      Author: ans
 */

#ifndef HELPER_FILESYSTEM_HPP_
#define HELPER_FILESYSTEM_HPP_

#include "../Main/Exception.hpp"

#include "Portability/filesystem.h"

#include <algorithm>	// std::sort
#include <fstream>		// std::ifstream, std::ofstream
#include <iterator>		// std::istreambuf_iterator
#include <string>		// std::string
#include <string_view>	// std::string_view
#include <system_error>	// std::error_code
#include <utility>		// std::pair
#include <vector>		// std::vector

//! Namespace for global file system helper functions.
namespace reviewlens::Helper::FileSystem {

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! The extension appended to files while they are being written.
	inline constexpr auto tmpFileExtension{".tmp"};

	//! The extension of backups kept while replacing files.
	inline constexpr auto backupFileExtension{".bak"};

	///@}

	/*
	 * DECLARATION
	 */

	///@name Existence and Validity
	///@{

	[[nodiscard]] bool exists(std::string_view path);
	[[nodiscard]] bool isValidDirectory(std::string_view path);
	[[nodiscard]] bool isValidFile(std::string_view path);

	///@}
	///@name Paths and Directories
	///@{

	[[nodiscard]] std::string join(std::string_view directory, std::string_view fileName);
	[[nodiscard]] std::string getFileName(std::string_view path);
	[[nodiscard]] std::vector<std::string> listFilesInDirectory(
			std::string_view pathToDir,
			std::string_view prefix,
			std::string_view extension
	);
	void createDirectoryIfNotExists(std::string_view pathToDir);

	///@}
	///@name Reading and Writing
	///@{

	[[nodiscard]] std::string readFile(std::string_view path);
	void writeFilesAtomically(const std::vector<std::pair<std::string, std::string>>& files);

	///@}

	/*
	 * CLASS FOR FILE SYSTEM EXCEPTIONS
	 */

	//! Class for file system exceptions.
	/*!
	 * This exception is being thrown when
	 * - a file system error occurs while checking the
	 *    existence or validity of a file or directory
	 * - a directory to be listed does not exist
	 * - a directory could not be created
	 * - a file could not be read or written
	 */
	MAIN_EXCEPTION_CLASS();

	/*
	 * IMPLEMENTATION
	 */

	//! Checks whether the specified path exists.
	/*!
	 * \param path A string view containing the path to be
	 *   checked for existence.
	 *
	 * \returns True if the path exists. False otherwise.
	 *
	 * \throws FileSystem::Exception if the existence of the path
	 *   could not be checked.
	 */
	inline bool exists(std::string_view path) {
		try {
			return stdfs::exists(path);
		}
		catch(const stdfs::filesystem_error& e) {
			std::string exceptionString{"Could not check the existence of the path '"};

			exceptionString += path;
			exceptionString += "': ";
			exceptionString += e.what();

			throw Exception(exceptionString);
		}
	}

	//! Checks whether the given path points to a valid directory.
	/*!
	 * \param path A string view containing the path to check.
	 *
	 * \returns True if the path points to a valid directory.
	 *   False otherwise.
	 *
	 * \throws FileSystem::Exception if the validity of the directory
	 *   could not be checked.
	 */
	inline bool isValidDirectory(std::string_view path) {
		const stdfs::path dir(path);

		try {
			return stdfs::exists(dir) && stdfs::is_directory(dir);
		}
		catch(const stdfs::filesystem_error& e) {
			std::string exceptionString{"Could not check the validity of the directory '"};

			exceptionString += path;
			exceptionString += "': ";
			exceptionString += e.what();

			throw Exception(exceptionString);
		}
	}

	//! Checks whether the given path points to a valid file.
	/*!
	 * \param path A string view containing the path to check.
	 *
	 * \returns True if the path points to a regular file.
	 *   False otherwise.
	 *
	 * \throws FileSystem::Exception if the validity of the file
	 *   could not be checked.
	 */
	inline bool isValidFile(std::string_view path) {
		const stdfs::path file(path);

		try {
			return stdfs::exists(file) && stdfs::is_regular_file(file);
		}
		catch(const stdfs::filesystem_error& e) {
			std::string exceptionString{"Could not check the validity of the file '"};

			exceptionString += path;
			exceptionString += "': ";
			exceptionString += e.what();

			throw Exception(exceptionString);
		}
	}

	//! Appends a file name to a directory.
	inline std::string join(std::string_view directory, std::string_view fileName) {
		return (stdfs::path(directory) / stdfs::path(fileName)).string();
	}

	//! Gets the file name (without directory) of a path.
	inline std::string getFileName(std::string_view path) {
		return stdfs::path(path).filename().string();
	}

	//! Lists the files in a directory with the given prefix and extension.
	/*!
	 * Sub-directories are not searched.
	 *
	 * \param pathToDir A string view containing the path
	 *   to the directory.
	 * \param prefix A string view containing the prefix
	 *   of the file names to list, or an empty view to
	 *   list files regardless of their prefix.
	 * \param extension A string view containing the
	 *   extension (including the dot) of the files to
	 *   list, or an empty view to list all files.
	 *
	 * \returns A vector of strings containing the paths
	 *   of the matching files, sorted alphabetically.
	 *
	 * \throws FileSystem::Exception if the given path is
	 *   not a directory, or when the iteration over its
	 *   contents has failed.
	 */
	inline std::vector<std::string> listFilesInDirectory(
			std::string_view pathToDir,
			std::string_view prefix,
			std::string_view extension
	) {
		std::vector<std::string> result;

		if(!FileSystem::isValidDirectory(pathToDir)) {
			std::string exceptionString{"'"};

			exceptionString += pathToDir;
			exceptionString += "' is not a directory";

			throw Exception(exceptionString);
		}

		try {
			for(const auto& entry : stdfs::directory_iterator(stdfs::path(pathToDir))) {
				if(!entry.is_regular_file()) {
					continue;
				}

				const auto name{entry.path().filename().string()};

				if(name.compare(0, prefix.length(), prefix) != 0) {
					continue;
				}

				if(!extension.empty() && entry.path().extension().string() != extension) {
					continue;
				}

				result.emplace_back(entry.path().string());
			}
		}
		catch(const stdfs::filesystem_error& e) {
			std::string exceptionString{"Could not iterate over the files in '"};

			exceptionString += pathToDir;
			exceptionString += "': ";
			exceptionString += e.what();

			throw Exception(exceptionString);
		}

		std::sort(result.begin(), result.end());

		return result;
	}

	//! Creates a directory (and its parents) at the given path, if it does not exist already.
	/*!
	 * \throws FileSystem::Exception if the directory
	 *   does not exist, but could not be created.
	 */
	inline void createDirectoryIfNotExists(std::string_view pathToDir) {
		if(FileSystem::isValidDirectory(pathToDir)) {
			return;
		}

		try {
			stdfs::create_directories(pathToDir);
		}
		catch(const stdfs::filesystem_error& e) {
			std::string exceptionString{"Could not create directory '"};

			exceptionString += pathToDir;
			exceptionString += "': ";
			exceptionString += e.what();

			throw Exception(exceptionString);
		}
	}

	//! Reads the whole content of a file.
	/*!
	 * \throws FileSystem::Exception if the file
	 *   could not be opened or read.
	 */
	inline std::string readFile(std::string_view path) {
		std::ifstream in{std::string(path), std::ios::binary};

		if(!in.is_open()) {
			std::string exceptionString{"Could not open '"};

			exceptionString += path;
			exceptionString += "' for reading";

			throw Exception(exceptionString);
		}

		std::string content{
			std::istreambuf_iterator<char>(in),
			std::istreambuf_iterator<char>()
		};

		if(in.bad()) {
			std::string exceptionString{"Could not read from '"};

			exceptionString += path;
			exceptionString += "'";

			throw Exception(exceptionString);
		}

		return content;
	}

	//! Writes a set of files, replacing them only if all of them could be written.
	/*!
	 * Every file is written to a temporary file
	 *  next to its destination first. Only after
	 *  all temporary files have been written
	 *  successfully, they are moved to their
	 *  destinations, one after another. An
	 *  existing destination is kept as a backup
	 *  until all files have been moved.
	 *
	 * On failure, all temporary files are
	 *  removed, destinations already replaced
	 *  are restored from their backups, and
	 *  the previous set of files is left as it
	 *  was.
	 *
	 * \param files Constant reference to a vector
	 *   of @c [path, content] pairs.
	 *
	 * \throws FileSystem::Exception if one of the
	 *   files could not be written or moved.
	 */
	inline void writeFilesAtomically(const std::vector<std::pair<std::string, std::string>>& files) {
		std::vector<std::string> written;
		std::vector<std::string> moved;
		std::vector<std::string> backedUp;

		const auto rollBack{
			[&written, &moved, &backedUp]() {
				std::error_code ignored;

				for(const auto& path : moved) {
					stdfs::remove(path, ignored);
				}

				for(const auto& path : backedUp) {
					stdfs::rename(path + backupFileExtension, path, ignored);
				}

				for(const auto& tmpPath : written) {
					stdfs::remove(tmpPath, ignored);
				}
			}
		};

		for(const auto& [path, content] : files) {
			const std::string tmpPath{path + tmpFileExtension};

			std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);

			if(!out.is_open()) {
				rollBack();

				throw Exception("Could not open '" + tmpPath + "' for writing");
			}

			written.emplace_back(tmpPath);

			out.write(content.data(), static_cast<std::streamsize>(content.size()));
			out.close();

			if(out.fail()) {
				rollBack();

				throw Exception("Could not write to '" + tmpPath + "'");
			}
		}

		for(const auto& [path, content] : files) {
			try {
				if(stdfs::exists(path)) {
					stdfs::rename(path, path + backupFileExtension);

					backedUp.emplace_back(path);
				}

				stdfs::rename(path + tmpFileExtension, path);

				moved.emplace_back(path);
			}
			catch(const stdfs::filesystem_error& e) {
				rollBack();

				throw Exception("Could not move '" + path + tmpFileExtension + "' to '" + path + "': " + e.what());
			}
		}

		for(const auto& path : backedUp) {
			std::error_code ignored;

			stdfs::remove(path + backupFileExtension, ignored);
		}
	}

} /* namespace reviewlens::Helper::FileSystem */

#endif /* HELPER_FILESYSTEM_HPP_ */
