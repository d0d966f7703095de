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
 * ConfigFile.hpp
 *
 * A simple one line one entry configuration file where each line consists of a key=value pair.
 *
 *  Created on: Sep 30, 2018
 *      Author: ans
 */

#ifndef MAIN_CONFIGFILE_HPP_
#define MAIN_CONFIGFILE_HPP_

#include "Exception.hpp"

#include "../Helper/Strings.hpp"

#include <boost/core/typeinfo.hpp>
#include <boost/lexical_cast.hpp>

#include <algorithm>	// std::find_if
#include <fstream>		// std::ifstream
#include <string>		// std::string, std::getline
#include <type_traits>	// std::is_unsigned
#include <utility>		// std::pair
#include <vector>		// std::vector

namespace reviewlens::Main {

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! The character starting a comment line.
	inline constexpr auto configCommentChar{'#'};

	//! The character separating the entries of a list.
	inline constexpr auto configListDelimiter{','};

	///@}

	/*
	 * DECLARATION
	 */

	//! Configuration file.
	/*!
	 * In this text file, each line represents
	 *  one entry and consists of a @c key=value
	 *  pair. Keys are case-insensitive. Empty
	 *  lines and lines starting with @c # are
	 *  ignored.
	 */
	class ConfigFile {

	public:
		///@name Construction
		///@{

		explicit ConfigFile(const std::string& name);

		///@}
		///@name Getters
		///@{

		[[nodiscard]] const std::string& getFileName() const;
		bool getValue(const std::string& name, std::string& to) const;
		bool getValue(const std::string& name, bool& to) const;
		bool getList(const std::string& name, std::vector<std::string>& to) const;

		//! Gets the converted value of a configuration entry.
		/*!
		 * \param name Constant reference to a string
		 *   containing the name of the configuration
		 *   entry to be retrieved.
		 * \param to Reference to a variable to which
		 *   the converted value of the entry should
		 *   be written. Will not be changed, if the
		 *   given configuration entry does not
		 *   exist or its value is empty.
		 *
		 * \return True, if the given configuration
		 *   entry exists and is not empty.
		 *   False otherwise.
		 *
		 * \throws ConfigFile::Exception, if the
		 *   conversion of the configuration entry
		 *   value failed.
		 */
		template<typename T> bool getValue(const std::string& name, T& to) const {
			std::string result;

			if(this->getValue(name, result) && !result.empty()) {
				try {
					// lexical_cast wraps negative values around for unsigned types
					if(std::is_unsigned<T>::value && result.front() == '-') {
						throw boost::bad_lexical_cast();
					}

					to = boost::lexical_cast<T>(result);

					return true;
				}
				catch(const boost::bad_lexical_cast& e) {
					throw Exception(
							this->fileName + ":"
							" Could not convert config file entry \"" + name + "\""
							" (=\"" + result + "\")"
							" to " + boost::core::demangled_name(typeid(T))
					);
				}
			}

			return false;
		}

		///@}

		//! Class for configuration file exceptions.
		MAIN_EXCEPTION_CLASS();

	protected:
		// configuration entries
		std::vector<std::pair<std::string, std::string>> entries;

	private:
		// file name
		std::string fileName;
	};

	/*
	 * IMPLEMENTATION
	 */

	//! Constructor reading the file.
	/*!
	 * Leading and trailing whitespaces
	 *  are removed from keys and values.
	 *
	 * \param name Const reference to a string
	 *   containing the name of the configuration
	 *   file to read.
	 *
	 * \throws ConfigFile::Exception if the
	 *   configuration file could not be opened
	 *   for reading.
	 */
	inline ConfigFile::ConfigFile(const std::string& name) : fileName(name) {
		std::ifstream fileStream(name);
		std::string line;

		if(!fileStream.is_open()) {
			throw Exception("Could not open \"" + name + "\" for reading");
		}

		while(std::getline(fileStream, line)) {
			Helper::Strings::trim(line);

			if(line.empty() || line.front() == configCommentChar) {
				continue;
			}

			const auto nameEnd{line.find('=')};

			if(nameEnd < line.length()) {
				std::string nameInLine(line, 0, nameEnd);
				std::string valueInLine(line, nameEnd + 1);

				Helper::Strings::trim(nameInLine);
				Helper::Strings::trim(valueInLine);
				Helper::Strings::toLower(nameInLine);

				this->entries.emplace_back(
						nameInLine,
						valueInLine
				);
			}
			else {
				Helper::Strings::toLower(line);

				this->entries.emplace_back(
						line,
						""
				);
			}
		}

		fileStream.close();
	}

	//! Gets the name of the configuration file.
	inline const std::string& ConfigFile::getFileName() const {
		return this->fileName;
	}

	//! Gets the string value of a configuration entry.
	/*!
	 * If an entry has been set more than
	 *  once, its last value will be used.
	 *
	 * \param name Constant reference to a string
	 *   containing the name of the configuration
	 *   entry to be retrieved.
	 * \param to Reference to a string to which
	 *   the value of the entry should be
	 *   written. Will not be changed, if the
	 *   given configuration entry does not
	 *   exist.
	 *
	 * \return True, if the given configuration
	 *   entry exists. False otherwise.
	 */
	inline bool ConfigFile::getValue(const std::string& name, std::string& to) const {
		const auto nameCopy{Helper::Strings::toLowerCopy(name)};

		const auto valueIt{
			std::find_if(
					this->entries.crbegin(),
					this->entries.crend(),
					[&nameCopy](const auto& entry) {
						return entry.first == nameCopy;
					}
			)
		};

		if(valueIt != this->entries.crend()) {
			to = valueIt->second;

			return true;
		}

		return false;
	}

	//! Gets the boolean value of a configuration entry.
	/*!
	 * Accepts @c true, @c 1, @c yes, @c y and
	 *  @c t as true, and @c false, @c 0, @c no,
	 *  @c n and @c f as false (case-insensitive).
	 *
	 * \throws ConfigFile::Exception, if the
	 *   value of the entry is neither true
	 *   nor false.
	 */
	inline bool ConfigFile::getValue(const std::string& name, bool& to) const {
		std::string result;

		if(!(this->getValue(name, result)) || result.empty()) {
			return false;
		}

		if(Helper::Strings::stringToBool(result)) {
			to = true;

			return true;
		}

		const auto lower{Helper::Strings::toLowerCopy(result)};

		if(lower == "false" || lower == "0" || lower == "no" || lower == "n" || lower == "f") {
			to = false;

			return true;
		}

		throw Exception(
				this->fileName + ":"
				" Could not convert config file entry \"" + name + "\""
				" (=\"" + result + "\")"
				" to bool"
		);
	}

	//! Gets the comma-separated values of a configuration entry.
	/*!
	 * Values will be trimmed. Empty values
	 *  will be ignored.
	 *
	 * \param name Constant reference to a string
	 *   containing the name of the configuration
	 *   entry to be retrieved.
	 * \param to Reference to a vector to which
	 *   the values of the entry should be
	 *   written. Will not be changed, if the
	 *   given configuration entry does not exist.
	 *
	 * \return True, if the given configuration
	 *   entry exists. False otherwise.
	 */
	inline bool ConfigFile::getList(const std::string& name, std::vector<std::string>& to) const {
		std::string result;

		if(!(this->getValue(name, result))) {
			return false;
		}

		to.clear();

		for(auto& value : Helper::Strings::splitAndTrim(result, configListDelimiter)) {
			if(!value.empty()) {
				to.emplace_back(std::move(value));
			}
		}

		return true;
	}

} /* namespace reviewlens::Main */

#endif /* MAIN_CONFIGFILE_HPP_ */
