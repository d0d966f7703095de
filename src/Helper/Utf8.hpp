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
 * Utf8.hpp
 *
 * Namespace for global UTF-8 encoding functions.
 *
 *  Created on: Feb 27, 2021
 *      Author: ans
 */

#ifndef HELPER_UTF8_HPP_
#define HELPER_UTF8_HPP_

#include "../Main/Exception.hpp"

#include <utf8.h>

#include <cstddef>		// std::size_t
#include <iterator>		// std::back_inserter
#include <string>		// std::string
#include <string_view>	// std::string_view

//! Namespace for global UTF-8 encoding functions.
namespace reviewlens::Helper::Utf8 {

	/*
	 * DECLARATION
	 */

	///@name Validation
	///@{

	[[nodiscard]] bool isValidUtf8(std::string_view stringToCheck);

	///@}
	///@name Repair
	///@{

	bool repairUtf8(std::string_view strIn, std::string& strOut);

	///@}
	///@name Length
	///@{

	[[nodiscard]] std::size_t length(std::string_view str);

	///@}

	/*
	 * EXCEPTION CLASS
	 */

	//! Class for UTF-8 exceptions.
	/*!
	 * Will be thrown when
	 * - invalid UTF-8 characters could not be
	 *    replaced.
	 * - the length of an invalid UTF-8 string
	 *    is requested.
	 */
	MAIN_EXCEPTION_CLASS();

	/*
	 * IMPLEMENTATION
	 */

	//! Checks whether a string contains valid UTF-8.
	inline bool isValidUtf8(std::string_view stringToCheck) {
		return utf8::is_valid(stringToCheck.cbegin(), stringToCheck.cend());
	}

	//! Replaces invalid UTF-8 characters in the given string and writes the result to another string.
	/*!
	 * \param strIn View of the string to be repaired.
	 * \param strOut Reference to a string to which the
	 *   repaired string will be written, if it needed to
	 *   be repaired. The string will not be changed if
	 *   the input string is valid.
	 *
	 * \returns True, if invalid characters have been
	 *   replaced and the result has been written to
	 *   the output string. False, if the input string
	 *   is valid and nothing has been written.
	 *
	 * \throws Utf8::Exception if the string could not
	 *   be repaired.
	 */
	inline bool repairUtf8(std::string_view strIn, std::string& strOut) {
		try {
			if(utf8::is_valid(strIn.cbegin(), strIn.cend())) {
				return false;
			}

			strOut.clear();

			utf8::replace_invalid(strIn.cbegin(), strIn.cend(), std::back_inserter(strOut));

			return true;
		}
		catch(const utf8::exception& e) {
			throw Exception("UTF-8 error: " + std::string(e.what()));
		}
	}

	//! Gets the length of a valid UTF-8 string, in characters.
	/*!
	 * \throws Utf8::Exception if the string
	 *   contains invalid UTF-8.
	 */
	inline std::size_t length(std::string_view str) {
		try {
			return static_cast<std::size_t>(utf8::distance(str.cbegin(), str.cend()));
		}
		catch(const utf8::exception& e) {
			std::string exceptionString{"Invalid UTF-8 in '"};

			exceptionString += str;
			exceptionString += "': ";
			exceptionString += e.what();

			throw Exception(exceptionString);
		}
	}

} /* namespace reviewlens::Helper::Utf8 */

#endif /* HELPER_UTF8_HPP_ */
