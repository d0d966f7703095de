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
 * Versions.hpp
 *
 * Report the versions of the third-party libraries reviewlens is built with.
 *
 *  Created on: Jan 13, 2019
 *      Author: ans
 */

#ifndef HELPER_VERSIONS_HPP_
#define HELPER_VERSIONS_HPP_

#include <boost/version.hpp>
#include <rapidjson/rapidjson.h>

#include <string>		// std::string, std::to_string
#include <string_view>	// std::string_view
#include <utility>		// std::pair
#include <vector>		// std::vector

//! Namespace for reporting the versions of the libraries linked into reviewlens.
namespace reviewlens::Helper::Versions {

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! Boost encodes its version as MMmmmpp, divide by this for the major part.
	inline constexpr auto boostMajor{100000};

	//! Modulus applied to the minor part of the Boost version.
	inline constexpr auto boostMinor{1000};

	//! Divisor and modulus for the Boost patch level.
	inline constexpr auto boostPatch{100};

	//! UTF8-CPP ships no version macro, so the release is named here.
	/*!
	 * \warning Update by hand when the installed
	 *   library changes.
	 */
	inline constexpr std::string_view utf8CppVersion{"3.2"};

	///@}

	/*
	 * DECLARATION
	 */

	//! A library name and its version.
	using StringString = std::pair<std::string, std::string>;

	///@name Getters
	///@{

	[[nodiscard]] std::vector<StringString> getLibraryVersions();
	[[nodiscard]] std::string getLibraryVersionsStr(const std::string& indent);

	///@}

	/*
	 * IMPLEMENTATION
	 */

	//! Lists the libraries reviewlens depends on.
	/*!
	 * \returns One @c [name, @c version] pair per
	 *   library, with an empty version where the
	 *   library does not publish one.
	 */
	inline std::vector<StringString> getLibraryVersions() {
		std::vector<StringString> result;

		result.emplace_back(
				"Boost",
				std::to_string(BOOST_VERSION / boostMajor)
				+ '.'
				+ std::to_string(BOOST_VERSION / boostPatch % boostMinor)
				+ '.'
				+ std::to_string(BOOST_VERSION % boostPatch)
		);

		result.emplace_back("Howard E. Hinnant's date.h", "");
		result.emplace_back("RapidJSON", RAPIDJSON_VERSION_STRING);
		result.emplace_back("UTF8-CPP", utf8CppVersion);

		return result;
	}

	//! Formats the library list for the @c -v output.
	/*!
	 * \param indent Prefix written at the start
	 *   of every line.
	 *
	 * \returns One line per library, e.g.
	 *   @c "  RapidJSON v1.1.0".
	 */
	inline std::string getLibraryVersionsStr(const std::string& indent) {
		std::string result;

		for(const auto& [name, version] : getLibraryVersions()) {
			result += indent + name;

			if(!version.empty()) {
				result += " v" + version;
			}

			result.push_back('\n');
		}

		return result;
	}

} /* namespace reviewlens::Helper::Versions */

#endif /* HELPER_VERSIONS_HPP_ */
