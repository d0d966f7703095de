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
 * Version.hpp
 *
 * Version information.
 *
 *  Created on: Jan 4, 2019
 *      Author: ans
 */

#ifndef MAIN_VERSION_HPP_
#define MAIN_VERSION_HPP_

#define REVIEWLENS_VERSION_MAJOR 0 //NOLINT(cppcoreguidelines-macro-usage)
#define REVIEWLENS_VERSION_MINOR 1 //NOLINT(cppcoreguidelines-macro-usage)
#define REVIEWLENS_VERSION_RELEASE 0 //NOLINT(cppcoreguidelines-macro-usage)
#define REVIEWLENS_VERSION_SUFFIX "beta" //NOLINT(cppcoreguidelines-macro-usage)

#include <string>		// std::string, std::to_string
#include <string_view>	// std::string_view

//! Namespace for version information.
namespace reviewlens::Main::Version {

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! Major version of the application.
	inline constexpr auto reviewlensVersionMajor{REVIEWLENS_VERSION_MAJOR};

	//! Minor version of the application
	inline constexpr auto reviewlensVersionMinor{REVIEWLENS_VERSION_MINOR};

	//! Current release (i.e. patch) version of the application.
	inline constexpr auto reviewlensVersionRelease{REVIEWLENS_VERSION_RELEASE};

	//! Version suffix of the application.
	inline constexpr std::string_view reviewlensVersionSuffix{REVIEWLENS_VERSION_SUFFIX};

	///@}

	/*
	 * DECLARATION
	 */

	///@name Version Information
	///@{

	[[nodiscard]] std::string getString();

	///@}

	/*
	 * IMPLEMENTATION
	 */

	//! Gets the current version of reviewlens.
	/*!
	 * \returns The copy of a string containing the current version
	 *   of reviewlens.
	 */
	inline std::string getString() {
		std::string result;

		result += std::to_string(reviewlensVersionMajor);
		result += ".";
		result += std::to_string(reviewlensVersionMinor);
		result += ".";
		result += std::to_string(reviewlensVersionRelease);
		result += reviewlensVersionSuffix;

		return result;
	}

} /* namespace reviewlens::Main::Version */

#endif /* MAIN_VERSION_HPP_ */
