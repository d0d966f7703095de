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
 * App.hpp
 *
 * The main application class.
 *
 *  Created on: Mar 13, 2021
 *      Author: ans
 */

#ifndef MAIN_APP_HPP_
#define MAIN_APP_HPP_

#include "ConfigFile.hpp"
#include "Exception.hpp"
#include "Version.hpp"

#include "../Helper/Versions.hpp"
#include "../Module/Pipeline.hpp"
#include "../Struct/PipelineResult.hpp"
#include "../Struct/PipelineSettings.hpp"
#include "../Struct/StatusSetter.hpp"

#include <cstddef>		// std::size_t
#include <cstdlib>		// EXIT_FAILURE, EXIT_SUCCESS
#include <exception>	// std::exception
#include <iomanip>		// std::setw
#include <ios>			// std::left, std::right
#include <iostream>		// std::cout, std::endl, std::flush
#include <optional>		// std::optional
#include <string>		// std::string
#include <string_view>	// std::string_view_literals
#include <vector>		// std::vector

//! Namespace for the main classes of the program.
namespace reviewlens::Main {

	using std::string_view_literals::operator""sv;

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! Number of arguments required by the application.
	inline constexpr std::size_t argsRequired{2};

	//! The current year.
	//NOLINTNEXTLINE(clang-diagnostic-string-plus-int, cppcoreguidelines-pro-bounds-pointer-arithmetic)
	inline constexpr auto year{__DATE__ + 7};

	//! The name of the application.
	inline constexpr auto descName{"reviewlens Review Analysis Pipeline"sv};

	//! The beginning of the version string.
	inline constexpr auto descVer{"Version "sv};

	//! The beginning of the copyright string.
	inline constexpr auto descCopyrightHead{"Copyright (C) "sv};

	//! The actual copyrigt.
	inline constexpr auto descCopyrightTail{" Anselm Schmidt (ans[ät]ohai.su)"sv};

	//! The text of the license.
	inline constexpr auto descLicense{
		"This program is free software: you can redistribute it and/or modify\n"
		"it under the terms of the GNU General Public License as published by\n"
		"the Free Software Foundation, either version 3 of the License, or\n"
		"(at your option) any later version.\n\n"
		"This program is distributed in the hope that it will be useful,\n"
		"but WITHOUT ANY WARRANTY; without even the implied warranty of\n"
		"MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the\n"
		"GNU General Public License for more details.\n\n"
		"You should have received a copy of the GNU General Public License\n"
		"along with this program. If not, see <https://www.gnu.org/licenses/>."sv
	};

	//! The string before the used libraries.
	inline constexpr auto descUsing{"using"sv};

	//! The usage string for the command line.
	inline constexpr auto descUsage{"USAGE: reviewlens <config_file> or reviewlens -v"};

	//! The width of the product column in the summary table.
	inline constexpr auto tableProductWidth{24};

	//! The width of the numeric columns in the summary table.
	inline constexpr auto tableNumberWidth{10};

	//! The number of decimals in the summary table.
	inline constexpr auto tableDecimals{2};

	///@}

	/*
	 * DECLARATION
	 */

	//! %Main application.
	/*!
	 * This class
	 * - writes default output to @c stdout
	 * - checks the program arguments
	 * - loads the configuration file
	 * - runs the review analysis pipeline
	 */
	class App final {
		// for convenience
		using LogLevel = Struct::LogLevel;
		using PipelineResult = Struct::PipelineResult;
		using PipelineSettings = Struct::PipelineSettings;
		using StatusSetter = Struct::StatusSetter;

	public:
		///@name Construction
		///@{

		explicit App(const std::vector<std::string>& args) noexcept;

		///@}
		///@name Execution
		///@{

		int run() noexcept;

		///@}
		///@name Configuration
		///@{

		static void loadConfig(const std::string& fileName, PipelineSettings& settingsTo);

		///@}
		/**@name Copy and Move
		 * The class is neither copyable, nor moveable.
		 */
		///@{

		//! Deleted copy constructor.
		App(App&) = delete;

		//! Deleted copy assignment operator.
		App& operator=(App&) = delete;

		//! Deleted move constructor.
		App(App&&) = delete;

		//! Deleted move assignment operator.
		App& operator=(App&&) = delete;

		///@}

	private:
		PipelineSettings settings;
		bool showVersionsOnly{false};
		bool ready{false};

		// static helper functions
		static void outputHeader(bool showLibraryVersions);
		static void outputSummary(const PipelineResult& result);
		static void log(LogLevel level, const std::string& message);
		static void checkArgumentNumber(std::size_t args);
	};

} /* namespace reviewlens::Main */

#endif /* MAIN_APP_HPP_ */
