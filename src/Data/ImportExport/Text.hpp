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
 * Text.hpp
 *
 * Namespace for importing and exporting raw text.
 *
 *  Created on: May 3, 2019
 *      Author: ans
 */

#ifndef DATA_IMPORTEXPORT_TEXT_HPP_
#define DATA_IMPORTEXPORT_TEXT_HPP_

#include "../../Helper/Strings.hpp"

#include <string>	// std::string
#include <utility>	// std::move
#include <vector>	// std::vector

//! Namespace for importing and exporting raw text.
namespace reviewlens::Data::ImportExport::Text {

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! The character starting a comment line in a list.
	inline constexpr auto listCommentChar{'#'};

	///@}

	/*
	 * DECLARATION
	 */

	///@name Import
	///@{

	[[nodiscard]] std::vector<std::string> importList(
			const std::string& content,
			bool skipFirstLine,
			bool ignoreEmpty
	);

	///@}

	/*
	 * IMPLEMENTATION
	 */

	//! Imports a list from raw text content, with each line representing a list entry.
	/*!
	 * Entries will be trimmed. Lines starting
	 *  with @c # are regarded as comments and
	 *  will be ignored.
	 *
	 * \param content A constant reference to the content to be
	 *   parsed as a list, each line representing a list entry.
	 * \param skipFirstLine If true, the first line in the content
	 *   will be ignored, e.g. when it contains a header for the list.
	 * \param ignoreEmpty If true, empty lines will be ignored.
	 *
	 * \returns A vector containing the list entries extracted from
	 *   the given content.
	 */
	inline std::vector<std::string> importList(
			const std::string& content,
			bool skipFirstLine,
			bool ignoreEmpty
	) {
		// split content into entries
		auto lines{Helper::Strings::split(content, '\n')};
		std::vector<std::string> result;

		result.reserve(lines.size());

		for(auto& line : lines) {
			if(skipFirstLine) {
				skipFirstLine = false;

				continue;
			}

			Helper::Strings::trim(line);

			if(!line.empty() && line.front() == listCommentChar) {
				continue;
			}

			if(ignoreEmpty && line.empty()) {
				continue;
			}

			result.emplace_back(std::move(line));
		}

		// return list
		return result;
	}

} /* namespace reviewlens::Data::ImportExport::Text */

#endif /* DATA_IMPORTEXPORT_TEXT_HPP_ */
