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
 * Csv.hpp
 *
 * Namespace for importing and exporting comma-separated values (RFC 4180).
 *
 *  Created on: Mar 5, 2021
 *      Author: ans
 */

#ifndef DATA_IMPORTEXPORT_CSV_HPP_
#define DATA_IMPORTEXPORT_CSV_HPP_

#include "../../Helper/Strings.hpp"
#include "../../Main/Exception.hpp"

#include <cstddef>			// std::size_t
#include <initializer_list>	// std::initializer_list
#include <optional>			// std::optional, std::nullopt
#include <string>			// std::string, std::to_string
#include <string_view>		// std::string_view
#include <utility>			// std::move
#include <vector>			// std::vector

//! Namespace for importing and exporting comma-separated values (RFC 4180).
namespace reviewlens::Data::ImportExport::Csv {

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! The character separating the fields of a row.
	inline constexpr auto separator{','};

	//! The character used to quote fields.
	inline constexpr auto quote{'"'};

	//! The byte order mark that might precede UTF-8 content.
	inline constexpr std::string_view utf8Bom{"\xEF\xBB\xBF"};

	///@}

	/*
	 * DECLARATION
	 */

	//! A row of fields.
	using Row = std::vector<std::string>;

	///@name Import
	///@{

	[[nodiscard]] std::vector<Row> importRows(std::string_view content);
	[[nodiscard]] std::optional<std::size_t> findColumn(
			const Row& header,
			std::initializer_list<std::string_view> names
	);

	///@}
	///@name Export
	///@{

	[[nodiscard]] std::string escapeField(std::string_view field);
	void exportRow(const Row& row, std::string& to);

	///@}

	/*
	 * EXCEPTION CLASS
	 */

	//! Class for CSV exceptions.
	/*!
	 * Will be thrown when a quoted field
	 *  has not been closed at the end of
	 *  the content.
	 */
	MAIN_EXCEPTION_CLASS();

	/*
	 * IMPLEMENTATION
	 */

	/*
	 * IMPORT
	 */

	//! Parses CSV content into rows of fields.
	/*!
	 * Fields may be enclosed in double quotes,
	 *  in which case they may contain separators,
	 *  line breaks and doubled double quotes.
	 *  Both @c \\n and @c \\r\\n are accepted as
	 *  line endings. Empty lines are skipped.
	 *
	 * \param content View of the content to be
	 *   parsed.
	 *
	 * \returns A vector containing the rows in
	 *   the content, including the header.
	 *
	 * \throws Csv::Exception if a quoted field
	 *   has not been closed.
	 */
	inline std::vector<Row> importRows(std::string_view content) {
		std::vector<Row> result;
		Row row;
		std::string field;
		bool inQuotes{false};
		bool quoted{false};
		std::size_t line{1};
		std::size_t quoteLine{0};

		if(content.substr(0, utf8Bom.length()) == utf8Bom) {
			content.remove_prefix(utf8Bom.length());
		}

		const auto endRow{
			[&result, &row, &field, &quoted]() {
				if(!row.empty() || !field.empty() || quoted) {
					row.emplace_back(std::move(field));
					result.emplace_back(std::move(row));
				}

				row.clear();
				field.clear();

				quoted = false;
			}
		};

		for(std::size_t pos{0}; pos < content.length(); ++pos) {
			const auto c{content[pos]};

			if(inQuotes) {
				if(c == quote) {
					if(pos + 1 < content.length() && content[pos + 1] == quote) {
						// escaped quote
						field.push_back(quote);

						++pos;
					}
					else {
						inQuotes = false;
					}
				}
				else {
					if(c == '\n') {
						++line;
					}

					field.push_back(c);
				}

				continue;
			}

			switch(c) {
			case quote:
				if(field.empty() && !quoted) {
					inQuotes = true;
					quoted = true;
					quoteLine = line;
				}
				else {
					// stray quote inside an unquoted field
					field.push_back(c);
				}

				break;

			case separator:
				row.emplace_back(std::move(field));

				field.clear();

				quoted = false;

				break;

			case '\r':
				if(pos + 1 < content.length() && content[pos + 1] == '\n') {
					break;
				}

				field.push_back(c);

				break;

			case '\n':
				endRow();

				++line;

				break;

			default:
				field.push_back(c);
			}
		}

		if(inQuotes) {
			throw Exception(
					"Unterminated quoted field starting in line "
					+ std::to_string(quoteLine)
			);
		}

		endRow();

		return result;
	}

	//! Finds a column by one of its names.
	/*!
	 * Names are compared case-insensitively,
	 *  ignoring surrounding whitespaces.
	 *
	 * \param header Constant reference to the
	 *   header row.
	 * \param names The accepted names of the
	 *   column, in order of preference.
	 *
	 * \returns The index of the column, or an
	 *   empty optional if none of the names
	 *   has been found in the header.
	 */
	inline std::optional<std::size_t> findColumn(
			const Row& header,
			std::initializer_list<std::string_view> names
	) {
		for(const auto name : names) {
			const auto lowerName{Helper::Strings::toLowerCopy(name)};

			for(std::size_t index{0}; index < header.size(); ++index) {
				auto column{Helper::Strings::toLowerCopy(header[index])};

				Helper::Strings::trim(column);

				if(column == lowerName) {
					return index;
				}
			}
		}

		return std::nullopt;
	}

	/*
	 * EXPORT
	 */

	//! Quotes a field if necessary.
	/*!
	 * A field is quoted if it contains a
	 *  separator, a double quote or a line
	 *  break. Double quotes inside the field
	 *  are doubled.
	 */
	inline std::string escapeField(std::string_view field) {
		if(field.find_first_of(",\"\r\n") == std::string_view::npos) {
			return std::string(field);
		}

		std::string result;

		result.reserve(field.length() + 2);

		result.push_back(quote);

		for(const auto c : field) {
			if(c == quote) {
				result.push_back(quote);
			}

			result.push_back(c);
		}

		result.push_back(quote);

		return result;
	}

	//! Appends a row, terminated by a line feed, to the given CSV content.
	inline void exportRow(const Row& row, std::string& to) {
		bool first{true};

		for(const auto& field : row) {
			if(first) {
				first = false;
			}
			else {
				to.push_back(separator);
			}

			to += escapeField(field);
		}

		to.push_back('\n');
	}

} /* namespace reviewlens::Data::ImportExport::Csv */

#endif /* DATA_IMPORTEXPORT_CSV_HPP_ */
