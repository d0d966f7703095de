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
 * Json.hpp
 *
 * Namespace for global JSON helper functions.
 *
 *  Created on: Mar 2, 2021
 *      Author: ans
 */

#ifndef HELPER_JSON_HPP_
#define HELPER_JSON_HPP_

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <optional>		// std::optional
#include <string>		// std::string
#include <string_view>	// std::string_view

//! Namespace for global JSON helper functions.
namespace reviewlens::Helper::Json {

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! The number of spaces used for indentation by prettify().
	inline constexpr auto prettyIndent{2};

	///@}

	/*
	 * DECLARATION
	 */

	///@name Stringification
	///@{

	[[nodiscard]] std::string prettify(const rapidjson::Value& value);

	///@}
	///@name Building
	///@{

	[[nodiscard]] rapidjson::Value makeString(
			std::string_view str,
			rapidjson::Document::AllocatorType& allocator
	);
	[[nodiscard]] rapidjson::Value makeNullable(const std::optional<double>& number);
	[[nodiscard]] rapidjson::Value makeNullable(
			const std::optional<std::string>& str,
			rapidjson::Document::AllocatorType& allocator
	);
	void addMember(
			rapidjson::Value& object,
			std::string_view key,
			rapidjson::Value& value,
			rapidjson::Document::AllocatorType& allocator
	);
	void addMember(
			rapidjson::Value& object,
			std::string_view key,
			rapidjson::Value&& value,
			rapidjson::Document::AllocatorType& allocator
	);

	///@}

	/*
	 * IMPLEMENTATION
	 */

	/*
	 * STRINGIFICATION
	 */

	//! Stringifies a JSON value into indented JSON code, ending with a newline.
	/*!
	 * \param value Constant reference to the
	 *   JSON value to be stringified.
	 *
	 * \returns The string containing the
	 *   indented JSON code.
	 */
	inline std::string prettify(const rapidjson::Value& value) {
		// create string buffer and writer
		rapidjson::StringBuffer buffer;
		rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);

		writer.SetIndent(' ', prettyIndent);

		// write value to string buffer
		value.Accept(writer);

		// return string
		std::string result(buffer.GetString(), buffer.GetSize());

		result.push_back('\n');

		return result;
	}

	/*
	 * BUILDING
	 */

	//! Creates a JSON string (copying the given string).
	inline rapidjson::Value makeString(
			std::string_view str,
			rapidjson::Document::AllocatorType& allocator
	) {
		rapidjson::Value value;

		value.SetString(str.data(), static_cast<rapidjson::SizeType>(str.length()), allocator);

		return value;
	}

	//! Creates a JSON number, or @c null if the given optional is empty.
	inline rapidjson::Value makeNullable(const std::optional<double>& number) {
		rapidjson::Value value;

		if(number.has_value()) {
			value.SetDouble(number.value());
		}

		return value;
	}

	//! Creates a JSON string, or @c null if the given optional is empty.
	inline rapidjson::Value makeNullable(
			const std::optional<std::string>& str,
			rapidjson::Document::AllocatorType& allocator
	) {
		if(str.has_value()) {
			return makeString(str.value(), allocator);
		}

		return rapidjson::Value{};
	}

	//! Adds a member with the given key to a JSON object, moving the given value.
	inline void addMember(
			rapidjson::Value& object,
			std::string_view key,
			rapidjson::Value& value,
			rapidjson::Document::AllocatorType& allocator
	) {
		rapidjson::Value keyValue{makeString(key, allocator)};

		object.AddMember(keyValue, value, allocator);
	}

	//! Adds a member with the given key to a JSON object, taking a temporary value.
	inline void addMember(
			rapidjson::Value& object,
			std::string_view key,
			rapidjson::Value&& value,
			rapidjson::Document::AllocatorType& allocator
	) {
		addMember(object, key, value, allocator);
	}

} /* namespace reviewlens::Helper::Json */

#endif /* HELPER_JSON_HPP_ */
