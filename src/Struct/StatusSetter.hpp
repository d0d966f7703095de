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
 * StatusSetter.hpp
 *
 * Structure for reporting the status of the pipeline.
 *
 *  Created on: Mar 8, 2021
 *      Author: ans
 */

#ifndef STRUCT_STATUSSETTER_HPP_
#define STRUCT_STATUSSETTER_HPP_

#include <cstdint>		// std::uint8_t
#include <functional>	// std::function
#include <string>		// std::string
#include <string_view>	// std::string_view, std::string_view_literals
#include <utility>		// std::move

namespace reviewlens::Struct {

	using std::string_view_literals::operator""sv;

	//! The level of a log message.
	enum class LogLevel : std::uint8_t {
		error = 0,
		warning,
		info,
		detail
	};

	//! Gets the prefix used for console output of log messages with the given level.
	inline constexpr std::string_view logPrefix(LogLevel level) {
		switch(level) {
		case LogLevel::error:
			return "[ERROR] "sv;

		case LogLevel::warning:
			return "[WARNING] "sv;

		case LogLevel::info:
			return "[INFO] "sv;

		case LogLevel::detail:
			return "[INFO]  "sv;
		}

		return ""sv;
	}

	//! Structure containing all the data needed to report the status of the pipeline.
	struct StatusSetter {
		///@name Properties
		///@{

		//! The current status, i.e. the name of the current stage.
		std::string currentStatus;

		//! Whether messages with the level LogLevel::detail will be reported.
		bool verbose{false};

		///@}
		///@name Callback Function
		///@{

		//! Callback function to report a log message.
		std::function<void(LogLevel, const std::string&)> callbackLog;

		///@}
		///@name Constructors
		///@{

		//! Default constructor, discarding all messages.
		StatusSetter() = default;

		//! Constructor setting the callback function.
		/*!
		 * \param setVerbose Set whether detailed
		 *   messages will be reported.
		 * \param callbackToLog The function (or
		 *   lambda) that will be used to report
		 *   log messages.
		 */
		StatusSetter(
				bool setVerbose,
				std::function<void(LogLevel, const std::string&)> callbackToLog
		) :		verbose(setVerbose),
				callbackLog(std::move(callbackToLog)) {}

		///@}
		///@name Reporting
		///@{

		//! Reports a message, if a callback function has been set.
		/*!
		 * Detailed messages are only reported
		 *  in verbose mode.
		 */
		void log(LogLevel level, const std::string& message) const {
			if(!(this->callbackLog) || (level == LogLevel::detail && !(this->verbose))) {
				return;
			}

			this->callbackLog(level, message);
		}

		//! Changes the current status and reports it.
		void change(const std::string& statusMessage) {
			this->currentStatus = statusMessage;

			this->log(LogLevel::info, statusMessage);
		}

		///@}
	};

} /* namespace reviewlens::Struct */

#endif /* STRUCT_STATUSSETTER_HPP_ */
