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
 * Exception.hpp
 *
 * Base class for all exceptions thrown by reviewlens.
 *
 *  Created on: Feb 27, 2021
 *      Author: ans
 */

#ifndef MAIN_EXCEPTION_HPP_
#define MAIN_EXCEPTION_HPP_

#include <stdexcept>		// std::runtime_error
#include <string>			// std::string
#include <string_view>		// std::string_view

/*
 * MACRO FOR CLASS CREATION
 */

//! Macro used to easily define classes for general exceptions.
/*!
 * This macro will create a fully functional child class
 *  of \link reviewlens::Main::Exception Main::Exception\endlink.
 * \warning The macro needs to be used inside another class
 *  or inside another namespace than \link reviewlens::Main Main\endlink.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAIN_EXCEPTION_CLASS()			class Exception : public Main::Exception { \
										public: \
											explicit Exception( \
													const std::string& description \
											) : Main::Exception(description) {} \
										}

namespace reviewlens::Main {

	/*
	 * DECLARATION
	 */

	//! Base class for all exceptions thrown by the pipeline.
	/*!
	 * Only systemic failures are reported by
	 *  exceptions, i.e. an unreadable product
	 *  table or lexicon, an invalid
	 *  configuration, or outputs that cannot
	 *  be written. Defects of single reviews
	 *  are counted by the pipeline stages
	 *  instead.
	 *
	 * Use #MAIN_EXCEPTION_CLASS() for adding
	 * 	child classes of Main::Exception for general exceptions
	 * 	to another class or namespace.
	 */
	class Exception : public std::runtime_error {
	public:
		///@name Construction and Destruction
		///@{

		explicit Exception(const std::string& description);

		//! Default destructor.
		~Exception() override = default;

		///@}
		///@name Getter
		///@{

		[[nodiscard]] std::string_view view() const noexcept;

		///@}
		/**@name Copy and Move
		 * The class is both copyable and moveable.
		 */
		///@{

		//! Default copy constructor.
		Exception(const Exception& other) = default;

		//! Default copy assignment operator.
		Exception& operator=(const Exception& other) = default;

		//! Default move constructor.
		Exception(Exception&& other) = default;

		//! Default move assignment operator.
		Exception& operator=(Exception&& other) = default;

		///@}

	private:
		std::string_view stringView;
	};

	/*
	 * IMPLEMENTATION
	 */

	//! Constructor creating a new exception from its description.
	/*!
	 * \param description A const reference to a string describing the exception.
	 */
	inline Exception::Exception(const std::string& description)
			: std::runtime_error(description), stringView(std::runtime_error::what()) {}

	//! Gets a view of the description of the exception.
	inline std::string_view Exception::view() const noexcept {
		return this->stringView;
	}

} /* namespace reviewlens::Main */

#endif /* MAIN_EXCEPTION_HPP_ */
