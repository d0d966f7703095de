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
 * main.hpp
 *
 * Helper function for main() and additional commenting for doxygen.
 *
 *  Created on: Mai 24, 2020
 *      Author: ans
 */

#ifndef MAIN_HPP_
#define MAIN_HPP_

#include <string>	// std::string
#include <vector>	// std::vector

//! The global namespace of reviewlens.
namespace reviewlens {

	/*
	 * DECLARATION
	 */

	std::vector<std::string> vectorize(int argc, char ** argv);

	/*
	 * IMPLEMENTATION
	 */

	//! Vectorizes the given arguments to the program.
	/*!
	 * This function is used by main() exclusively
	 *  and accepts the same arguments exactly.
	 *
	 * \param argc The number of arguments, including the name
	 *   used when executing the program, i.e. the number of
	 *   elements in \p argv.
	 *
	 * \param argv A C-style array of C-style null-terminated
	 *   strings containing the arguments, including the name
	 *   used to call the program.
	 *
	 * \returns A vector with the given arguments to the program
	 *   as strings, including the name used to call the program.
	 */
	inline std::vector<std::string> vectorize(int argc, char ** argv) {
		std::vector<std::string> result;

		for(int n{0}; n < argc; ++n) {
			result.emplace_back(argv[n]);
		}

		return result;
	}

} /* namespace reviewlens */

#endif /* MAIN_HPP_ */

/*
 * ADDITIONAL COMMENTING FOR DOXYGEN
 */

/**
 * \mainpage
 *
 * **reviewlens review analysis pipeline**
 *
 * Cleans customer reviews, scores their sentiment, extracts keywords
 *  and compares products.
 */

//! Namespace for data processing classes and algorithms.
/**
 * \namespace reviewlens::Data
 */

//! Namespace for the import and export of data.
/**
 * \namespace reviewlens::Data::ImportExport
 */

//! Namespace for global helper functions.
/**
 * \namespace reviewlens::Helper
 */

//! Namespace for the stages of the pipeline.
/**
 * \namespace reviewlens::Module
 */

//! Namespace for data structures.
/**
 * \namespace reviewlens::Struct
 */
