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
 * filesystem.h
 *
 * Namespace alias for the file system library.
 *
 *  Created on: Feb 27, 2021
 *      Author: ans
 */

#ifndef HELPER_PORTABILITY_FILESYSTEM_H_
#define HELPER_PORTABILITY_FILESYSTEM_H_

#include <filesystem>

namespace stdfs = std::filesystem;

#endif /* HELPER_PORTABILITY_FILESYSTEM_H_ */
