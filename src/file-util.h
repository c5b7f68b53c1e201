// Copyright Cartesi and individual authors (see AUTHORS)
// SPDX-License-Identifier: LGPL-3.0-or-later
//
// This program is free software: you can redistribute it and/or modify it under
// the terms of the GNU Lesser General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version.
//
// This program is distributed in the hope that it will be useful, but WITHOUT ANY
// WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
// PARTICULAR PURPOSE. See the GNU Lesser General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public License along
// with this program (see COPYING). If not, see <https://www.gnu.org/licenses/>.
//

#ifndef FILE_UTIL_H
#define FILE_UTIL_H

#include <cstdio>
#include <memory>
#include <string>

namespace arbiter {

namespace detail {

struct fclose_deleter {
    void operator()(FILE *p) const;
};

} // namespace detail

using unique_file_ptr = std::unique_ptr<FILE, detail::fclose_deleter>;

/// \brief Opens a file, throwing std::system_error on failure
unique_file_ptr make_unique_fopen(const char *pathname, const char *mode);

/// \brief Reads the whole contents of a file
/// \details Throws std::system_error if the file cannot be opened and std::runtime_error on read errors.
std::string read_text_file(const std::string &filename);

/// \brief Replaces the contents of a file
/// \details Throws std::system_error if the file cannot be opened and std::runtime_error on write errors.
void write_text_file(const std::string &filename, const std::string &text);

} // namespace arbiter

#endif
