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

#include "file-util.h"

#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <system_error>
#include <tuple>

namespace arbiter {

void detail::fclose_deleter::operator()(FILE *p) const {
    std::ignore = std::fclose(p);
}

unique_file_ptr make_unique_fopen(const char *pathname, const char *mode) {
    FILE *fp = fopen(pathname, mode);
    if (fp == nullptr) {
        throw std::system_error(errno, std::generic_category(),
            "unable to open '" + std::string{pathname} + "' in mode '" + std::string{mode} + "'");
    }
    return unique_file_ptr{fp};
}

std::string read_text_file(const std::string &filename) {
    auto fp = make_unique_fopen(filename.c_str(), "rb");
    std::string text;
    char buf[4096];
    while (true) {
        const auto got = fread(buf, 1, sizeof(buf), fp.get());
        text.append(buf, got);
        if (got < sizeof(buf)) {
            if (ferror(fp.get()) != 0) {
                throw std::runtime_error{"error reading '" + filename + "'"};
            }
            break;
        }
    }
    return text;
}

void write_text_file(const std::string &filename, const std::string &text) {
    auto fp = make_unique_fopen(filename.c_str(), "wb");
    if (fwrite(text.data(), 1, text.size(), fp.get()) != text.size()) {
        throw std::runtime_error{"error writing '" + filename + "'"};
    }
}

} // namespace arbiter
