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

#ifndef HEX_UTIL_H
#define HEX_UTIL_H

#include <span>
#include <string>
#include <string_view>

#include "memory-word.h"

namespace arbiter {

/// \brief Encodes bytes as lowercase hexadecimal with a 0x prefix
std::string encode_hex(std::span<const unsigned char> data);

/// \brief Decodes hexadecimal text, with or without a 0x prefix
/// \details Throws std::invalid_argument on an odd number of digits or a non-hexadecimal character.
byte_string decode_hex(std::string_view text);

/// \brief Decodes hexadecimal text holding exactly one word
/// \details Throws std::invalid_argument if the text does not decode to WORD_SIZE bytes.
memory_word decode_hex_word(std::string_view text);

} // namespace arbiter

#endif
