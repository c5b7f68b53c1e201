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

#ifndef MEMORY_WORD_H
#define MEMORY_WORD_H

/// \file
/// \brief Storage for 32-byte words, hashes and memory slots

#include <array>
#include <span>
#include <vector>

#include "scrypt-constants.h"

namespace arbiter {

/// \brief A 32-byte word. Hashes are words too.
using memory_word = std::array<unsigned char, WORD_SIZE>;
using memory_word_view = std::span<unsigned char, WORD_SIZE>;
using const_memory_word_view = std::span<const unsigned char, WORD_SIZE>;

/// \brief Contents of one memory slot
using slot_value = std::array<memory_word, SLOT_WORD_COUNT>;

/// \brief Arbitrary byte strings (serialized states, raw input, output)
using byte_string = std::vector<unsigned char>;

} // namespace arbiter

#endif
