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

#ifndef SALSA20_H
#define SALSA20_H

/// \file
/// \brief Salsa20/8 core and the scrypt BlockMix built on it (RFC 7914)

#include <cstdint>

#include "memory-word.h"

namespace arbiter {

/// \brief Number of 32-bit words in a Salsa20 block
constexpr int SALSA20_BLOCK_WORD_COUNT = 16;

/// \brief Applies the Salsa20/8 core to a 64-byte block in place
/// \param block Block stored as little-endian 32-bit words
void salsa20_8(uint32_t (&block)[SALSA20_BLOCK_WORD_COUNT]) noexcept;

/// \brief Computes scrypt BlockMix with Salsa20/8 and r = 1
/// \param value 128-byte block B = B0 || B1, stored in the 4 words of a slot
/// \returns Y0 || Y1
slot_value scrypt_block_mix(const slot_value &value) noexcept;

/// \brief Word-wise exclusive or of two slots
slot_value xor_slot(const slot_value &a, const slot_value &b) noexcept;

/// \brief Returns the little-endian integer in the first 4 bytes of B1
/// \details This is the scrypt Integerify function for r = 1, truncated to 32 bits.
uint32_t scrypt_integerify(const slot_value &value) noexcept;

} // namespace arbiter

#endif
