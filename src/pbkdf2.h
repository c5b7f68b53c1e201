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

#ifndef PBKDF2_H
#define PBKDF2_H

/// \file
/// \brief HMAC-SHA-256 and PBKDF2-HMAC-SHA-256 (RFC 2104, RFC 8018)

#include <cstdint>
#include <span>

#include "memory-word.h"

namespace arbiter {

/// \brief Computes HMAC-SHA-256
/// \param key Key of any length
/// \param message Message to authenticate
/// \returns The 32-byte authentication code
memory_word hmac_sha_256(std::span<const unsigned char> key, std::span<const unsigned char> message);

/// \brief Derives a key with PBKDF2 using HMAC-SHA-256 as the pseudo-random function
/// \param password Password bytes
/// \param salt Salt bytes
/// \param iterations Iteration count, must be positive
/// \param output Receives the derived key, of any length
/// \details Throws std::invalid_argument if iterations is zero.
void pbkdf2_hmac_sha_256(std::span<const unsigned char> password, std::span<const unsigned char> salt,
    uint32_t iterations, std::span<unsigned char> output);

} // namespace arbiter

#endif
