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

#ifndef SCRYPT_STATE_H
#define SCRYPT_STATE_H

/// \file
/// \brief State of the scrypt computation at a step boundary and its codec

#include <optional>
#include <span>

#include "memory-word.h"

namespace arbiter {

/// \brief Working set of the scrypt computation between two steps
struct scrypt_state {
    slot_value vars{};         ///< Current scrypt block X, opaque to the step verifier
    memory_word memory_hash{}; ///< Root hash of the memory tree
    memory_word input_hash{};  ///< Hash of the raw input

    bool operator==(const scrypt_state &other) const = default;
};

/// \brief Serializes a state into its fixed-size wire encoding
/// \details Layout is vars[0..3] || memory_hash || input_hash.
byte_string encode_state(const scrypt_state &state);

/// \brief Parses a state from its wire encoding
/// \returns Decoded state, or nothing unless data is exactly SCRYPT_STATE_SIZE bytes
std::optional<scrypt_state> decode_state(std::span<const unsigned char> data);

/// \brief Builds the genesis state from the raw input
/// \details The block X is PBKDF2-HMAC-SHA-256(input, input, 1, 128), the memory
/// is all zeros and input_hash commits to the input.
scrypt_state input_to_state(std::span<const unsigned char> input);

/// \brief Derives the final output from the last state and the raw input
/// \returns PBKDF2-HMAC-SHA-256(input, X, 1, 32)
byte_string final_state_to_output(const scrypt_state &state, std::span<const unsigned char> input);

/// \brief Returns the hash committing to a raw input
memory_word get_input_hash(std::span<const unsigned char> input);

} // namespace arbiter

#endif
