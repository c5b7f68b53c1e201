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

#include "scrypt-state.h"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>

#include "i-hasher.h"
#include "memory-merkle-proof.h"
#include "pbkdf2.h"
#include "pristine-memory-tree.h"

namespace arbiter {

static_assert(SCRYPT_STATE_SIZE == (SLOT_WORD_COUNT + 2) * WORD_SIZE, "unexpected state size");

byte_string encode_state(const scrypt_state &state) {
    byte_string data;
    data.reserve(SCRYPT_STATE_SIZE);
    for (const auto &word : state.vars) {
        data.insert(data.end(), word.begin(), word.end());
    }
    data.insert(data.end(), state.memory_hash.begin(), state.memory_hash.end());
    data.insert(data.end(), state.input_hash.begin(), state.input_hash.end());
    return data;
}

std::optional<scrypt_state> decode_state(std::span<const unsigned char> data) {
    if (data.size() != SCRYPT_STATE_SIZE) {
        return std::nullopt;
    }
    scrypt_state state;
    auto it = data.begin();
    for (auto &word : state.vars) {
        std::copy_n(it, WORD_SIZE, word.begin());
        it += WORD_SIZE;
    }
    std::copy_n(it, WORD_SIZE, state.memory_hash.begin());
    it += WORD_SIZE;
    std::copy_n(it, WORD_SIZE, state.input_hash.begin());
    return state;
}

memory_word get_input_hash(std::span<const unsigned char> input) {
    return get_hash(memory_hasher{}, input);
}

scrypt_state input_to_state(std::span<const unsigned char> input) {
    unsigned char block[SLOT_SIZE];
    pbkdf2_hmac_sha_256(input, input, 1, block);
    scrypt_state state;
    for (size_t i = 0; i < SLOT_WORD_COUNT; ++i) {
        std::copy_n(block + (i * WORD_SIZE), WORD_SIZE, state.vars[i].begin());
    }
    state.memory_hash = get_pristine_memory_root();
    state.input_hash = get_input_hash(input);
    return state;
}

byte_string final_state_to_output(const scrypt_state &state, std::span<const unsigned char> input) {
    byte_string block;
    block.reserve(SLOT_SIZE);
    for (const auto &word : state.vars) {
        block.insert(block.end(), word.begin(), word.end());
    }
    byte_string output(SCRYPT_OUTPUT_SIZE);
    pbkdf2_hmac_sha_256(input, block, 1, output);
    return output;
}

} // namespace arbiter
