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

#include "salsa20.h"
#include "compiler-defines.h"

#include <bit>
#include <cstddef>
#include <cstdint>

namespace arbiter {

namespace {

constexpr size_t SALSA20_BLOCK_SIZE = SALSA20_BLOCK_WORD_COUNT * sizeof(uint32_t);

static_assert(SLOT_SIZE == 2 * SALSA20_BLOCK_SIZE, "slot must hold a BlockMix block with r = 1");

uint32_t load_le32(const slot_value &value, size_t offset) noexcept {
    const auto &word = value[offset / WORD_SIZE];
    const size_t pos = offset % WORD_SIZE;
    return static_cast<uint32_t>(word[pos]) | (static_cast<uint32_t>(word[pos + 1]) << 8) |
        (static_cast<uint32_t>(word[pos + 2]) << 16) | (static_cast<uint32_t>(word[pos + 3]) << 24);
}

void store_le32(slot_value &value, size_t offset, uint32_t val) noexcept {
    auto &word = value[offset / WORD_SIZE];
    const size_t pos = offset % WORD_SIZE;
    word[pos] = static_cast<unsigned char>(val);
    word[pos + 1] = static_cast<unsigned char>(val >> 8);
    word[pos + 2] = static_cast<unsigned char>(val >> 16);
    word[pos + 3] = static_cast<unsigned char>(val >> 24);
}

FORCE_INLINE void quarter_round(uint32_t (&x)[SALSA20_BLOCK_WORD_COUNT], int a, int b, int c, int d) noexcept {
    x[b] ^= std::rotl(x[a] + x[d], 7);
    x[c] ^= std::rotl(x[b] + x[a], 9);
    x[d] ^= std::rotl(x[c] + x[b], 13);
    x[a] ^= std::rotl(x[d] + x[c], 18);
}

} // namespace

void salsa20_8(uint32_t (&block)[SALSA20_BLOCK_WORD_COUNT]) noexcept {
    uint32_t x[SALSA20_BLOCK_WORD_COUNT];
    for (int i = 0; i < SALSA20_BLOCK_WORD_COUNT; ++i) {
        x[i] = block[i];
    }
    for (int round = 0; round < 8; round += 2) {
        // Column round
        quarter_round(x, 0, 4, 8, 12);
        quarter_round(x, 5, 9, 13, 1);
        quarter_round(x, 10, 14, 2, 6);
        quarter_round(x, 15, 3, 7, 11);
        // Row round
        quarter_round(x, 0, 1, 2, 3);
        quarter_round(x, 5, 6, 7, 4);
        quarter_round(x, 10, 11, 8, 9);
        quarter_round(x, 15, 12, 13, 14);
    }
    for (int i = 0; i < SALSA20_BLOCK_WORD_COUNT; ++i) {
        block[i] += x[i];
    }
}

slot_value scrypt_block_mix(const slot_value &value) noexcept {
    // X = B1
    uint32_t x[SALSA20_BLOCK_WORD_COUNT];
    for (int i = 0; i < SALSA20_BLOCK_WORD_COUNT; ++i) {
        x[i] = load_le32(value, SALSA20_BLOCK_SIZE + (4 * i));
    }
    slot_value result{};
    for (size_t half = 0; half < 2; ++half) {
        for (int i = 0; i < SALSA20_BLOCK_WORD_COUNT; ++i) {
            x[i] ^= load_le32(value, (half * SALSA20_BLOCK_SIZE) + (4 * i));
        }
        salsa20_8(x);
        for (int i = 0; i < SALSA20_BLOCK_WORD_COUNT; ++i) {
            store_le32(result, (half * SALSA20_BLOCK_SIZE) + (4 * i), x[i]);
        }
    }
    return result;
}

slot_value xor_slot(const slot_value &a, const slot_value &b) noexcept {
    slot_value result{};
    for (size_t i = 0; i < SLOT_WORD_COUNT; ++i) {
        for (size_t j = 0; j < WORD_SIZE; ++j) {
            result[i][j] = a[i][j] ^ b[i][j];
        }
    }
    return result;
}

uint32_t scrypt_integerify(const slot_value &value) noexcept {
    return load_le32(value, SALSA20_BLOCK_SIZE);
}

} // namespace arbiter
