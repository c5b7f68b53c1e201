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

#ifndef KECCAKF_H
#define KECCAKF_H

/// \file
/// \brief Keccak-f[1600] permutation

#include <bit>
#include <cstddef>
#include <cstdint>

#include "compiler-defines.h"

namespace arbiter {

constexpr size_t KECCAKF_WORD_COUNT = 25;
constexpr size_t KECCAKF_ROUND_COUNT = 24;

/// \brief Applies the Keccak-f[1600] permutation in place
/// \param st State lanes, lane (x, y) at index x + 5*y
FORCE_INLINE void keccakf_1600(uint64_t (&st)[KECCAKF_WORD_COUNT]) noexcept {
    static constexpr uint64_t KECCAKF_RNDC[KECCAKF_ROUND_COUNT] = {0x0000000000000001, 0x0000000000008082,
        0x800000000000808a, 0x8000000080008000, 0x000000000000808b, 0x0000000080000001, 0x8000000080008081,
        0x8000000000008009, 0x000000000000008a, 0x0000000000000088, 0x0000000080008009, 0x000000008000000a,
        0x000000008000808b, 0x800000000000008b, 0x8000000000008089, 0x8000000000008003, 0x8000000000008002,
        0x8000000000000080, 0x000000000000800a, 0x800000008000000a, 0x8000000080008081, 0x8000000000008080,
        0x0000000080000001, 0x8000000080008008};
    static constexpr int KECCAKF_ROTC[24] = {1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14, 27, 41, 56, 8, 25, 43, 62,
        18, 39, 61, 20, 44};
    static constexpr size_t KECCAKF_PILN[24] = {10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4, 15, 23, 19, 13, 12, 2, 20,
        14, 22, 9, 6, 1};
    uint64_t bc[5]{};
    for (size_t round = 0; round < KECCAKF_ROUND_COUNT; ++round) {
        // Theta
        UNROLL_LOOP_FULL()
        for (size_t i = 0; i < 5; ++i) {
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        UNROLL_LOOP_FULL()
        for (size_t i = 0; i < 5; ++i) {
            const uint64_t t = bc[(i + 4) % 5] ^ std::rotl(bc[(i + 1) % 5], 1);
            UNROLL_LOOP_FULL()
            for (size_t j = 0; j < KECCAKF_WORD_COUNT; j += 5) {
                st[j + i] ^= t;
            }
        }
        // Rho and pi
        uint64_t t = st[1];
        UNROLL_LOOP_FULL()
        for (size_t i = 0; i < 24; ++i) {
            const size_t j = KECCAKF_PILN[i];
            bc[0] = st[j];
            st[j] = std::rotl(t, KECCAKF_ROTC[i]);
            t = bc[0];
        }
        // Chi
        UNROLL_LOOP_FULL()
        for (size_t j = 0; j < KECCAKF_WORD_COUNT; j += 5) {
            UNROLL_LOOP_FULL()
            for (size_t i = 0; i < 5; ++i) {
                bc[i] = st[j + i];
            }
            UNROLL_LOOP_FULL()
            for (size_t i = 0; i < 5; ++i) {
                st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }
        // Iota
        st[0] ^= KECCAKF_RNDC[round];
    }
}

} // namespace arbiter

#endif
