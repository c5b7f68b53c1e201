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

#ifndef SCRYPT_SOLIDITY_COMPAT_H
#define SCRYPT_SOLIDITY_COMPAT_H

#include <cstdint>

#include "memory-merkle-proof.h"
#include "memory-word.h"
#include "salsa20.h"

/// \file
/// \brief Solidity Compatibility Layer
/// \brief The purpose of this file is to keep the scrypt step close to its on-chain counterpart.
/// \brief The step implementation uses functions from this file to perform operations not available
/// \brief or whose behavior differ in Solidity.

namespace arbiter {

// Solidity integer types
using uint32 = uint32_t;
using uint64 = uint64_t;
using bytes32 = memory_word;
using bytes32x4 = slot_value;

// Wrapper functions used to access data from the scrypt state accessor

template <typename ScryptState>
static inline bytes32x4 readVars(ScryptState &a) {
    return a.read_vars();
}

template <typename ScryptState>
static inline void writeVars(ScryptState &a, const bytes32x4 &val) {
    a.write_vars(val);
}

template <typename ScryptState>
static inline proof_status readSlot(ScryptState &a, uint64 index, bytes32x4 &val) {
    return a.read_slot(index, val);
}

template <typename ScryptState>
static inline proof_status writeSlot(ScryptState &a, uint64 index, const bytes32x4 &val) {
    return a.write_slot(index, val);
}

// Mixing primitives

static inline bytes32x4 blockMix(const bytes32x4 &val) {
    return scrypt_block_mix(val);
}

static inline bytes32x4 xorWords(const bytes32x4 &a, const bytes32x4 &b) {
    return xor_slot(a, b);
}

static inline uint64 integerify(const bytes32x4 &val) {
    return uint64(scrypt_integerify(val));
}

} // namespace arbiter

#endif
