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

#ifndef SCRYPT_CONSTANTS_H
#define SCRYPT_CONSTANTS_H

#include <cstddef>
#include <cstdint>

/// \file
/// \brief Fixed parameters of the arbitrated scrypt computation and of its memory proofs.

namespace arbiter {

const constexpr int MEMORY_LOG2_SLOT_COUNT = 10;
const constexpr uint64_t MEMORY_SLOT_COUNT = UINT64_C(1) << MEMORY_LOG2_SLOT_COUNT;
const constexpr size_t SLOT_WORD_COUNT = 4;
const constexpr size_t WORD_SIZE = 32;
const constexpr size_t SLOT_SIZE = SLOT_WORD_COUNT * WORD_SIZE;

/// \brief Words in a memory proof: the slot words followed by one sibling per tree level
const constexpr size_t PROOF_WORD_COUNT = SLOT_WORD_COUNT + MEMORY_LOG2_SLOT_COUNT;
const constexpr size_t PROOF_SIZE = PROOF_WORD_COUNT * WORD_SIZE;

/// \brief Mixing steps: N writes followed by N reads
const constexpr uint64_t SCRYPT_MIX_STEP_COUNT = 2 * MEMORY_SLOT_COUNT;

/// \brief Step 0 is genesis, steps 1..SCRYPT_MIX_STEP_COUNT mix, the last one finalizes
const constexpr uint64_t SCRYPT_GENESIS_STEP = 0;
const constexpr uint64_t SCRYPT_FINAL_STEP = SCRYPT_MIX_STEP_COUNT + 1;
const constexpr uint64_t SCRYPT_STEP_COUNT = SCRYPT_FINAL_STEP;

const constexpr size_t SCRYPT_OUTPUT_SIZE = 32;

/// \brief Encoded state: scrypt block words, memory root, input hash
const constexpr size_t SCRYPT_STATE_VARS_WORD_COUNT = SLOT_WORD_COUNT;
const constexpr size_t SCRYPT_STATE_SIZE = (SCRYPT_STATE_VARS_WORD_COUNT + 2) * WORD_SIZE;

} // namespace arbiter

#endif
