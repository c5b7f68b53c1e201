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

/// \file
/// \brief This file mirrors the on-chain scrypt step.

// NOLINTBEGIN(google-readability-casting,misc-const-correctness)

#include "scrypt-step.h"

#include "memory-state-access.h"
#include "record-step-state-access.h"
#include "replay-step-state-access.h"

#include "scrypt-constants.h"
#include "scrypt-solidity-compat.h"

namespace arbiter {

const char *scrypt_step_status_name(ScryptStepStatus status) noexcept {
    switch (status) {
        case ScryptStepStatus::Success:
            return "success";
        case ScryptStepStatus::StepOutOfRange:
            return "step out of range";
        case ScryptStepStatus::InvalidProofWordCount:
            return "invalid proof word count";
        case ScryptStepStatus::ProofRootMismatch:
            return "proof root mismatch";
    }
    return "unknown";
}

static inline ScryptStepStatus proofFailure(proof_status status) {
    if (status == proof_status::invalid_word_count) {
        return ScryptStepStatus::InvalidProofWordCount;
    }
    return ScryptStepStatus::ProofRootMismatch;
}

template <typename ScryptState>
ScryptStepStatus scrypt_step(uint64 k, const ScryptState &a) {
    if (k >= SCRYPT_MIX_STEP_COUNT) {
        return ScryptStepStatus::StepOutOfRange;
    }
    bytes32x4 x = readVars(a);
    if (k < MEMORY_SLOT_COUNT) {
        // V[k] = X
        proof_status status = writeSlot(a, k, x);
        if (status != proof_status::success) {
            return proofFailure(status);
        }
        writeVars(a, blockMix(x));
    } else {
        // X = BlockMix(X xor V[j])
        uint64 j = integerify(x) % MEMORY_SLOT_COUNT;
        bytes32x4 v{};
        proof_status status = readSlot(a, j, v);
        if (status != proof_status::success) {
            return proofFailure(status);
        }
        writeVars(a, blockMix(xorWords(x, v)));
    }
    return ScryptStepStatus::Success;
}

// Explicit instantiation for memory_state_access
template ScryptStepStatus scrypt_step(uint64 k, const memory_state_access &a);

// Explicit instantiation for record_step_state_access
template ScryptStepStatus scrypt_step(uint64 k, const record_step_state_access &a);

// Explicit instantiation for replay_step_state_access
template ScryptStepStatus scrypt_step(uint64 k, const replay_step_state_access &a);

} // namespace arbiter
// NOLINTEND(google-readability-casting,misc-const-correctness)
