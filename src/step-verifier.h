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

#ifndef STEP_VERIFIER_H
#define STEP_VERIFIER_H

/// \file
/// \brief Arbitration entry points: single step verification and session admission

#include <cstdint>
#include <ostream>
#include <span>

#include "dispute-session.h"

namespace arbiter {

/// \brief Verdict of a step verification, with the reason for a rejection
enum class step_verdict : uint8_t {
    valid,               ///< Transition is valid
    undecodable_state,   ///< Pre-state could not be decoded
    malformed_proof,     ///< Proof is not a whole number of words
    proof_word_count,    ///< Proof does not hold exactly one slot and its path
    proof_root_mismatch, ///< Proof does not match the pre-state memory hash
    post_state_mismatch, ///< Computed post-state differs from the claimed one
    input_hash_mismatch, ///< Revealed input does not match the committed input hash
    output_mismatch,     ///< Output derived from the revealed input differs from the claimed one
    step_out_of_range,   ///< Step index is past the finalization step
};

/// \brief Returns the name of a verdict
const char *step_verdict_name(step_verdict verdict) noexcept;

inline std::ostream &operator<<(std::ostream &out, step_verdict verdict) {
    return out << step_verdict_name(verdict);
}

/// \brief Verifies one step and reports why it was rejected
/// \param step Step index
/// \param pre_state Serialized state before the step (raw input for step 0)
/// \param post_state Serialized state after the step (output bytes for the finalization step)
/// \param proof Step-dependent proof
/// \returns Verdict
/// \details Never throws on malformed input: every failure becomes a verdict.
step_verdict verify_step_with_status(uint64_t step, std::span<const unsigned char> pre_state,
    std::span<const unsigned char> post_state, std::span<const unsigned char> proof);

/// \brief Verifies one step
/// \returns True if the transition is valid, false otherwise
bool verify_step(uint64_t step, std::span<const unsigned char> pre_state, std::span<const unsigned char> post_state,
    std::span<const unsigned char> proof);

/// \brief Checks whether a session may be arbitrated step by step
/// \returns True iff the claimed output has SCRYPT_OUTPUT_SIZE bytes and high_step is SCRYPT_STEP_COUNT
bool is_initially_valid(const dispute_session &session) noexcept;

} // namespace arbiter

#endif
