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

#include "step-verifier.h"

#include <algorithm>
#include <cstdint>
#include <span>
#include <utility>

#include "memory-merkle-proof.h"
#include "replay-step-state-access.h"
#include "scrypt-state.h"
#include "scrypt-step.h"
#include "slog.h"

namespace arbiter {

const char *step_verdict_name(step_verdict verdict) noexcept {
    switch (verdict) {
        case step_verdict::valid:
            return "valid";
        case step_verdict::undecodable_state:
            return "undecodable state";
        case step_verdict::malformed_proof:
            return "malformed proof";
        case step_verdict::proof_word_count:
            return "wrong proof word count";
        case step_verdict::proof_root_mismatch:
            return "proof root mismatch";
        case step_verdict::post_state_mismatch:
            return "post-state mismatch";
        case step_verdict::input_hash_mismatch:
            return "input hash mismatch";
        case step_verdict::output_mismatch:
            return "output mismatch";
        case step_verdict::step_out_of_range:
            return "step out of range";
    }
    return "unknown";
}

static bool equal_bytes(std::span<const unsigned char> a, std::span<const unsigned char> b) {
    return std::ranges::equal(a, b);
}

static step_verdict verify_genesis_step(std::span<const unsigned char> input,
    std::span<const unsigned char> post_state) {
    const auto state = input_to_state(input);
    if (!equal_bytes(encode_state(state), post_state)) {
        return step_verdict::post_state_mismatch;
    }
    return step_verdict::valid;
}

static step_verdict verify_mixing_step(uint64_t step, std::span<const unsigned char> pre_state,
    std::span<const unsigned char> post_state, std::span<const unsigned char> proof) {
    auto state = decode_state(pre_state);
    if (!state) {
        return step_verdict::undecodable_state;
    }
    auto parsed = slot_proof::from_bytes(proof);
    if (!parsed) {
        return step_verdict::malformed_proof;
    }
    replay_step_state_access::context context{std::move(*parsed), {}};
    const replay_step_state_access a(context, *state);
    switch (scrypt_step(step - 1, a)) {
        case ScryptStepStatus::Success:
            break;
        case ScryptStepStatus::InvalidProofWordCount:
            return step_verdict::proof_word_count;
        case ScryptStepStatus::ProofRootMismatch:
            return step_verdict::proof_root_mismatch;
        case ScryptStepStatus::StepOutOfRange:
            return step_verdict::step_out_of_range;
    }
    if (!equal_bytes(encode_state(*state), post_state)) {
        return step_verdict::post_state_mismatch;
    }
    return step_verdict::valid;
}

static step_verdict verify_final_step(std::span<const unsigned char> pre_state,
    std::span<const unsigned char> post_state, std::span<const unsigned char> input) {
    const auto state = decode_state(pre_state);
    if (!state) {
        return step_verdict::undecodable_state;
    }
    if (get_input_hash(input) != state->input_hash) {
        return step_verdict::input_hash_mismatch;
    }
    if (!equal_bytes(final_state_to_output(*state, input), post_state)) {
        return step_verdict::output_mismatch;
    }
    return step_verdict::valid;
}

step_verdict verify_step_with_status(uint64_t step, std::span<const unsigned char> pre_state,
    std::span<const unsigned char> post_state, std::span<const unsigned char> proof) {
    step_verdict verdict = step_verdict::step_out_of_range;
    if (step == SCRYPT_GENESIS_STEP) {
        verdict = verify_genesis_step(pre_state, post_state);
    } else if (step <= SCRYPT_MIX_STEP_COUNT) {
        verdict = verify_mixing_step(step, pre_state, post_state, proof);
    } else if (step == SCRYPT_FINAL_STEP) {
        verdict = verify_final_step(pre_state, post_state, proof);
    }
    if (verdict != step_verdict::valid) {
        SLOG(info) << "step " << step << " rejected: " << step_verdict_name(verdict);
    }
    SLOG(debug) << "step " << step << " verdict: " << step_verdict_name(verdict);
    return verdict;
}

bool verify_step(uint64_t step, std::span<const unsigned char> pre_state, std::span<const unsigned char> post_state,
    std::span<const unsigned char> proof) {
    return verify_step_with_status(step, pre_state, post_state, proof) == step_verdict::valid;
}

bool is_initially_valid(const dispute_session &session) noexcept {
    return session.output.size() == SCRYPT_OUTPUT_SIZE && session.high_step == SCRYPT_STEP_COUNT;
}

} // namespace arbiter
