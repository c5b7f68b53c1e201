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

#include "scrypt-machine.h"

#include <span>
#include <stdexcept>
#include <string>

#include "record-step-state-access.h"
#include "scrypt-step.h"
#include "slog.h"

namespace arbiter {

scrypt_machine::scrypt_machine(std::span<const unsigned char> input) : m_input(input.begin(), input.end()) {
    m_states.reserve(SCRYPT_MIX_STEP_COUNT + 1);
    m_proofs.reserve(SCRYPT_MIX_STEP_COUNT);
    scrypt_state state = input_to_state(m_input);
    m_states.push_back(state);
    scrypt_memory memory;
    for (uint64_t k = 0; k < SCRYPT_MIX_STEP_COUNT; ++k) {
        record_step_state_access::context context;
        const record_step_state_access a(context, state, memory);
        const auto status = scrypt_step(k, a);
        if (status != ScryptStepStatus::Success) {
            throw std::runtime_error{"mixing step " + std::to_string(k) + " failed: " + scrypt_step_status_name(status)};
        }
        m_proofs.push_back(a.get_proof());
        m_states.push_back(state);
    }
    m_output = final_state_to_output(state, m_input);
    SLOG(debug) << "ran " << SCRYPT_MIX_STEP_COUNT << " mixing steps over " << m_input.size() << " input bytes";
}

const scrypt_state &scrypt_machine::get_state(uint64_t step) const {
    if (step < 1 || step > m_states.size()) {
        throw std::out_of_range{"no state after step count " + std::to_string(step)};
    }
    return m_states[step - 1];
}

step_witness scrypt_machine::get_step_witness(uint64_t step) const {
    step_witness witness;
    witness.step = step;
    if (step == SCRYPT_GENESIS_STEP) {
        witness.pre_state = m_input;
        witness.post_state = encode_state(get_state(1));
    } else if (step <= SCRYPT_MIX_STEP_COUNT) {
        witness.pre_state = encode_state(get_state(step));
        witness.post_state = encode_state(get_state(step + 1));
        witness.proof = m_proofs[step - 1].to_bytes();
    } else if (step == SCRYPT_FINAL_STEP) {
        witness.pre_state = encode_state(get_state(step));
        witness.post_state = m_output;
        witness.proof = m_input;
    } else {
        throw std::out_of_range{"step " + std::to_string(step) + " is out of range"};
    }
    return witness;
}

} // namespace arbiter
