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

#ifndef SCRYPT_MACHINE_H
#define SCRYPT_MACHINE_H

/// \file
/// \brief Honest prover that runs the scrypt computation and produces step witnesses

#include <cstdint>
#include <span>
#include <vector>

#include "dispute-session.h"
#include "memory-merkle-proof.h"
#include "memory-word.h"
#include "scrypt-state.h"

namespace arbiter {

/// \brief Everything the verifier needs to check one step
struct step_witness {
    uint64_t step{0};       ///< Step index
    byte_string pre_state;  ///< Serialized state before the step (raw input for genesis)
    byte_string post_state; ///< Serialized state after the step (output bytes for finalization)
    byte_string proof;      ///< Step-dependent proof (slot proof for mixing steps, raw input for finalization)

    bool operator==(const step_witness &other) const = default;
};

/// \brief Runs scrypt over an input and keeps the trace of every step
/// \details The whole computation runs in the constructor, recording the
/// proof of the single memory access of each mixing step.
class scrypt_machine final {
public:
    /// \brief Constructor
    /// \param input Raw input, used as both password and salt
    explicit scrypt_machine(std::span<const unsigned char> input);

    scrypt_machine(const scrypt_machine &other) = delete;
    scrypt_machine(scrypt_machine &&other) noexcept = default;
    scrypt_machine &operator=(const scrypt_machine &other) = delete;
    scrypt_machine &operator=(scrypt_machine &&other) noexcept = default;
    ~scrypt_machine() = default;

    /// \brief Returns the raw input
    const byte_string &get_input() const {
        return m_input;
    }

    /// \brief Returns the scrypt output
    const byte_string &get_output() const {
        return m_output;
    }

    /// \brief Returns the state after a given number of steps
    /// \param step Number of steps executed, from 1 (genesis) to SCRYPT_MIX_STEP_COUNT+1
    const scrypt_state &get_state(uint64_t step) const;

    /// \brief Returns the witness for a step
    /// \param step Step index, from 0 to SCRYPT_FINAL_STEP
    /// \details Throws std::out_of_range for any other step.
    step_witness get_step_witness(uint64_t step) const;

    /// \brief Returns the session claimed by an honest prover
    dispute_session get_session() const {
        return dispute_session{m_output, SCRYPT_STEP_COUNT};
    }

private:
    byte_string m_input;                    ///< Raw input
    std::vector<scrypt_state> m_states;     ///< States after genesis and after each mixing step
    std::vector<slot_proof> m_proofs;       ///< Proof used by each mixing step
    byte_string m_output;                   ///< Final output
};

} // namespace arbiter

#endif
