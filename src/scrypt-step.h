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

#ifndef SCRYPT_STEP_H
#define SCRYPT_STEP_H

#include <cstdint>
#include <ostream>

#include "memory-merkle-proof.h"

namespace arbiter {

/// \brief Scrypt mixing step execution status code
enum class ScryptStepStatus : int {
    Success,               // one mixing step was executed successfully
    StepOutOfRange,        // step index is past the last mixing step; nothing was done
    InvalidProofWordCount, // the memory proof does not have the expected number of words
    ProofRootMismatch      // the memory proof does not match the state's memory hash
};

/// \brief Returns the name of a step status
const char *scrypt_step_status_name(ScryptStepStatus status) noexcept;

inline std::ostream &operator<<(std::ostream &out, ScryptStepStatus status) {
    return out << scrypt_step_status_name(status);
}

/// \brief Executes one step of the scrypt ROMix loop
/// \tparam STATE_ACCESS Scrypt state accessor class
/// \param k Mixing step index, from 0 to SCRYPT_MIX_STEP_COUNT-1
/// \param a Scrypt state accessor
/// \returns Returns a status code indicating whether the state was advanced
/// \details \{
/// Steps below MEMORY_SLOT_COUNT store X in slot k and replace X with BlockMix(X).
/// Later steps read slot Integerify(X) mod MEMORY_SLOT_COUNT into V and replace X with BlockMix(X xor V).
/// Each step performs exactly one memory access, and stops at the first proof failure.
/// \}
template <typename STATE_ACCESS>
ScryptStepStatus scrypt_step(uint64_t k, const STATE_ACCESS &a);

class memory_state_access;
class record_step_state_access;
class replay_step_state_access;

// Declaration of explicit instantiation in module scrypt-step.cpp
extern template ScryptStepStatus scrypt_step(uint64_t k, const memory_state_access &a);

// Declaration of explicit instantiation in module scrypt-step.cpp
extern template ScryptStepStatus scrypt_step(uint64_t k, const record_step_state_access &a);

// Declaration of explicit instantiation in module scrypt-step.cpp
extern template ScryptStepStatus scrypt_step(uint64_t k, const replay_step_state_access &a);

} // namespace arbiter

#endif
