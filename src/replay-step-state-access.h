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

#ifndef REPLAY_STEP_STATE_ACCESS_H
#define REPLAY_STEP_STATE_ACCESS_H

/// \file
/// \brief State access that authenticates memory through a single slot proof

#include <cstdint>
#include <optional>
#include <stdexcept>

#include "i-scrypt-state-access.h"
#include "memory-merkle-proof.h"
#include "scrypt-state.h"

namespace arbiter {

// \brief Provides the scrypt memory of one step from a slot proof
// \details The state holds only the memory root. Each access is checked against
// the current root and a write replaces the root through the same proof.
class replay_step_state_access : public i_scrypt_state_access<replay_step_state_access> {
public:
    struct context {
        slot_proof proof;              ///< Proof supplied for the step, updated in place by writes
        std::optional<uint64_t> index; ///< Index of the slot the proof was bound to by the first access
    };

private:
    // NOLINTBEGIN(cppcoreguidelines-avoid-const-or-ref-data-members)
    context &m_context; ///< Context with the proof
    scrypt_state &m_s;  ///< State being advanced
    // NOLINTEND(cppcoreguidelines-avoid-const-or-ref-data-members)

public:
    // \brief Constructs a replay_step_state_access object
    // \param context The context holding the proof for the step
    // \param s State whose memory hash the proof is checked against
    replay_step_state_access(context &context, scrypt_state &s) : m_context(context), m_s(s) {}

    replay_step_state_access(const replay_step_state_access &other) = default;
    replay_step_state_access(replay_step_state_access &&other) = default;
    replay_step_state_access &operator=(const replay_step_state_access &other) = delete;
    replay_step_state_access &operator=(replay_step_state_access &&other) = delete;
    ~replay_step_state_access() = default;

private:
    friend i_scrypt_state_access<replay_step_state_access>;

    // \brief Binds the proof to the first slot accessed
    // \throw logic_error if a different slot is accessed with the same proof
    void bind_slot(uint64_t index) const {
        if (m_context.index && *m_context.index != index) {
            throw std::logic_error{"slot proof reused for a different slot"};
        }
        m_context.index = index;
    }

    slot_value do_read_vars() const {
        return m_s.vars;
    }

    void do_write_vars(const slot_value &val) const {
        m_s.vars = val;
    }

    proof_status do_read_slot(uint64_t index, slot_value &val) const {
        bind_slot(index);
        return arbiter::read_slot(m_s.memory_hash, index, m_context.proof, val);
    }

    proof_status do_write_slot(uint64_t index, const slot_value &val) const {
        bind_slot(index);
        return arbiter::write_slot(m_s.memory_hash, index, val, m_context.proof);
    }

    static constexpr const char *do_get_name() {
        return "replay_step_state_access";
    }
};

} // namespace arbiter

#endif
