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

#ifndef RECORD_STEP_STATE_ACCESS_H
#define RECORD_STEP_STATE_ACCESS_H

/// \file
/// \brief State access that records the proof a step needs

#include <cstdint>
#include <optional>
#include <stdexcept>

#include "i-scrypt-state-access.h"
#include "memory-state-access.h"

namespace arbiter {

/// \class record_step_state_access
/// \brief Records the slot proof of the single memory access of a step
class record_step_state_access : public i_scrypt_state_access<record_step_state_access> {
public:
    struct context {
        std::optional<uint64_t> index;    ///< Index of the slot the step touched
        std::optional<slot_proof> proof;  ///< Proof for the slot, taken before the access
    };

private:
    // NOLINTBEGIN(cppcoreguidelines-avoid-const-or-ref-data-members)
    context &m_context;  ///< Context for the recording
    scrypt_state &m_s;   ///< State being advanced
    scrypt_memory &m_m;  ///< Memory backing the state
    // NOLINTEND(cppcoreguidelines-avoid-const-or-ref-data-members)

public:
    /// \brief Constructor of record step state access
    /// \param context Context that receives the recorded proof
    /// \param s Reference to state
    /// \param m Reference to memory, whose root must match the state's memory hash
    record_step_state_access(context &context, scrypt_state &s, scrypt_memory &m) :
        m_context(context),
        m_s(s),
        m_m(m) {
        if (m_s.memory_hash != m_m.get_root_hash()) {
            throw std::invalid_argument{"memory root does not match state memory hash"};
        }
    }

    record_step_state_access(const record_step_state_access &other) = default;
    record_step_state_access(record_step_state_access &&other) = default;
    record_step_state_access &operator=(const record_step_state_access &other) = delete;
    record_step_state_access &operator=(record_step_state_access &&other) = delete;
    ~record_step_state_access() = default;

    /// \brief Returns the recorded proof
    /// \details Throws std::runtime_error if the step touched no memory.
    const slot_proof &get_proof() const {
        if (!m_context.proof) {
            throw std::runtime_error{"step did not access memory"};
        }
        return *m_context.proof;
    }

private:
    friend i_scrypt_state_access<record_step_state_access>;

    void touch_slot(uint64_t index) const {
        if (m_context.index) {
            throw std::runtime_error{"step accessed memory more than once"};
        }
        m_context.proof = m_m.get_proof(index);
        m_context.index = index;
    }

    slot_value do_read_vars() const {
        return m_s.vars;
    }

    void do_write_vars(const slot_value &val) const {
        m_s.vars = val;
    }

    proof_status do_read_slot(uint64_t index, slot_value &val) const {
        touch_slot(index);
        val = m_m.get_slot(index);
        return proof_status::success;
    }

    proof_status do_write_slot(uint64_t index, const slot_value &val) const {
        touch_slot(index);
        m_m.set_slot(index, val);
        m_s.memory_hash = m_m.get_root_hash();
        return proof_status::success;
    }

    static constexpr const char *do_get_name() {
        return "record_step_state_access";
    }
};

} // namespace arbiter

#endif
