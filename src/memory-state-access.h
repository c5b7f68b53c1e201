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

#ifndef MEMORY_STATE_ACCESS_H
#define MEMORY_STATE_ACCESS_H

/// \file
/// \brief Direct state access over a full copy of the scrypt memory

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "full-memory-tree.h"
#include "i-scrypt-state-access.h"
#include "scrypt-state.h"

namespace arbiter {

/// \brief Full scrypt memory together with its Merkle tree
class scrypt_memory {
public:
    scrypt_memory() : m_slots(MEMORY_SLOT_COUNT) {}

    const slot_value &get_slot(uint64_t index) const {
        check_index(index);
        return m_slots[index];
    }

    void set_slot(uint64_t index, const slot_value &value) {
        check_index(index);
        m_slots[index] = value;
        m_tree.set_slot(index, value);
    }

    const memory_word &get_root_hash() const {
        return m_tree.get_root_hash();
    }

    /// \brief Returns the proof for a slot against the current root
    slot_proof get_proof(uint64_t index) const {
        return m_tree.get_proof(index, get_slot(index));
    }

private:
    static void check_index(uint64_t index) {
        if (index >= MEMORY_SLOT_COUNT) {
            throw std::out_of_range{"slot index " + std::to_string(index) + " is out of range"};
        }
    }

    std::vector<slot_value> m_slots; ///< Slot values
    full_memory_tree m_tree;         ///< Hashes over slot values
};

/// \class memory_state_access
/// \brief Accesses the scrypt state and its memory directly
/// \details Every write keeps the state's memory hash equal to the memory tree root.
class memory_state_access : public i_scrypt_state_access<memory_state_access> {
    // NOLINTBEGIN(cppcoreguidelines-avoid-const-or-ref-data-members)
    scrypt_state &m_s;   ///< State being advanced
    scrypt_memory &m_m;  ///< Memory backing the state
    // NOLINTEND(cppcoreguidelines-avoid-const-or-ref-data-members)

public:
    /// \brief Constructor from state and memory
    /// \param s Reference to state
    /// \param m Reference to memory, whose root must match the state's memory hash
    memory_state_access(scrypt_state &s, scrypt_memory &m) : m_s(s), m_m(m) {
        if (m_s.memory_hash != m_m.get_root_hash()) {
            throw std::invalid_argument{"memory root does not match state memory hash"};
        }
    }

    memory_state_access(const memory_state_access &other) = default;
    memory_state_access(memory_state_access &&other) = default;
    memory_state_access &operator=(const memory_state_access &other) = delete;
    memory_state_access &operator=(memory_state_access &&other) = delete;
    ~memory_state_access() = default;

private:
    friend i_scrypt_state_access<memory_state_access>;

    slot_value do_read_vars() const {
        return m_s.vars;
    }

    void do_write_vars(const slot_value &val) const {
        m_s.vars = val;
    }

    proof_status do_read_slot(uint64_t index, slot_value &val) const {
        val = m_m.get_slot(index);
        return proof_status::success;
    }

    proof_status do_write_slot(uint64_t index, const slot_value &val) const {
        m_m.set_slot(index, val);
        m_s.memory_hash = m_m.get_root_hash();
        return proof_status::success;
    }

    static constexpr const char *do_get_name() {
        return "memory_state_access";
    }
};

} // namespace arbiter

#endif
