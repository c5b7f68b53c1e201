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

#ifndef FULL_MEMORY_TREE_H
#define FULL_MEMORY_TREE_H

#include <cstdint>
#include <vector>

#include "memory-merkle-proof.h"
#include "memory-word.h"

/// \file
/// \brief Full memory tree interface.

namespace arbiter {

/// \brief Full Merkle tree over the memory slots
/// \details Keeps the hash of every node, so a slot can be updated
/// and a proof produced with one hash per level.
class full_memory_tree {
public:
    /// \brief Constructor for a tree over an all-zero memory
    full_memory_tree();

    /// \brief Returns the tree's root hash
    const memory_word &get_root_hash() const {
        return m_tree[1];
    }

    /// \brief Returns the hash of a node
    /// \param index Index of first slot spanned by node
    /// \param level Height of node above the leaves
    const memory_word &get_node_hash(uint64_t index, int level) const {
        return m_tree[get_node_index(index, level)];
    }

    /// \brief Replaces the value of a slot and updates all hashes along its path
    /// \param index Slot index
    /// \param value New slot value
    void set_slot(uint64_t index, const slot_value &value);

    /// \brief Returns proof for a given slot
    /// \param index Slot index
    /// \param value Current value of the slot
    /// \returns Proof, or throws exception
    /// \details The tree keeps only hashes, so the caller supplies the slot value.
    slot_proof get_proof(uint64_t index, const slot_value &value) const;

private:
    /// \brief Returns the index of the left child of node at given index
    static constexpr uint64_t left_child_index(uint64_t index) {
        return 2 * index;
    }

    /// \brief Returns the index of the right child of node at given index
    static constexpr uint64_t right_child_index(uint64_t index) {
        return (2 * index) + 1;
    }

    /// \brief Returns index of a node in the tree array
    static uint64_t get_node_index(uint64_t index, int level);

    std::vector<memory_word> m_tree; ///< Binary heap with tree node hashes
};

} // namespace arbiter

#endif
