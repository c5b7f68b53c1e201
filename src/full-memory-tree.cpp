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

#include "full-memory-tree.h"

#include <cstdint>
#include <stdexcept>
#include <vector>

#include "i-hasher.h"
#include "pristine-memory-tree.h"

/// \file
/// \brief Full memory tree implementation.

namespace arbiter {

full_memory_tree::full_memory_tree() : m_tree(2 * MEMORY_SLOT_COUNT) {
    const pristine_memory_tree pristine;
    for (int level = 0; level <= MEMORY_LOG2_SLOT_COUNT; ++level) {
        const uint64_t base = MEMORY_SLOT_COUNT >> level;
        for (uint64_t i = base; i < 2 * base; ++i) {
            m_tree[i] = pristine.get_hash(level);
        }
    }
}

void full_memory_tree::set_slot(uint64_t index, const slot_value &value) {
    auto node = get_node_index(index, 0);
    memory_hasher h;
    m_tree[node] = get_slot_hash(h, value);
    while (node > 1) {
        node >>= 1;
        get_concat_hash(h, m_tree[left_child_index(node)], m_tree[right_child_index(node)], m_tree[node]);
    }
}

slot_proof full_memory_tree::get_proof(uint64_t index, const slot_value &value) const {
    slot_proof proof;
    proof.set_slot_value(value);
    for (int level = 0; level < MEMORY_LOG2_SLOT_COUNT; ++level) {
        const auto sibling_index = (index >> level) ^ UINT64_C(1);
        proof.set_sibling_hash(get_node_hash(sibling_index << level, level), level);
    }
#ifndef NDEBUG
    if (check_against_root(get_root_hash(), index, proof) != proof_status::success) {
        throw std::runtime_error{"produced invalid proof"};
    }
#endif
    return proof;
}

uint64_t full_memory_tree::get_node_index(uint64_t index, int level) {
    if (level < 0 || level > MEMORY_LOG2_SLOT_COUNT) {
        throw std::out_of_range{"level is out of bounds"};
    }
    const uint64_t base = MEMORY_SLOT_COUNT >> level;
    // Nodes of a level live in indices [base, 2*base)
    // 0 <unused>
    // 1 root
    // 2 root-1
    // 3 root-1
    // 4 root-2
    // ...
    index >>= level;
    if (index >= base) {
        throw std::out_of_range{"slot index is out of bounds"};
    }
    return base + index;
}

} // namespace arbiter
