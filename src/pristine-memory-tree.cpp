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

#include "pristine-memory-tree.h"

#include <stdexcept>

#include "i-hasher.h"

/// \file
/// \brief Pristine memory tree implementation.

namespace arbiter {

pristine_memory_tree::pristine_memory_tree() {
    memory_hasher h;
    m_hashes[0] = get_slot_hash(h, slot_value{});
    for (unsigned i = 1; i < m_hashes.size(); ++i) {
        get_concat_hash(h, m_hashes[i - 1], m_hashes[i - 1], m_hashes[i]);
    }
}

const memory_word &pristine_memory_tree::get_hash(int level) const {
    if (level < 0 || level > MEMORY_LOG2_SLOT_COUNT) {
        throw std::out_of_range{"level is out of range"};
    }
    return m_hashes[level];
}

const memory_word &get_pristine_memory_root() {
    static const pristine_memory_tree tree;
    return tree.get_root_hash();
}

} // namespace arbiter
