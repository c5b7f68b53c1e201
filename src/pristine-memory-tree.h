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

#ifndef PRISTINE_MEMORY_TREE_H
#define PRISTINE_MEMORY_TREE_H

#include <array>

#include "memory-merkle-proof.h"
#include "memory-word.h"

/// \file
/// \brief Pristine memory tree interface.

namespace arbiter {

/// \brief Hashes of all-zero memory subtrees, from a single slot up to the whole memory
class pristine_memory_tree {
public:
    pristine_memory_tree();

    /// \brief Returns hash of pristine subtree
    /// \param level Height of subtree above the leaves. Must be between
    /// 0 (a single slot) and MEMORY_LOG2_SLOT_COUNT (the whole memory), inclusive.
    const memory_word &get_hash(int level) const;

    /// \brief Returns the root hash of an all-zero memory
    const memory_word &get_root_hash() const {
        return m_hashes[MEMORY_LOG2_SLOT_COUNT];
    }

private:
    std::array<memory_word, MEMORY_LOG2_SLOT_COUNT + 1> m_hashes{}; ///< Hashes by level
};

/// \brief Returns the root hash of an all-zero memory
const memory_word &get_pristine_memory_root();

} // namespace arbiter

#endif
