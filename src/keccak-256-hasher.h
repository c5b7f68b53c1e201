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

#ifndef KECCAK_256_HASHER_H
#define KECCAK_256_HASHER_H

#include <cstddef>
#include <cstdint>
#include <span>

#include "i-hasher.h"
#include "keccakf.h"
#include "memory-word.h"

namespace arbiter {

/// \brief Keccak-256 as used by the EVM (original 0x01 padding, not SHA3-256)
class keccak_256_hasher final : public i_hasher<keccak_256_hasher> {
public:
    /// \brief Bytes absorbed per permutation
    static constexpr size_t RATE = (KECCAKF_WORD_COUNT * sizeof(uint64_t)) - (2 * WORD_SIZE);

    keccak_256_hasher() = default;

    keccak_256_hasher(const keccak_256_hasher &) = default;
    keccak_256_hasher(keccak_256_hasher &&) = default;
    keccak_256_hasher &operator=(const keccak_256_hasher &) = default;
    keccak_256_hasher &operator=(keccak_256_hasher &&) = default;
    ~keccak_256_hasher() = default;

private:
    friend i_hasher<keccak_256_hasher>;

    void do_begin() noexcept;
    void do_add_data(std::span<const unsigned char> data) noexcept;
    void do_end(memory_word_view hash) noexcept;

    uint64_t m_words[KECCAKF_WORD_COUNT]{}; ///< Sponge state
    size_t m_pos{0};                        ///< Bytes absorbed into the current block
};

} // namespace arbiter

#endif
