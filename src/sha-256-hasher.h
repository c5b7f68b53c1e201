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

#ifndef SHA_256_HASHER_H
#define SHA_256_HASHER_H

#include <cstddef>
#include <cstdint>
#include <span>

#include "i-hasher.h"
#include "memory-word.h"

namespace arbiter {

class sha_256_hasher final : public i_hasher<sha_256_hasher> {
public:
    static constexpr size_t BLOCK_SIZE = 64;

    sha_256_hasher() noexcept {
        do_begin();
    }

    sha_256_hasher(const sha_256_hasher &) = default;
    sha_256_hasher(sha_256_hasher &&) = default;
    sha_256_hasher &operator=(const sha_256_hasher &) = default;
    sha_256_hasher &operator=(sha_256_hasher &&) = default;
    ~sha_256_hasher() = default;

private:
    friend i_hasher<sha_256_hasher>;

    static constexpr size_t STATE_WORD_COUNT = 8;

    void do_begin() noexcept;
    void do_add_data(std::span<const unsigned char> data) noexcept;
    void do_end(memory_word_view hash) noexcept;

    void compress() noexcept;

    uint32_t m_state[STATE_WORD_COUNT]{}; ///< Chaining value
    unsigned char m_block[BLOCK_SIZE]{};  ///< Pending input block
    size_t m_pos{0};                      ///< Bytes in pending block
    uint64_t m_length{0};                 ///< Total bytes hashed
};

} // namespace arbiter

#endif
