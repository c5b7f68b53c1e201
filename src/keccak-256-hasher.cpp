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

#include "keccak-256-hasher.h"
#include "keccakf.h"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>

namespace arbiter {

// This code is not portable to big-endian architectures.
// NOLINTNEXTLINE(misc-redundant-expression)
static_assert(std::endian::native == std::endian::little, "code assumes little-endian byte ordering");

static_assert(keccak_256_hasher::RATE == 136, "unexpected Keccak-256 rate");

void keccak_256_hasher::do_begin() noexcept {
    std::fill(std::begin(m_words), std::end(m_words), 0);
    m_pos = 0;
}

void keccak_256_hasher::do_add_data(std::span<const unsigned char> data) noexcept {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    auto *words_bytes = reinterpret_cast<unsigned char *>(m_words);
    for (size_t i = 0; i < data.size();) {
        const size_t step = std::min(RATE - m_pos, data.size() - i);
        for (size_t j = 0; j < step; ++j) {
            words_bytes[m_pos + j] ^= data[i + j];
        }
        i += step;
        m_pos += step;
        if (m_pos >= RATE) {
            keccakf_1600(m_words);
            m_pos = 0;
        }
    }
}

void keccak_256_hasher::do_end(memory_word_view hash) noexcept {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    auto *words_bytes = reinterpret_cast<unsigned char *>(m_words);
    // Append delimiter suffix
    constexpr unsigned char KECCAK_DSUFFIX = 0x01;
    words_bytes[m_pos] ^= KECCAK_DSUFFIX;
    // Append last bit
    constexpr unsigned char KECCAK_LASTBIT = 0x80;
    words_bytes[RATE - 1] ^= KECCAK_LASTBIT;
    keccakf_1600(m_words);
    std::memcpy(hash.data(), words_bytes, hash.size());
    do_begin();
}

} // namespace arbiter
