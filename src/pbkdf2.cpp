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

#include "pbkdf2.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>

#include "sha-256-hasher.h"

namespace arbiter {

namespace {

/// \brief HMAC-SHA-256 with the padded key already prepared, so PBKDF2 can reuse it
class hmac_sha_256_context {
public:
    explicit hmac_sha_256_context(std::span<const unsigned char> key) {
        std::array<unsigned char, sha_256_hasher::BLOCK_SIZE> block_key{};
        if (key.size() > block_key.size()) {
            sha_256_hasher h;
            memory_word hashed_key;
            get_hash(h, key, hashed_key);
            std::copy(hashed_key.begin(), hashed_key.end(), block_key.begin());
        } else {
            std::copy(key.begin(), key.end(), block_key.begin());
        }
        for (size_t i = 0; i < block_key.size(); ++i) {
            m_ipad[i] = block_key[i] ^ 0x36;
            m_opad[i] = block_key[i] ^ 0x5c;
        }
    }

    /// \brief Authenticates the concatenation of two messages
    memory_word compute(std::span<const unsigned char> message1, std::span<const unsigned char> message2 = {}) {
        memory_word inner;
        m_h.begin();
        m_h.add_data(m_ipad);
        m_h.add_data(message1);
        m_h.add_data(message2);
        m_h.end(inner);
        memory_word outer;
        m_h.begin();
        m_h.add_data(m_opad);
        m_h.add_data(inner);
        m_h.end(outer);
        return outer;
    }

private:
    sha_256_hasher m_h;
    std::array<unsigned char, sha_256_hasher::BLOCK_SIZE> m_ipad{};
    std::array<unsigned char, sha_256_hasher::BLOCK_SIZE> m_opad{};
};

} // namespace

memory_word hmac_sha_256(std::span<const unsigned char> key, std::span<const unsigned char> message) {
    hmac_sha_256_context ctx{key};
    return ctx.compute(message);
}

void pbkdf2_hmac_sha_256(std::span<const unsigned char> password, std::span<const unsigned char> salt,
    uint32_t iterations, std::span<unsigned char> output) {
    if (iterations == 0) {
        throw std::invalid_argument{"PBKDF2 iteration count must be positive"};
    }
    hmac_sha_256_context ctx{password};
    uint32_t block_index = 1;
    for (size_t offset = 0; offset < output.size(); offset += WORD_SIZE, ++block_index) {
        const std::array<unsigned char, 4> be_index{static_cast<unsigned char>(block_index >> 24),
            static_cast<unsigned char>(block_index >> 16), static_cast<unsigned char>(block_index >> 8),
            static_cast<unsigned char>(block_index)};
        memory_word u = ctx.compute(salt, be_index);
        memory_word t = u;
        for (uint32_t i = 1; i < iterations; ++i) {
            u = ctx.compute(u);
            for (size_t j = 0; j < t.size(); ++j) {
                t[j] ^= u[j];
            }
        }
        const size_t count = std::min(WORD_SIZE, output.size() - offset);
        std::copy_n(t.begin(), count, output.begin() + static_cast<std::ptrdiff_t>(offset));
    }
}

} // namespace arbiter
