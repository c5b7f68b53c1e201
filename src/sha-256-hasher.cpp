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

#include "sha-256-hasher.h"
#include "compiler-defines.h"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>

namespace arbiter {

static constexpr size_t SHA256_ROUND_COUNT = 64;
static constexpr size_t SHA256_LENGTH_OFFSET = 56;

void sha_256_hasher::do_begin() noexcept {
    m_state[0] = 0x6a09e667;
    m_state[1] = 0xbb67ae85;
    m_state[2] = 0x3c6ef372;
    m_state[3] = 0xa54ff53a;
    m_state[4] = 0x510e527f;
    m_state[5] = 0x9b05688c;
    m_state[6] = 0x1f83d9ab;
    m_state[7] = 0x5be0cd19;
    m_pos = 0;
    m_length = 0;
}

void sha_256_hasher::do_add_data(std::span<const unsigned char> data) noexcept {
    m_length += data.size();
    for (size_t i = 0; i < data.size();) {
        const size_t step = std::min(BLOCK_SIZE - m_pos, data.size() - i);
        std::memcpy(m_block + m_pos, data.data() + i, step);
        i += step;
        m_pos += step;
        if (m_pos >= BLOCK_SIZE) {
            compress();
            m_pos = 0;
        }
    }
}

void sha_256_hasher::do_end(memory_word_view hash) noexcept {
    const uint64_t bit_len = m_length * 8;
    // Append the 1 bit and pad with zeros
    m_block[m_pos++] = 0x80;
    if (m_pos > SHA256_LENGTH_OFFSET) {
        std::fill(m_block + m_pos, m_block + BLOCK_SIZE, 0);
        compress();
        m_pos = 0;
    }
    std::fill(m_block + m_pos, m_block + SHA256_LENGTH_OFFSET, 0);
    // Store big-endian length in the last 8 bytes
    for (size_t i = 0; i < 8; ++i) {
        m_block[SHA256_LENGTH_OFFSET + i] = static_cast<unsigned char>(bit_len >> (56 - (8 * i)));
    }
    compress();
    for (size_t i = 0; i < STATE_WORD_COUNT; ++i) {
        hash[(4 * i) + 0] = static_cast<unsigned char>(m_state[i] >> 24);
        hash[(4 * i) + 1] = static_cast<unsigned char>(m_state[i] >> 16);
        hash[(4 * i) + 2] = static_cast<unsigned char>(m_state[i] >> 8);
        hash[(4 * i) + 3] = static_cast<unsigned char>(m_state[i]);
    }
    do_begin();
}

void sha_256_hasher::compress() noexcept {
    // This code follows the SHA-256 pseudo-code from Wikipedia:
    // https://en.wikipedia.org/wiki/SHA-2#Pseudocode
    static constexpr uint32_t SHA256_K[SHA256_ROUND_COUNT] = {0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
        0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5, 0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74,
        0x80deb1fe, 0x9bdc06a7, 0xc19bf174, 0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa,
        0x5cb0a9dc, 0x76f988da, 0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351,
        0x14292967, 0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
        0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070, 0x19a4c116,
        0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3, 0x748f82ee, 0x78a5636f,
        0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2};
    uint32_t w[SHA256_ROUND_COUNT];
    UNROLL_LOOP_FULL()
    for (size_t i = 0; i < 16; ++i) {
        w[i] = (static_cast<uint32_t>(m_block[4 * i]) << 24) | (static_cast<uint32_t>(m_block[(4 * i) + 1]) << 16) |
            (static_cast<uint32_t>(m_block[(4 * i) + 2]) << 8) | static_cast<uint32_t>(m_block[(4 * i) + 3]);
    }
    for (size_t i = 16; i < SHA256_ROUND_COUNT; ++i) {
        const uint32_t s0 = std::rotr(w[i - 15], 7) ^ std::rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        const uint32_t s1 = std::rotr(w[i - 2], 17) ^ std::rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }
    uint32_t a = m_state[0];
    uint32_t b = m_state[1];
    uint32_t c = m_state[2];
    uint32_t d = m_state[3];
    uint32_t e = m_state[4];
    uint32_t f = m_state[5];
    uint32_t g = m_state[6];
    uint32_t h = m_state[7];
    for (size_t i = 0; i < SHA256_ROUND_COUNT; ++i) {
        const uint32_t S1 = std::rotr(e, 6) ^ std::rotr(e, 11) ^ std::rotr(e, 25);
        const uint32_t ch = (e & f) ^ ((~e) & g);
        const uint32_t temp1 = h + S1 + ch + SHA256_K[i] + w[i];
        const uint32_t S0 = std::rotr(a, 2) ^ std::rotr(a, 13) ^ std::rotr(a, 22);
        const uint32_t maj = (a & b) ^ (a & c) ^ (b & c);
        const uint32_t temp2 = S0 + maj;
        h = g;
        g = f;
        f = e;
        e = d + temp1;
        d = c;
        c = b;
        b = a;
        a = temp1 + temp2;
    }
    m_state[0] += a;
    m_state[1] += b;
    m_state[2] += c;
    m_state[3] += d;
    m_state[4] += e;
    m_state[5] += f;
    m_state[6] += g;
    m_state[7] += h;
}

} // namespace arbiter
