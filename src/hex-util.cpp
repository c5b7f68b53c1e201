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

#include "hex-util.h"

#include <algorithm>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace arbiter {

static int hex_digit_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

std::string encode_hex(std::span<const unsigned char> data) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string text;
    text.reserve(2 + (2 * data.size()));
    text += "0x";
    for (auto b : data) {
        text += digits[b >> 4];
        text += digits[b & 0x0f];
    }
    return text;
}

byte_string decode_hex(std::string_view text) {
    if (text.starts_with("0x") || text.starts_with("0X")) {
        text.remove_prefix(2);
    }
    if (text.size() % 2 != 0) {
        throw std::invalid_argument{"hex string has an odd number of digits"};
    }
    byte_string data(text.size() / 2);
    for (size_t i = 0; i < data.size(); ++i) {
        const int hi = hex_digit_value(text[2 * i]);
        const int lo = hex_digit_value(text[(2 * i) + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument{"invalid hex digit in \"" + std::string{text} + "\""};
        }
        data[i] = static_cast<unsigned char>((hi << 4) | lo);
    }
    return data;
}

memory_word decode_hex_word(std::string_view text) {
    const auto data = decode_hex(text);
    if (data.size() != WORD_SIZE) {
        throw std::invalid_argument{"hex string does not hold a " + std::to_string(WORD_SIZE) + "-byte word"};
    }
    memory_word word;
    std::copy(data.begin(), data.end(), word.begin());
    return word;
}

} // namespace arbiter
