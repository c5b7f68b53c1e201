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

#include "memory-merkle-proof.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "i-hasher.h"

namespace arbiter {

static void check_slot_index(uint64_t index) {
    if (index >= MEMORY_SLOT_COUNT) {
        throw std::out_of_range{"slot index " + std::to_string(index) + " is out of range"};
    }
}

const char *proof_status_name(proof_status status) noexcept {
    switch (status) {
        case proof_status::success:
            return "success";
        case proof_status::invalid_word_count:
            return "invalid word count";
        case proof_status::root_mismatch:
            return "root mismatch";
    }
    return "unknown";
}

std::optional<slot_proof> slot_proof::from_bytes(std::span<const unsigned char> data) {
    if (data.size() % WORD_SIZE != 0) {
        return std::nullopt;
    }
    std::vector<memory_word> words(data.size() / WORD_SIZE);
    for (size_t i = 0; i < words.size(); ++i) {
        std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(i * WORD_SIZE), WORD_SIZE, words[i].begin());
    }
    return slot_proof{std::move(words)};
}

byte_string slot_proof::to_bytes() const {
    byte_string data;
    data.reserve(m_words.size() * WORD_SIZE);
    for (const auto &word : m_words) {
        data.insert(data.end(), word.begin(), word.end());
    }
    return data;
}

void slot_proof::check_well_sized() const {
    if (!is_well_sized()) {
        throw std::invalid_argument{"slot proof has " + std::to_string(m_words.size()) + " words, expected " +
            std::to_string(PROOF_WORD_COUNT)};
    }
}

slot_value slot_proof::get_slot_value() const {
    check_well_sized();
    slot_value value{};
    std::copy_n(m_words.begin(), SLOT_WORD_COUNT, value.begin());
    return value;
}

void slot_proof::set_slot_value(const slot_value &value) {
    check_well_sized();
    std::copy(value.begin(), value.end(), m_words.begin());
}

const memory_word &slot_proof::get_sibling_hash(int level) const {
    check_well_sized();
    if (level < 0 || level >= MEMORY_LOG2_SLOT_COUNT) {
        throw std::out_of_range{"sibling level is out of range"};
    }
    return m_words[SLOT_WORD_COUNT + level];
}

void slot_proof::set_sibling_hash(const memory_word &hash, int level) {
    check_well_sized();
    if (level < 0 || level >= MEMORY_LOG2_SLOT_COUNT) {
        throw std::out_of_range{"sibling level is out of range"};
    }
    m_words[SLOT_WORD_COUNT + level] = hash;
}

memory_word compute_root(memory_hasher &h, const slot_proof &proof, uint64_t index) {
    check_slot_index(index);
    memory_word hash = get_slot_hash(h, proof.get_slot_value());
    for (int level = 0; level < MEMORY_LOG2_SLOT_COUNT; ++level) {
        const auto bit = (index & (UINT64_C(1) << level)) != 0;
        if (bit) {
            get_concat_hash(h, proof.get_sibling_hash(level), hash, hash);
        } else {
            get_concat_hash(h, hash, proof.get_sibling_hash(level), hash);
        }
    }
    return hash;
}

proof_status check_against_root(const memory_word &root, uint64_t index, const slot_proof &proof) {
    check_slot_index(index);
    if (!proof.is_well_sized()) {
        return proof_status::invalid_word_count;
    }
    memory_hasher h;
    if (compute_root(h, proof, index) != root) {
        return proof_status::root_mismatch;
    }
    return proof_status::success;
}

proof_status read_slot(const memory_word &root, uint64_t index, const slot_proof &proof, slot_value &value) {
    const auto status = check_against_root(root, index, proof);
    if (status != proof_status::success) {
        return status;
    }
    value = proof.get_slot_value();
    return proof_status::success;
}

proof_status write_slot(memory_word &root, uint64_t index, const slot_value &value, slot_proof &proof) {
    const auto status = check_against_root(root, index, proof);
    if (status != proof_status::success) {
        return status;
    }
    proof.set_slot_value(value);
    memory_hasher h;
    root = compute_root(h, proof, index);
    return proof_status::success;
}

} // namespace arbiter
