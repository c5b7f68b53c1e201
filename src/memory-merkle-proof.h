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

#ifndef MEMORY_MERKLE_PROOF_H
#define MEMORY_MERKLE_PROOF_H

/// \file
/// \brief Authenticated access to one memory slot through a Merkle path

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <utility>
#include <vector>

#include "keccak-256-hasher.h"
#include "memory-word.h"

namespace arbiter {

/// \brief Hasher committed to by the memory tree
using memory_hasher = keccak_256_hasher;

/// \brief Outcome of checking a slot proof against a memory root
enum class proof_status : uint8_t {
    success,            ///< Proof authenticates the slot against the root
    invalid_word_count, ///< Proof does not hold exactly PROOF_WORD_COUNT words
    root_mismatch,      ///< Root computed from the proof differs from the committed root
};

/// \brief Returns the name of a proof status
const char *proof_status_name(proof_status status) noexcept;

inline std::ostream &operator<<(std::ostream &out, proof_status status) {
    return out << proof_status_name(status);
}

/// \brief Value of one memory slot followed by the sibling hashes of its path to the root
/// \details \{
/// Words 0 to SLOT_WORD_COUNT-1 hold the slot value. The remaining
/// MEMORY_LOG2_SLOT_COUNT words hold the sibling hashes, from the leaf level up.
/// A proof parsed from untrusted bytes may hold any number of words.
/// Only check_against_root decides whether the count is acceptable.
/// \}
class slot_proof final {
public:
    /// \brief Constructs a well-sized proof with all words zero
    slot_proof() : m_words(PROOF_WORD_COUNT) {}

    /// \brief Constructs a proof from a list of words of any length
    explicit slot_proof(std::vector<memory_word> words) : m_words(std::move(words)) {}

    /// \brief Parses a proof from its wire encoding
    /// \param data Concatenation of 32-byte words
    /// \returns Parsed proof, or nothing if the length is not a whole number of words
    static std::optional<slot_proof> from_bytes(std::span<const unsigned char> data);

    /// \brief Returns the wire encoding of the proof
    byte_string to_bytes() const;

    /// \brief Returns the number of words in the proof
    size_t get_word_count() const {
        return m_words.size();
    }

    /// \brief Tells whether the proof has exactly the number of words a slot proof needs
    bool is_well_sized() const {
        return m_words.size() == PROOF_WORD_COUNT;
    }

    const std::vector<memory_word> &get_words() const {
        return m_words;
    }

    /// \brief Returns the slot value carried in the proof
    /// \details Throws std::invalid_argument if the proof is not well sized.
    slot_value get_slot_value() const;

    /// \brief Replaces the slot value carried in the proof
    void set_slot_value(const slot_value &value);

    /// \brief Returns the sibling hash at a given level
    /// \param level Level above the leaves, from 0 to MEMORY_LOG2_SLOT_COUNT-1
    const memory_word &get_sibling_hash(int level) const;

    /// \brief Replaces the sibling hash at a given level
    void set_sibling_hash(const memory_word &hash, int level);

    bool operator==(const slot_proof &other) const = default;

private:
    void check_well_sized() const;

    std::vector<memory_word> m_words; ///< Slot value words then sibling hashes
};

/// \brief Computes the root implied by a well-sized proof for a slot index
/// \param h Hasher object
/// \param proof Proof whose slot value is hashed into the leaf
/// \param index Slot index, whose bits select the side of each sibling
/// \returns Root hash
/// \details Throws std::invalid_argument if the proof is not well sized and
/// std::out_of_range if the index is not a valid slot index.
memory_word compute_root(memory_hasher &h, const slot_proof &proof, uint64_t index);

/// \brief Checks a proof for a slot index against a committed memory root
/// \details Throws std::out_of_range if the index is not a valid slot index.
proof_status check_against_root(const memory_word &root, uint64_t index, const slot_proof &proof);

/// \brief Reads a slot value authenticated by a proof
/// \param root Committed memory root
/// \param index Slot index
/// \param proof Proof for the slot
/// \param value Receives the slot value on success, untouched otherwise
proof_status read_slot(const memory_word &root, uint64_t index, const slot_proof &proof, slot_value &value);

/// \brief Writes a slot value, updating the memory root through the proof
/// \param root Committed memory root, replaced by the new root on success
/// \param index Slot index
/// \param value New slot value
/// \param proof Proof for the slot, whose slot value is replaced on success
/// \details The proof is checked against the root before it is modified.
/// Siblings are left untouched, so the same proof also authenticates the new value.
proof_status write_slot(memory_word &root, uint64_t index, const slot_value &value, slot_proof &proof);

} // namespace arbiter

#endif
