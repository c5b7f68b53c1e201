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

#ifndef I_HASHER_H
#define I_HASHER_H

/// \file
/// \brief Hasher interface

#include <cstdint>
#include <ranges>
#include <span>
#include <type_traits>
#include <utility>

#include "concepts.h"
#include "memory-word.h"
#include "meta.h"

namespace arbiter {

/// \brief Hasher interface.
/// \tparam DERIVED Derived class implementing the interface. (An example of CRTP.)
/// \details Derived classes implement do_begin(), do_add_data() and do_end().
/// All hashers produce 32-byte digests.
template <typename DERIVED>
class i_hasher { // CRTP
    i_hasher() = default;
    friend DERIVED;

    /// \brief Returns object cast as the derived class
    DERIVED &derived() {
        return *static_cast<DERIVED *>(this);
    }

    /// \brief Returns object cast as the derived class
    const DERIVED &derived() const {
        return *static_cast<const DERIVED *>(this);
    }

public:
    /// \brief Starts a new digest, discarding any data added so far
    void begin() noexcept {
        derived().do_begin();
    }

    /// \brief Adds data to the digest in progress
    template <ContiguousRangeOfByteLike D>
    void add_data(D &&data) noexcept { // NOLINT(cppcoreguidelines-missing-std-forward)
        derived().do_add_data(std::span<const unsigned char>{
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
            reinterpret_cast<const unsigned char *>(std::ranges::data(data)), std::ranges::size(data)});
    }

    /// \brief Finishes the digest in progress
    /// \param hash Receives the digest
    void end(memory_word_view hash) noexcept {
        derived().do_end(hash);
    }

    template <ContiguousRangeOfByteLike D>
    void hash(D &&data, memory_word_view hash) noexcept {
        begin();
        add_data(std::forward<D>(data));
        end(hash);
    }

    void concat_hash(const_memory_word_view data1, const_memory_word_view data2, memory_word_view hash) noexcept {
        begin();
        add_data(data1);
        add_data(data2);
        end(hash);
    }
};

template <typename DERIVED>
using is_an_i_hasher = std::integral_constant<bool, is_template_base_of_v<i_hasher, std::remove_cvref_t<DERIVED>>>;

template <typename DERIVED>
constexpr bool is_an_i_hasher_v = is_an_i_hasher<DERIVED>::value;

// C++20 concept for is_an_i_hasher_v
template <typename T>
concept IHasher = is_an_i_hasher_v<T>;

/// \brief Computes the hash of data
/// \tparam H Hasher class
/// \param h Hasher object
/// \param data Data to hash
/// \param result Receives the hash of data
template <IHasher H, ContiguousRangeOfByteLike D>
inline static void get_hash(H &h, D &&data, memory_word_view result) noexcept {
    h.hash(std::forward<D>(data), result);
}

/// \brief Computes the hash of data
/// \tparam H Hasher class
/// \param h Hasher object
/// \param data Data to hash
/// \returns The hash of data
template <IHasher H, ContiguousRangeOfByteLike D>
inline static memory_word get_hash(H &&h, D &&data) noexcept {
    memory_word result;
    get_hash(h, std::forward<D>(data), result);
    return result;
}

/// \brief Computes the hash of concatenated hashes
/// \tparam H Hasher class
/// \param h Hasher object
/// \param left Left hash to concatenate
/// \param right Right hash to concatenate
/// \param result Receives the hash of the concatenation
template <IHasher H>
inline static void get_concat_hash(H &h, const_memory_word_view left, const_memory_word_view right,
    memory_word_view result) noexcept {
    h.concat_hash(left, right, result);
}

/// \brief Computes the hash of concatenated hashes
/// \tparam H Hasher class
/// \param h Hasher object
/// \param left Left hash to concatenate
/// \param right Right hash to concatenate
/// \return The hash of the concatenation
template <IHasher H>
inline static memory_word get_concat_hash(H &&h, const_memory_word_view left, const_memory_word_view right) noexcept {
    memory_word result;
    get_concat_hash(h, left, right, result);
    return result;
}

/// \brief Computes the hash of the raw contents of a memory slot
/// \tparam H Hasher class
/// \param h Hasher object
/// \param value Slot contents, hashed as one contiguous run of bytes
/// \returns The slot leaf hash
template <IHasher H>
inline static memory_word get_slot_hash(H &&h, const slot_value &value) noexcept {
    memory_word result;
    h.begin();
    for (const auto &word : value) {
        h.add_data(word);
    }
    h.end(result);
    return result;
}

} // namespace arbiter

#endif
