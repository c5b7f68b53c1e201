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

#ifndef I_SCRYPT_STATE_ACCESS_H
#define I_SCRYPT_STATE_ACCESS_H

#include <cinttypes>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <tuple>
#include <type_traits>

#include "memory-merkle-proof.h"
#include "memory-word.h"
#include "meta.h"

namespace arbiter {

// Interface for scrypt state access
template <typename DERIVED>
class i_scrypt_state_access { // CRTP
    i_scrypt_state_access() = default;
    friend DERIVED;

    DERIVED &derived() {
        return *static_cast<DERIVED *>(this);
    }

    const DERIVED &derived() const {
        return *static_cast<const DERIVED *>(this);
    }

    static void dump_slot([[maybe_unused]] const slot_value &value) {
#ifdef DUMP_SCRYPT_STATE_ACCESS
        for (const auto &word : value) {
            for (auto b : word) {
                std::ignore = fprintf(stderr, "%02x", b);
            }
        }
#endif
    }

public:
    /// \brief Works as vprintf if we are dumping scrypt state accesses, otherwise does nothing
    static void dsa_vprintf([[maybe_unused]] const char *fmt, [[maybe_unused]] va_list ap) {
#ifdef DUMP_SCRYPT_STATE_ACCESS
        std::ignore = vfprintf(stderr, fmt, ap);
#endif
    }

    /// \brief Works as printf if we are dumping scrypt state accesses, otherwise does nothing
    // Better to use C-style variadic function that checks for format!
    // NOLINTNEXTLINE(cert-dcl50-cpp)
    __attribute__((__format__(__printf__, 1, 2))) static void dsa_printf([[maybe_unused]] const char *fmt, ...) {
#ifdef DUMP_SCRYPT_STATE_ACCESS
        va_list ap;
        va_start(ap, fmt);
        dsa_vprintf(fmt, ap);
        va_end(ap);
#endif
    }

    /// \brief Reads the scrypt block X
    slot_value read_vars() const {
        const auto val = derived().do_read_vars();
        dsa_printf("%s::read_vars() = ", get_name());
        dump_slot(val);
        dsa_printf("\n");
        return val;
    }

    /// \brief Writes the scrypt block X
    void write_vars(const slot_value &val) const {
        derived().do_write_vars(val);
        dsa_printf("%s::write_vars(", get_name());
        dump_slot(val);
        dsa_printf(")\n");
    }

    /// \brief Reads a memory slot
    /// \param index Slot index
    /// \param val Receives the slot value on success
    /// \returns Status of the proof that authenticates the access
    proof_status read_slot(uint64_t index, slot_value &val) const {
        const auto status = derived().do_read_slot(index, val);
        dsa_printf("%s::read_slot(%" PRIu64 ") = %s ", get_name(), index, proof_status_name(status));
        dump_slot(val);
        dsa_printf("\n");
        return status;
    }

    /// \brief Writes a memory slot, updating the memory root
    /// \param index Slot index
    /// \param val New slot value
    /// \returns Status of the proof that authenticates the access
    proof_status write_slot(uint64_t index, const slot_value &val) const {
        const auto status = derived().do_write_slot(index, val);
        dsa_printf("%s::write_slot(%" PRIu64 ", ", get_name(), index);
        dump_slot(val);
        dsa_printf(") = %s\n", proof_status_name(status));
        return status;
    }

    constexpr const char *get_name() const {
        return derived().do_get_name();
    }
};

/// \brief SFINAE test implementation of the i_scrypt_state_access interface
template <typename DERIVED>
using is_an_i_scrypt_state_access =
    std::integral_constant<bool, is_template_base_of_v<i_scrypt_state_access, std::remove_cvref_t<DERIVED>>>;

template <typename DERIVED>
constexpr bool is_an_i_scrypt_state_access_v = is_an_i_scrypt_state_access<DERIVED>::value;

} // namespace arbiter

#endif
