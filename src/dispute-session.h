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

#ifndef DISPUTE_SESSION_H
#define DISPUTE_SESSION_H

/// \file
/// \brief Dispute session record consumed by the admission check

#include <cstdint>

#include "memory-word.h"

namespace arbiter {

/// \brief Claims of a dispute session relevant to step arbitration
struct dispute_session {
    byte_string output;     ///< Claimed final output
    uint64_t high_step{0};  ///< Total step count the dispute is scoped to

    bool operator==(const dispute_session &other) const = default;
};

} // namespace arbiter

#endif
