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

#ifndef JSON_UTIL_H
#define JSON_UTIL_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <json.hpp>

#include "dispute-session.h"
#include "memory-word.h"
#include "scrypt-machine.h"

namespace arbiter {

using namespace std::string_literals;

// Allow using arbiter::to_string when the input type is already a string
using std::to_string;
std::string to_string(const std::string &s);
std::string to_string(const char *s);

// Overload for case where index is a string and j contains an object
inline bool contains(const nlohmann::json &j, const std::string &s, const std::string &path) {
    if (!j.empty() && !j.is_object()) {
        throw std::invalid_argument("\""s + path + "\" not an object");
    }
    return j.contains(s);
}

/// \brief Attempts to load a string from a field in a JSON object
/// \tparam K Key type (explicit extern declaration for std::string is provided)
/// \param j JSON object to load from
/// \param key Key to load value from
/// \param value Object to store value
/// \param path Path to j
template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, std::string &value, const std::string &path = "/");

/// \brief Attempts to load an unsigned integer from a field in a JSON object
template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, uint64_t &value, const std::string &path = "/");

/// \brief Attempts to load a byte string from a 0x-prefixed hexadecimal field in a JSON object
template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, byte_string &value, const std::string &path = "/");

/// \brief Loads an object from a field in a JSON object.
/// \tparam T Type of object
/// \tparam K Key type
/// \param j JSON object to load from
/// \param key Key to load value from
/// \param value Object to store value
/// \param path Path to j
/// \detail Throws error if field is missing
template <typename T, typename K>
void ju_get_field(const nlohmann::json &j, const K &key, T &value, const std::string &path = "/") {
    if (!contains(j, key, path)) {
        throw std::invalid_argument("missing field \""s + path + to_string(key) + "\""s);
    }
    ju_get_opt_field(j, key, value, path);
}

/// \brief Loads a step witness from a JSON document
/// \details Throws std::invalid_argument if any field is missing or malformed.
step_witness step_witness_from_json(const nlohmann::json &j);

/// \brief Loads a dispute session from a JSON document
/// \details Throws std::invalid_argument if any field is missing or malformed.
dispute_session dispute_session_from_json(const nlohmann::json &j);

void to_json(nlohmann::json &j, const step_witness &w);
void to_json(nlohmann::json &j, const dispute_session &s);

// Extern template declarations
extern template void ju_get_opt_field(const nlohmann::json &j, const std::string &key, std::string &value,
    const std::string &path);
extern template void ju_get_opt_field(const nlohmann::json &j, const std::string &key, uint64_t &value,
    const std::string &path);
extern template void ju_get_opt_field(const nlohmann::json &j, const std::string &key, byte_string &value,
    const std::string &path);

} // namespace arbiter

#endif
