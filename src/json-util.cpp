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

#include "json-util.h"

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "hex-util.h"

namespace arbiter {

std::string to_string(const std::string &s) {
    return s;
}

std::string to_string(const char *s) {
    return s;
}

template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, std::string &value, const std::string &path) {
    if (!contains(j, key, path)) {
        return;
    }
    const auto &jk = j[key];
    if (!jk.is_string()) {
        throw std::invalid_argument("field \""s + path + to_string(key) + "\" not a string");
    }
    value = jk.template get<std::string>();
}

template void ju_get_opt_field<std::string>(const nlohmann::json &j, const std::string &key, std::string &value,
    const std::string &path);

template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, uint64_t &value, const std::string &path) {
    if (!contains(j, key, path)) {
        return;
    }
    const auto &jk = j[key];
    if (!jk.is_number_integer() && !jk.is_number_unsigned() && !jk.is_number_float()) {
        throw std::invalid_argument("field \""s + path + to_string(key) + "\" not an unsigned integer");
    }
    if (jk.is_number_float()) {
        auto f = jk.template get<nlohmann::json::number_float_t>();
        if (f < 0 || std::fmod(f, static_cast<nlohmann::json::number_float_t>(1.0)) != 0 ||
            f >= static_cast<nlohmann::json::number_float_t>(UINT64_MAX)) {
            throw std::invalid_argument("field \""s + path + to_string(key) + "\" not an unsigned integer");
        }
        value = static_cast<uint64_t>(f);
        return;
    }
    if (jk.is_number_unsigned()) {
        value = jk.template get<uint64_t>();
        return;
    }
    auto i = jk.template get<nlohmann::json::number_integer_t>();
    if (i < 0) {
        throw std::invalid_argument("field \""s + path + to_string(key) + "\" not an unsigned integer");
    }
    value = static_cast<uint64_t>(i);
}

template void ju_get_opt_field<std::string>(const nlohmann::json &j, const std::string &key, uint64_t &value,
    const std::string &path);

template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, byte_string &value, const std::string &path) {
    if (!contains(j, key, path)) {
        return;
    }
    std::string hex;
    ju_get_opt_field(j, key, hex, path);
    try {
        value = decode_hex(hex);
    } catch (const std::invalid_argument &x) {
        throw std::invalid_argument("field \""s + path + to_string(key) + "\" not a hex string (" + x.what() + ")");
    }
}

template void ju_get_opt_field<std::string>(const nlohmann::json &j, const std::string &key, byte_string &value,
    const std::string &path);

step_witness step_witness_from_json(const nlohmann::json &j) {
    step_witness value;
    ju_get_field(j, "step"s, value.step);
    ju_get_field(j, "pre_state"s, value.pre_state);
    ju_get_field(j, "post_state"s, value.post_state);
    ju_get_field(j, "proof"s, value.proof);
    return value;
}

dispute_session dispute_session_from_json(const nlohmann::json &j) {
    dispute_session value;
    ju_get_field(j, "output"s, value.output);
    ju_get_field(j, "high_step"s, value.high_step);
    return value;
}

void to_json(nlohmann::json &j, const step_witness &w) {
    j = nlohmann::json{{"step", w.step}, {"pre_state", encode_hex(w.pre_state)},
        {"post_state", encode_hex(w.post_state)}, {"proof", encode_hex(w.proof)}};
}

void to_json(nlohmann::json &j, const dispute_session &s) {
    j = nlohmann::json{{"output", encode_hex(s.output)}, {"high_step", s.high_step}};
}

} // namespace arbiter
