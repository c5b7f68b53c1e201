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

#include "slog.h"

#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

namespace slog {

severity_level log_level(level_operation operation, severity_level new_level) {
    static severity_level level = severity_level::warning;
    if (operation == level_operation::set) {
        auto old_level = level;
        level = new_level;
        return old_level;
    }
    return level;
}

const char *to_string(severity_level level) {
    switch (level) {
        case severity_level::trace:
            return "trace";
        case severity_level::debug:
            return "debug";
        case severity_level::info:
            return "info";
        case severity_level::warning:
            return "warning";
        case severity_level::error:
            return "error";
        case severity_level::fatal:
            return "fatal";
        default:
            return "unknown";
    }
}

severity_level from_string(const char *name) {
    static constexpr severity_level levels[] = {severity_level::trace, severity_level::debug, severity_level::info,
        severity_level::warning, severity_level::error, severity_level::fatal};
    for (auto level : levels) {
        if (strcmp(name, to_string(level)) == 0) {
            return level;
        }
    }
    throw std::domain_error{std::string{"unknown log severity level '"} + name + "'"};
}

bool log_level_from_env(const char *var) {
    const char *value = std::getenv(var); // NOLINT(concurrency-mt-unsafe)
    if (value == nullptr) {
        return false;
    }
    log_level(level_operation::set, from_string(value));
    return true;
}

} // namespace slog
