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

#include <cinttypes>
#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <optional>
#include <string>

#include <json.hpp>

#include "file-util.h"
#include "hex-util.h"
#include "json-util.h"
#include "scrypt-constants.h"
#include "scrypt-machine.h"
#include "slog.h"
#include "step-verifier.h"

using namespace arbiter;

/// \brief Exit status for a rejected step or session
constexpr int EXIT_REJECTED = 2;

/// \brief Checks if string matches prefix and captures remaninder
/// \param pre Prefix to match in str.
/// \param str Input string
/// \param val If string matches prefix, points to remaninder
/// \returns True if string matches prefix, false otherwise
static bool stringval(const char *pre, const char *str, const char **val) {
    const size_t len = strlen(pre);
    if (strncmp(pre, str, len) == 0) {
        *val = str + len;
        return true;
    }
    return false;
}

/// \brief Checks if string matches prefix and captures uint64_t that follows
/// \param pre Prefix to match in str.
/// \param str Input string
/// \param val If string matches prefix and conversion to uint64_t succeeds, receives
/// converted value
/// \returns True if string matches prefix and conversion succeeds,
/// false otherwise
static bool uint64val(const char *pre, const char *str, std::optional<uint64_t> &val) {
    const size_t len = strlen(pre);
    if (strncmp(pre, str, len) == 0) {
        str += len;
        int end = 0;
        uint64_t v = 0;
        // NOLINTNEXTLINE(cert-err34-c): %n is used to verify conversion errors
        if (sscanf(str, "%" SCNu64 "%n", &v, &end) == 1 && !str[end]) {
            val = v;
            return true;
        }
    }
    return false;
}

/// \brief Prints formatted message to stderr
/// \param fmt Format string
/// \param ... Arguments, if any
// NOLINTNEXTLINE(cert-dcl50-cpp): this vararg is safe because the compiler can check the format
__attribute__((format(printf, 1, 2))) static void error(const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    (void) vfprintf(stderr, fmt, ap);
    va_end(ap);
    exit(1);
}

/// \brief Prints help message
static void help(const char *name) {
    (void) fprintf(stderr, R"(Usage:

  %s [options]

Runs, proves and arbitrates single steps of the scrypt computation
with N=1024, r=1, p=1 and a 32-byte output, where the input is used as
both password and salt.

The computation has %)" PRIu64 R"( steps: step 0 builds the initial state from
the raw input, steps 1 to %)" PRIu64 R"( run one iteration of the mixing loop each,
touching exactly one 128-byte memory slot authenticated by a Merkle proof,
and step %)" PRIu64 R"( derives the output from the last state.

Byte strings are given and printed as 0x-prefixed hexadecimal.

Options:

  --input=<hex>                         default: empty input
  Gives the raw input of the computation.

  --hash
  Prints the output of the computation.

  --log-step=<integer>
  Prints the JSON witness of a step: the step index, the state before and
  after the step, and the proof the verifier needs.

  --json-output=<filename>
  Writes the witness produced by --log-step to a file instead.

  --verify=<filename>
  Reads a JSON step witness and prints whether the step is valid.
  Exits with status 0 if valid, %d if invalid and 1 on errors.

  --session=<filename>
  Reads a JSON session with fields "output" and "high_step" and prints
  whether it may be arbitrated step by step.
  Exits with status 0 if admissible, %d if not and 1 on errors.

  --log-level=<level>                   default: warning
  (trace, debug, info, warning, error or fatal)
  Sets the log level. Overrides the SCRYPT_ARBITER_LOG_LEVEL environment variable.

  --help
  Prints this message and returns.
)",
        name, SCRYPT_STEP_COUNT, SCRYPT_MIX_STEP_COUNT, SCRYPT_FINAL_STEP, EXIT_REJECTED, EXIT_REJECTED);
    exit(0);
}

static int verify_witness_file(const char *filename) {
    const auto witness = step_witness_from_json(nlohmann::json::parse(read_text_file(filename)));
    const auto verdict = verify_step_with_status(witness.step, witness.pre_state, witness.post_state, witness.proof);
    if (verdict != step_verdict::valid) {
        (void) fprintf(stdout, "invalid: %s\n", step_verdict_name(verdict));
        return EXIT_REJECTED;
    }
    (void) fprintf(stdout, "valid\n");
    return 0;
}

static int check_session_file(const char *filename) {
    const auto session = dispute_session_from_json(nlohmann::json::parse(read_text_file(filename)));
    if (!is_initially_valid(session)) {
        SLOG(info) << "session with " << session.output.size() << " output bytes and high step " << session.high_step
                   << " rejected";
        (void) fprintf(stdout, "not admissible\n");
        return EXIT_REJECTED;
    }
    (void) fprintf(stdout, "admissible\n");
    return 0;
}

int main(int argc, char *argv[]) try {
    const char *input_hex = "";
    const char *json_output = nullptr;
    const char *verify_name = nullptr;
    const char *session_name = nullptr;
    const char *log_level = nullptr;
    std::optional<uint64_t> log_step;
    bool hash = false;
    // Process command line arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--help") == 0) {
            help(argv[0]);
        } else if (strcmp(argv[i], "--hash") == 0) {
            hash = true;
        } else if (stringval("--input=", argv[i], &input_hex)) {
            ;
        } else if (uint64val("--log-step=", argv[i], log_step)) {
            ;
        } else if (stringval("--json-output=", argv[i], &json_output)) {
            ;
        } else if (stringval("--verify=", argv[i], &verify_name)) {
            ;
        } else if (stringval("--session=", argv[i], &session_name)) {
            ;
        } else if (stringval("--log-level=", argv[i], &log_level)) {
            ;
        } else {
            error("unrecognized option '%s'\n", argv[i]);
        }
    }
    (void) slog::log_level_from_env("SCRYPT_ARBITER_LOG_LEVEL");
    if (log_level != nullptr) {
        slog::log_level(slog::level_operation::set, slog::from_string(log_level));
    }
    if (json_output != nullptr && !log_step) {
        error("--json-output requires --log-step\n");
    }
    if (verify_name != nullptr) {
        return verify_witness_file(verify_name);
    }
    if (session_name != nullptr) {
        return check_session_file(session_name);
    }
    if (!hash && !log_step) {
        error("nothing to do (try --help)\n");
    }
    const auto input = decode_hex(input_hex);
    const scrypt_machine machine(input);
    if (hash) {
        (void) fprintf(stdout, "%s\n", encode_hex(machine.get_output()).c_str());
    }
    if (log_step) {
        if (*log_step > SCRYPT_FINAL_STEP) {
            error("step %" PRIu64 " is out of range (last step is %" PRIu64 ")\n", *log_step, SCRYPT_FINAL_STEP);
        }
        const nlohmann::json j = machine.get_step_witness(*log_step);
        if (json_output != nullptr) {
            write_text_file(json_output, j.dump(2) + "\n");
            SLOG(info) << "wrote witness of step " << *log_step << " to '" << json_output << "'";
        } else {
            (void) fprintf(stdout, "%s\n", j.dump(2).c_str());
        }
    }
    return 0;
} catch (const std::exception &e) {
    error("%s\n", e.what());
    return 1;
}
