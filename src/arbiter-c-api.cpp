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

#include "arbiter-c-api.h"

#include <cstdint>
#include <exception>
#include <new>
#include <span>
#include <stdexcept>
#include <string>

#include "arbiter-c-api-internal.h"
#include "json-util.h"
#include "scrypt-constants.h"
#include "scrypt-machine.h"
#include "step-verifier.h"

static_assert(SA_HASH_SIZE == arbiter::WORD_SIZE);
static_assert(SA_MEMORY_SLOT_COUNT == arbiter::MEMORY_SLOT_COUNT);
static_assert(SA_PROOF_SIZE == arbiter::PROOF_SIZE);
static_assert(SA_STATE_SIZE == arbiter::SCRYPT_STATE_SIZE);
static_assert(SA_OUTPUT_SIZE == arbiter::SCRYPT_OUTPUT_SIZE);
static_assert(SA_STEP_COUNT == arbiter::SCRYPT_STEP_COUNT);

static std::string &get_last_err_msg_storage() {
    static thread_local std::string last_err_msg;
    return last_err_msg;
}

const char *sa_get_last_error_message() {
    return get_last_err_msg_storage().c_str();
}

const char *sa_set_temp_string(const std::string &s) {
    static thread_local std::string temp_string;
    temp_string = s;
    return temp_string.c_str();
}

sa_error sa_result_failure() try { throw; } catch (const std::exception &e) {
    try {
        get_last_err_msg_storage() = e.what();
        throw;
    } catch (const std::invalid_argument &ex) {
        return SA_ERROR_INVALID_ARGUMENT;
    } catch (const std::domain_error &ex) {
        return SA_ERROR_DOMAIN_ERROR;
    } catch (const std::length_error &ex) {
        return SA_ERROR_LENGTH_ERROR;
    } catch (const std::out_of_range &ex) {
        return SA_ERROR_OUT_OF_RANGE;
    } catch (const std::logic_error &ex) {
        return SA_ERROR_LOGIC_ERROR;
    } catch (const std::range_error &ex) {
        return SA_ERROR_RANGE_ERROR;
    } catch (const std::overflow_error &ex) {
        return SA_ERROR_OVERFLOW_ERROR;
    } catch (const std::underflow_error &ex) {
        return SA_ERROR_UNDERFLOW_ERROR;
    } catch (const std::runtime_error &ex) {
        return SA_ERROR_RUNTIME_ERROR;
    } catch (const std::bad_alloc &ex) {
        return SA_ERROR_BAD_ALLOC;
    } catch (const std::exception &e) {
        return SA_ERROR_EXCEPTION;
    }
} catch (...) {
    try {
        get_last_err_msg_storage() = std::string("unknown error");
    } catch (...) {
        // Failed to allocate string, last resort is to set an empty error.
        get_last_err_msg_storage().clear();
    }
    return SA_ERROR_UNKNOWN;
}

sa_error sa_result_success() {
    get_last_err_msg_storage().clear();
    return SA_ERROR_OK;
}

// --------------------------------------------
// Conversion functions
// --------------------------------------------

static std::span<const unsigned char> convert_from_c(const uint8_t *data, size_t length, const char *name) {
    if (data == nullptr && length != 0) {
        throw std::invalid_argument(std::string("invalid ") + name);
    }
    if (length == 0) {
        return {};
    }
    return {data, length};
}

static sa_verdict convert_to_c(arbiter::step_verdict verdict) {
    using v = arbiter::step_verdict;
    switch (verdict) {
        case v::valid:
            return SA_VERDICT_VALID;
        case v::undecodable_state:
            return SA_VERDICT_UNDECODABLE_STATE;
        case v::malformed_proof:
            return SA_VERDICT_MALFORMED_PROOF;
        case v::proof_word_count:
            return SA_VERDICT_PROOF_WORD_COUNT;
        case v::proof_root_mismatch:
            return SA_VERDICT_PROOF_ROOT_MISMATCH;
        case v::post_state_mismatch:
            return SA_VERDICT_POST_STATE_MISMATCH;
        case v::input_hash_mismatch:
            return SA_VERDICT_INPUT_HASH_MISMATCH;
        case v::output_mismatch:
            return SA_VERDICT_OUTPUT_MISMATCH;
        case v::step_out_of_range:
            return SA_VERDICT_STEP_OUT_OF_RANGE;
    }
    throw std::domain_error{"unknown step verdict"};
}

// --------------------------------------------
// API functions
// --------------------------------------------

sa_error sa_get_step_count(uint64_t *count) try {
    if (count == nullptr) {
        throw std::invalid_argument("invalid count output");
    }
    *count = arbiter::SCRYPT_STEP_COUNT;
    return sa_result_success();
} catch (...) {
    return sa_result_failure();
}

sa_error sa_verify_step(uint64_t step, const uint8_t *pre_state, size_t pre_state_length, const uint8_t *post_state,
    size_t post_state_length, const uint8_t *proof, size_t proof_length, sa_verdict *verdict) try {
    if (verdict == nullptr) {
        throw std::invalid_argument("invalid verdict output");
    }
    const auto cpp_pre_state = convert_from_c(pre_state, pre_state_length, "pre_state");
    const auto cpp_post_state = convert_from_c(post_state, post_state_length, "post_state");
    const auto cpp_proof = convert_from_c(proof, proof_length, "proof");
    *verdict = convert_to_c(arbiter::verify_step_with_status(step, cpp_pre_state, cpp_post_state, cpp_proof));
    return sa_result_success();
} catch (...) {
    return sa_result_failure();
}

sa_error sa_verify_step_json(const char *witness, sa_verdict *verdict) try {
    if (witness == nullptr) {
        throw std::invalid_argument("invalid witness");
    }
    if (verdict == nullptr) {
        throw std::invalid_argument("invalid verdict output");
    }
    const auto json = nlohmann::json::parse(witness);
    const auto w = arbiter::step_witness_from_json(json);
    *verdict = convert_to_c(arbiter::verify_step_with_status(w.step, w.pre_state, w.post_state, w.proof));
    return sa_result_success();
} catch (const nlohmann::json::exception &e) {
    try {
        throw std::invalid_argument(e.what());
    } catch (...) {
        return sa_result_failure();
    }
} catch (...) {
    return sa_result_failure();
}

sa_error sa_is_initially_valid(const uint8_t *output, size_t output_length, uint64_t high_step, bool *result) try {
    if (result == nullptr) {
        throw std::invalid_argument("invalid result output");
    }
    const auto cpp_output = convert_from_c(output, output_length, "output");
    const arbiter::dispute_session session{arbiter::byte_string(cpp_output.begin(), cpp_output.end()), high_step};
    *result = arbiter::is_initially_valid(session);
    return sa_result_success();
} catch (...) {
    return sa_result_failure();
}

sa_error sa_get_step_witness(const uint8_t *input, size_t input_length, uint64_t step, const char **witness) try {
    if (witness == nullptr) {
        throw std::invalid_argument("invalid witness output");
    }
    *witness = nullptr;
    const auto cpp_input = convert_from_c(input, input_length, "input");
    if (step > arbiter::SCRYPT_FINAL_STEP) {
        throw std::out_of_range("step is out of range");
    }
    const arbiter::scrypt_machine machine(cpp_input);
    const nlohmann::json j = machine.get_step_witness(step);
    *witness = sa_set_temp_string(j.dump());
    return sa_result_success();
} catch (...) {
    return sa_result_failure();
}
