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

#ifndef SA_ARBITER_C_API_H // NOLINTBEGIN
#define SA_ARBITER_C_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

// -----------------------------------------------------------------------------
// API definitions
// -----------------------------------------------------------------------------

// Compiler visibility definition
#ifndef SA_API
#define SA_API __attribute__((visibility("default")))
#endif

// -----------------------------------------------------------------------------
// API enums and structures
// -----------------------------------------------------------------------------

/// \brief Constants.
typedef enum sa_constant {
    SA_HASH_SIZE = 32,
    SA_MEMORY_SLOT_COUNT = 1024,
    SA_PROOF_SIZE = 448,
    SA_STATE_SIZE = 192,
    SA_OUTPUT_SIZE = 32,
    SA_STEP_COUNT = 2049,
} sa_constant;

/// \brief Error codes returned from the C API.
typedef enum sa_error {
    SA_ERROR_OK = 0,
    SA_ERROR_INVALID_ARGUMENT = -1,
    SA_ERROR_DOMAIN_ERROR = -2,
    SA_ERROR_LENGTH_ERROR = -3,
    SA_ERROR_OUT_OF_RANGE = -4,
    SA_ERROR_LOGIC_ERROR = -5,
    SA_ERROR_RUNTIME_ERROR = -6,
    SA_ERROR_RANGE_ERROR = -7,
    SA_ERROR_OVERFLOW_ERROR = -8,
    SA_ERROR_UNDERFLOW_ERROR = -9,
    SA_ERROR_BAD_ALLOC = -10,
    SA_ERROR_EXCEPTION = -11,
    SA_ERROR_UNKNOWN = -12,
} sa_error;

/// \brief Verdicts of a step verification.
typedef enum sa_verdict {
    SA_VERDICT_VALID,
    SA_VERDICT_UNDECODABLE_STATE,
    SA_VERDICT_MALFORMED_PROOF,
    SA_VERDICT_PROOF_WORD_COUNT,
    SA_VERDICT_PROOF_ROOT_MISMATCH,
    SA_VERDICT_POST_STATE_MISMATCH,
    SA_VERDICT_INPUT_HASH_MISMATCH,
    SA_VERDICT_OUTPUT_MISMATCH,
    SA_VERDICT_STEP_OUT_OF_RANGE,
} sa_verdict;

// -----------------------------------------------------------------------------
// API functions
// -----------------------------------------------------------------------------

/// \brief Returns the error message set by the very last C API call.
/// \returns A C string, guaranteed to remain valid only until the next SA_API function call.
/// \details Must be called from the same thread that called the function that produced the error.
/// In case the last SA_API function call on that thread was successful, returns an empty string.
SA_API const char *sa_get_last_error_message();

/// \brief Returns the total number of steps of a computation.
/// \param count Receives the step count.
/// \returns 0 for success, non zero code for error.
SA_API sa_error sa_get_step_count(uint64_t *count);

/// \brief Verifies one step of a computation.
/// \param step Step index.
/// \param pre_state Serialized state before the step (raw input for step 0). Can be NULL if length is 0.
/// \param pre_state_length Length of pre_state.
/// \param post_state Serialized state after the step (output for the last step). Can be NULL if length is 0.
/// \param post_state_length Length of post_state.
/// \param proof Step-dependent proof. Can be NULL if length is 0.
/// \param proof_length Length of proof.
/// \param verdict Receives the verdict. SA_VERDICT_VALID means the step is valid.
/// \returns 0 for success, non zero code for error.
/// \details Malformed states and proofs are reported through the verdict, not as errors.
SA_API sa_error sa_verify_step(uint64_t step, const uint8_t *pre_state, size_t pre_state_length,
    const uint8_t *post_state, size_t post_state_length, const uint8_t *proof, size_t proof_length,
    sa_verdict *verdict);

/// \brief Verifies one step of a computation given as a JSON step witness.
/// \param witness JSON object with fields "step", "pre_state", "post_state" and "proof".
/// \param verdict Receives the verdict.
/// \returns 0 for success, non zero code for error.
SA_API sa_error sa_verify_step_json(const char *witness, sa_verdict *verdict);

/// \brief Checks whether a dispute session may be arbitrated step by step.
/// \param output Claimed output. Can be NULL if length is 0.
/// \param output_length Length of output.
/// \param high_step Total step count claimed by the session.
/// \param result Receives true if the session is admissible, false otherwise.
/// \returns 0 for success, non zero code for error.
SA_API sa_error sa_is_initially_valid(const uint8_t *output, size_t output_length, uint64_t high_step, bool *result);

/// \brief Runs the computation on an input and produces the witness for one step.
/// \param input Raw input. Can be NULL if length is 0.
/// \param input_length Length of input.
/// \param step Step index.
/// \param witness Receives the witness as a JSON object in a string, guaranteed to remain valid only until
/// the next SA_API function is called from the same thread. Set to NULL on failure.
/// \returns 0 for success, non zero code for error.
SA_API sa_error sa_get_step_witness(const uint8_t *input, size_t input_length, uint64_t step, const char **witness);

#ifdef __cplusplus
}
#endif

#endif // NOLINTEND
