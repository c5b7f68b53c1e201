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

#define BOOST_TEST_MODULE Scrypt state test // NOLINT(cppcoreguidelines-macro-usage)
#define BOOST_TEST_NO_OLD_TOOLS

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <boost/test/included/unit_test.hpp>
#pragma GCC diagnostic pop

#include <cstdint>
#include <string>

#include <memory-state-access.h>
#include <pristine-memory-tree.h>
#include <record-step-state-access.h>
#include <replay-step-state-access.h>
#include <scrypt-machine.h>
#include <scrypt-state.h>
#include <scrypt-step.h>

#include "test-utils.h"

// NOLINTBEGIN(cppcoreguidelines-avoid-do-while)

// NOLINTNEXTLINE
#define BOOST_AUTO_TEST_CASE_NOLINT(...) BOOST_AUTO_TEST_CASE(__VA_ARGS__)

using namespace arbiter;

static scrypt_state make_state(uint64_t seed) {
    scrypt_state state;
    state.vars = make_slot(seed);
    state.memory_hash = get_hash(memory_hasher{}, to_bytes("memory " + std::to_string(seed)));
    state.input_hash = get_hash(memory_hasher{}, to_bytes("input " + std::to_string(seed)));
    return state;
}

BOOST_AUTO_TEST_CASE_NOLINT(state_codec_test) {
    const auto state = make_state(42);
    const auto data = encode_state(state);
    BOOST_REQUIRE_EQUAL(data.size(), SCRYPT_STATE_SIZE);
    // vars, then memory hash, then input hash
    BOOST_CHECK(std::equal(state.vars[3].begin(), state.vars[3].end(), data.begin() + (3 * WORD_SIZE)));
    BOOST_CHECK(std::equal(state.memory_hash.begin(), state.memory_hash.end(), data.begin() + SLOT_SIZE));
    BOOST_CHECK(
        std::equal(state.input_hash.begin(), state.input_hash.end(), data.begin() + SLOT_SIZE + WORD_SIZE));
    const auto decoded = decode_state(data);
    BOOST_REQUIRE(decoded.has_value());
    BOOST_CHECK(decoded.value() == state);
}

BOOST_AUTO_TEST_CASE_NOLINT(state_decode_length_test) {
    for (size_t length : {size_t{0}, SCRYPT_STATE_SIZE - 1, SCRYPT_STATE_SIZE + 1, SCRYPT_OUTPUT_SIZE}) {
        const byte_string data(length, 0x5a);
        BOOST_CHECK(!decode_state(data).has_value());
    }
}

BOOST_AUTO_TEST_CASE_NOLINT(input_to_state_test) {
    const auto input = to_bytes("abc");
    const auto state = input_to_state(input);
    BOOST_CHECK(state.memory_hash == get_pristine_memory_root());
    BOOST_CHECK(state.input_hash == get_hash(memory_hasher{}, input));
    BOOST_CHECK(state.input_hash == get_input_hash(input));
    byte_string block(SLOT_SIZE);
    pbkdf2_hmac_sha_256(input, input, 1, block);
    for (size_t i = 0; i < SLOT_WORD_COUNT; ++i) {
        BOOST_CHECK(std::equal(state.vars[i].begin(), state.vars[i].end(), block.begin() + (i * WORD_SIZE)));
    }
    BOOST_CHECK(input_to_state(input) == state);
    BOOST_CHECK(!(input_to_state(to_bytes("abd")) == state));
}

BOOST_AUTO_TEST_CASE_NOLINT(scrypt_machine_output_test) {
    BOOST_CHECK_EQUAL(encode_hex(scrypt_machine{byte_string{}}.get_output()),
        "0xb34ab7cd1ce0c308146ab970fa75517bcf20f95c7ed7a34efc0d5f096469b2e1");
    BOOST_CHECK_EQUAL(encode_hex(scrypt_machine{to_bytes("abc")}.get_output()),
        "0xe652c1c3b7a8cd99d2edc49d4509f545c80e4395765e7225c4dde5d80dd76519");
    const auto input = to_bytes("scrypt arbiter");
    const scrypt_machine machine{input};
    BOOST_CHECK_EQUAL(encode_hex(machine.get_output()),
        "0xccf80bf2423a5acceac43f509d4964e682cb8b326968be6b1698b9a1dcd84850");
    BOOST_CHECK(machine.get_output() == reference_scrypt(input));
    BOOST_CHECK(machine.get_input() == input);
}

BOOST_AUTO_TEST_CASE_NOLINT(scrypt_machine_states_test) {
    const auto input = to_bytes("states");
    const scrypt_machine machine{input};
    BOOST_CHECK(machine.get_state(1) == input_to_state(input));
    // The memory hash only changes while memory is being filled
    BOOST_CHECK(machine.get_state(MEMORY_SLOT_COUNT + 1).memory_hash ==
        machine.get_state(SCRYPT_MIX_STEP_COUNT + 1).memory_hash);
    BOOST_CHECK(!(machine.get_state(MEMORY_SLOT_COUNT).memory_hash ==
        machine.get_state(MEMORY_SLOT_COUNT + 1).memory_hash));
    BOOST_CHECK(machine.get_state(SCRYPT_FINAL_STEP).input_hash == get_input_hash(input));
    BOOST_CHECK(final_state_to_output(machine.get_state(SCRYPT_FINAL_STEP), input) == machine.get_output());
    BOOST_CHECK_THROW((void) machine.get_state(0), std::out_of_range);
    BOOST_CHECK_THROW((void) machine.get_state(SCRYPT_FINAL_STEP + 1), std::out_of_range);
    const auto session = machine.get_session();
    BOOST_CHECK(session.output == machine.get_output());
    BOOST_CHECK_EQUAL(session.high_step, SCRYPT_STEP_COUNT);
}

BOOST_AUTO_TEST_CASE_NOLINT(scrypt_step_out_of_range_test) {
    auto state = input_to_state(to_bytes("abc"));
    const auto original = state;
    scrypt_memory memory;
    const memory_state_access a(state, memory);
    BOOST_CHECK(scrypt_step(SCRYPT_MIX_STEP_COUNT, a) == ScryptStepStatus::StepOutOfRange);
    BOOST_CHECK(scrypt_step(UINT64_MAX, a) == ScryptStepStatus::StepOutOfRange);
    BOOST_CHECK(state == original);
    BOOST_CHECK(memory.get_root_hash() == get_pristine_memory_root());
}

BOOST_AUTO_TEST_CASE_NOLINT(scrypt_step_fill_test) {
    auto state = input_to_state(to_bytes("fill"));
    const auto x = state.vars;
    scrypt_memory memory;
    const memory_state_access a(state, memory);
    BOOST_REQUIRE(scrypt_step(0, a) == ScryptStepStatus::Success);
    BOOST_CHECK(memory.get_slot(0) == x);
    BOOST_CHECK(state.vars == scrypt_block_mix(x));
    BOOST_CHECK(state.memory_hash == memory.get_root_hash());
}

BOOST_AUTO_TEST_CASE_NOLINT(record_and_replay_step_test) {
    auto state = input_to_state(to_bytes("replay"));
    scrypt_memory memory;
    for (uint64_t k = 0; k < MEMORY_SLOT_COUNT + 1; ++k) {
        auto before = state;
        record_step_state_access::context record_context;
        const record_step_state_access record(record_context, state, memory);
        BOOST_REQUIRE(scrypt_step(k, record) == ScryptStepStatus::Success);
        BOOST_REQUIRE(record_context.index.has_value());
        replay_step_state_access::context replay_context{record.get_proof(), {}};
        const replay_step_state_access replay(replay_context, before);
        BOOST_REQUIRE(scrypt_step(k, replay) == ScryptStepStatus::Success);
        BOOST_REQUIRE(before == state);
    }
}

BOOST_AUTO_TEST_CASE_NOLINT(replay_step_bad_proof_test) {
    auto state = input_to_state(to_bytes("bad proof"));
    const auto original = state;
    replay_step_state_access::context short_context{slot_proof{std::vector<memory_word>(3)}, {}};
    const replay_step_state_access short_replay(short_context, state);
    BOOST_CHECK(scrypt_step(0, short_replay) == ScryptStepStatus::InvalidProofWordCount);
    BOOST_CHECK(state == original);
    slot_proof proof;
    proof.set_sibling_hash(get_hash(memory_hasher{}, to_bytes("not a sibling")), 0);
    replay_step_state_access::context wrong_context{proof, {}};
    const replay_step_state_access wrong_replay(wrong_context, state);
    BOOST_CHECK(scrypt_step(0, wrong_replay) == ScryptStepStatus::ProofRootMismatch);
    BOOST_CHECK(state == original);
}

BOOST_AUTO_TEST_CASE_NOLINT(record_step_without_access_test) {
    auto state = input_to_state(to_bytes("abc"));
    scrypt_memory memory;
    record_step_state_access::context context;
    const record_step_state_access a(context, state, memory);
    BOOST_CHECK(scrypt_step(SCRYPT_MIX_STEP_COUNT, a) == ScryptStepStatus::StepOutOfRange);
    BOOST_CHECK_THROW((void) a.get_proof(), std::runtime_error);
}

BOOST_AUTO_TEST_CASE_NOLINT(state_access_root_check_test) {
    auto state = make_state(1);
    scrypt_memory memory;
    BOOST_CHECK_THROW((void) memory_state_access(state, memory), std::invalid_argument);
    record_step_state_access::context context;
    BOOST_CHECK_THROW((void) record_step_state_access(context, state, memory), std::invalid_argument);
    BOOST_CHECK_THROW((void) memory.get_slot(MEMORY_SLOT_COUNT), std::out_of_range);
}

BOOST_AUTO_TEST_CASE_NOLINT(scrypt_step_status_name_test) {
    BOOST_CHECK_EQUAL(scrypt_step_status_name(ScryptStepStatus::Success), "success");
    BOOST_CHECK_EQUAL(scrypt_step_status_name(ScryptStepStatus::StepOutOfRange), "step out of range");
    BOOST_CHECK_EQUAL(scrypt_step_status_name(ScryptStepStatus::ProofRootMismatch), "proof root mismatch");
}

// NOLINTEND(cppcoreguidelines-avoid-do-while)
