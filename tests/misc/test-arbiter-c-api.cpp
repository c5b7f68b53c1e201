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

#define BOOST_TEST_MODULE Arbiter C API test // NOLINT(cppcoreguidelines-macro-usage)
#define BOOST_TEST_NO_OLD_TOOLS

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <boost/test/included/unit_test.hpp>
#pragma GCC diagnostic pop

#define JSON_HAS_FILESYSTEM 0
#include <json.hpp>

#include <cstdint>
#include <string>

#include <arbiter-c-api.h>

#include "test-utils.h"

// NOLINTBEGIN(cppcoreguidelines-avoid-do-while)

// NOLINTNEXTLINE
#define BOOST_AUTO_TEST_CASE_NOLINT(...) BOOST_AUTO_TEST_CASE(__VA_ARGS__)
// NOLINTNEXTLINE
#define BOOST_FIXTURE_TEST_CASE_NOLINT(...) BOOST_FIXTURE_TEST_CASE(__VA_ARGS__)

BOOST_AUTO_TEST_CASE_NOLINT(get_step_count_test) {
    uint64_t count = 0;
    BOOST_CHECK_EQUAL(sa_get_step_count(&count), SA_ERROR_OK);
    BOOST_CHECK_EQUAL(count, UINT64_C(2049));
    BOOST_CHECK_EQUAL(std::string(""), std::string(sa_get_last_error_message()));
}

BOOST_AUTO_TEST_CASE_NOLINT(get_step_count_null_test) {
    BOOST_CHECK_EQUAL(sa_get_step_count(nullptr), SA_ERROR_INVALID_ARGUMENT);
    BOOST_CHECK_EQUAL(std::string("invalid count output"), std::string(sa_get_last_error_message()));
    // A successful call clears the error message
    uint64_t count = 0;
    BOOST_CHECK_EQUAL(sa_get_step_count(&count), SA_ERROR_OK);
    BOOST_CHECK_EQUAL(std::string(""), std::string(sa_get_last_error_message()));
}

BOOST_AUTO_TEST_CASE_NOLINT(is_initially_valid_test) {
    const arbiter::byte_string output(SA_OUTPUT_SIZE, 0xaa);
    bool result = false;
    BOOST_CHECK_EQUAL(sa_is_initially_valid(output.data(), output.size(), SA_STEP_COUNT, &result), SA_ERROR_OK);
    BOOST_CHECK(result);
    BOOST_CHECK_EQUAL(sa_is_initially_valid(output.data(), output.size() - 1, SA_STEP_COUNT, &result), SA_ERROR_OK);
    BOOST_CHECK(!result);
    BOOST_CHECK_EQUAL(sa_is_initially_valid(output.data(), output.size(), SA_STEP_COUNT + 1, &result), SA_ERROR_OK);
    BOOST_CHECK(!result);
    BOOST_CHECK_EQUAL(sa_is_initially_valid(nullptr, 0, SA_STEP_COUNT, &result), SA_ERROR_OK);
    BOOST_CHECK(!result);
}

BOOST_AUTO_TEST_CASE_NOLINT(is_initially_valid_null_test) {
    bool result = false;
    BOOST_CHECK_EQUAL(sa_is_initially_valid(nullptr, SA_OUTPUT_SIZE, SA_STEP_COUNT, &result),
        SA_ERROR_INVALID_ARGUMENT);
    BOOST_CHECK_EQUAL(std::string("invalid output"), std::string(sa_get_last_error_message()));
    const arbiter::byte_string output(SA_OUTPUT_SIZE);
    BOOST_CHECK_EQUAL(sa_is_initially_valid(output.data(), output.size(), SA_STEP_COUNT, nullptr),
        SA_ERROR_INVALID_ARGUMENT);
    BOOST_CHECK_EQUAL(std::string("invalid result output"), std::string(sa_get_last_error_message()));
}

class witness_fixture {
public:
    witness_fixture() : _input(to_bytes("c api")) {}

    witness_fixture(const witness_fixture &other) = delete;
    witness_fixture(witness_fixture &&other) noexcept = delete;
    witness_fixture &operator=(const witness_fixture &other) = delete;
    witness_fixture &operator=(witness_fixture &&other) noexcept = delete;
    ~witness_fixture() = default;

protected:
    nlohmann::json get_witness(uint64_t step) {
        const char *witness{};
        BOOST_REQUIRE_EQUAL(sa_get_step_witness(_input.data(), _input.size(), step, &witness), SA_ERROR_OK);
        BOOST_REQUIRE(witness != nullptr);
        return nlohmann::json::parse(witness);
    }

    static arbiter::byte_string get_bytes(const nlohmann::json &j, const char *field) {
        return arbiter::decode_hex(j[field].get<std::string>());
    }

    arbiter::byte_string _input;
};

BOOST_FIXTURE_TEST_CASE_NOLINT(get_step_witness_test, witness_fixture) {
    const auto genesis = get_witness(0);
    BOOST_CHECK_EQUAL(genesis["step"].get<uint64_t>(), UINT64_C(0));
    BOOST_CHECK(get_bytes(genesis, "pre_state") == _input);
    BOOST_CHECK_EQUAL(get_bytes(genesis, "post_state").size(), size_t{SA_STATE_SIZE});
    const auto mixing = get_witness(1024);
    BOOST_CHECK_EQUAL(get_bytes(mixing, "proof").size(), size_t{SA_PROOF_SIZE});
    const auto finalization = get_witness(SA_STEP_COUNT);
    BOOST_CHECK(get_bytes(finalization, "proof") == _input);
    BOOST_CHECK_EQUAL(get_bytes(finalization, "post_state").size(), size_t{SA_OUTPUT_SIZE});
}

BOOST_FIXTURE_TEST_CASE_NOLINT(get_step_witness_out_of_range_test, witness_fixture) {
    const char *witness = "untouched";
    BOOST_CHECK_EQUAL(sa_get_step_witness(_input.data(), _input.size(), SA_STEP_COUNT + 1, &witness),
        SA_ERROR_OUT_OF_RANGE);
    BOOST_CHECK(witness == nullptr);
    BOOST_CHECK_EQUAL(std::string("step is out of range"), std::string(sa_get_last_error_message()));
}

BOOST_FIXTURE_TEST_CASE_NOLINT(get_step_witness_null_test, witness_fixture) {
    const char *witness{};
    BOOST_CHECK_EQUAL(sa_get_step_witness(nullptr, 1, 0, &witness), SA_ERROR_INVALID_ARGUMENT);
    BOOST_CHECK_EQUAL(std::string("invalid input"), std::string(sa_get_last_error_message()));
    BOOST_CHECK_EQUAL(sa_get_step_witness(_input.data(), _input.size(), 0, nullptr), SA_ERROR_INVALID_ARGUMENT);
    BOOST_CHECK_EQUAL(std::string("invalid witness output"), std::string(sa_get_last_error_message()));
}

BOOST_FIXTURE_TEST_CASE_NOLINT(verify_step_test, witness_fixture) {
    for (uint64_t step : {UINT64_C(0), UINT64_C(1), UINT64_C(1025), UINT64_C(2049)}) {
        const auto w = get_witness(step);
        const auto pre_state = get_bytes(w, "pre_state");
        auto post_state = get_bytes(w, "post_state");
        const auto proof = get_bytes(w, "proof");
        sa_verdict verdict = SA_VERDICT_STEP_OUT_OF_RANGE;
        BOOST_CHECK_EQUAL(sa_verify_step(step, pre_state.data(), pre_state.size(), post_state.data(),
                              post_state.size(), proof.data(), proof.size(), &verdict),
            SA_ERROR_OK);
        BOOST_CHECK_EQUAL(verdict, SA_VERDICT_VALID);
        post_state[0] ^= 1;
        BOOST_CHECK_EQUAL(sa_verify_step(step, pre_state.data(), pre_state.size(), post_state.data(),
                              post_state.size(), proof.data(), proof.size(), &verdict),
            SA_ERROR_OK);
        BOOST_CHECK_NE(verdict, SA_VERDICT_VALID);
    }
}

BOOST_FIXTURE_TEST_CASE_NOLINT(verify_step_rejection_test, witness_fixture) {
    const auto w = get_witness(3);
    const auto pre_state = get_bytes(w, "pre_state");
    const auto post_state = get_bytes(w, "post_state");
    sa_verdict verdict = SA_VERDICT_VALID;
    BOOST_CHECK_EQUAL(sa_verify_step(3, pre_state.data(), pre_state.size(), post_state.data(), post_state.size(),
                          nullptr, 0, &verdict),
        SA_ERROR_OK);
    BOOST_CHECK_EQUAL(verdict, SA_VERDICT_PROOF_WORD_COUNT);
    BOOST_CHECK_EQUAL(sa_verify_step(3, nullptr, 0, post_state.data(), post_state.size(), nullptr, 0, &verdict),
        SA_ERROR_OK);
    BOOST_CHECK_EQUAL(verdict, SA_VERDICT_UNDECODABLE_STATE);
    BOOST_CHECK_EQUAL(sa_verify_step(SA_STEP_COUNT + 1, pre_state.data(), pre_state.size(), post_state.data(),
                          post_state.size(), nullptr, 0, &verdict),
        SA_ERROR_OK);
    BOOST_CHECK_EQUAL(verdict, SA_VERDICT_STEP_OUT_OF_RANGE);
}

BOOST_AUTO_TEST_CASE_NOLINT(verify_step_null_test) {
    sa_verdict verdict = SA_VERDICT_VALID;
    BOOST_CHECK_EQUAL(sa_verify_step(1, nullptr, SA_STATE_SIZE, nullptr, 0, nullptr, 0, &verdict),
        SA_ERROR_INVALID_ARGUMENT);
    BOOST_CHECK_EQUAL(std::string("invalid pre_state"), std::string(sa_get_last_error_message()));
    BOOST_CHECK_EQUAL(sa_verify_step(1, nullptr, 0, nullptr, 1, nullptr, 0, &verdict), SA_ERROR_INVALID_ARGUMENT);
    BOOST_CHECK_EQUAL(std::string("invalid post_state"), std::string(sa_get_last_error_message()));
    BOOST_CHECK_EQUAL(sa_verify_step(1, nullptr, 0, nullptr, 0, nullptr, SA_PROOF_SIZE, &verdict),
        SA_ERROR_INVALID_ARGUMENT);
    BOOST_CHECK_EQUAL(std::string("invalid proof"), std::string(sa_get_last_error_message()));
    BOOST_CHECK_EQUAL(sa_verify_step(1, nullptr, 0, nullptr, 0, nullptr, 0, nullptr), SA_ERROR_INVALID_ARGUMENT);
    BOOST_CHECK_EQUAL(std::string("invalid verdict output"), std::string(sa_get_last_error_message()));
}

BOOST_FIXTURE_TEST_CASE_NOLINT(verify_step_json_test, witness_fixture) {
    auto w = get_witness(2048);
    sa_verdict verdict = SA_VERDICT_STEP_OUT_OF_RANGE;
    BOOST_CHECK_EQUAL(sa_verify_step_json(w.dump().c_str(), &verdict), SA_ERROR_OK);
    BOOST_CHECK_EQUAL(verdict, SA_VERDICT_VALID);
    w["step"] = SA_STEP_COUNT + 1;
    BOOST_CHECK_EQUAL(sa_verify_step_json(w.dump().c_str(), &verdict), SA_ERROR_OK);
    BOOST_CHECK_EQUAL(verdict, SA_VERDICT_STEP_OUT_OF_RANGE);
}

BOOST_AUTO_TEST_CASE_NOLINT(verify_step_json_error_test) {
    sa_verdict verdict = SA_VERDICT_VALID;
    BOOST_CHECK_EQUAL(sa_verify_step_json(nullptr, &verdict), SA_ERROR_INVALID_ARGUMENT);
    BOOST_CHECK_EQUAL(std::string("invalid witness"), std::string(sa_get_last_error_message()));
    BOOST_CHECK_EQUAL(sa_verify_step_json("{", &verdict), SA_ERROR_INVALID_ARGUMENT);
    BOOST_CHECK(!std::string(sa_get_last_error_message()).empty());
    BOOST_CHECK_EQUAL(sa_verify_step_json(R"({"step":1,"pre_state":"0x","post_state":"0x"})", &verdict),
        SA_ERROR_INVALID_ARGUMENT);
    BOOST_CHECK_EQUAL(std::string(R"(missing field "/proof")"), std::string(sa_get_last_error_message()));
    BOOST_CHECK_EQUAL(
        sa_verify_step_json(R"({"step":18446744073709551616.0,"pre_state":"0x","post_state":"0x","proof":"0x"})",
            &verdict),
        SA_ERROR_INVALID_ARGUMENT);
    BOOST_CHECK_EQUAL(std::string(R"(field "/step" not an unsigned integer)"),
        std::string(sa_get_last_error_message()));
    BOOST_CHECK_EQUAL(sa_verify_step_json(R"({"step":1,"pre_state":"0x","post_state":"0x","proof":"0x"})", nullptr),
        SA_ERROR_INVALID_ARGUMENT);
    BOOST_CHECK_EQUAL(std::string("invalid verdict output"), std::string(sa_get_last_error_message()));
}

// NOLINTEND(cppcoreguidelines-avoid-do-while)
