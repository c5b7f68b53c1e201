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

#define BOOST_TEST_MODULE Hashers test // NOLINT(cppcoreguidelines-macro-usage)
#define BOOST_TEST_NO_OLD_TOOLS

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <boost/test/included/unit_test.hpp>
#pragma GCC diagnostic pop

#include <cstdint>
#include <string>
#include <vector>

#include <hex-util.h>
#include <keccak-256-hasher.h>
#include <pbkdf2.h>
#include <salsa20.h>
#include <sha-256-hasher.h>

#include "test-utils.h"

// NOLINTBEGIN(cppcoreguidelines-avoid-do-while)

// NOLINTNEXTLINE
#define BOOST_AUTO_TEST_CASE_NOLINT(...) BOOST_AUTO_TEST_CASE(__VA_ARGS__)

using namespace arbiter;

BOOST_AUTO_TEST_CASE_NOLINT(keccak_256_empty_test) {
    const auto hash = get_hash(keccak_256_hasher{}, byte_string{});
    BOOST_CHECK_EQUAL(encode_hex(hash), "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

BOOST_AUTO_TEST_CASE_NOLINT(keccak_256_abc_test) {
    const auto hash = get_hash(keccak_256_hasher{}, to_bytes("abc"));
    BOOST_CHECK_EQUAL(encode_hex(hash), "0x4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

BOOST_AUTO_TEST_CASE_NOLINT(keccak_256_incremental_test) {
    // Lengths straddle the 136-byte rate
    for (size_t length : {135, 136, 137, 272, 300}) {
        byte_string data(length);
        for (size_t i = 0; i < length; ++i) {
            data[i] = static_cast<unsigned char>(i * 3);
        }
        const auto one_shot = get_hash(keccak_256_hasher{}, data);
        keccak_256_hasher h;
        h.begin();
        for (size_t i = 0; i < length; i += 7) {
            h.add_data(std::span<const unsigned char>{data}.subspan(i, std::min<size_t>(7, length - i)));
        }
        memory_word incremental;
        h.end(incremental);
        BOOST_CHECK(one_shot == incremental);
    }
}

BOOST_AUTO_TEST_CASE_NOLINT(keccak_256_reuse_test) {
    keccak_256_hasher h;
    memory_word first;
    memory_word second;
    get_hash(h, to_bytes("abc"), first);
    get_hash(h, to_bytes("abc"), second);
    BOOST_CHECK(first == second);
}

BOOST_AUTO_TEST_CASE_NOLINT(concat_hash_test) {
    keccak_256_hasher h;
    const auto a = get_hash(h, to_bytes("left"));
    const auto b = get_hash(h, to_bytes("right"));
    byte_string joined(a.begin(), a.end());
    joined.insert(joined.end(), b.begin(), b.end());
    BOOST_CHECK(get_concat_hash(h, a, b) == get_hash(h, joined));
    // Output may alias an input
    memory_word c = a;
    get_concat_hash(h, c, b, c);
    BOOST_CHECK(c == get_hash(h, joined));
}

BOOST_AUTO_TEST_CASE_NOLINT(slot_hash_test) {
    const auto slot = make_slot(5);
    byte_string joined;
    for (const auto &word : slot) {
        joined.insert(joined.end(), word.begin(), word.end());
    }
    BOOST_CHECK_EQUAL(joined.size(), SLOT_SIZE);
    BOOST_CHECK(get_slot_hash(keccak_256_hasher{}, slot) == get_hash(keccak_256_hasher{}, joined));
}

BOOST_AUTO_TEST_CASE_NOLINT(sha_256_vectors_test) {
    BOOST_CHECK_EQUAL(encode_hex(get_hash(sha_256_hasher{}, byte_string{})),
        "0xe3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    BOOST_CHECK_EQUAL(encode_hex(get_hash(sha_256_hasher{}, to_bytes("abc"))),
        "0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    BOOST_CHECK_EQUAL(encode_hex(get_hash(sha_256_hasher{}, byte_string(1000, 'a'))),
        "0x41edece42d63e8d9bf515a9ba6932e1c20cbc9f5a5d134645adb5db1b9737ea3");
}

BOOST_AUTO_TEST_CASE_NOLINT(hmac_sha_256_test) {
    BOOST_CHECK_EQUAL(encode_hex(hmac_sha_256(to_bytes("key"), to_bytes("The quick brown fox jumps over the lazy dog"))),
        "0xf7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
    // Keys longer than a block are hashed first
    BOOST_CHECK_EQUAL(encode_hex(hmac_sha_256(byte_string(100, 'k'), to_bytes("msg"))),
        "0xbd56a1782c2830e8abc6ed866a57a1230661e650b84c62f7ee3accc5fa5af491");
}

BOOST_AUTO_TEST_CASE_NOLINT(pbkdf2_hmac_sha_256_test) {
    byte_string dk(64);
    pbkdf2_hmac_sha_256(to_bytes("passwd"), to_bytes("salt"), 1, dk);
    BOOST_CHECK_EQUAL(encode_hex(dk),
        "0x55ac046e56e3089fec1691c22544b605f94185216dde0465e68b9d57c20dacbc"
        "49ca9cccf179b645991664b39d77ef317c71b845b1e30bd509112041d3a19783");
    byte_string dk2(32);
    pbkdf2_hmac_sha_256(to_bytes("password"), to_bytes("salt"), 2, dk2);
    BOOST_CHECK_EQUAL(encode_hex(dk2), "0xae4d0c95af6b46d32d0adff928f06dd02a303f8ef3c251dfd6e2d85a95474c43");
}

BOOST_AUTO_TEST_CASE_NOLINT(pbkdf2_zero_iterations_test) {
    byte_string dk(32);
    BOOST_CHECK_THROW(pbkdf2_hmac_sha_256(to_bytes("password"), to_bytes("salt"), 0, dk), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE_NOLINT(salsa20_8_test) {
    const auto in = decode_hex("7e879a214f3ec9867ca940e641718f26baee555b8c61c1b50df846116dcd3b1d"
                               "ee24f319df9b3d8514121e4b5ac5aa3276021d2909c74829edebc68db8b8c25e");
    uint32_t block[SALSA20_BLOCK_WORD_COUNT];
    for (int i = 0; i < SALSA20_BLOCK_WORD_COUNT; ++i) {
        block[i] = static_cast<uint32_t>(in[4 * i]) | (static_cast<uint32_t>(in[(4 * i) + 1]) << 8) |
            (static_cast<uint32_t>(in[(4 * i) + 2]) << 16) | (static_cast<uint32_t>(in[(4 * i) + 3]) << 24);
    }
    salsa20_8(block);
    byte_string out;
    for (auto w : block) {
        for (int j = 0; j < 4; ++j) {
            out.push_back(static_cast<unsigned char>(w >> (8 * j)));
        }
    }
    BOOST_CHECK_EQUAL(encode_hex(out),
        "0xa41f859c6608cc993b81cacb020cef05044b2181a2fd337dfd7b1c6396682f29"
        "b4393168e3c9e6bcfe6bc5b7a06d96bae424cc102c91745c24ad673dc7618f81");
}

static slot_value slot_from_hex(const std::string &hex) {
    const auto data = decode_hex(hex);
    BOOST_REQUIRE_EQUAL(data.size(), SLOT_SIZE);
    slot_value value{};
    for (size_t i = 0; i < SLOT_WORD_COUNT; ++i) {
        std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(i * WORD_SIZE), WORD_SIZE, value[i].begin());
    }
    return value;
}

static std::string slot_to_hex(const slot_value &value) {
    byte_string data;
    for (const auto &word : value) {
        data.insert(data.end(), word.begin(), word.end());
    }
    return encode_hex(data);
}

BOOST_AUTO_TEST_CASE_NOLINT(scrypt_block_mix_test) {
    const auto in = slot_from_hex("f7ce0b653d2d72a4108cf5abe912ffdd777616dbbb27a70e8204f3ae2d0f6fad"
                                  "89f68f4811d1e87bcc3bd7400a9ffd29094f0184639574f39ae5a1315217bcd7"
                                  "894991447213bb226c25b54da86370fbcd984380374666bb8ffcb5bf40c254b0"
                                  "67d27c51ce4ad5fed829c90b505a571b7f4d1cad6a523cda770e67bceaaf7e89");
    BOOST_CHECK_EQUAL(slot_to_hex(scrypt_block_mix(in)),
        "0xa41f859c6608cc993b81cacb020cef05044b2181a2fd337dfd7b1c6396682f29"
        "b4393168e3c9e6bcfe6bc5b7a06d96bae424cc102c91745c24ad673dc7618f81"
        "20edc975323881a80540f64c162dcd3c21077cfe5f8d5fe2b1a4168f953678b7"
        "7d3b3d803b60e4ab920996e59b4d53b65d2a225877d5edf5842cb9f14eefe425");
}

BOOST_AUTO_TEST_CASE_NOLINT(scrypt_integerify_test) {
    slot_value value{};
    value[2][0] = 0x04;
    value[2][1] = 0x03;
    value[2][2] = 0x02;
    value[2][3] = 0x01;
    BOOST_CHECK_EQUAL(scrypt_integerify(value), UINT32_C(0x01020304));
}

BOOST_AUTO_TEST_CASE_NOLINT(hex_util_test) {
    BOOST_CHECK_EQUAL(encode_hex(decode_hex("0xDEADbeef")), "0xdeadbeef");
    BOOST_CHECK(decode_hex("").empty());
    BOOST_CHECK(decode_hex("0x").empty());
    BOOST_CHECK_THROW(decode_hex("0xabc"), std::invalid_argument);
    BOOST_CHECK_THROW(decode_hex("0xzz"), std::invalid_argument);
    BOOST_CHECK_THROW(decode_hex_word("0x00"), std::invalid_argument);
}

// NOLINTEND(cppcoreguidelines-avoid-do-while)
