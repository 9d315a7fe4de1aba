/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/common/test.hpp>
#include <lc/big-int.hpp>

namespace {
    using namespace ledger_codec;
    using namespace ledger_codec::cbor;

    void test_echo(const std::string_view hex, const std::string_view canon_hex, const std::source_location &loc=std::source_location::current())
    {
        const auto bytes = uint8_vector::from_hex(hex);
        const auto v = big_integer::from_bytes(bytes);
        test_same(v.to_bytes(), bytes, loc);
        test_same(v.to_bytes(true), uint8_vector::from_hex(canon_hex), loc);
    }
}

suite big_int_suite = [] {
    "big_integer"_test = [] {
        "boundaries"_test = [] {
            test_same(big_integer { 0 }.to_bytes(true), uint8_vector::from_hex("00"));
            test_same(big_integer { std::numeric_limits<uint64_t>::max() }.to_bytes(true), uint8_vector::from_hex("1BFFFFFFFFFFFFFFFF"));
            test_same(big_integer { -1 }.to_bytes(true), uint8_vector::from_hex("20"));
            {
                const auto v = big_integer::from_string("-18446744073709551616");
                test_same(v.to_bytes(true), uint8_vector::from_hex("3BFFFFFFFFFFFFFFFF"));
                test_same(big_integer::from_bytes(uint8_vector::from_hex("3BFFFFFFFFFFFFFFFF")), v);
                expect(v.as_int().has_value());
                expect(!v.as_u64().has_value());
            }
            {
                const auto v = big_integer::from_string("18446744073709551616");
                test_same(v.to_bytes(true), uint8_vector::from_hex("C249010000000000000000"));
                test_same(big_integer::from_bytes(uint8_vector::from_hex("C249010000000000000000")), v);
                expect(!v.as_u64().has_value());
                expect(!v.as_int().has_value());
                const uint128_t two_pow_64 = uint128_t { 1 } << 64;
                expect(v.as_u128() == two_pow_64);
            }
            test_same(big_integer::from_string("-18446744073709551617").to_bytes(true), uint8_vector::from_hex("C349010000000000000000"));
        };
        "decode"_test = [] {
            test_same(big_integer::from_bytes(uint8_vector::from_hex("00")), big_integer { 0 });
            test_same(big_integer::from_bytes(uint8_vector::from_hex("1BFFFFFFFFFFFFFFFF")).as_u64(), std::optional<uint64_t> { std::numeric_limits<uint64_t>::max() });
            test_same(big_integer::from_bytes(uint8_vector::from_hex("20")), big_integer { -1 });
            test_same(big_integer::from_bytes(uint8_vector::from_hex("C24101")), big_integer { 1 });
            test_same(big_integer::from_bytes(uint8_vector::from_hex("C340")), big_integer { -1 });
            test_same(big_integer::from_bytes(uint8_vector::from_hex("C25F41014102FF")), big_integer { 0x0102 });
        };
        "echo"_test = [] {
            test_echo("1817", "17");
            test_echo("3900FF", "38FF");
            test_echo("C24100", "00");
            test_echo("C2420001", "01");
            test_echo("D80241FF", "18FF");
            test_echo("C25F41014102FF", "190102");
            test_echo("C25F4101404102FF", "190102");
        };
        "native width widened when too narrow"_test = [] {
            const auto v = big_integer::from_int(native_int { 1000, false, int_width::in_header });
            test_same(v.to_bytes(), uint8_vector::from_hex("1903E8"));
            const auto w = big_integer::from_int(native_int { 10, false, int_width::four_bytes });
            test_same(w.to_bytes(), uint8_vector::from_hex("1A0000000A"));
            test_same(w.to_bytes(true), uint8_vector::from_hex("0A"));
        };
        "long values are chunked"_test = [] {
            const auto v = big_integer::from_string("13407807929942597099574024998205846127479365820592393377723561443721764030073546976801874298166903427690031858186486050853753882811946569946433649006084096");
            const auto exp = uint8_vector::from_hex("C25F5840010000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000004100FF");
            test_same(v.to_bytes(), exp);
            test_same(v.to_bytes(true), exp);
            test_same(big_integer::from_bytes(exp), v);
        };
        "decode failures"_test = [] {
            // a definite bignum longer than 64 bytes
            uint8_vector long_bytes = uint8_vector::from_hex("C25841");
            long_bytes << uint8_vector(65);
            test_throws<decode_error>("BigInteger", [&] { big_integer::from_bytes(long_bytes); });
            test_throws<decode_error>("value out of range", [&] { big_integer::from_bytes(long_bytes); });
            test_throws<decode_error>("tag mismatch", [] { big_integer::from_bytes(uint8_vector::from_hex("C44101")); });
            test_throws<decode_error>("no variant matched", [] { big_integer::from_bytes(uint8_vector::from_hex("6161")); });
            test_throws<decode_error>("incomplete", [] { big_integer::from_bytes(uint8_vector::from_hex("C249010000")); });
            codec_config cfg {};
            cfg.max_big_int_bytes = 8;
            test_throws<decode_error>("at most 8", [&] { big_integer::from_bytes(uint8_vector::from_hex("C249010000000000000000"), cfg); });
            test_same(big_integer::from_bytes(uint8_vector::from_hex("C2480100000000000000"), cfg).as_u64(), std::optional<uint64_t> { 0x0100000000000000ULL });
        };
        "from_string"_test = [] {
            test_same(big_integer::from_string("0123"), big_integer { 123 });
            test_same(big_integer::from_string("-0"), big_integer { 0 });
            test_same(big_integer::from_string("-42").to_string(), std::string { "-42" });
            expect(throws<error>([] { big_integer::from_string("12a"); }));
            expect(throws<error>([] { big_integer::from_string("-"); }));
            expect(throws<error>([] { big_integer::from_string(""); }));
        };
        "order"_test = [] {
            expect(big_integer { -1 } < big_integer { 0 });
            expect(big_integer::from_string("18446744073709551616") > big_integer { std::numeric_limits<uint64_t>::max() });
        };
        "format"_test = [] {
            test_same(fmt::format("{}", big_integer::from_string("-18446744073709551616")), std::string { "-18446744073709551616" });
        };
    };
};
