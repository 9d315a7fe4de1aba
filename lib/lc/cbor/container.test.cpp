/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/common/test.hpp>
#include <lc/big-int.hpp>
#include <lc/cbor/canonical.hpp>
#include <lc/cbor/container.hpp>

namespace {
    using namespace ledger_codec;
    using namespace ledger_codec::cbor;

    enum class light { red, yellow, green };

    static constexpr std::array<fixed_uint_candidate<light>, 3> light_candidates {{
        { light::red, 0 },
        { light::yellow, 1 },
        { light::green, 2 }
    }};
}

suite cbor_container_suite = [] {
    "cbor::container"_test = [] {
        "set"_test = [] {
            const auto tagged_bytes = uint8_vector::from_hex("D90102820102");
            const auto bare_bytes = uint8_vector::from_hex("820102");
            const auto tagged = set<big_integer>::from_bytes(tagged_bytes);
            const auto bare = set<big_integer>::from_bytes(bare_bytes);
            expect(tagged.tagged());
            expect(!bare.tagged());
            expect(tagged == bare);
            test_same(tagged.size(), size_t { 2 });
            test_same(tagged[1], big_integer { 2 });
            test_same(tagged.to_bytes(), tagged_bytes);
            test_same(tagged.to_bytes(true), tagged_bytes);
            test_same(bare.to_bytes(), bare_bytes);
            test_same(bare.to_bytes(true), bare_bytes);
        };
        "set length form"_test = [] {
            const auto bytes = uint8_vector::from_hex("9F0102FF");
            const auto s = set<big_integer>::from_bytes(bytes);
            test_same(s.len_encoding, len_form::indefinite());
            test_same(s.to_bytes(), bytes);
            test_same(s.to_bytes(true), uint8_vector::from_hex("820102"));
        };
        "constructed set"_test = [] {
            set<big_integer> s { big_integer { 1 }, big_integer { 2 } };
            test_same(s.to_bytes(), uint8_vector::from_hex("820102"));
            s.tag_encoding = int_width::two_bytes;
            test_same(s.to_bytes(), uint8_vector::from_hex("D90102820102"));
        };
        "set failures"_test = [] {
            test_throws<decode_error>("decoding failed in Set at offset 0 because: tag mismatch", [] { set<big_integer>::from_bytes(uint8_vector::from_hex("D90103820102")); });
            test_throws<decode_error>("Set.1.BigInteger", [] { set<big_integer>::from_bytes(uint8_vector::from_hex("820160")); });
            test_throws<decode_error>("NonemptySet", [] { nonempty_set<big_integer>::from_bytes(uint8_vector::from_hex("80")); });
            test_throws<decode_error>("value out of range", [] { nonempty_set<big_integer>::from_bytes(uint8_vector::from_hex("D9010280")); });
            test_throws<decode_error>("ending break missing", [] { set<big_integer>::from_bytes(uint8_vector::from_hex("9F01")); });
            test_throws<decode_error>("trailing bytes", [] { set<big_integer>::from_bytes(uint8_vector::from_hex("82010200")); });
            expect(throws<error>([] { nonempty_set<big_integer> {}.to_bytes(); }));
            test_same(nonempty_set<big_integer>::from_bytes(uint8_vector::from_hex("8101")).to_bytes(), uint8_vector::from_hex("8101"));
        };
        "read_fixed_uint"_test = [] {
            {
                const auto data = uint8_vector::from_hex("01");
                decoder dec { data };
                const auto [v, w] = read_fixed_uint(dec, light_candidates);
                expect(v == light::yellow);
                test_same(w, int_width::in_header);
                expect(dec.done());
            }
            {
                const auto data = uint8_vector::from_hex("1802");
                decoder dec { data };
                const auto [v, w] = read_fixed_uint(dec, light_candidates);
                expect(v == light::green);
                test_same(w, int_width::one_byte);
            }
            for (const auto hex: { "03", "60", "" }) {
                const auto data = uint8_vector::from_hex(hex);
                decoder dec { data };
                test_throws<decode_error>("no variant matched", [&] { read_fixed_uint(dec, light_candidates); });
                test_same(dec.position(), size_t { 0 });
            }
        };
        "record_reader"_test = [] {
            {
                const auto data = uint8_vector::from_hex("9F0102FF");
                decoder dec { data };
                record_reader rec { dec, 2 };
                dec.uint();
                dec.uint();
                rec.finish();
                test_same(rec.form(), len_form::indefinite());
                expect(dec.done());
            }
            {
                const auto data = uint8_vector::from_hex("9F010203FF");
                decoder dec { data };
                record_reader rec { dec, 2 };
                dec.uint();
                dec.uint();
                test_throws<decode_error>("ending break missing", [&] { rec.finish(); });
            }
            {
                const auto data = uint8_vector::from_hex("83010203");
                decoder dec { data };
                test_throws<decode_error>("definite length mismatch", [&] { record_reader rec { dec, 2 }; });
            }
        };
        "read_items"_test = [] {
            const auto data = uint8_vector::from_hex("9F010203FF");
            decoder dec { data };
            std::vector<uint64_t> items {};
            const auto num_read = read_items(dec, dec.array(), [&](size_t) { items.emplace_back(dec.uint().val); });
            test_same(num_read, size_t { 3 });
            test_same(items, std::vector<uint64_t> { 1, 2, 3 });
            expect(dec.done());
        };
        "ordered_map"_test = [] {
            ordered_map<uint64_t, std::string> m {};
            expect(m.insert(5, "five"));
            expect(m.insert(1, "one"));
            expect(!m.insert(5, "cinq"));
            test_same(m.size(), size_t { 2 });
            test_same(m[0].first, uint64_t { 5 });
            test_same(m.at(5), std::string { "five" });
            expect(m.find(7) == nullptr);
            expect(throws<error>([&] { m.at(7); }));
            expect(throws<error>([] { ordered_map<uint64_t, uint64_t> { { 1, 1 }, { 1, 2 } }; }));
        };
        "ordered_map updates"_test = [] {
            ordered_map<uint64_t, std::string> m { { 3, "three" }, { 5, "five" }, { 1, "one" } };
            m.at(5) = "FIVE";
            *m.find(1) += "!";
            m.value(0) = "THREE";
            test_same(m.at(5), std::string { "FIVE" });
            test_same(m.at(1), std::string { "one!" });
            test_same(m.at(3), std::string { "THREE" });
            expect(m.erase(3));
            expect(!m.erase(3));
            test_same(m.size(), size_t { 2 });
            test_same(m[0].first, uint64_t { 5 });
            test_same(m[1].first, uint64_t { 1 });
            test_same(m.at(1), std::string { "one!" });
            expect(m.find(3) == nullptr);
            expect(m.insert(3, "again"));
            test_same(m[2].first, uint64_t { 3 });
            m.for_each_value([](const uint64_t k, std::string &v) { v = fmt::format("{}:{}", k, v); });
            test_same(m.at(5), std::string { "5:FIVE" });
            test_same(m.at(3), std::string { "3:again" });
        };
        "key_order"_test = [] {
            const std::vector<uint64_t> keys { 256, 1, 24, 10 };
            const auto write_key = [](encoder &enc, const uint64_t k) { enc.uint(k); };
            std::vector<size_t> canon {};
            for (const auto &k: key_order(keys, write_key, true))
                canon.emplace_back(k.idx);
            test_same(canon, std::vector<size_t> { 1, 3, 2, 0 });
            std::vector<size_t> orig {};
            for (const auto &k: key_order(keys, write_key, false))
                orig.emplace_back(k.idx);
            test_same(orig, std::vector<size_t> { 0, 1, 2, 3 });
        };
        "canonical order is length first"_test = [] {
            const std::vector<std::string> keys { "aa", "b" };
            const auto order = key_order(keys, [](encoder &enc, const std::string &k) { enc.text(k); }, true);
            test_same(order.at(0).idx, size_t { 1 });
            expect(canonical_less(uint8_vector::from_hex("FF"), uint8_vector::from_hex("0000")));
            expect(!canonical_less(uint8_vector::from_hex("02"), uint8_vector::from_hex("01")));
        };
    };
};
