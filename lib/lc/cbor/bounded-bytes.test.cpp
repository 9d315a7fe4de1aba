/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/common/test.hpp>
#include <lc/cbor/bounded-bytes.hpp>

namespace {
    using namespace ledger_codec;
    using namespace ledger_codec::cbor;

    uint8_vector write_bounded(const buffer bytes, const string_form &form, const bool force_canonical)
    {
        encoder enc {};
        bounded_bytes::write(enc, bytes, form, force_canonical);
        return std::move(enc.cbor());
    }

    uint8_vector with_prefix(const std::string_view prefix_hex, const buffer bytes)
    {
        auto res = uint8_vector::from_hex(prefix_hex);
        res << bytes;
        return res;
    }
}

suite cbor_bounded_bytes_suite = [] {
    "cbor::bounded_bytes"_test = [] {
        const uint8_vector b64(64);
        uint8_vector b65(65);
        b65[64] = 0xAB;
        "write"_test = [=] {
            test_same(write_bounded(b64, {}, false), with_prefix("5840", b64));
            // longer values are split into maximal 64-byte chunks
            auto exp65 = with_prefix("5F5840", b64);
            exp65 << uint8_vector::from_hex("41ABFF");
            test_same(write_bounded(b65, {}, false), exp65);
            test_same(write_bounded(b65, string_form::definite(int_width::one_byte), false), exp65);
            test_same(write_bounded(uint8_vector::from_hex("AABBCC"), string_form::definite(int_width::two_bytes), false),
                uint8_vector::from_hex("590003AABBCC"));
            const auto chunked = string_form::indefinite({ { 1, int_width::in_header }, { 64, int_width::one_byte } });
            auto exp_chunked = uint8_vector::from_hex("5F4100");
            exp_chunked << with_prefix("5840", static_cast<buffer>(b65).subbuf(1)) << uint8_vector::from_hex("FF");
            test_same(write_bounded(b65, chunked, false), exp_chunked);
            test_same(write_bounded(b65, chunked, true), exp65);
            // a recorded chunk longer than 64 bytes cannot be reused
            test_same(write_bounded(b65, string_form::indefinite({ { 65, int_width::one_byte } }), false), exp65);
            test_same(write_bounded(uint8_vector {}, {}, false), uint8_vector::from_hex("40"));
        };
        "read"_test = [=] {
            {
                const auto data = with_prefix("5840", b64);
                decoder dec { data };
                const auto [bytes, form] = bounded_bytes::read(dec);
                test_same(bytes, b64);
                test_same(form, string_form::definite(int_width::one_byte));
            }
            {
                const auto data = with_prefix("5841", b65);
                decoder dec { data };
                test_throws<decode_error>("definite bounded bytes have 65 bytes", [&] { bounded_bytes::read(dec); });
            }
            {
                auto data = with_prefix("5F5841", b65);
                data << uint8_vector::from_hex("FF");
                decoder dec { data };
                test_throws<decode_error>("chunk #0 of bounded bytes has 65 bytes", [&] { bounded_bytes::read(dec); });
            }
            {
                auto data = with_prefix("5F5840", b64);
                data << uint8_vector::from_hex("41ABFF");
                decoder dec { data };
                const auto [bytes, form] = bounded_bytes::read(dec);
                test_same(bytes, b65);
                test_same(write_bounded(bytes, form, false), data);
            }
        };
    };
};
