/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CBOR_RAW_BYTES_HPP
#define LEDGER_CODEC_CBOR_RAW_BYTES_HPP

#include <lc/array.hpp>
#include <lc/cbor/container.hpp>

namespace ledger_codec::cbor {
    // A fixed-size byte string such as a key or script hash. The string form it was read with is kept.
    template<size_t SZ>
    struct raw_bytes: serializable<raw_bytes<SZ>> {
        byte_array<SZ> bytes {};
        string_form bytes_encoding {};

        static raw_bytes from_cbor(decoder &dec)
        {
            const auto start = dec.position();
            auto [data, form] = dec.bytes();
            if (data.size() != SZ) [[unlikely]]
                throw decode_error { failure::invalid_structure, start, fmt::format("expected a byte string of {} bytes but got {}", SZ, data.size()) };
            return raw_bytes { byte_array<SZ> { data }, std::move(form) };
        }

        raw_bytes() =default;

        raw_bytes(const byte_array<SZ> &b, string_form form={}):
            bytes { b }, bytes_encoding { std::move(form) }
        {
        }

        void to_cbor(encoder &enc, const bool force_canonical) const
        {
            enc.bytes(bytes, bytes_encoding, force_canonical);
        }

        bool operator==(const raw_bytes &o) const
        {
            return bytes == o.bytes;
        }
    };

    template<size_t SZ>
    using raw_bytes_set = set<raw_bytes<SZ>>;

    template<size_t SZ>
    using nonempty_raw_bytes_set = nonempty_set<raw_bytes<SZ>>;
}

namespace fmt {
    template<size_t SZ>
    struct formatter<ledger_codec::cbor::raw_bytes<SZ>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", v.bytes);
        }
    };
}

#endif // !LEDGER_CODEC_CBOR_RAW_BYTES_HPP
