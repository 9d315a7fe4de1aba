/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_BIG_INT_HPP
#define LEDGER_CODEC_BIG_INT_HPP

#include <compare>
#include <concepts>
#include <sstream>
#include <variant>
#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <boost/multiprecision/cpp_int.hpp>
#include <lc/common/format.hpp>
#include <lc/common/bytes.hpp>
#include <lc/cbor/serializable.hpp>

namespace ledger_codec {
    using boost::multiprecision::cpp_int;
    using boost::multiprecision::uint128_t;

    // big-endian bytes of a non-negative value without leading zeros; zero produces no bytes
    extern uint8_vector big_uint_to_bytes(const cpp_int &val);
    extern cpp_int big_uint_from_bytes(buffer data);

    /*
     * An arbitrary-precision integer that remembers how it was written:
     * as a native CBOR uint/nint of a given width or as a tag 2/3 bignum with a given byte string layout.
     * The origin is reused on re-encoding while it can still represent the value.
     */
    struct big_integer: cbor::serializable<big_integer> {
        struct int_origin {
            cbor::int_width width;
        };

        struct bytes_origin {
            cbor::string_form form {};
            // the byte length on the wire including any leading zero bytes
            size_t num_bytes = 0;
            cbor::int_width tag_width = cbor::int_width::in_header;
        };

        using origin_type = std::variant<std::monostate, int_origin, bytes_origin>;

        static big_integer from_int(const cbor::native_int &v);
        static big_integer from_string(std::string_view text);
        static big_integer from_cbor(cbor::decoder &dec);

        big_integer() =default;

        big_integer(cpp_int val):
            _val { std::move(val) }
        {
        }

        template<std::integral T>
        big_integer(const T val):
            _val { val }
        {
        }

        void to_cbor(cbor::encoder &enc, bool force_canonical) const;

        const cpp_int &value() const noexcept
        {
            return _val;
        }

        const origin_type &origin() const noexcept
        {
            return _origin;
        }

        // std::nullopt if negative or too large
        std::optional<uint64_t> as_u64() const;
        std::optional<uint128_t> as_u128() const;
        // std::nullopt if the value is outside of the range of native CBOR integers: [-2^64, 2^64 - 1]
        std::optional<cbor::native_int> as_int() const;
        std::string to_string() const;

        bool operator==(const big_integer &o) const
        {
            return _val == o._val;
        }

        std::strong_ordering operator<=>(const big_integer &o) const
        {
            return _val.compare(o._val) <=> 0;
        }
    private:
        cpp_int _val {};
        origin_type _origin {};

        big_integer(cpp_int val, origin_type origin):
            _val { std::move(val) }, _origin { std::move(origin) }
        {
        }

        bool _write_as_origin(cbor::encoder &enc) const;
        void _write_tagged(cbor::encoder &enc, const cbor::string_form &form, size_t min_bytes, std::optional<cbor::int_width> tag_width, bool force_canonical) const;
    };
}

namespace fmt {
    template<typename T>
    struct formatter<boost::multiprecision::number<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::ostringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };

    template<>
    struct formatter<ledger_codec::big_integer>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !LEDGER_CODEC_BIG_INT_HPP
