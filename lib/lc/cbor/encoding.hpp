/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CBOR_ENCODING_HPP
#define LEDGER_CODEC_CBOR_ENCODING_HPP

#include <cstdint>
#include <limits>
#include <optional>
#include <vector>
#include <lc/common/format.hpp>
#include <lc/cbor/types.hpp>

/*
 * Metadata describing how a CBOR item was laid out on the wire.
 * Decoders return it alongside each value so that encoders can reproduce the original bytes.
 */

namespace ledger_codec::cbor {
    // the size of the argument following the initial byte of a CBOR item
    enum class int_width: uint8_t {
        in_header, one_byte, two_bytes, four_bytes, eight_bytes
    };

    constexpr uint64_t width_max(const int_width w)
    {
        switch (w) {
            case int_width::in_header: return 23;
            case int_width::one_byte: return std::numeric_limits<uint8_t>::max();
            case int_width::two_bytes: return std::numeric_limits<uint16_t>::max();
            case int_width::four_bytes: return std::numeric_limits<uint32_t>::max();
            default: return std::numeric_limits<uint64_t>::max();
        }
    }

    constexpr size_t width_bytes(const int_width w)
    {
        switch (w) {
            case int_width::in_header: return 0;
            case int_width::one_byte: return 1;
            case int_width::two_bytes: return 2;
            case int_width::four_bytes: return 4;
            default: return 8;
        }
    }

    constexpr int_width canonical_width(const uint64_t val)
    {
        if (val < 24)
            return int_width::in_header;
        if (val <= std::numeric_limits<uint8_t>::max())
            return int_width::one_byte;
        if (val <= std::numeric_limits<uint16_t>::max())
            return int_width::two_bytes;
        if (val <= std::numeric_limits<uint32_t>::max())
            return int_width::four_bytes;
        return int_width::eight_bytes;
    }

    // Reuses the preferred width unless canonical output is requested or the width is too narrow for the value.
    constexpr int_width choose_width(const uint64_t val, const std::optional<int_width> preferred, const bool force_canonical)
    {
        if (!force_canonical && preferred && val <= width_max(*preferred))
            return *preferred;
        return canonical_width(val);
    }

    struct len_form {
        enum class kind: uint8_t { canonical, definite, indefinite };

        kind type = kind::canonical;
        int_width width = int_width::in_header;

        static len_form definite(const int_width w)
        {
            return { kind::definite, w };
        }

        static len_form indefinite()
        {
            return { kind::indefinite, int_width::in_header };
        }

        // std::nullopt means that the container must be written with an indefinite length
        std::optional<int_width> header_width(const uint64_t count, const bool force_canonical) const
        {
            if (force_canonical)
                return canonical_width(count);
            switch (type) {
                case kind::definite: return choose_width(count, width, false);
                case kind::indefinite: return {};
                default: return canonical_width(count);
            }
        }

        bool needs_break(const bool force_canonical) const
        {
            return !force_canonical && type == kind::indefinite;
        }

        bool operator==(const len_form &o) const =default;
    };

    struct string_chunk {
        uint64_t size = 0;
        int_width width = int_width::in_header;

        bool operator==(const string_chunk &o) const =default;
    };
    using string_chunk_list = std::vector<string_chunk>;

    struct string_form {
        enum class kind: uint8_t { canonical, definite, indefinite };

        kind type = kind::canonical;
        int_width width = int_width::in_header;
        string_chunk_list chunks {};

        static string_form definite(const int_width w)
        {
            return { kind::definite, w, {} };
        }

        static string_form indefinite(string_chunk_list chunks)
        {
            return { kind::indefinite, int_width::in_header, std::move(chunks) };
        }

        // the recorded chunking can be reused only if it partitions exactly total_size bytes
        bool chunks_fit(const uint64_t total_size) const
        {
            if (type != kind::indefinite)
                return false;
            uint64_t sum = 0;
            for (const auto &c: chunks) {
                if (c.size > width_max(c.width))
                    return false;
                sum += c.size;
            }
            return sum == total_size;
        }

        bool operator==(const string_form &o) const =default;
    };

    /*
     * A CBOR integer as it appears on the wire: for negative values raw = -1 - value.
     * The width is not a part of the value and is ignored in comparisons.
     */
    struct native_int {
        uint64_t raw = 0;
        bool negative = false;
        std::optional<int_width> width {};

        static native_int from_int64(const int64_t val, const std::optional<int_width> w={})
        {
            if (val >= 0)
                return { static_cast<uint64_t>(val), false, w };
            // -(val + 1) cannot overflow for any negative int64_t
            return { static_cast<uint64_t>(-(val + 1)), true, w };
        }

        std::optional<int64_t> as_int64() const
        {
            if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                return {};
            const auto v = static_cast<int64_t>(raw);
            return negative ? -v - 1 : v;
        }

        bool operator==(const native_int &o) const
        {
            return raw == o.raw && negative == o.negative;
        }
    };
}

namespace fmt {
    template<>
    struct formatter<ledger_codec::cbor::int_width>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ledger_codec::cbor::int_width;
            switch (v) {
                case int_width::in_header: return fmt::format_to(ctx.out(), "in_header");
                case int_width::one_byte: return fmt::format_to(ctx.out(), "one_byte");
                case int_width::two_bytes: return fmt::format_to(ctx.out(), "two_bytes");
                case int_width::four_bytes: return fmt::format_to(ctx.out(), "four_bytes");
                case int_width::eight_bytes: return fmt::format_to(ctx.out(), "eight_bytes");
                default: return fmt::format_to(ctx.out(), "int_width: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<ledger_codec::cbor::len_form>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ledger_codec::cbor::len_form;
            switch (v.type) {
                case len_form::kind::definite: return fmt::format_to(ctx.out(), "definite({})", v.width);
                case len_form::kind::indefinite: return fmt::format_to(ctx.out(), "indefinite");
                default: return fmt::format_to(ctx.out(), "canonical");
            }
        }
    };

    template<>
    struct formatter<ledger_codec::cbor::string_chunk>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "({}, {})", v.size, v.width);
        }
    };

    template<>
    struct formatter<ledger_codec::cbor::string_form>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ledger_codec::cbor::string_form;
            switch (v.type) {
                case string_form::kind::definite: return fmt::format_to(ctx.out(), "definite({})", v.width);
                case string_form::kind::indefinite: return fmt::format_to(ctx.out(), "indefinite({})", v.chunks);
                default: return fmt::format_to(ctx.out(), "canonical");
            }
        }
    };

    template<>
    struct formatter<ledger_codec::cbor::native_int>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v.negative)
                return fmt::format_to(ctx.out(), "-1-{}", v.raw);
            return fmt::format_to(ctx.out(), "{}", v.raw);
        }
    };
}

#endif // !LEDGER_CODEC_CBOR_ENCODING_HPP
