/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CBOR_ERROR_HPP
#define LEDGER_CODEC_CBOR_ERROR_HPP

#include <string>
#include <string_view>
#include <lc/common/error.hpp>
#include <lc/common/format.hpp>

namespace ledger_codec::cbor {
    enum class failure: uint8_t {
        range_check,
        tag_mismatch,
        fixed_value_mismatch,
        no_variant_matched,
        duplicate_key,
        ending_break_missing,
        invalid_structure,
        definite_len_mismatch,
        unexpected_type,
        incomplete
    };

    /*
     * A decoding failure. Each enclosing decode step prepends its own name with annotate(),
     * so that the location reads as a dotted path from the outermost type down to the failed field.
     */
    struct decode_error: error {
        decode_error(failure kind, size_t offset, std::string_view detail);

        decode_error &annotate(std::string_view name);

        failure kind() const noexcept
        {
            return _kind;
        }

        size_t offset() const noexcept
        {
            return _offset;
        }

        const std::string &location() const noexcept
        {
            return _location;
        }

        const std::string &detail() const noexcept
        {
            return _detail;
        }
    private:
        failure _kind;
        size_t _offset;
        std::string _detail;
        std::string _location {};

        std::string _make_message() const;
    };

    // Runs the decode step and prefixes the location of any decode_error escaping from it with the given name.
    template<typename F>
    auto annotate(const std::string_view name, const F &step) -> decltype(step())
    {
        try {
            return step();
        } catch (decode_error &ex) {
            ex.annotate(name);
            throw;
        }
    }
}

namespace fmt {
    template<>
    struct formatter<ledger_codec::cbor::failure>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ledger_codec::cbor::failure;
            switch (v) {
                case failure::range_check: return fmt::format_to(ctx.out(), "value out of range");
                case failure::tag_mismatch: return fmt::format_to(ctx.out(), "tag mismatch");
                case failure::fixed_value_mismatch: return fmt::format_to(ctx.out(), "fixed value mismatch");
                case failure::no_variant_matched: return fmt::format_to(ctx.out(), "no variant matched");
                case failure::duplicate_key: return fmt::format_to(ctx.out(), "duplicate key");
                case failure::ending_break_missing: return fmt::format_to(ctx.out(), "ending break missing");
                case failure::invalid_structure: return fmt::format_to(ctx.out(), "invalid structure");
                case failure::definite_len_mismatch: return fmt::format_to(ctx.out(), "definite length mismatch");
                case failure::unexpected_type: return fmt::format_to(ctx.out(), "unexpected type");
                case failure::incomplete: return fmt::format_to(ctx.out(), "incomplete data");
                default: return fmt::format_to(ctx.out(), "failure: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !LEDGER_CODEC_CBOR_ERROR_HPP
