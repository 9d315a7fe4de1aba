/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CBOR_DECODER_HPP
#define LEDGER_CODEC_CBOR_DECODER_HPP

#include <optional>
#include <string>
#include <utility>
#include <lc/common/bytes.hpp>
#include <lc/cbor/encoding.hpp>
#include <lc/cbor/error.hpp>
#include <lc/cbor/types.hpp>
#include <lc/config.hpp>

/*
 * A pull decoder over an in-memory buffer. Every read reports the encoding it observed
 * and the read position can be saved and restored to try alternative interpretations of the same bytes.
 */

namespace ledger_codec::cbor {
    struct uint_item {
        uint64_t val = 0;
        int_width width = int_width::in_header;
    };

    struct container_header {
        // std::nullopt for indefinite-length containers
        std::optional<uint64_t> size {};
        int_width width = int_width::in_header;

        len_form form() const
        {
            return size ? len_form::definite(width) : len_form::indefinite();
        }
    };

    struct decoder {
        explicit decoder(buffer data, const codec_config &cfg=codec_config::get());

        size_t position() const noexcept
        {
            return _pos;
        }

        void seek(size_t pos);

        bool done() const noexcept
        {
            return _pos >= _data.size();
        }

        size_t remaining() const noexcept
        {
            return _data.size() - _pos;
        }

        const codec_config &config() const noexcept
        {
            return _cfg;
        }

        // the type of the next item without consuming it
        major_type type() const;
        // true if the next byte is a break marker
        bool is_break() const;

        uint_item uint();
        // returns the raw representation: the value is -1 - raw
        uint_item nint();
        native_int integer();
        uint_item tag();
        container_header array();
        container_header map();
        std::pair<uint8_vector, string_form> bytes();
        std::pair<std::string, string_form> text();
        void s_break();

        decode_error make_error(failure kind, std::string_view detail) const
        {
            return decode_error { kind, _pos, detail };
        }

        // limits the recursion depth of self-similar structures
        struct nesting_guard {
            explicit nesting_guard(decoder &dec);
            ~nesting_guard();
            nesting_guard(const nesting_guard &) =delete;
            nesting_guard &operator=(const nesting_guard &) =delete;
        private:
            decoder &_dec;
        };
    private:
        struct header {
            major_type type;
            uint64_t arg = 0;
            int_width width = int_width::in_header;
            bool indefinite = false;
        };

        buffer _data;
        codec_config _cfg;
        size_t _pos = 0;
        size_t _depth = 0;

        header _read_header();
        header _expect(major_type typ);
        container_header _container(major_type typ, size_t min_item_size);
        std::pair<uint8_vector, string_form> _string(major_type typ);
        buffer _read_raw(size_t sz);
    };
}

#endif // !LEDGER_CODEC_CBOR_DECODER_HPP
