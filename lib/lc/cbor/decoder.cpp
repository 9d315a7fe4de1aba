/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <utfcpp/utf8.h>
#include <lc/cbor/decoder.hpp>

namespace ledger_codec::cbor {
    decoder::decoder(const buffer data, const codec_config &cfg):
        _data { data }, _cfg { cfg }
    {
    }

    void decoder::seek(const size_t pos)
    {
        if (pos > _data.size()) [[unlikely]]
            throw ledger_codec::error(fmt::format("seek position {} is beyond the end of the {}-byte input", pos, _data.size()));
        _pos = pos;
    }

    major_type decoder::type() const
    {
        if (done()) [[unlikely]]
            throw make_error(failure::incomplete, "expected a CBOR item but reached the end of input");
        return static_cast<major_type>(_data[_pos] >> 5);
    }

    bool decoder::is_break() const
    {
        if (done()) [[unlikely]]
            throw make_error(failure::ending_break_missing, "reached the end of input while looking for a break marker");
        return _data[_pos] == break_byte;
    }

    uint_item decoder::uint()
    {
        const auto h = _expect(major_type::uint);
        return { h.arg, h.width };
    }

    uint_item decoder::nint()
    {
        const auto h = _expect(major_type::nint);
        return { h.arg, h.width };
    }

    native_int decoder::integer()
    {
        switch (const auto typ = type(); typ) {
            case major_type::uint: {
                const auto [val, width] = uint();
                return { val, false, width };
            }
            case major_type::nint: {
                const auto [val, width] = nint();
                return { val, true, width };
            }
            default:
                throw make_error(failure::unexpected_type, fmt::format("expected an integer but got {}", typ));
        }
    }

    uint_item decoder::tag()
    {
        const auto h = _expect(major_type::tag);
        return { h.arg, h.width };
    }

    container_header decoder::array()
    {
        return _container(major_type::array, 1);
    }

    container_header decoder::map()
    {
        return _container(major_type::map, 2);
    }

    std::pair<uint8_vector, string_form> decoder::bytes()
    {
        return _string(major_type::bytes);
    }

    std::pair<std::string, string_form> decoder::text()
    {
        const auto start = _pos;
        auto [bytes, form] = _string(major_type::text);
        std::string s { bytes.str() };
        if (const auto it = utf8::find_invalid(s.begin(), s.end()); it != s.end()) [[unlikely]]
            throw decode_error { failure::invalid_structure, start, "a text string is not valid UTF-8" };
        return { std::move(s), std::move(form) };
    }

    void decoder::s_break()
    {
        if (!is_break()) [[unlikely]]
            throw make_error(failure::ending_break_missing, fmt::format("expected a break marker but got byte 0x{:02X}", _data[_pos]));
        ++_pos;
    }

    decoder::nesting_guard::nesting_guard(decoder &dec): _dec { dec }
    {
        if (_dec._depth >= _dec._cfg.max_nesting_depth) [[unlikely]]
            throw _dec.make_error(failure::range_check, fmt::format("nesting depth exceeds the limit of {}", _dec._cfg.max_nesting_depth));
        ++_dec._depth;
    }

    decoder::nesting_guard::~nesting_guard()
    {
        --_dec._depth;
    }

    decoder::header decoder::_read_header()
    {
        const auto start = _pos;
        const auto hdr = _read_raw(1)[0];
        header h { static_cast<major_type>(hdr >> 5) };
        const uint8_t info = hdr & 0x1F;
        if (info < 24) {
            h.arg = info;
            return h;
        }
        switch (info) {
            case 24:
                h.width = int_width::one_byte;
                break;
            case 25:
                h.width = int_width::two_bytes;
                break;
            case 26:
                h.width = int_width::four_bytes;
                break;
            case 27:
                h.width = int_width::eight_bytes;
                break;
            case 31:
                h.indefinite = true;
                return h;
            default:
                throw decode_error { failure::invalid_structure, start, fmt::format("reserved additional information value {} in a {} item", info, h.type) };
        }
        for (const auto b: _read_raw(width_bytes(h.width)))
            h.arg = (h.arg << 8) | b;
        return h;
    }

    decoder::header decoder::_expect(const major_type typ)
    {
        const auto start = _pos;
        if (const auto actual = type(); actual != typ) [[unlikely]]
            throw make_error(failure::unexpected_type, fmt::format("expected {} but got {}", typ, actual));
        const auto h = _read_header();
        if (h.indefinite) {
            switch (typ) {
                case major_type::bytes:
                case major_type::text:
                case major_type::array:
                case major_type::map:
                    break;
                default:
                    throw decode_error { failure::invalid_structure, start, fmt::format("{} items cannot have an indefinite length", typ) };
            }
        }
        return h;
    }

    container_header decoder::_container(const major_type typ, const size_t min_item_size)
    {
        const auto start = _pos;
        const auto h = _expect(typ);
        if (h.indefinite)
            return { {}, h.width };
        if (h.arg > _cfg.max_collection_size) [[unlikely]]
            throw decode_error { failure::range_check, start, fmt::format("{} size {} exceeds the limit of {}", typ, h.arg, _cfg.max_collection_size) };
        // each item takes at least one byte, so a larger count cannot be satisfied by the remaining input
        if (h.arg > remaining() / min_item_size) [[unlikely]]
            throw decode_error { failure::range_check, start, fmt::format("declared {} size {} exceeds the {} remaining bytes", typ, h.arg, remaining()) };
        return { h.arg, h.width };
    }

    std::pair<uint8_vector, string_form> decoder::_string(const major_type typ)
    {
        const auto start = _pos;
        const auto h = _expect(typ);
        if (!h.indefinite) {
            if (h.arg > _cfg.max_string_size) [[unlikely]]
                throw decode_error { failure::range_check, start, fmt::format("{} string of {} bytes exceeds the limit of {}", typ, h.arg, _cfg.max_string_size) };
            return { uint8_vector { _read_raw(h.arg) }, string_form::definite(h.width) };
        }
        uint8_vector data {};
        string_chunk_list chunks {};
        for (;;) {
            if (is_break()) {
                ++_pos;
                break;
            }
            const auto chunk_start = _pos;
            const auto ch = _read_header();
            if (ch.type != typ || ch.indefinite) [[unlikely]]
                throw decode_error { failure::invalid_structure, chunk_start, fmt::format("chunks of an indefinite {} string must be definite {} strings", typ, typ) };
            if (chunks.size() >= _cfg.max_collection_size) [[unlikely]]
                throw decode_error { failure::range_check, chunk_start, fmt::format("an indefinite {} string has more than {} chunks", typ, _cfg.max_collection_size) };
            if (ch.arg > _cfg.max_string_size - data.size()) [[unlikely]]
                throw decode_error { failure::range_check, chunk_start, fmt::format("an indefinite {} string exceeds the limit of {} bytes", typ, _cfg.max_string_size) };
            data << _read_raw(ch.arg);
            chunks.emplace_back(string_chunk { ch.arg, ch.width });
        }
        return { std::move(data), string_form::indefinite(std::move(chunks)) };
    }

    buffer decoder::_read_raw(const size_t sz)
    {
        if (sz > remaining()) [[unlikely]]
            throw make_error(failure::incomplete, fmt::format("need {} bytes but only {} remain", sz, remaining()));
        const buffer res = _data.subbuf(_pos, sz);
        _pos += sz;
        return res;
    }
}
