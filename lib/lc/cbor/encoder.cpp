/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cbor/encoder.hpp>
#include <lc/logger.hpp>

namespace ledger_codec::cbor {
    void encoder::_encode_len(const major_type typ, const len_form &form, const size_t sz, const bool force_canonical)
    {
        if (const auto width = form.header_width(sz, force_canonical); width)
            _encode_uint_item(typ, sz, *width);
        else
            _encode_item(typ, static_cast<uint8_t>(special_val::s_break));
    }

    void encoder::_encode_string(const major_type typ, const buffer buf, const string_form &form, const bool force_canonical)
    {
        if (!force_canonical) {
            switch (form.type) {
                case string_form::kind::definite:
                    _encode_uint_item(typ, buf.size(), choose_width(buf.size(), form.width, false));
                    _encode_data(buf);
                    return;
                case string_form::kind::indefinite:
                    if (form.chunks_fit(buf.size())) {
                        _encode_item(typ, static_cast<uint8_t>(special_val::s_break));
                        size_t start = 0;
                        for (const auto &chunk: form.chunks) {
                            _encode_uint_item(typ, chunk.size, chunk.width);
                            _encode_data(buf.subbuf(start, chunk.size));
                            start += chunk.size;
                        }
                        s_break();
                        return;
                    }
                    logger::debug("the recorded chunking {} does not match a {} string of {} bytes; writing it canonically", form, typ, buf.size());
                    break;
                default:
                    break;
            }
        }
        _encode_uint_item(typ, buf.size(), canonical_width(buf.size()));
        _encode_data(buf);
    }

    void encoder::_encode_uint_item(const major_type typ, const uint64_t val, const int_width width)
    {
        if (val > width_max(width)) [[unlikely]]
            throw error(fmt::format("value {} of a CBOR {} item cannot be written with width {}", val, typ, width));
        switch (width) {
            case int_width::in_header:
                _encode_item(typ, static_cast<uint8_t>(val));
                break;
            case int_width::one_byte:
                _encode_item(typ, static_cast<uint8_t>(special_val::one_byte));
                _buf.emplace_back(static_cast<uint8_t>(val));
                break;
            case int_width::two_bytes:
                _encode_item(typ, static_cast<uint8_t>(special_val::two_bytes));
                _encode_data(buffer::from(host_to_net<uint16_t>(static_cast<uint16_t>(val))));
                break;
            case int_width::four_bytes:
                _encode_item(typ, static_cast<uint8_t>(special_val::four_bytes));
                _encode_data(buffer::from(host_to_net<uint32_t>(static_cast<uint32_t>(val))));
                break;
            case int_width::eight_bytes:
                _encode_item(typ, static_cast<uint8_t>(special_val::eight_bytes));
                _encode_data(buffer::from(host_to_net<uint64_t>(val)));
                break;
            default:
                throw error(fmt::format("unsupported integer width: {}", static_cast<int>(width)));
        }
    }
}
