/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CBOR_ENCODER_HPP
#define LEDGER_CODEC_CBOR_ENCODER_HPP

#include <lc/common/bytes.hpp>
#include <lc/cbor/encoding.hpp>
#include <lc/cbor/types.hpp>

namespace ledger_codec::cbor {
    struct encoder {
        encoder &array()
        {
            _encode_item(major_type::array, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &array(const size_t sz)
        {
            _encode_uint_item(major_type::array, sz, canonical_width(sz));
            return *this;
        }

        encoder &array(const len_form &form, const size_t sz, const bool force_canonical)
        {
            _encode_len(major_type::array, form, sz, force_canonical);
            return *this;
        }

        encoder &map()
        {
            _encode_item(major_type::map, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &map(const size_t sz)
        {
            _encode_uint_item(major_type::map, sz, canonical_width(sz));
            return *this;
        }

        encoder &map(const len_form &form, const size_t sz, const bool force_canonical)
        {
            _encode_len(major_type::map, form, sz, force_canonical);
            return *this;
        }

        // closes a container opened with the same length form
        encoder &end(const len_form &form, const bool force_canonical)
        {
            if (form.needs_break(force_canonical))
                s_break();
            return *this;
        }

        encoder &uint(const uint64_t val)
        {
            _encode_uint_item(major_type::uint, val, canonical_width(val));
            return *this;
        }

        encoder &uint(const uint64_t val, const std::optional<int_width> width, const bool force_canonical)
        {
            _encode_uint_item(major_type::uint, val, choose_width(val, width, force_canonical));
            return *this;
        }

        // the negative value must be already converted to the uint64_t representation
        encoder &nint(const uint64_t val)
        {
            _encode_uint_item(major_type::nint, val, canonical_width(val));
            return *this;
        }

        encoder &nint(const uint64_t val, const std::optional<int_width> width, const bool force_canonical)
        {
            _encode_uint_item(major_type::nint, val, choose_width(val, width, force_canonical));
            return *this;
        }

        encoder &integer(const native_int &val, const bool force_canonical)
        {
            _encode_uint_item(val.negative ? major_type::nint : major_type::uint, val.raw, choose_width(val.raw, val.width, force_canonical));
            return *this;
        }

        encoder &integer(const int64_t val, const std::optional<int_width> width, const bool force_canonical)
        {
            return integer(native_int::from_int64(val, width), force_canonical);
        }

        encoder &tag(const uint64_t id)
        {
            _encode_uint_item(major_type::tag, id, canonical_width(id));
            return *this;
        }

        encoder &tag(const uint64_t id, const std::optional<int_width> width, const bool force_canonical)
        {
            _encode_uint_item(major_type::tag, id, choose_width(id, width, force_canonical));
            return *this;
        }

        encoder &bytes()
        {
            _encode_item(major_type::bytes, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &bytes(const buffer buf)
        {
            _encode_uint_item(major_type::bytes, buf.size(), canonical_width(buf.size()));
            _encode_data(buf);
            return *this;
        }

        // writes a definite byte string whose length uses exactly the given width
        encoder &bytes(const buffer buf, const int_width width)
        {
            _encode_uint_item(major_type::bytes, buf.size(), width);
            _encode_data(buf);
            return *this;
        }

        encoder &bytes(const buffer buf, const string_form &form, const bool force_canonical)
        {
            _encode_string(major_type::bytes, buf, form, force_canonical);
            return *this;
        }

        encoder &text(const std::string_view sv)
        {
            _encode_uint_item(major_type::text, sv.size(), canonical_width(sv.size()));
            _encode_data(sv);
            return *this;
        }

        encoder &text(const std::string_view sv, const string_form &form, const bool force_canonical)
        {
            _encode_string(major_type::text, sv, form, force_canonical);
            return *this;
        }

        encoder &raw_cbor(const buffer buf)
        {
            _encode_data(buf);
            return *this;
        }

        encoder &s_break()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        [[nodiscard]] uint8_vector &cbor()
        {
            return _buf;
        }

        [[nodiscard]] const uint8_vector &cbor() const
        {
            return _buf;
        }
    private:
        uint8_vector _buf {};

        void _encode_data(const buffer buf)
        {
            _buf << buf;
        }

        void _encode_len(major_type typ, const len_form &form, size_t sz, bool force_canonical);
        void _encode_string(major_type typ, buffer buf, const string_form &form, bool force_canonical);
        void _encode_uint_item(major_type typ, uint64_t val, int_width width);

        void _encode_item(const major_type typ, const uint8_t special)
        {
            _buf.emplace_back((static_cast<uint8_t>(typ) << 5) | (special & 0x1F));
        }
    };

    inline encoder &operator<<(encoder &dst, const encoder &src)
    {
        dst.cbor() << src.cbor();
        return dst;
    }
}

#endif // !LEDGER_CODEC_CBOR_ENCODER_HPP
