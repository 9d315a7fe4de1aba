/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <lc/big-int.hpp>
#include <lc/cbor/bounded-bytes.hpp>
#include <lc/logger.hpp>

namespace ledger_codec {
    static constexpr uint64_t tag_pos_bignum = 2;
    static constexpr uint64_t tag_neg_bignum = 3;

    uint8_vector big_uint_to_bytes(const cpp_int &val)
    {
        if (val < 0) [[unlikely]]
            throw error(fmt::format("a negative value cannot be converted to magnitude bytes: {}", val));
        uint8_vector res {};
        auto val_copy = val;
        while (val_copy) {
            res.emplace_back(val_copy & 0xFF);
            val_copy >>= 8;
        }
        std::reverse(res.begin(), res.end());
        return res;
    }

    cpp_int big_uint_from_bytes(const buffer data)
    {
        cpp_int val = 0;
        for (const uint8_t b: data) {
            val <<= 8;
            val += b;
        }
        return val;
    }

    static cpp_int from_native(const cbor::native_int &v)
    {
        cpp_int res { v.raw };
        if (v.negative)
            res = -res - 1;
        return res;
    }

    // the bignum tag and the magnitude bytes, left-padded with zeros to min_bytes
    static std::pair<uint64_t, uint8_vector> bignum_parts(const cpp_int &val, const size_t min_bytes)
    {
        const bool neg = val < 0;
        auto mag = big_uint_to_bytes(neg ? cpp_int { -val - 1 } : val);
        if (mag.size() < min_bytes) {
            uint8_vector padded(min_bytes - mag.size());
            padded << mag;
            mag = std::move(padded);
        }
        return { neg ? tag_neg_bignum : tag_pos_bignum, std::move(mag) };
    }

    static bool bounded_form_fits(const cbor::string_form &form, const size_t num_bytes)
    {
        using cbor::string_form;
        using cbor::bounded_bytes::max_chunk_size;
        switch (form.type) {
            case string_form::kind::definite:
                return num_bytes <= max_chunk_size;
            case string_form::kind::indefinite:
                if (!form.chunks_fit(num_bytes))
                    return false;
                for (const auto &c: form.chunks) {
                    if (c.size > max_chunk_size)
                        return false;
                }
                return true;
            default:
                return true;
        }
    }

    big_integer big_integer::from_int(const cbor::native_int &v)
    {
        if (v.width)
            return { from_native(v), int_origin { *v.width } };
        return { from_native(v) };
    }

    big_integer big_integer::from_string(const std::string_view text)
    {
        const auto digits = !text.empty() && text.front() == '-' ? text.substr(1) : text;
        if (digits.empty()) [[unlikely]]
            throw error(fmt::format("an empty string is not a valid integer: '{}'", text));
        for (const auto c: digits) {
            if (c < '0' || c > '9') [[unlikely]]
                throw error(fmt::format("unexpected character '{}' in a decimal integer: '{}'", c, text));
        }
        // cpp_int parses a leading zero as an octal prefix
        const auto first_nz = digits.find_first_not_of('0');
        if (first_nz == std::string_view::npos)
            return { cpp_int { 0 } };
        std::string norm {};
        if (digits.size() != text.size())
            norm += '-';
        norm += digits.substr(first_nz);
        return { cpp_int { norm.c_str() } };
    }

    big_integer big_integer::from_cbor(cbor::decoder &dec)
    {
        using namespace cbor;
        return annotate("BigInteger", [&]() -> big_integer {
            const auto start = dec.position();
            switch (const auto typ = dec.type(); typ) {
                case major_type::uint:
                case major_type::nint: {
                    const auto v = dec.integer();
                    return { from_native(v), int_origin { v.width.value_or(canonical_width(v.raw)) } };
                }
                case major_type::tag: {
                    const auto tag = dec.tag();
                    if (tag.val != tag_pos_bignum && tag.val != tag_neg_bignum) [[unlikely]]
                        throw decode_error { failure::tag_mismatch, start, fmt::format("found tag {} but expected a bignum tag 2 or 3", tag.val) };
                    auto [bytes, form] = bounded_bytes::read(dec);
                    if (bytes.size() > dec.config().max_big_int_bytes) [[unlikely]]
                        throw decode_error { failure::range_check, start,
                            fmt::format("a bignum has {} bytes but at most {} are allowed", bytes.size(), dec.config().max_big_int_bytes) };
                    auto val = big_uint_from_bytes(bytes);
                    if (tag.val == tag_neg_bignum)
                        val = -val - 1;
                    return { std::move(val), bytes_origin { std::move(form), bytes.size(), tag.width } };
                }
                default:
                    throw decode_error { failure::no_variant_matched, start, fmt::format("expected an integer or a bignum but got {}", typ) };
            }
        });
    }

    void big_integer::to_cbor(cbor::encoder &enc, const bool force_canonical) const
    {
        if (!force_canonical && _write_as_origin(enc))
            return;
        if (const auto ni = as_int(); ni) {
            enc.integer(*ni, true);
            return;
        }
        _write_tagged(enc, cbor::string_form {}, 0, {}, true);
    }

    bool big_integer::_write_as_origin(cbor::encoder &enc) const
    {
        if (const auto *io = std::get_if<int_origin>(&_origin); io) {
            if (auto ni = as_int(); ni) {
                ni->width = io->width;
                enc.integer(*ni, false);
                return true;
            }
            logger::debug("big integer {} no longer fits into a native CBOR integer", _val);
        } else if (const auto *bo = std::get_if<bytes_origin>(&_origin); bo) {
            const auto [tag, mag] = bignum_parts(_val, bo->num_bytes);
            if (bounded_form_fits(bo->form, mag.size())) {
                _write_tagged(enc, bo->form, bo->num_bytes, bo->tag_width, false);
                return true;
            }
            logger::debug("the recorded form {} of big integer {} cannot hold its {} bytes", bo->form, _val, mag.size());
        }
        return false;
    }

    void big_integer::_write_tagged(cbor::encoder &enc, const cbor::string_form &form, const size_t min_bytes,
        const std::optional<cbor::int_width> tag_width, const bool force_canonical) const
    {
        const auto [tag, mag] = bignum_parts(_val, min_bytes);
        enc.tag(tag, tag_width, force_canonical);
        cbor::bounded_bytes::write(enc, mag, form, force_canonical);
    }

    std::optional<uint64_t> big_integer::as_u64() const
    {
        if (_val < 0 || _val > std::numeric_limits<uint64_t>::max())
            return {};
        return static_cast<uint64_t>(_val);
    }

    std::optional<uint128_t> big_integer::as_u128() const
    {
        if (_val < 0 || (_val != 0 && msb(_val) >= 128))
            return {};
        return _val.convert_to<uint128_t>();
    }

    std::optional<cbor::native_int> big_integer::as_int() const
    {
        std::optional<cbor::int_width> width {};
        if (const auto *io = std::get_if<int_origin>(&_origin); io)
            width = io->width;
        if (_val >= 0) {
            if (_val > std::numeric_limits<uint64_t>::max())
                return {};
            return cbor::native_int { static_cast<uint64_t>(_val), false, width };
        }
        // -(2^64) is the smallest native value: its raw form is u64::max
        const cpp_int raw = -_val - 1;
        if (raw > std::numeric_limits<uint64_t>::max())
            return {};
        return cbor::native_int { static_cast<uint64_t>(raw), true, width };
    }

    std::string big_integer::to_string() const
    {
        return _val.str();
    }
}
