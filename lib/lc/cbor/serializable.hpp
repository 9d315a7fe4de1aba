/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CBOR_SERIALIZABLE_HPP
#define LEDGER_CODEC_CBOR_SERIALIZABLE_HPP

#include <concepts>
#include <lc/cbor/decoder.hpp>
#include <lc/cbor/encoder.hpp>

namespace ledger_codec::cbor {
    template<typename T>
    concept codec = requires(const T &v, encoder &enc, decoder &dec, bool force_canonical) {
        { T::from_cbor(dec) } -> std::same_as<T>;
        { v.to_cbor(enc, force_canonical) };
    };

    /*
     * The external contract of every ledger type: to_bytes writes the preserved encoding unless
     * force_canonical is set, from_bytes decodes exactly one complete item.
     */
    template<typename T>
    struct serializable {
        uint8_vector to_bytes(const bool force_canonical=false) const
        {
            encoder enc {};
            static_cast<const T &>(*this).to_cbor(enc, force_canonical);
            return std::move(enc.cbor());
        }

        static T from_bytes(const buffer data, const codec_config &cfg=codec_config::get())
        {
            decoder dec { data, cfg };
            auto val = T::from_cbor(dec);
            if (!dec.done()) [[unlikely]]
                throw dec.make_error(failure::invalid_structure, fmt::format("{} trailing bytes after the end of the item", dec.remaining()));
            return val;
        }

        bool operator==(const serializable &) const =default;
    };
}

#endif // !LEDGER_CODEC_CBOR_SERIALIZABLE_HPP
