/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CBOR_CANONICAL_HPP
#define LEDGER_CODEC_CBOR_CANONICAL_HPP

#include <algorithm>
#include <vector>
#include <lc/cbor/encoder.hpp>

namespace ledger_codec::cbor {
    // CBOR canonical key order: shorter serialized keys first, then lexicographic by bytes
    inline bool canonical_less(const buffer a, const buffer b) noexcept
    {
        if (a.size() != b.size())
            return a.size() < b.size();
        return a < b;
    }

    struct encoded_key {
        uint8_vector bytes;
        size_t idx;
    };

    /*
     * Serializes the key of every map entry independently with write_key(encoder &, const entry &).
     * With force_canonical the entries are returned in the canonical key order, otherwise in their original order.
     * The caller writes the returned key bytes followed by the value of entries[idx].
     * Nested maps must call this function for themselves.
     */
    template<typename R, typename F>
    std::vector<encoded_key> key_order(const R &entries, const F &write_key, const bool force_canonical)
    {
        std::vector<encoded_key> order {};
        order.reserve(std::size(entries));
        size_t idx = 0;
        for (const auto &entry: entries) {
            encoder enc {};
            write_key(enc, entry);
            order.emplace_back(encoded_key { std::move(enc.cbor()), idx++ });
        }
        if (force_canonical) {
            std::stable_sort(order.begin(), order.end(), [](const auto &a, const auto &b) {
                return canonical_less(a.bytes, b.bytes);
            });
        }
        return order;
    }
}

#endif // !LEDGER_CODEC_CBOR_CANONICAL_HPP
