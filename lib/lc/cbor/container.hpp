/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CBOR_CONTAINER_HPP
#define LEDGER_CODEC_CBOR_CONTAINER_HPP

#include <array>
#include <initializer_list>
#include <map>
#include <utility>
#include <vector>
#include <lc/cbor/serializable.hpp>
#include <lc/logger.hpp>

namespace ledger_codec::cbor {
    /*
     * Calls read_item(idx) for every item of an array or a map whose header has already been read.
     * Definite containers end after the declared number of items, indefinite ones at a break marker,
     * which is consumed. Returns the number of items read.
     */
    template<typename F>
    size_t read_items(decoder &dec, const container_header &hdr, const F &read_item)
    {
        size_t num_read = 0;
        for (;;) {
            if (hdr.size) {
                if (num_read >= *hdr.size)
                    break;
            } else if (dec.is_break()) {
                dec.s_break();
                break;
            }
            if (num_read >= dec.config().max_collection_size) [[unlikely]]
                throw dec.make_error(failure::range_check, fmt::format("an indefinite container has more than {} items", dec.config().max_collection_size));
            read_item(num_read);
            ++num_read;
        }
        return num_read;
    }

    // An array with a fixed number of fields, such as [mem, steps].
    struct record_reader {
        record_reader(decoder &dec, const size_t num_fields):
            _dec { dec }, _start { dec.position() }, _hdr { dec.array() }
        {
            if (_hdr.size && *_hdr.size != num_fields) [[unlikely]]
                throw decode_error { failure::definite_len_mismatch, _start, fmt::format("expected an array of {} items but got {}", num_fields, *_hdr.size) };
        }

        len_form form() const
        {
            return _hdr.form();
        }

        void finish()
        {
            if (!_hdr.size) {
                if (!_dec.is_break()) [[unlikely]]
                    throw _dec.make_error(failure::ending_break_missing, "an indefinite record has more fields than expected");
                _dec.s_break();
            }
        }
    private:
        decoder &_dec;
        size_t _start;
        container_header _hdr;
    };

    // Keeps the insertion order of entries and rejects duplicate keys.
    template<typename K, typename V>
    struct ordered_map {
        using value_type = std::pair<K, V>;
        using storage_type = std::vector<value_type>;
        using const_iterator = typename storage_type::const_iterator;

        ordered_map() =default;

        ordered_map(std::initializer_list<value_type> items)
        {
            for (const auto &[k, v]: items) {
                if (!insert(k, v)) [[unlikely]]
                    throw error(fmt::format("duplicate key in the map initializer list"));
            }
        }

        // returns false and keeps the map unchanged if the key is already present
        bool insert(K k, V v)
        {
            if (_index.contains(k))
                return false;
            _index.emplace(k, _items.size());
            _items.emplace_back(std::move(k), std::move(v));
            return true;
        }

        // returns false if the key is not present; the remaining entries keep their order
        bool erase(const K &k)
        {
            const auto it = _index.find(k);
            if (it == _index.end())
                return false;
            const auto idx = it->second;
            _index.erase(it);
            _items.erase(_items.begin() + idx);
            for (auto &[ik, pos]: _index) {
                if (pos > idx)
                    --pos;
            }
            return true;
        }

        const V *find(const K &k) const
        {
            if (const auto it = _index.find(k); it != _index.end())
                return &_items[it->second].second;
            return nullptr;
        }

        // keys stay immutable, only the values can be updated in place
        V *find(const K &k)
        {
            if (const auto it = _index.find(k); it != _index.end())
                return &_items[it->second].second;
            return nullptr;
        }

        const V &at(const K &k) const
        {
            if (const auto *v = find(k); v)
                return *v;
            throw error(fmt::format("an unknown map key"));
        }

        V &at(const K &k)
        {
            if (auto *v = find(k); v)
                return *v;
            throw error(fmt::format("an unknown map key"));
        }

        V &value(const size_t idx)
        {
            return _items.at(idx).second;
        }

        template<typename F>
        void for_each_value(const F &update)
        {
            for (auto &[k, v]: _items)
                update(static_cast<const K &>(k), v);
        }

        size_t size() const noexcept
        {
            return _items.size();
        }

        bool empty() const noexcept
        {
            return _items.empty();
        }

        const_iterator begin() const noexcept
        {
            return _items.begin();
        }

        const_iterator end() const noexcept
        {
            return _items.end();
        }

        const value_type &operator[](const size_t idx) const
        {
            return _items.at(idx);
        }

        bool operator==(const ordered_map &o) const
        {
            return _items == o._items;
        }
    private:
        storage_type _items {};
        std::map<K, size_t> _index {};
    };

    static constexpr uint64_t set_tag = 258;

    /*
     * A sequence written either as a bare array or as an array tagged with 258.
     * Both forms decode into the same elements, the presence of the tag is kept for re-encoding.
     */
    template<codec T, bool NONEMPTY>
    struct basic_set: std::vector<T>, serializable<basic_set<T, NONEMPTY>> {
        using base_type = std::vector<T>;
        using base_type::base_type;

        len_form len_encoding {};
        // set only when the tag was present
        std::optional<int_width> tag_encoding {};

        static basic_set from_cbor(decoder &dec)
        {
            return annotate(NONEMPTY ? "NonemptySet" : "Set", [&] {
                basic_set res {};
                const auto start = dec.position();
                if (dec.type() == major_type::tag) {
                    const auto tag = dec.tag();
                    if (tag.val != set_tag) [[unlikely]]
                        throw decode_error { failure::tag_mismatch, start, fmt::format("found tag {} but expected {}", tag.val, set_tag) };
                    res.tag_encoding = tag.width;
                }
                const auto hdr = dec.array();
                res.len_encoding = hdr.form();
                read_items(dec, hdr, [&](const size_t idx) {
                    annotate(fmt::format("{}", idx), [&] {
                        res.emplace_back(T::from_cbor(dec));
                    });
                });
                if (NONEMPTY && res.empty()) [[unlikely]]
                    throw decode_error { failure::range_check, start, "a non-empty set has no elements" };
                return res;
            });
        }

        bool tagged() const noexcept
        {
            return tag_encoding.has_value();
        }

        void to_cbor(encoder &enc, const bool force_canonical) const
        {
            if (NONEMPTY && base_type::empty()) [[unlikely]]
                throw error("a non-empty set cannot be serialized without elements");
            if (tag_encoding)
                enc.tag(set_tag, *tag_encoding, force_canonical);
            enc.array(len_encoding, base_type::size(), force_canonical);
            for (const auto &v: *this)
                v.to_cbor(enc, force_canonical);
            enc.end(len_encoding, force_canonical);
        }

        bool operator==(const basic_set &o) const
        {
            return static_cast<const base_type &>(*this) == static_cast<const base_type &>(o);
        }
    };

    template<codec T>
    using set = basic_set<T, false>;

    template<codec T>
    using nonempty_set = basic_set<T, true>;

    template<typename E>
    struct fixed_uint_candidate {
        E variant;
        uint64_t value;
    };

    static constexpr size_t max_fixed_uint_candidates = 16;

    /*
     * Decodes an enum whose variants are written as fixed unsigned integers by trying the candidates in order.
     * The read position is restored after every failed attempt.
     * Returns the matched variant together with the width its value had on the wire.
     */
    template<typename E, size_t N>
    std::pair<E, int_width> read_fixed_uint(decoder &dec, const std::array<fixed_uint_candidate<E>, N> &candidates)
    {
        static_assert(N > 0 && N <= max_fixed_uint_candidates);
        const auto mark = dec.position();
        std::string last_failure {};
        for (const auto &c: candidates) {
            try {
                const auto [val, width] = dec.uint();
                if (val == c.value)
                    return { c.variant, width };
                last_failure = fmt::format("{}: found {} but expected {}", failure::fixed_value_mismatch, val, c.value);
            } catch (const decode_error &ex) {
                last_failure = ex.what();
            }
            logger::trace("fixed value candidate {} rejected at offset {}: {}", c.value, mark, last_failure);
            dec.seek(mark);
        }
        throw decode_error { failure::no_variant_matched, mark, fmt::format("all {} candidates failed, the last with: {}", N, last_failure) };
    }
}

#endif // !LEDGER_CODEC_CBOR_CONTAINER_HPP
