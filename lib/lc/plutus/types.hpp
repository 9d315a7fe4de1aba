/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_PLUTUS_TYPES_HPP
#define LEDGER_CODEC_PLUTUS_TYPES_HPP

#include <map>
#include <variant>
#include <vector>
#include <lc/big-int.hpp>
#include <lc/blake2b.hpp>
#include <lc/cbor/container.hpp>

namespace ledger_codec::plutus {
    using cbor::int_width;
    using cbor::len_form;
    using cbor::string_form;

    struct ex_units_encoding {
        len_form len_encoding {};
        std::optional<int_width> mem_encoding {};
        std::optional<int_width> steps_encoding {};
    };

    struct ex_units: cbor::serializable<ex_units> {
        uint64_t mem = 0;
        uint64_t steps = 0;
        std::optional<ex_units_encoding> encodings {};

        static ex_units from_cbor(cbor::decoder &dec);

        ex_units() =default;

        ex_units(const uint64_t m, const uint64_t s):
            mem { m }, steps { s }
        {
        }

        void to_cbor(cbor::encoder &enc, bool force_canonical) const;

        bool operator==(const ex_units &o) const
        {
            return mem == o.mem && steps == o.steps;
        }
    };

    struct rational_encoding {
        std::optional<int_width> tag_encoding {};
        len_form len_encoding {};
        std::optional<int_width> numerator_encoding {};
        std::optional<int_width> denominator_encoding {};
    };

    // A non-negative fraction written as tag 30 [numerator, denominator].
    struct rational: cbor::serializable<rational> {
        static constexpr uint64_t tag = 30;

        uint64_t numerator = 0;
        uint64_t denominator = 1;
        std::optional<rational_encoding> encodings {};

        static rational from_cbor(cbor::decoder &dec);

        rational() =default;

        rational(const uint64_t num, const uint64_t denom):
            numerator { num }, denominator { denom }
        {
        }

        void to_cbor(cbor::encoder &enc, bool force_canonical) const;

        bool operator==(const rational &o) const
        {
            return numerator == o.numerator && denominator == o.denominator;
        }
    };

    struct ex_unit_prices_encoding {
        len_form len_encoding {};
    };

    struct ex_unit_prices: cbor::serializable<ex_unit_prices> {
        rational mem_price {};
        rational step_price {};
        std::optional<ex_unit_prices_encoding> encodings {};

        static ex_unit_prices from_cbor(cbor::decoder &dec);

        ex_unit_prices() =default;

        ex_unit_prices(rational mem, rational step):
            mem_price { std::move(mem) }, step_price { std::move(step) }
        {
        }

        void to_cbor(cbor::encoder &enc, bool force_canonical) const;

        bool operator==(const ex_unit_prices &o) const
        {
            return mem_price == o.mem_price && step_price == o.step_price;
        }
    };

    enum class redeemer_tag: uint8_t {
        spend = 0, mint = 1, cert = 2, reward = 3, voting = 4, proposing = 5
    };

    // the observed width of the tag value is returned for the encoding of the enclosing structure
    extern std::pair<redeemer_tag, int_width> read_redeemer_tag(cbor::decoder &dec);

    struct plutus_data;

    struct constr_plutus_data_encoding {
        std::optional<int_width> tag_encoding {};
        // tag 102 [alternative, fields] even when a compact tag exists
        bool general_form = false;
        len_form general_len_encoding {};
        std::optional<int_width> alternative_encoding {};
        len_form fields_encoding {};
    };

    struct constr_plutus_data: cbor::serializable<constr_plutus_data> {
        static constexpr uint64_t general_form_tag = 102;

        uint64_t alternative = 0;
        std::vector<plutus_data> fields {};
        std::optional<constr_plutus_data_encoding> encodings {};

        // std::nullopt if the alternative can only be written in the general form
        static std::optional<uint64_t> compact_tag(uint64_t alternative);
        static std::optional<uint64_t> alternative_from_tag(uint64_t tag);
        static constr_plutus_data from_cbor(cbor::decoder &dec);

        constr_plutus_data();
        constr_plutus_data(uint64_t alt, std::vector<plutus_data> flds);

        void to_cbor(cbor::encoder &enc, bool force_canonical) const;
        bool operator==(const constr_plutus_data &o) const;
    };

    // Entries are kept in their original order and, unlike other ledger maps, duplicate keys are allowed.
    struct plutus_map: cbor::serializable<plutus_map> {
        using entry_type = std::pair<plutus_data, plutus_data>;

        std::vector<entry_type> entries {};
        len_form len_encoding {};

        static plutus_map from_cbor(cbor::decoder &dec);

        plutus_map();
        plutus_map(std::vector<entry_type> ents);

        // the first value with the given key
        const plutus_data *find(const plutus_data &k) const;
        void to_cbor(cbor::encoder &enc, bool force_canonical) const;
        bool operator==(const plutus_map &o) const;
    };

    struct plutus_list {
        std::vector<plutus_data> items {};
        len_form len_encoding {};

        bool operator==(const plutus_list &o) const;
    };

    struct plutus_bytes {
        uint8_vector bytes {};
        string_form bytes_encoding {};

        bool operator==(const plutus_bytes &o) const
        {
            return bytes == o.bytes;
        }
    };

    struct plutus_data: cbor::serializable<plutus_data> {
        using value_type = std::variant<constr_plutus_data, plutus_map, plutus_list, big_integer, plutus_bytes>;

        value_type val;

        static plutus_data from_cbor(cbor::decoder &dec);

        static plutus_data list(std::vector<plutus_data> items)
        {
            return { plutus_list { std::move(items) } };
        }

        static plutus_data bytes(const buffer b)
        {
            return { plutus_bytes { uint8_vector { b } } };
        }

        plutus_data(constr_plutus_data v):
            val { std::move(v) }
        {
        }

        plutus_data(plutus_map v):
            val { std::move(v) }
        {
        }

        plutus_data(plutus_list v):
            val { std::move(v) }
        {
        }

        plutus_data(big_integer v):
            val { std::move(v) }
        {
        }

        plutus_data(plutus_bytes v):
            val { std::move(v) }
        {
        }

        void to_cbor(cbor::encoder &enc, bool force_canonical) const;
        // the datum hash over the preserved encoding
        blake2b_256_hash hash() const;

        bool operator==(const plutus_data &o) const
        {
            return val == o.val;
        }
    };

    struct redeemer_key_encoding {
        len_form len_encoding {};
        std::optional<int_width> tag_encoding {};
        std::optional<int_width> index_encoding {};
    };

    struct redeemer_key: cbor::serializable<redeemer_key> {
        redeemer_tag tag = redeemer_tag::spend;
        uint64_t index = 0;
        std::optional<redeemer_key_encoding> encodings {};

        static redeemer_key from_cbor(cbor::decoder &dec);

        redeemer_key() =default;

        redeemer_key(const redeemer_tag t, const uint64_t idx):
            tag { t }, index { idx }
        {
        }

        void to_cbor(cbor::encoder &enc, bool force_canonical) const;

        bool operator==(const redeemer_key &o) const
        {
            return tag == o.tag && index == o.index;
        }

        std::strong_ordering operator<=>(const redeemer_key &o) const
        {
            if (tag != o.tag)
                return tag <=> o.tag;
            return index <=> o.index;
        }
    };

    struct redeemer_val_encoding {
        len_form len_encoding {};
    };

    struct redeemer_val: cbor::serializable<redeemer_val> {
        plutus_data data;
        ex_units units {};
        std::optional<redeemer_val_encoding> encodings {};

        static redeemer_val from_cbor(cbor::decoder &dec);

        redeemer_val(plutus_data d, ex_units u):
            data { std::move(d) }, units { std::move(u) }
        {
        }

        void to_cbor(cbor::encoder &enc, bool force_canonical) const;

        bool operator==(const redeemer_val &o) const
        {
            return data == o.data && units == o.units;
        }
    };

    struct legacy_redeemer_encoding {
        len_form len_encoding {};
        std::optional<int_width> tag_encoding {};
        std::optional<int_width> index_encoding {};
    };

    // The pre-Conway redeemer: [tag, index, data, ex_units].
    struct legacy_redeemer: cbor::serializable<legacy_redeemer> {
        redeemer_tag tag = redeemer_tag::spend;
        uint64_t index = 0;
        plutus_data data;
        ex_units units {};
        std::optional<legacy_redeemer_encoding> encodings {};

        static legacy_redeemer from_cbor(cbor::decoder &dec);

        legacy_redeemer(const redeemer_tag t, const uint64_t idx, plutus_data d, ex_units u):
            tag { t }, index { idx }, data { std::move(d) }, units { std::move(u) }
        {
        }

        void to_cbor(cbor::encoder &enc, bool force_canonical) const;

        bool operator==(const legacy_redeemer &o) const
        {
            return tag == o.tag && index == o.index && data == o.data && units == o.units;
        }
    };

    /*
     * Either the legacy list of redeemers or, since Conway, a map from (tag, index) to (data, ex_units).
     * Both forms are accepted in every era and re-encoded in the form they were decoded from.
     */
    struct redeemers: cbor::serializable<redeemers> {
        using legacy_list = std::vector<legacy_redeemer>;
        using map_type = cbor::ordered_map<redeemer_key, redeemer_val>;
        using value_type = std::variant<legacy_list, map_type>;

        value_type val;
        len_form len_encoding {};

        static redeemers from_cbor(cbor::decoder &dec);

        redeemers(value_type v):
            val { std::move(v) }
        {
        }

        size_t size() const;
        void to_cbor(cbor::encoder &enc, bool force_canonical) const;

        bool operator==(const redeemers &o) const
        {
            return val == o.val;
        }
    };

    struct cost_models_encoding {
        len_form len_encoding {};
        std::map<uint64_t, std::optional<int_width>> key_encodings {};
        std::map<uint64_t, std::pair<len_form, std::vector<std::optional<int_width>>>> value_encodings {};
    };

    // The cost model parameters of each Plutus language indexed by the language id.
    struct cost_models: cbor::serializable<cost_models> {
        using map_type = cbor::ordered_map<uint64_t, std::vector<int64_t>>;

        map_type models {};
        std::optional<cost_models_encoding> encodings {};

        static cost_models from_cbor(cbor::decoder &dec);

        cost_models() =default;

        cost_models(map_type m):
            models { std::move(m) }
        {
        }

        void to_cbor(cbor::encoder &enc, bool force_canonical) const;

        bool operator==(const cost_models &o) const
        {
            return models == o.models;
        }
    };

    // Serialized Plutus script bytes. The hash is taken over the language id prefixed to the raw bytes.
    template<uint8_t LANG>
    struct plutus_script: cbor::serializable<plutus_script<LANG>> {
        static constexpr uint8_t language_id = LANG;

        uint8_vector bytes {};
        std::optional<string_form> bytes_encoding {};

        static plutus_script from_cbor(cbor::decoder &dec)
        {
            return cbor::annotate(fmt::format("PlutusV{}Script", LANG), [&] {
                auto [data, form] = dec.bytes();
                plutus_script res { std::move(data) };
                res.bytes_encoding = std::move(form);
                return res;
            });
        }

        plutus_script() =default;

        plutus_script(uint8_vector b):
            bytes { std::move(b) }
        {
        }

        void to_cbor(cbor::encoder &enc, const bool force_canonical) const
        {
            enc.bytes(bytes, bytes_encoding.value_or(string_form {}), force_canonical);
        }

        blake2b_224_hash hash() const
        {
            uint8_vector preimage {};
            preimage << language_id << bytes;
            return blake2b<blake2b_224_hash>(preimage);
        }

        bool operator==(const plutus_script &o) const
        {
            return bytes == o.bytes;
        }
    };

    using plutus_v1_script = plutus_script<1>;
    using plutus_v2_script = plutus_script<2>;
    using plutus_v3_script = plutus_script<3>;
}

namespace fmt {
    template<>
    struct formatter<ledger_codec::plutus::redeemer_tag>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ledger_codec::plutus::redeemer_tag;
            switch (v) {
                case redeemer_tag::spend: return fmt::format_to(ctx.out(), "spend");
                case redeemer_tag::mint: return fmt::format_to(ctx.out(), "mint");
                case redeemer_tag::cert: return fmt::format_to(ctx.out(), "cert");
                case redeemer_tag::reward: return fmt::format_to(ctx.out(), "reward");
                case redeemer_tag::voting: return fmt::format_to(ctx.out(), "voting");
                case redeemer_tag::proposing: return fmt::format_to(ctx.out(), "proposing");
                default: return fmt::format_to(ctx.out(), "redeemer_tag: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<ledger_codec::plutus::ex_units>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "mem: {} steps: {}", v.mem, v.steps);
        }
    };

    template<>
    struct formatter<ledger_codec::plutus::rational>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}/{}", v.numerator, v.denominator);
        }
    };

    template<>
    struct formatter<ledger_codec::plutus::redeemer_key>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}#{}", v.tag, v.index);
        }
    };

    template<>
    struct formatter<ledger_codec::plutus::plutus_data>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "plutus_data({})", v.to_bytes());
        }
    };

    template<uint8_t LANG>
    struct formatter<ledger_codec::plutus::plutus_script<LANG>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "plutus_v{}_script({})", LANG, v.bytes);
        }
    };
}

#endif // !LEDGER_CODEC_PLUTUS_TYPES_HPP
