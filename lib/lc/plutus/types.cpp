/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cbor/bounded-bytes.hpp>
#include <lc/cbor/canonical.hpp>
#include <lc/plutus/types.hpp>

namespace ledger_codec::plutus {
    using cbor::annotate;
    using cbor::decode_error;
    using cbor::failure;
    using cbor::major_type;

    ex_units ex_units::from_cbor(cbor::decoder &dec)
    {
        return annotate("ExUnits", [&] {
            cbor::record_reader rec { dec, 2 };
            const auto mem = annotate("mem", [&] { return dec.uint(); });
            const auto steps = annotate("steps", [&] { return dec.uint(); });
            rec.finish();
            ex_units res { mem.val, steps.val };
            res.encodings = ex_units_encoding { rec.form(), mem.width, steps.width };
            return res;
        });
    }

    void ex_units::to_cbor(cbor::encoder &enc, const bool force_canonical) const
    {
        const auto encs = encodings.value_or(ex_units_encoding {});
        enc.array(encs.len_encoding, 2, force_canonical);
        enc.uint(mem, encs.mem_encoding, force_canonical);
        enc.uint(steps, encs.steps_encoding, force_canonical);
        enc.end(encs.len_encoding, force_canonical);
    }

    rational rational::from_cbor(cbor::decoder &dec)
    {
        return annotate("Rational", [&] {
            const auto start = dec.position();
            const auto t = dec.tag();
            if (t.val != tag) [[unlikely]]
                throw decode_error { failure::tag_mismatch, start, fmt::format("found tag {} but expected {}", t.val, tag) };
            cbor::record_reader rec { dec, 2 };
            const auto num = annotate("numerator", [&] { return dec.uint(); });
            const auto denom = annotate("denominator", [&] { return dec.uint(); });
            rec.finish();
            rational res { num.val, denom.val };
            res.encodings = rational_encoding { t.width, rec.form(), num.width, denom.width };
            return res;
        });
    }

    void rational::to_cbor(cbor::encoder &enc, const bool force_canonical) const
    {
        const auto encs = encodings.value_or(rational_encoding {});
        enc.tag(tag, encs.tag_encoding, force_canonical);
        enc.array(encs.len_encoding, 2, force_canonical);
        enc.uint(numerator, encs.numerator_encoding, force_canonical);
        enc.uint(denominator, encs.denominator_encoding, force_canonical);
        enc.end(encs.len_encoding, force_canonical);
    }

    ex_unit_prices ex_unit_prices::from_cbor(cbor::decoder &dec)
    {
        return annotate("ExUnitPrices", [&] {
            cbor::record_reader rec { dec, 2 };
            auto mem = annotate("mem_price", [&] { return rational::from_cbor(dec); });
            auto step = annotate("step_price", [&] { return rational::from_cbor(dec); });
            rec.finish();
            ex_unit_prices res { std::move(mem), std::move(step) };
            res.encodings = ex_unit_prices_encoding { rec.form() };
            return res;
        });
    }

    void ex_unit_prices::to_cbor(cbor::encoder &enc, const bool force_canonical) const
    {
        const auto encs = encodings.value_or(ex_unit_prices_encoding {});
        enc.array(encs.len_encoding, 2, force_canonical);
        mem_price.to_cbor(enc, force_canonical);
        step_price.to_cbor(enc, force_canonical);
        enc.end(encs.len_encoding, force_canonical);
    }

    std::pair<redeemer_tag, int_width> read_redeemer_tag(cbor::decoder &dec)
    {
        static constexpr std::array<cbor::fixed_uint_candidate<redeemer_tag>, 6> candidates {{
            { redeemer_tag::spend, 0 },
            { redeemer_tag::mint, 1 },
            { redeemer_tag::cert, 2 },
            { redeemer_tag::reward, 3 },
            { redeemer_tag::voting, 4 },
            { redeemer_tag::proposing, 5 }
        }};
        return annotate("RedeemerTag", [&] {
            return cbor::read_fixed_uint(dec, candidates);
        });
    }

    constr_plutus_data::constr_plutus_data() =default;

    constr_plutus_data::constr_plutus_data(const uint64_t alt, std::vector<plutus_data> flds):
        alternative { alt }, fields { std::move(flds) }
    {
    }

    std::optional<uint64_t> constr_plutus_data::compact_tag(const uint64_t alt)
    {
        if (alt <= 6)
            return 121 + alt;
        if (alt <= 127)
            return 1280 + (alt - 7);
        return {};
    }

    std::optional<uint64_t> constr_plutus_data::alternative_from_tag(const uint64_t t)
    {
        if (t >= 121 && t <= 127)
            return t - 121;
        if (t >= 1280 && t <= 1400)
            return t - 1280 + 7;
        return {};
    }

    constr_plutus_data constr_plutus_data::from_cbor(cbor::decoder &dec)
    {
        return annotate("ConstrPlutusData", [&] {
            constr_plutus_data res {};
            constr_plutus_data_encoding encs {};
            const auto read_fields = [&] {
                annotate("fields", [&] {
                    const auto hdr = dec.array();
                    encs.fields_encoding = hdr.form();
                    cbor::read_items(dec, hdr, [&](const size_t idx) {
                        annotate(fmt::format("{}", idx), [&] {
                            res.fields.emplace_back(plutus_data::from_cbor(dec));
                        });
                    });
                });
            };
            const auto start = dec.position();
            const auto t = dec.tag();
            encs.tag_encoding = t.width;
            if (t.val == general_form_tag) {
                encs.general_form = true;
                cbor::record_reader rec { dec, 2 };
                encs.general_len_encoding = rec.form();
                const auto alt = annotate("alternative", [&] { return dec.uint(); });
                res.alternative = alt.val;
                encs.alternative_encoding = alt.width;
                read_fields();
                rec.finish();
            } else if (const auto alt = alternative_from_tag(t.val); alt) {
                res.alternative = *alt;
                read_fields();
            } else {
                throw decode_error { failure::tag_mismatch, start, fmt::format("tag {} is not a constructor tag", t.val) };
            }
            res.encodings = std::move(encs);
            return res;
        });
    }

    void constr_plutus_data::to_cbor(cbor::encoder &enc, const bool force_canonical) const
    {
        const auto encs = encodings.value_or(constr_plutus_data_encoding {});
        const auto ctag = compact_tag(alternative);
        const bool general = !ctag || (encs.general_form && !force_canonical);
        if (general) {
            enc.tag(general_form_tag, encs.tag_encoding, force_canonical);
            enc.array(encs.general_len_encoding, 2, force_canonical);
            enc.uint(alternative, encs.alternative_encoding, force_canonical);
        } else {
            enc.tag(*ctag, encs.tag_encoding, force_canonical);
        }
        enc.array(encs.fields_encoding, fields.size(), force_canonical);
        for (const auto &f: fields)
            f.to_cbor(enc, force_canonical);
        enc.end(encs.fields_encoding, force_canonical);
        if (general)
            enc.end(encs.general_len_encoding, force_canonical);
    }

    bool constr_plutus_data::operator==(const constr_plutus_data &o) const
    {
        return alternative == o.alternative && fields == o.fields;
    }

    plutus_map::plutus_map() =default;

    plutus_map::plutus_map(std::vector<entry_type> ents):
        entries { std::move(ents) }
    {
    }

    plutus_map plutus_map::from_cbor(cbor::decoder &dec)
    {
        plutus_map res {};
        const auto hdr = dec.map();
        res.len_encoding = hdr.form();
        cbor::read_items(dec, hdr, [&](const size_t idx) {
            annotate(fmt::format("{}", idx), [&] {
                auto k = annotate("key", [&] { return plutus_data::from_cbor(dec); });
                auto v = annotate("value", [&] { return plutus_data::from_cbor(dec); });
                res.entries.emplace_back(std::move(k), std::move(v));
            });
        });
        return res;
    }

    const plutus_data *plutus_map::find(const plutus_data &k) const
    {
        for (const auto &[ek, ev]: entries) {
            if (ek == k)
                return &ev;
        }
        return nullptr;
    }

    void plutus_map::to_cbor(cbor::encoder &enc, const bool force_canonical) const
    {
        enc.map(len_encoding, entries.size(), force_canonical);
        const auto order = cbor::key_order(entries, [&](cbor::encoder &key_enc, const entry_type &e) {
            e.first.to_cbor(key_enc, force_canonical);
        }, force_canonical);
        for (const auto &k: order) {
            enc.raw_cbor(k.bytes);
            entries[k.idx].second.to_cbor(enc, force_canonical);
        }
        enc.end(len_encoding, force_canonical);
    }

    bool plutus_map::operator==(const plutus_map &o) const
    {
        return entries == o.entries;
    }

    bool plutus_list::operator==(const plutus_list &o) const
    {
        return items == o.items;
    }

    plutus_data plutus_data::from_cbor(cbor::decoder &dec)
    {
        return annotate("PlutusData", [&]() -> plutus_data {
            cbor::decoder::nesting_guard guard { dec };
            switch (const auto typ = dec.type(); typ) {
                case major_type::tag: {
                    // a bignum or a constructor: peek at the tag and let the matching decoder reread it
                    const auto mark = dec.position();
                    const auto t = dec.tag();
                    dec.seek(mark);
                    if (t.val == 2 || t.val == 3)
                        return annotate("Integer", [&] { return big_integer::from_cbor(dec); });
                    return annotate("Constr", [&] { return constr_plutus_data::from_cbor(dec); });
                }
                case major_type::map:
                    return annotate("Map", [&] { return plutus_map::from_cbor(dec); });
                case major_type::array:
                    return annotate("List", [&] {
                        plutus_list l {};
                        const auto hdr = dec.array();
                        l.len_encoding = hdr.form();
                        cbor::read_items(dec, hdr, [&](const size_t idx) {
                            annotate(fmt::format("{}", idx), [&] {
                                l.items.emplace_back(plutus_data::from_cbor(dec));
                            });
                        });
                        return l;
                    });
                case major_type::uint:
                case major_type::nint:
                    return annotate("Integer", [&] { return big_integer::from_cbor(dec); });
                case major_type::bytes:
                    return annotate("Bytes", [&] {
                        auto [bstr, form] = cbor::bounded_bytes::read(dec);
                        return plutus_bytes { std::move(bstr), std::move(form) };
                    });
                default:
                    throw dec.make_error(failure::no_variant_matched, fmt::format("{} items cannot start plutus data", typ));
            }
        });
    }

    void plutus_data::to_cbor(cbor::encoder &enc, const bool force_canonical) const
    {
        std::visit([&](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, plutus_list>) {
                enc.array(v.len_encoding, v.items.size(), force_canonical);
                for (const auto &item: v.items)
                    item.to_cbor(enc, force_canonical);
                enc.end(v.len_encoding, force_canonical);
            } else if constexpr (std::is_same_v<T, plutus_bytes>) {
                cbor::bounded_bytes::write(enc, v.bytes, v.bytes_encoding, force_canonical);
            } else {
                v.to_cbor(enc, force_canonical);
            }
        }, val);
    }

    blake2b_256_hash plutus_data::hash() const
    {
        return blake2b<blake2b_256_hash>(to_bytes(false));
    }

    redeemer_key redeemer_key::from_cbor(cbor::decoder &dec)
    {
        return annotate("RedeemerKey", [&] {
            cbor::record_reader rec { dec, 2 };
            const auto [t, t_width] = annotate("tag", [&] { return read_redeemer_tag(dec); });
            const auto idx = annotate("index", [&] { return dec.uint(); });
            rec.finish();
            redeemer_key res { t, idx.val };
            res.encodings = redeemer_key_encoding { rec.form(), t_width, idx.width };
            return res;
        });
    }

    void redeemer_key::to_cbor(cbor::encoder &enc, const bool force_canonical) const
    {
        const auto encs = encodings.value_or(redeemer_key_encoding {});
        enc.array(encs.len_encoding, 2, force_canonical);
        enc.uint(static_cast<uint64_t>(tag), encs.tag_encoding, force_canonical);
        enc.uint(index, encs.index_encoding, force_canonical);
        enc.end(encs.len_encoding, force_canonical);
    }

    redeemer_val redeemer_val::from_cbor(cbor::decoder &dec)
    {
        return annotate("RedeemerVal", [&] {
            cbor::record_reader rec { dec, 2 };
            auto data = annotate("data", [&] { return plutus_data::from_cbor(dec); });
            auto units = annotate("ex_units", [&] { return ex_units::from_cbor(dec); });
            rec.finish();
            redeemer_val res { std::move(data), std::move(units) };
            res.encodings = redeemer_val_encoding { rec.form() };
            return res;
        });
    }

    void redeemer_val::to_cbor(cbor::encoder &enc, const bool force_canonical) const
    {
        const auto encs = encodings.value_or(redeemer_val_encoding {});
        enc.array(encs.len_encoding, 2, force_canonical);
        data.to_cbor(enc, force_canonical);
        units.to_cbor(enc, force_canonical);
        enc.end(encs.len_encoding, force_canonical);
    }

    legacy_redeemer legacy_redeemer::from_cbor(cbor::decoder &dec)
    {
        return annotate("LegacyRedeemer", [&] {
            cbor::record_reader rec { dec, 4 };
            const auto [t, t_width] = annotate("tag", [&] { return read_redeemer_tag(dec); });
            const auto idx = annotate("index", [&] { return dec.uint(); });
            auto data = annotate("data", [&] { return plutus_data::from_cbor(dec); });
            auto units = annotate("ex_units", [&] { return ex_units::from_cbor(dec); });
            rec.finish();
            legacy_redeemer res { t, idx.val, std::move(data), std::move(units) };
            res.encodings = legacy_redeemer_encoding { rec.form(), t_width, idx.width };
            return res;
        });
    }

    void legacy_redeemer::to_cbor(cbor::encoder &enc, const bool force_canonical) const
    {
        const auto encs = encodings.value_or(legacy_redeemer_encoding {});
        enc.array(encs.len_encoding, 4, force_canonical);
        enc.uint(static_cast<uint64_t>(tag), encs.tag_encoding, force_canonical);
        enc.uint(index, encs.index_encoding, force_canonical);
        data.to_cbor(enc, force_canonical);
        units.to_cbor(enc, force_canonical);
        enc.end(encs.len_encoding, force_canonical);
    }

    redeemers redeemers::from_cbor(cbor::decoder &dec)
    {
        return annotate("Redeemers", [&]() -> redeemers {
            switch (const auto typ = dec.type(); typ) {
                case major_type::array: {
                    const auto hdr = dec.array();
                    legacy_list items {};
                    cbor::read_items(dec, hdr, [&](const size_t idx) {
                        annotate(fmt::format("{}", idx), [&] {
                            items.emplace_back(legacy_redeemer::from_cbor(dec));
                        });
                    });
                    redeemers res { std::move(items) };
                    res.len_encoding = hdr.form();
                    return res;
                }
                case major_type::map: {
                    const auto hdr = dec.map();
                    map_type items {};
                    cbor::read_items(dec, hdr, [&](const size_t) {
                        const auto key_start = dec.position();
                        auto k = redeemer_key::from_cbor(dec);
                        auto v = redeemer_val::from_cbor(dec);
                        if (!items.insert(k, std::move(v))) [[unlikely]]
                            throw decode_error { failure::duplicate_key, key_start, fmt::format("redeemer key {} is already present", k) };
                    });
                    redeemers res { std::move(items) };
                    res.len_encoding = hdr.form();
                    return res;
                }
                default:
                    throw dec.make_error(failure::no_variant_matched, fmt::format("expected an array or a map but got {}", typ));
            }
        });
    }

    size_t redeemers::size() const
    {
        return std::visit([](const auto &v) { return v.size(); }, val);
    }

    void redeemers::to_cbor(cbor::encoder &enc, const bool force_canonical) const
    {
        std::visit([&](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, legacy_list>) {
                enc.array(len_encoding, v.size(), force_canonical);
                for (const auto &r: v)
                    r.to_cbor(enc, force_canonical);
            } else {
                enc.map(len_encoding, v.size(), force_canonical);
                const auto order = cbor::key_order(v, [&](cbor::encoder &key_enc, const auto &entry) {
                    entry.first.to_cbor(key_enc, force_canonical);
                }, force_canonical);
                for (const auto &k: order) {
                    enc.raw_cbor(k.bytes);
                    v[k.idx].second.to_cbor(enc, force_canonical);
                }
            }
            enc.end(len_encoding, force_canonical);
        }, val);
    }

    cost_models cost_models::from_cbor(cbor::decoder &dec)
    {
        return annotate("CostModels", [&] {
            cost_models res {};
            cost_models_encoding encs {};
            const auto hdr = dec.map();
            encs.len_encoding = hdr.form();
            cbor::read_items(dec, hdr, [&](const size_t) {
                const auto key_start = dec.position();
                const auto lang = dec.uint();
                std::vector<int64_t> params {};
                std::vector<std::optional<int_width>> widths {};
                const auto params_len = annotate(fmt::format("{}", lang.val), [&] {
                    const auto params_hdr = dec.array();
                    cbor::read_items(dec, params_hdr, [&](const size_t) {
                        const auto start = dec.position();
                        const auto v = dec.integer();
                        const auto i64 = v.as_int64();
                        if (!i64) [[unlikely]]
                            throw decode_error { failure::range_check, start, fmt::format("cost model parameter {} does not fit into int64", v) };
                        params.emplace_back(*i64);
                        widths.emplace_back(v.width);
                    });
                    return params_hdr.form();
                });
                if (!res.models.insert(lang.val, std::move(params))) [[unlikely]]
                    throw decode_error { failure::duplicate_key, key_start, fmt::format("cost model {} is already present", lang.val) };
                encs.key_encodings.emplace(lang.val, lang.width);
                encs.value_encodings.emplace(lang.val, std::make_pair(params_len, std::move(widths)));
            });
            res.encodings = std::move(encs);
            return res;
        });
    }

    void cost_models::to_cbor(cbor::encoder &enc, const bool force_canonical) const
    {
        const auto *encs = encodings ? &*encodings : nullptr;
        const auto len_encoding = encs ? encs->len_encoding : len_form {};
        enc.map(len_encoding, models.size(), force_canonical);
        const auto order = cbor::key_order(models, [&](cbor::encoder &key_enc, const auto &entry) {
            std::optional<int_width> width {};
            if (encs) {
                if (const auto it = encs->key_encodings.find(entry.first); it != encs->key_encodings.end())
                    width = it->second;
            }
            key_enc.uint(entry.first, width, force_canonical);
        }, force_canonical);
        for (const auto &k: order) {
            enc.raw_cbor(k.bytes);
            const auto &[lang, params] = models[k.idx];
            len_form params_len {};
            const std::vector<std::optional<int_width>> *widths = nullptr;
            if (encs) {
                if (const auto it = encs->value_encodings.find(lang); it != encs->value_encodings.end()) {
                    params_len = it->second.first;
                    widths = &it->second.second;
                }
            }
            enc.array(params_len, params.size(), force_canonical);
            for (size_t i = 0; i < params.size(); ++i)
                enc.integer(params[i], widths && i < widths->size() ? (*widths)[i] : std::nullopt, force_canonical);
            enc.end(params_len, force_canonical);
        }
        enc.end(len_encoding, force_canonical);
    }
}
