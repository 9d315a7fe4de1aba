/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <utility>
#include <lc/cbor/canonical.hpp>
#include <lc/cardano/types.hpp>

namespace ledger_codec::cardano {
    using cbor::annotate;
    using cbor::decode_error;
    using cbor::failure;

    network_id network_id::from_cbor(cbor::decoder &dec)
    {
        return annotate("NetworkId", [&] {
            const auto v = dec.uint();
            network_id res { v.val };
            res.encoding = v.width;
            return res;
        });
    }

    void network_id::to_cbor(cbor::encoder &enc, const bool force_canonical) const
    {
        enc.uint(id, encoding, force_canonical);
    }

    const mint::asset_map *mint::find(const policy_id &id) const
    {
        for (const auto &[policy, assets]: policies) {
            if (policy == id)
                return &assets;
        }
        return nullptr;
    }

    mint::asset_map *mint::find(const policy_id &id)
    {
        return const_cast<asset_map *>(std::as_const(*this).find(id));
    }

    static policy_assets_encoding read_policy_assets(cbor::decoder &dec, policy_id &policy, mint::asset_map &assets)
    {
        policy_assets_encoding encs {};
        const auto policy_start = dec.position();
        auto [policy_bytes, policy_form] = dec.bytes();
        if (policy_bytes.size() != policy.size()) [[unlikely]]
            throw decode_error { failure::range_check, policy_start, fmt::format("a policy id must have {} bytes but has {}", policy.size(), policy_bytes.size()) };
        policy = policy_id { policy_bytes };
        encs.policy = policy;
        encs.policy_encoding = std::move(policy_form);
        const auto hdr = dec.map();
        encs.len_encoding = hdr.form();
        cbor::read_items(dec, hdr, [&](const size_t) {
            const auto name_start = dec.position();
            auto [name, name_form] = dec.bytes();
            if (name.size() > max_asset_name_size) [[unlikely]]
                throw decode_error { failure::range_check, name_start, fmt::format("an asset name must have at most {} bytes but has {}", max_asset_name_size, name.size()) };
            const auto qty_start = dec.position();
            const auto qty = dec.integer();
            const auto i64 = qty.as_int64();
            if (!i64) [[unlikely]]
                throw decode_error { failure::range_check, qty_start, fmt::format("quantity {} does not fit into int64", qty) };
            if (*i64 == 0) [[unlikely]]
                throw decode_error { failure::range_check, qty_start, "a minted quantity must be non-zero" };
            if (!assets.insert(name, *i64)) [[unlikely]]
                throw decode_error { failure::duplicate_key, name_start, fmt::format("asset {} is already present", name) };
            encs.asset_encodings.emplace(std::move(name), std::make_pair(std::move(name_form), qty.width));
        });
        return encs;
    }

    mint mint::from_cbor(cbor::decoder &dec)
    {
        return annotate("Mint", [&] {
            mint res {};
            mint_encoding encs {};
            const auto hdr = dec.map();
            encs.len_encoding = hdr.form();
            cbor::read_items(dec, hdr, [&](const size_t idx) {
                annotate(fmt::format("{}", idx), [&] {
                    policy_id policy {};
                    asset_map assets {};
                    encs.policy_encodings.emplace_back(read_policy_assets(dec, policy, assets));
                    res.policies.emplace_back(policy, std::move(assets));
                });
            });
            res.encodings = std::move(encs);
            return res;
        });
    }

    void mint::to_cbor(cbor::encoder &enc, const bool force_canonical) const
    {
        const auto *encs = encodings ? &*encodings : nullptr;
        const auto policy_encs = [&](const size_t idx) -> const policy_assets_encoding * {
            if (encs && idx < encs->policy_encodings.size() && encs->policy_encodings[idx].policy == policies[idx].first)
                return &encs->policy_encodings[idx];
            return nullptr;
        };
        const auto len_encoding = encs ? encs->len_encoding : len_form {};
        enc.map(len_encoding, policies.size(), force_canonical);
        size_t policy_idx = 0;
        const auto order = cbor::key_order(policies, [&](cbor::encoder &key_enc, const auto &entry) {
            const auto *penc = policy_encs(policy_idx++);
            key_enc.bytes(entry.first, penc ? penc->policy_encoding : string_form {}, force_canonical);
        }, force_canonical);
        for (const auto &k: order) {
            enc.raw_cbor(k.bytes);
            const auto &assets = policies[k.idx].second;
            const auto *penc = policy_encs(k.idx);
            const auto assets_len = penc ? penc->len_encoding : len_form {};
            const auto asset_enc = [&](const asset_name &name) -> const std::pair<string_form, std::optional<int_width>> * {
                if (penc) {
                    if (const auto it = penc->asset_encodings.find(name); it != penc->asset_encodings.end())
                        return &it->second;
                }
                return nullptr;
            };
            enc.map(assets_len, assets.size(), force_canonical);
            const auto asset_order = cbor::key_order(assets, [&](cbor::encoder &key_enc, const auto &entry) {
                const auto *aenc = asset_enc(entry.first);
                key_enc.bytes(entry.first, aenc ? aenc->first : string_form {}, force_canonical);
            }, force_canonical);
            for (const auto &ak: asset_order) {
                enc.raw_cbor(ak.bytes);
                const auto &[name, qty] = assets[ak.idx];
                const auto *aenc = asset_enc(name);
                enc.integer(qty, aenc ? aenc->second : std::nullopt, force_canonical);
            }
            enc.end(assets_len, force_canonical);
        }
        enc.end(len_encoding, force_canonical);
    }
}
