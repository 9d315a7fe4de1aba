/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CARDANO_TYPES_HPP
#define LEDGER_CODEC_CARDANO_TYPES_HPP

#include <map>
#include <vector>
#include <lc/blake2b.hpp>
#include <lc/cbor/container.hpp>

namespace ledger_codec::cardano {
    using cbor::int_width;
    using cbor::len_form;
    using cbor::string_form;

    struct network_id: cbor::serializable<network_id> {
        uint64_t id = 1;
        std::optional<int_width> encoding {};

        static network_id mainnet()
        {
            return network_id { 1 };
        }

        static network_id testnet()
        {
            return network_id { 0 };
        }

        static network_id from_cbor(cbor::decoder &dec);

        network_id() =default;

        explicit network_id(const uint64_t i):
            id { i }
        {
        }

        void to_cbor(cbor::encoder &enc, bool force_canonical) const;

        bool operator==(const network_id &o) const
        {
            return id == o.id;
        }
    };

    using policy_id = blake2b_224_hash;
    using asset_name = uint8_vector;

    static constexpr size_t max_asset_name_size = 32;

    struct policy_assets_encoding {
        // the encodings apply only while the entry still refers to the same policy
        policy_id policy {};
        string_form policy_encoding {};
        len_form len_encoding {};
        std::map<asset_name, std::pair<string_form, std::optional<int_width>>> asset_encodings {};
    };

    struct mint_encoding {
        len_form len_encoding {};
        std::vector<policy_assets_encoding> policy_encodings {};
    };

    /*
     * Minted and burned tokens: policy id -> asset name -> non-zero quantity.
     * Policies are kept as a list since historical blocks contain maps with a repeated policy id.
     */
    struct mint: cbor::serializable<mint> {
        using asset_map = cbor::ordered_map<asset_name, int64_t>;
        using policy_list = std::vector<std::pair<policy_id, asset_map>>;

        policy_list policies {};
        std::optional<mint_encoding> encodings {};

        static mint from_cbor(cbor::decoder &dec);

        mint() =default;

        mint(policy_list p):
            policies { std::move(p) }
        {
        }

        // the assets of the first entry with the given policy id
        const asset_map *find(const policy_id &id) const;
        asset_map *find(const policy_id &id);
        void to_cbor(cbor::encoder &enc, bool force_canonical) const;

        bool operator==(const mint &o) const
        {
            return policies == o.policies;
        }
    };
}

namespace fmt {
    template<>
    struct formatter<ledger_codec::cardano::network_id>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            switch (v.id) {
                case 0: return fmt::format_to(ctx.out(), "testnet");
                case 1: return fmt::format_to(ctx.out(), "mainnet");
                default: return fmt::format_to(ctx.out(), "network#{}", v.id);
            }
        }
    };

    template<>
    struct formatter<ledger_codec::cardano::mint>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            auto out_it = fmt::format_to(ctx.out(), "{{");
            for (const auto &[policy, assets]: v.policies) {
                out_it = fmt::format_to(out_it, " {}: {{", policy);
                for (const auto &[name, qty]: assets)
                    out_it = fmt::format_to(out_it, " {}: {}", name, qty);
                out_it = fmt::format_to(out_it, " }}");
            }
            return fmt::format_to(out_it, " }}");
        }
    };
}

#endif // !LEDGER_CODEC_CARDANO_TYPES_HPP
