/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/common/test.hpp>
#include <lc/cardano/types.hpp>

namespace {
    using namespace ledger_codec;
    using namespace ledger_codec::cardano;

    const std::string policy_a_hex = "01010101010101010101010101010101010101010101010101010101";
    const std::string policy_b_hex = "02020202020202020202020202020202020202020202020202020202";

    uint8_vector with_policies(const std::string_view prefix, const std::string_view suffix, const std::string_view policy_hex)
    {
        return uint8_vector::from_hex(fmt::format("{}581C{}{}", prefix, policy_hex, suffix));
    }
}

suite cardano_types_suite = [] {
    "cardano::types"_test = [] {
        "network_id"_test = [] {
            test_same(network_id::from_bytes(uint8_vector::from_hex("00")), network_id::testnet());
            const auto wide = network_id::from_bytes(uint8_vector::from_hex("1801"));
            test_same(wide, network_id::mainnet());
            test_same(wide.to_bytes(), uint8_vector::from_hex("1801"));
            test_same(wide.to_bytes(true), uint8_vector::from_hex("01"));
            test_same(network_id::mainnet().to_bytes(), uint8_vector::from_hex("01"));
            test_same(fmt::format("{}", network_id { 7 }), std::string { "network#7" });
            test_throws<cbor::decode_error>("decoding failed in NetworkId at offset 0 because: unexpected type", [] { network_id::from_bytes(uint8_vector::from_hex("20")); });
        };
        "mint canonical asset order"_test = [] {
            const auto bytes = with_policies("A1", "A242616101416220", policy_a_hex);
            const auto m = mint::from_bytes(bytes);
            test_same(m.policies.size(), size_t { 1 });
            const auto *assets = m.find(policy_id::from_hex(policy_a_hex));
            expect((assets != nullptr) >> fatal);
            test_same(assets->at(uint8_vector::from_hex("6161")), int64_t { 1 });
            test_same(assets->at(uint8_vector::from_hex("62")), int64_t { -1 });
            test_same(m.to_bytes(), bytes);
            test_same(m.to_bytes(true), with_policies("A1", "A241622042616101", policy_a_hex));
        };
        "mint canonical policy order"_test = [] {
            const auto bytes = uint8_vector::from_hex(fmt::format("BF581C{}A1416101581C{}A1416102FF", policy_b_hex, policy_a_hex));
            const auto m = mint::from_bytes(bytes);
            test_same(m.to_bytes(), bytes);
            test_same(m.to_bytes(true), uint8_vector::from_hex(fmt::format("A2581C{}A1416102581C{}A1416101", policy_a_hex, policy_b_hex)));
        };
        "mint preserves widths"_test = [] {
            const auto bytes = with_policies("A1", "BF416119000541623B0000000000000009FF", policy_a_hex);
            const auto m = mint::from_bytes(bytes);
            test_same(m.find(policy_id::from_hex(policy_a_hex))->at(uint8_vector::from_hex("62")), int64_t { -10 });
            test_same(m.to_bytes(), bytes);
            test_same(m.to_bytes(true), with_policies("A1", "A2416105416229", policy_a_hex));
        };
        "mint update in place"_test = [] {
            auto m = mint::from_bytes(with_policies("A1", "A2416119000541623B0000000000000009", policy_a_hex));
            auto *assets = m.find(policy_id::from_hex(policy_a_hex));
            expect((assets != nullptr) >> fatal);
            assets->at(uint8_vector::from_hex("61")) = 6;
            test_same(m.to_bytes(), with_policies("A1", "A2416119000641623B0000000000000009", policy_a_hex));
            expect(assets->erase(uint8_vector::from_hex("62")));
            test_same(m.to_bytes(), with_policies("A1", "A14161190006", policy_a_hex));
        };
        "mint duplicate policies"_test = [] {
            const auto bytes = uint8_vector::from_hex(fmt::format("A2581C{0}A1416101581C{0}A1416202", policy_a_hex));
            const auto m = mint::from_bytes(bytes);
            test_same(m.policies.size(), size_t { 2 });
            test_same(m.to_bytes(), bytes);
            test_same(m.find(policy_id::from_hex(policy_a_hex))->at(uint8_vector::from_hex("61")), int64_t { 1 });
        };
        "mint constructed"_test = [] {
            mint m { { { policy_id::from_hex(policy_a_hex), mint::asset_map { { uint8_vector::from_hex("62"), 5 } } } } };
            test_same(m.to_bytes(), with_policies("A1", "A1416205", policy_a_hex));
            test_same(mint::from_bytes(m.to_bytes()), m);
        };
        "mint stale encodings"_test = [] {
            auto m = mint::from_bytes(with_policies("A1", "A14161190005", policy_a_hex));
            m.policies[0].first = policy_id::from_hex(policy_b_hex);
            test_same(m.to_bytes(), with_policies("A1", "A1416105", policy_b_hex));
        };
        "mint failures"_test = [] {
            test_throws<cbor::decode_error>("decoding failed in Mint.0 at offset 34 because: value out of range", [] {
                mint::from_bytes(with_policies("A1", "A1416100", policy_a_hex));
            });
            test_throws<cbor::decode_error>("decoding failed in Mint.0 at offset 1 because: value out of range", [] {
                mint::from_bytes(uint8_vector::from_hex("A14101A0"));
            });
            test_throws<cbor::decode_error>("decoding failed in Mint.0 at offset 35 because: duplicate key", [] {
                mint::from_bytes(with_policies("A1", "A2416101416102", policy_a_hex));
            });
            test_throws<cbor::decode_error>("decoding failed in Mint.0 at offset 32 because: value out of range", [] {
                mint::from_bytes(with_policies("A1", fmt::format("A15821{}01", std::string(66, '0')), policy_a_hex));
            });
            test_throws<cbor::decode_error>("Mint.0", [] {
                mint::from_bytes(with_policies("A1", "A141611B8000000000000000", policy_a_hex));
            });
        };
    };
};
