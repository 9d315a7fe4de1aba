/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/common/test.hpp>
#include <lc/blake2b.hpp>

using namespace ledger_codec;

suite blake2b_suite = [] {
    "blake2b"_test = [] {
        "256"_test = [] {
            using test_vector = std::pair<std::string, std::string>;
            static std::vector<test_vector> test_vectors = {
                test_vector { "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8", "" },
                test_vector { "bddd813c634239723171ef3fee98579b94964e3bb1cb3e427262c8c068d52319", "abc" }
            };
            for (const auto &[exp_hash, input]: test_vectors) {
                const auto hash = blake2b<blake2b_256_hash>(input);
                test_same(uint8_vector::from_hex(exp_hash), uint8_vector { hash });
            }
        };
        "224"_test = [] {
            const auto hash = blake2b<blake2b_224_hash>(std::string_view { "abc" });
            test_same(uint8_vector::from_hex("9bd237b02a29e43bdd6738afa5b53ff0eee178d6210b618e4511aec8"), uint8_vector { hash });
            test_same(fmt::format("{}", blake2b<blake2b_224_hash>(std::string_view {})), std::string { "836CC68931C2E4E3E838602ECA1902591D216837BAFDDFE6F0C8CB07" });
        };
    };
};
