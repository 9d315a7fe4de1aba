/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <fstream>
#include <map>
#include <lc/common/test.hpp>
#include <lc/config.hpp>

using namespace ledger_codec;

namespace {
    codec_config::env_lookup fake_env(const std::map<std::string, std::string> &vars)
    {
        return [vars](const std::string_view name) -> std::optional<std::string> {
            if (const auto it = vars.find(std::string { name }); it != vars.end())
                return it->second;
            return {};
        };
    }
}

suite config_suite = [] {
    "config"_test = [] {
        "defaults"_test = [] {
            const auto cfg = codec_config::from_env(fake_env({}));
            test_same(cfg.max_collection_size, codec_config::default_max_collection_size);
            test_same(cfg.max_nesting_depth, codec_config::default_max_nesting_depth);
            test_same(cfg.max_big_int_bytes, codec_config::default_max_big_int_bytes);
        };
        "overrides"_test = [] {
            const auto cfg = codec_config::from_env(fake_env({ { "LC_MAX_NESTING_DEPTH", "16" }, { "LC_MAX_BIG_INT_BYTES", "64" }, { "LC_MAX_STRING_SIZE", "1024" } }));
            test_same(cfg.max_collection_size, codec_config::default_max_collection_size);
            test_same(cfg.max_string_size, size_t { 1024 });
            test_same(cfg.max_nesting_depth, size_t { 16 });
            test_same(cfg.max_big_int_bytes, size_t { 64 });
        };
        "invalid"_test = [] {
            test_throws<error>("LC_MAX_COLLECTION_SIZE", [] { codec_config::from_env(fake_env({ { "LC_MAX_COLLECTION_SIZE", "12ab" } })); });
            test_throws<error>("must be positive", [] { codec_config::from_env(fake_env({ { "LC_MAX_NESTING_DEPTH", "0" } })); });
        };
        "json"_test = [] {
            const auto cfg = codec_config::from_json(boost::json::object { { "max_nesting_depth", 32 }, { "max_collection_size", 1000 }, { "max_string_size", 4096 } });
            test_same(cfg.max_nesting_depth, size_t { 32 });
            test_same(cfg.max_collection_size, size_t { 1000 });
            test_same(cfg.max_string_size, size_t { 4096 });
            test_same(cfg.max_big_int_bytes, codec_config::default_max_big_int_bytes);
            test_throws<error>("unsupported config element: max_depth", [] { codec_config::from_json(boost::json::object { { "max_depth", 1 } }); });
            test_throws<error>("must be an unsigned integer", [] { codec_config::from_json(boost::json::object { { "max_nesting_depth", "16" } }); });
            test_throws<error>("must be positive", [] { codec_config::from_json(boost::json::object { { "max_big_int_bytes", 0 } }); });
        };
        "file then environment"_test = [] {
            const auto path = (std::filesystem::temp_directory_path() / "lc-config-test.json").string();
            {
                std::ofstream os { path, std::ios::binary };
                os << R"({ "max_nesting_depth": 64, "max_big_int_bytes": 128 })";
            }
            const auto from_file = codec_config::from_file(path);
            test_same(from_file.max_nesting_depth, size_t { 64 });
            test_same(from_file.max_big_int_bytes, size_t { 128 });
            const auto cfg = codec_config::from_env(fake_env({ { "LC_MAX_NESTING_DEPTH", "8" } }), from_file);
            test_same(cfg.max_nesting_depth, size_t { 8 });
            test_same(cfg.max_big_int_bytes, size_t { 128 });
            std::filesystem::remove(path);
            test_throws<error>("can't open the config file", [&] { codec_config::from_file(path); });
        };
        "process-wide"_test = [] {
            expect(codec_config::get().max_collection_size > 0);
        };
    };
};
