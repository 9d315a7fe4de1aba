/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <lc/config.hpp>
#include <lc/logger.hpp>

namespace ledger_codec {
    static size_t parse_limit(const std::string_view name, const std::string &text)
    {
        size_t val = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), val);
        if (ec != std::errc {} || ptr != text.data() + text.size()) [[unlikely]]
            throw error(fmt::format("the value of {} must be an unsigned integer but got: '{}'", name, text));
        if (val == 0) [[unlikely]]
            throw error(fmt::format("the value of {} must be positive", name));
        return val;
    }

    static size_t json_limit(const boost::json::value &v, const std::string_view name)
    {
        uint64_t val = 0;
        if (const auto *u = v.if_uint64(); u)
            val = *u;
        else if (const auto *i = v.if_int64(); i && *i >= 0)
            val = static_cast<uint64_t>(*i);
        else
            throw error(fmt::format("the config element {} must be an unsigned integer but got: {}", name, boost::json::serialize(v)));
        if (val == 0) [[unlikely]]
            throw error(fmt::format("the value of {} must be positive", name));
        return static_cast<size_t>(val);
    }

    static std::string read_file(const std::string &path)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is) [[unlikely]]
            throw error(fmt::format("can't open the config file {}", path));
        std::string data { std::istreambuf_iterator<char> { is }, std::istreambuf_iterator<char> {} };
        if (is.bad()) [[unlikely]]
            throw error(fmt::format("failed to read the config file {}", path));
        return data;
    }

    codec_config codec_config::from_json(const boost::json::object &j, const codec_config &base)
    {
        codec_config cfg { base };
        for (const auto &[jk, v]: j) {
            const std::string_view k { jk.data(), jk.size() };
            if (k == "max_collection_size")
                cfg.max_collection_size = json_limit(v, k);
            else if (k == "max_string_size")
                cfg.max_string_size = json_limit(v, k);
            else if (k == "max_nesting_depth")
                cfg.max_nesting_depth = json_limit(v, k);
            else if (k == "max_big_int_bytes")
                cfg.max_big_int_bytes = json_limit(v, k);
            else
                throw error(fmt::format("unsupported config element: {}", k));
        }
        return cfg;
    }

    codec_config codec_config::from_file(const std::string &path, const codec_config &base)
    {
        const auto data = read_file(path);
        boost::json::error_code ec {};
        const auto j = boost::json::parse(data, ec);
        if (ec) [[unlikely]]
            throw error(fmt::format("the config file {} is not valid JSON: {}", path, ec.message()));
        if (!j.is_object()) [[unlikely]]
            throw error(fmt::format("the config file {} must contain a JSON object", path));
        return from_json(j.get_object(), base);
    }

    std::optional<std::string> codec_config::process_env(const std::string_view name)
    {
        if (const char *val = std::getenv(std::string { name }.c_str()); val)
            return std::string { val };
        return {};
    }

    codec_config codec_config::from_env(const env_lookup &lookup, const codec_config &base)
    {
        codec_config cfg { base };
        if (const auto val = lookup("LC_MAX_COLLECTION_SIZE"); val)
            cfg.max_collection_size = parse_limit("LC_MAX_COLLECTION_SIZE", *val);
        if (const auto val = lookup("LC_MAX_STRING_SIZE"); val)
            cfg.max_string_size = parse_limit("LC_MAX_STRING_SIZE", *val);
        if (const auto val = lookup("LC_MAX_NESTING_DEPTH"); val)
            cfg.max_nesting_depth = parse_limit("LC_MAX_NESTING_DEPTH", *val);
        if (const auto val = lookup("LC_MAX_BIG_INT_BYTES"); val)
            cfg.max_big_int_bytes = parse_limit("LC_MAX_BIG_INT_BYTES", *val);
        return cfg;
    }

    const codec_config &codec_config::get()
    {
        static const codec_config cfg = [] {
            codec_config c {};
            if (const auto path = process_env("LC_CONFIG"); path) {
                c = from_file(*path);
                logger::info("codec limits loaded from {}: {}", *path, c);
            }
            c = from_env(process_env, c);
            if (c != codec_config {})
                logger::info("codec limits in effect: {}", c);
            return c;
        }();
        return cfg;
    }
}
