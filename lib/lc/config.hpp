/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CONFIG_HPP
#define LEDGER_CODEC_CONFIG_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <boost/json.hpp>
#include <lc/common/format.hpp>

namespace ledger_codec {
    /*
     * Hard limits applied by the CBOR decoder to untrusted input.
     * The process-wide instance starts from the defaults below, then applies the JSON file named by LC_CONFIG
     * and finally the LC_MAX_COLLECTION_SIZE, LC_MAX_STRING_SIZE, LC_MAX_NESTING_DEPTH and LC_MAX_BIG_INT_BYTES variables.
     * max_collection_size counts the items of arrays and maps and the chunks of indefinite strings,
     * max_string_size counts the bytes of a byte or text string.
     */
    struct codec_config {
        static constexpr size_t default_max_collection_size = 0x100'000;
        static constexpr size_t default_max_string_size = 0x4'000'000;
        static constexpr size_t default_max_nesting_depth = 1024;
        static constexpr size_t default_max_big_int_bytes = 8192;

        using env_lookup = std::function<std::optional<std::string>(std::string_view)>;

        size_t max_collection_size = default_max_collection_size;
        size_t max_string_size = default_max_string_size;
        size_t max_nesting_depth = default_max_nesting_depth;
        size_t max_big_int_bytes = default_max_big_int_bytes;

        static const codec_config &get();
        static codec_config from_json(const boost::json::object &j, const codec_config &base={});
        static codec_config from_file(const std::string &path, const codec_config &base={});
        static codec_config from_env(const env_lookup &lookup, const codec_config &base={});
        static std::optional<std::string> process_env(std::string_view name);

        bool operator==(const codec_config &) const =default;
    };
}

namespace fmt {
    template<>
    struct formatter<ledger_codec::codec_config>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "max_collection_size: {} max_string_size: {} max_nesting_depth: {} max_big_int_bytes: {}",
                v.max_collection_size, v.max_string_size, v.max_nesting_depth, v.max_big_int_bytes);
        }
    };
}

#endif // !LEDGER_CODEC_CONFIG_HPP
