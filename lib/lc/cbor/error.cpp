/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cbor/error.hpp>

namespace ledger_codec::cbor {
    decode_error::decode_error(const failure kind, const size_t offset, const std::string_view detail):
        error { fmt::format("decoding failed at offset {} because: {}: {}", offset, kind, detail) },
        _kind { kind }, _offset { offset }, _detail { detail }
    {
    }

    decode_error &decode_error::annotate(const std::string_view name)
    {
        if (_location.empty())
            _location = name;
        else
            _location = fmt::format("{}.{}", name, _location);
        _replace_message(_make_message());
        return *this;
    }

    std::string decode_error::_make_message() const
    {
        if (_location.empty())
            return fmt::format("decoding failed at offset {} because: {}: {}", _offset, _kind, _detail);
        return fmt::format("decoding failed in {} at offset {} because: {}: {}", _location, _offset, _kind, _detail);
    }
}
