/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cbor/bounded-bytes.hpp>
#include <lc/logger.hpp>

namespace ledger_codec::cbor::bounded_bytes {
    void write(encoder &enc, const buffer bytes, const string_form &form, const bool force_canonical)
    {
        if (!force_canonical) {
            switch (form.type) {
                case string_form::kind::definite:
                    if (bytes.size() <= max_chunk_size) {
                        enc.bytes(bytes, choose_width(bytes.size(), form.width, false));
                        return;
                    }
                    logger::debug("bounded bytes of size {} no longer fit into a definite string", bytes.size());
                    break;
                case string_form::kind::indefinite: {
                    bool chunks_ok = form.chunks_fit(bytes.size());
                    for (const auto &c: form.chunks)
                        chunks_ok &= c.size <= max_chunk_size;
                    if (chunks_ok) {
                        enc.bytes();
                        size_t start = 0;
                        for (const auto &c: form.chunks) {
                            enc.bytes(bytes.subbuf(start, c.size), c.width);
                            start += c.size;
                        }
                        enc.s_break();
                        return;
                    }
                    logger::debug("the recorded chunking {} does not match bounded bytes of size {}", form, bytes.size());
                    break;
                }
                default:
                    break;
            }
        }
        if (bytes.size() <= max_chunk_size) {
            enc.bytes(bytes);
            return;
        }
        enc.bytes();
        for (size_t start = 0; start < bytes.size(); start += max_chunk_size)
            enc.bytes(bytes.subbuf(start, std::min(max_chunk_size, bytes.size() - start)));
        enc.s_break();
    }

    std::pair<uint8_vector, string_form> read(decoder &dec)
    {
        const auto start = dec.position();
        auto res = dec.bytes();
        const auto &[bytes, form] = res;
        if (form.type == string_form::kind::indefinite) {
            for (size_t i = 0; i < form.chunks.size(); ++i) {
                if (form.chunks[i].size > max_chunk_size) [[unlikely]]
                    throw decode_error { failure::range_check, start,
                        fmt::format("chunk #{} of bounded bytes has {} bytes but at most {} are allowed", i, form.chunks[i].size, max_chunk_size) };
            }
        } else if (bytes.size() > max_chunk_size) [[unlikely]] {
            throw decode_error { failure::range_check, start,
                fmt::format("definite bounded bytes have {} bytes but at most {} are allowed", bytes.size(), max_chunk_size) };
        }
        return res;
    }
}
