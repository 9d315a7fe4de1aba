/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CBOR_BOUNDED_BYTES_HPP
#define LEDGER_CODEC_CBOR_BOUNDED_BYTES_HPP

#include <lc/cbor/decoder.hpp>
#include <lc/cbor/encoder.hpp>

/*
 * The ledger's bounded_bytes: any byte string chunk present on the wire, be it a whole definite string
 * or a single chunk of an indefinite one, may not be longer than 64 bytes.
 * Longer values must therefore be written as indefinite strings.
 */

namespace ledger_codec::cbor::bounded_bytes {
    static constexpr size_t max_chunk_size = 64;

    // Follows the recorded form while it is valid for the bytes,
    // otherwise writes a single definite string or, for longer values, 64-byte chunks of an indefinite one.
    extern void write(encoder &enc, buffer bytes, const string_form &form, bool force_canonical);
    extern std::pair<uint8_vector, string_form> read(decoder &dec);
}

#endif // !LEDGER_CODEC_CBOR_BOUNDED_BYTES_HPP
