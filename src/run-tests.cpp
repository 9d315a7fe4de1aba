/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/common/test.hpp>
#include <lc/config.hpp>
#include <lc/logger.hpp>

using namespace ledger_codec;

int main(int argc, char **argv)
{
    logger::info("codec limits: {}", codec_config::get());
    if (argc >= 2) {
        logger::info("using test-filter mask: {}", argv[1]);
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
}
