#pragma once

#include "types.hpp"
#include "checksum.hpp"
#include "assembler.hpp"

// retrotype command line options

struct Options {
    const char* filename;
    u16 load_address = Assembler::C64_LOAD_ADDRESS;
    SourceVariant variant = Checksum::DEFAULT_VARIANT;
    bool dry_run = false; // checks and checksums only, no files written
};

bool parse_options(int argc, char **argv, Options &out);
