#pragma once

#include <span>
#include <vector>

#include "types.hpp"
#include "errors.hpp"
#include "program.hpp"

namespace Assembler {
    // Start of BASIC memory on the supported machines
    constexpr u16 C64_LOAD_ADDRESS = 0x0801;
    constexpr u16 VIC20_LOAD_ADDRESS = 0x1001;       // unexpanded
    constexpr u16 VIC20_3K_LOAD_ADDRESS = 0x0401;
    constexpr u16 VIC20_8K_LOAD_ADDRESS = 0x1201;    // also +16K, +24K

    constexpr u32 MAX_ADDRESS = 0xFFFF;

    // False if a line record would end past MAX_ADDRESS
    bool check_size(std::span<const EncodedLine> lines, u16 load_address, ListingError &err);

    // Image layout:
    //   load address (lo, hi)
    //   per line: address of the next line (lo, hi), line number (lo, hi), bytes
    //   0, 0 (end of program)
    // Line numbers must be strictly increasing and check_size() must pass,
    // throws std::invalid_argument otherwise.
    std::vector<u8> assemble(std::span<const EncodedLine> lines, u16 load_address);
}
