#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"
#include "program.hpp"

// Ahoy! "Bug Repellent" line codes. Each issue range used its own version of
// the checker program, and the codes printed next to a listing only match the
// algorithm of the matching version.
enum class SourceVariant : u8 {
    AHOY1, // Mar-Apr 1984
    AHOY2, // May 1984 - Apr 1987
    AHOY3, // May 1987 onwards
};

namespace Checksum {
    constexpr SourceVariant DEFAULT_VARIANT = SourceVariant::AHOY2;

    // "ahoy1", "ahoy2", "ahoy3". False for anything else.
    bool parse_variant(std::string_view name, SourceVariant &out);
    std::string_view variant_name(SourceVariant variant);

    // Two letters, high nibble first, 'A' + nibble
    std::string to_code(u8 value);

    // The raw accumulators. Bytes are a tokenized line, terminator included.
    u8 ahoy1_value(std::span<const u8> bytes);
    u8 ahoy2_value(std::span<const u8> bytes);
    u8 ahoy3_value(u16 line_number, std::span<const u8> bytes);

    std::string line_checksum(SourceVariant variant, u16 line_number, std::span<const u8> bytes);

    std::vector<ChecksumRecord> listing_checksums(SourceVariant variant, std::span<const EncodedLine> lines);
}
