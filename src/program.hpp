#pragma once

#include <vector>
#include <string>

#include "types.hpp"

// One numbered line of the typed-in listing, lower-case, whitespace trimmed
struct SourceLine {
    u16 number;
    std::string text;
};

// Text with every magazine escape rewritten to the petcat-style {xxx} form
struct CanonicalLine {
    u16 number;
    std::string text;
};

// Tokenized bytes of one line; always ends with the 0 terminator
struct EncodedLine {
    u16 number;
    std::vector<u8> bytes;
};

struct ChecksumRecord {
    u16 number;
    std::string code; // two letters, 'A'..'P'

    bool operator==(const ChecksumRecord &) const = default;
};

struct Program {
    std::vector<EncodedLine> lines;
    std::vector<ChecksumRecord> checksums;

    u16 load_address;
    std::vector<u8> image; // .prg contents, load address included
};
