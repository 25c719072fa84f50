#include "tokenizer.hpp"

#include <cstdio>

#include "char_maps.hpp"
#include "sequencer.hpp"
#include "strings.hpp"

// ASCII lower case sits where PETSCII keeps upper case in an unshifted listing
constexpr u8 LOWERCASE_FIRST = 'a';
constexpr u8 LOWERCASE_LAST = 'z';
constexpr u8 PETSCII_CASE_SHIFT = 32;

static bool match_table(std::span<const CharToken> table, std::string_view text, CharToken &out) {
    for (const auto &token : table) {
        if (text.starts_with(token.text)) {
            out = token;
            return true;
        }
    }
    return false;
}

Tokenizer::ScanResult Tokenizer::scan(std::string_view text, ScanState state) {
    auto token = CharToken{};

    bool matched = match_table(petcat_tokens(), text, token)
        || match_table(shift_commodore_tokens(), text, token);

    if (!matched && !state.in_quotes && !state.in_remark) {
        matched = match_table(basic_v2_tokens(), text, token);
    }

    u8 byte{};
    std::size_t length{};
    if (matched) {
        byte = token.value;
        length = token.text.length();
    } else {
        u32 code_point{};
        if (decode_utf8(text, code_point, length) && code_point <= 0xFF) {
            byte = u8(code_point);
        } else {
            byte = u8(text[0]);
            length = 1;
        }
        if (byte >= LOWERCASE_FIRST && byte <= LOWERCASE_LAST) byte -= PETSCII_CASE_SHIFT;
    }

    if (byte == QUOTE_CHAR) state.in_quotes = !state.in_quotes;
    if (byte == REM_TOKEN) state.in_remark = true;

    return ScanResult {
        .byte = byte,
        .rest = substring(text, length),
        .state = state,
    };
}

bool Tokenizer::check_characters(std::span<const std::string> listing, ListingError &err) {
    for (std::size_t i = 0; i < listing.size(); ++i) {
        const std::string_view line = listing[i];

        std::size_t pos = 0;
        while (pos < line.length()) {
            u32 code_point{};
            std::size_t length{};
            const bool decoded = decode_utf8(substring(line, pos), code_point, length);
            if (decoded && code_point <= 0xFF) {
                pos += length;
                continue;
            }

            char detail[16];
            if (decoded) std::snprintf(detail, sizeof(detail), "U+%04X", unsigned(code_point));
            else std::snprintf(detail, sizeof(detail), "byte 0x%02X", unsigned(u8(line[pos])));

            u16 number = 0;
            auto split = Sequencer::SplitLine{};
            if (!Sequencer::split_line_num(line, split) || !Sequencer::parse_line_number(split.digits, number)) {
                number = 0; // only without a prior sequence check
            }

            err = ListingError {
                .kind = ErrorKind::CHARACTER,
                .line_number = number,
                .offending_number = number,
                .listing_index = i,
                .column = pos,
                .detail = detail,
            };
            return false;
        }
    }

    return true;
}

std::vector<u8> Tokenizer::tokenize_line(std::string_view text) {
    auto bytes = std::vector<u8>{};
    bytes.reserve(text.length() + 1);

    auto state = ScanState{};
    while (!text.empty()) {
        const auto result = scan(text, state);
        bytes.push_back(result.byte);
        text = result.rest;
        state = result.state;
    }

    bytes.push_back(0);
    return bytes;
}

EncodedLine Tokenizer::encode(const CanonicalLine &line) {
    return EncodedLine {
        .number = line.number,
        .bytes = tokenize_line(line.text),
    };
}

std::vector<EncodedLine> Tokenizer::encode_listing(std::span<const CanonicalLine> lines) {
    auto out = std::vector<EncodedLine>{};
    out.reserve(lines.size());

    for (const auto &line : lines) out.push_back(encode(line));

    return out;
}
