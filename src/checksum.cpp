#include "checksum.hpp"

#include <stdexcept>

#include "char_maps.hpp"

bool Checksum::parse_variant(std::string_view name, SourceVariant &out) {
    if (name == "ahoy1") out = SourceVariant::AHOY1;
    else if (name == "ahoy2") out = SourceVariant::AHOY2;
    else if (name == "ahoy3") out = SourceVariant::AHOY3;
    else return false;

    return true;
}

std::string_view Checksum::variant_name(SourceVariant variant) {
    switch (variant) {
        case SourceVariant::AHOY1: return "ahoy1";
        case SourceVariant::AHOY2: return "ahoy2";
        case SourceVariant::AHOY3: return "ahoy3";
        default: return "{unknown}";
    }
}

std::string Checksum::to_code(u8 value) {
    auto code = std::string(2, 'A');
    code[0] = char('A' + (value >> 4));
    code[1] = char('A' + (value & 0x0F));
    return code;
}

// Mar-Apr 1984: add, shift left, keep a byte. Every space is skipped, even
// inside strings; the later versions only skip spaces outside quotes.
u8 Checksum::ahoy1_value(std::span<const u8> bytes) {
    u8 value = 0;

    for (u8 byte : bytes) {
        if (byte == SPACE_CHAR) continue;
        value = u8((value + byte) << 1);
    }
    return value;
}

u8 Checksum::ahoy2_value(std::span<const u8> bytes) {
    u8 xor_value = 0;
    u8 position = 1;
    bool in_quotes = false;

    for (u8 byte : bytes) {
        // The checker compares against '"' (CMP #$22) right before the ADC,
        // so the carry going into the addition is set for everything >= 34.
        const u8 carry = byte < QUOTE_CHAR ? 0 : 1;

        if (byte == QUOTE_CHAR) in_quotes = !in_quotes;
        if (byte == SPACE_CHAR && !in_quotes) continue;

        const u8 next = u8(byte + xor_value + carry);
        xor_value = u8(next ^ position);
        position += 1;
    }
    return xor_value;
}

// May 1987 onwards: the line number (low, high) is checked along with the text
u8 Checksum::ahoy3_value(u16 line_number, std::span<const u8> bytes) {
    auto line = std::vector<u8>{};
    line.reserve(bytes.size() + 2);
    line.push_back(u8(line_number % 256));
    line.push_back(u8(line_number / 256));
    line.insert(line.end(), bytes.begin(), bytes.end());

    u8 xor_value = 0;
    u8 position = 0;
    bool in_quotes = false;

    for (u8 byte : line) {
        if (byte == QUOTE_CHAR) in_quotes = !in_quotes;
        if (byte == SPACE_CHAR && !in_quotes) continue;

        const u8 next = u8(byte + xor_value);
        xor_value = u8(next ^ position);
        position += 1;
    }
    return xor_value;
}

std::string Checksum::line_checksum(SourceVariant variant, u16 line_number, std::span<const u8> bytes) {
    switch (variant) {
        case SourceVariant::AHOY1: return to_code(ahoy1_value(bytes));
        case SourceVariant::AHOY2: return to_code(ahoy2_value(bytes));
        case SourceVariant::AHOY3: return to_code(ahoy3_value(line_number, bytes));
    }
    throw std::invalid_argument("no checksum algorithm for this source variant");
}

std::vector<ChecksumRecord> Checksum::listing_checksums(SourceVariant variant, std::span<const EncodedLine> lines) {
    auto records = std::vector<ChecksumRecord>{};
    records.reserve(lines.size());

    for (const auto &line : lines) {
        records.push_back(ChecksumRecord {
            .number = line.number,
            .code = line_checksum(variant, line.number, line.bytes),
        });
    }
    return records;
}
