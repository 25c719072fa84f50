#pragma once

#include <cctype>
#include <string>
#include <string_view>

#include "types.hpp"

// Small string_view helpers shared by the listing passes.

// str.substr() does bounds checks that are redundant here
inline std::string_view substring(std::string_view str, std::size_t start, std::size_t end) {
    return std::string_view { str.data() + start, end - start };
}

inline std::string_view substring(std::string_view str, std::size_t start) {
    return std::string_view { str.data() + start, str.length() - start };
}

// std::isspace is UB for negative chars, and listings may carry Latin-1 bytes
inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

inline void skip_spaces(std::string_view &str) {
    while (!str.empty() && is_space(str[0])) str = substring(str, 1);
}

inline void trim_end(std::string_view &str) {
    while (!str.empty() && is_space(str.back())) str = substring(str, 0, str.length() - 1);
}

// ASCII only, on purpose: bytes >= 0x80 pass through unchanged
inline std::string ascii_upper(std::string_view str) {
    auto out = std::string{ str };
    for (char &c : out) {
        if (c >= 'a' && c <= 'z') c = char(c - 'a' + 'A');
    }
    return out;
}

inline std::string ascii_lower(std::string_view str) {
    auto out = std::string{ str };
    for (char &c : out) {
        if (c >= 'A' && c <= 'Z') c = char(c - 'A' + 'a');
    }
    return out;
}

// One UTF-8 encoded character from the start of `text`. False for a stray
// continuation byte, a cut-off sequence or an overlong form.
inline bool decode_utf8(std::string_view text, u32 &code_point, std::size_t &length) {
    if (text.empty()) return false;

    const u8 lead = u8(text[0]);
    if (lead < 0x80) {
        code_point = lead;
        length = 1;
        return true;
    }

    std::size_t n{};
    u32 value{};
    if ((lead & 0xE0) == 0xC0) { n = 2; value = lead & 0x1F; }
    else if ((lead & 0xF0) == 0xE0) { n = 3; value = lead & 0x0F; }
    else if ((lead & 0xF8) == 0xF0) { n = 4; value = lead & 0x07; }
    else return false;

    if (text.length() < n) return false;
    for (std::size_t i = 1; i < n; ++i) {
        const u8 cont = u8(text[i]);
        if ((cont & 0xC0) != 0x80) return false;
        value = (value << 6) | (cont & 0x3F);
    }

    constexpr u32 SMALLEST[] = { 0, 0, 0x80, 0x800, 0x10000 };
    if (value < SMALLEST[n] || value > 0x10FFFF) return false;

    code_point = value;
    length = n;
    return true;
}
