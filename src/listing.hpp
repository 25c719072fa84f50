#pragma once

#include <string>
#include <string_view>
#include <vector>

// Splits file contents into listing lines: blank lines dropped, trailing
// whitespace (and \r) stripped, ASCII letters lower-cased.
// Listings are UTF-8 text. Characters up to U+00FF (Latin-1, e.g. the pound
// sign) stand for the byte of the same value; anything else is rejected by
// Tokenizer::check_characters().
std::vector<std::string> to_listing(std::string_view text);

// False if the file can't be read
bool read_listing(const char *filename, std::vector<std::string> &out);
