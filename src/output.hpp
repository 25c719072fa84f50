#pragma once

#include <iosfwd>
#include <span>
#include <string>
#include <string_view>

#include "types.hpp"
#include "program.hpp"

// "<number> <code>" per line, a blank line, then "Lines: <count>"
std::string checksum_file_text(std::span<const ChecksumRecord> records);

// Column-major grid, `width / 12` columns, as printed to the console
std::string checksum_grid(std::span<const ChecksumRecord> records, std::size_t width);

// Columns of the attached terminal, 80 if there is none
std::size_t terminal_width();

// Asks on stdout, reads the answer from `in`. Only y/Y counts as yes.
bool confirm_overwrite(std::string_view filename, std::istream &in);

// Writes the .prg. An existing file is only replaced after confirm_overwrite().
// False if the file could not be written (declining to overwrite is not a failure).
bool write_binary(const std::string &filename, std::span<const u8> image, std::istream &in);

bool write_checksums(const std::string &filename, std::span<const ChecksumRecord> records);
