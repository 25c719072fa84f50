#include "output.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>

#include <sys/ioctl.h>
#include <unistd.h>

constexpr std::size_t GRID_CELL_WIDTH = 12;
constexpr std::size_t DEFAULT_TERMINAL_WIDTH = 80;

std::string checksum_file_text(std::span<const ChecksumRecord> records) {
    auto text = std::string{};
    for (const auto &record : records) {
        text += std::to_string(record.number);
        text += ' ';
        text += record.code;
        text += '\n';
    }

    text += "\nLines: " + std::to_string(records.size()) + "\n";
    return text;
}

std::string checksum_grid(std::span<const ChecksumRecord> records, std::size_t width) {
    std::size_t columns = width / GRID_CELL_WIDTH;
    if (columns == 0) columns = 1;

    const std::size_t rows = (records.size() + columns - 1) / columns;

    auto text = std::string{};
    char cell[32];
    for (std::size_t row = 0; row < rows; ++row) {
        for (std::size_t col = 0; col < columns; ++col) {
            const std::size_t idx = row + col * rows;
            if (idx >= records.size()) continue;

            // Number right aligned in 6 columns, then the code and 3 spaces
            const auto &record = records[idx];
            std::snprintf(cell, sizeof(cell), "%6u %s   ", unsigned(record.number), record.code.c_str());
            text += cell;
        }
        text += '\n';
    }

    text += "\nLines: " + std::to_string(records.size()) + "\n\n";
    return text;
}

std::size_t terminal_width() {
    winsize size{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) == 0 && size.ws_col > 0) {
        return size.ws_col;
    }
    return DEFAULT_TERMINAL_WIDTH;
}

bool confirm_overwrite(std::string_view filename, std::istream &in) {
    std::printf("Output file \"%.*s\" already exists. Overwrite? (Y = yes) ", (int)filename.length(), filename.data());
    std::fflush(stdout);

    auto answer = std::string{};
    if (!std::getline(in, answer)) return false;

    return answer == "y" || answer == "Y";
}

bool write_binary(const std::string &filename, std::span<const u8> image, std::istream &in) {
    std::printf("Writing binary output file \"%s\"...\n\n", filename.c_str());

    // "x": fail instead of truncating when the file is already there
    std::FILE *file = std::fopen(filename.c_str(), "wbx");
    if (!file && errno == EEXIST) {
        if (!confirm_overwrite(filename, in)) {
            std::printf("File \"%s\" not overwritten.\n\n", filename.c_str());
            return true;
        }
        file = std::fopen(filename.c_str(), "wb");
    }

    if (!file) {
        std::printf("Error: Could not open \"%s\" for writing (%s)\n", filename.c_str(), std::strerror(errno));
        return false;
    }

    const std::size_t written = std::fwrite(image.data(), 1, image.size(), file);
    const bool closed = std::fclose(file) == 0;

    if (written != image.size() || !closed) {
        std::printf("Error: Writing \"%s\" failed\n", filename.c_str());
        return false;
    }

    std::printf("File \"%s\" written successfully.\n\n", filename.c_str());
    return true;
}

bool write_checksums(const std::string &filename, std::span<const ChecksumRecord> records) {
    std::ofstream stream(filename, std::ios::out | std::ios::trunc);
    if (!stream) {
        std::printf("Error: Could not open \"%s\" for writing\n", filename.c_str());
        return false;
    }

    stream << checksum_file_text(records);
    stream.close();

    if (!stream) {
        std::printf("Error: Writing \"%s\" failed\n", filename.c_str());
        return false;
    }
    return true;
}
