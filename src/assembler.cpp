#include "assembler.hpp"

#include <stdexcept>

static void push_word(std::vector<u8> &out, u32 word) {
    out.push_back(u8(word & 0xFF));
    out.push_back(u8((word >> 8) & 0xFF));
}

// Start address of the record after `line`, unmasked
static u32 next_line_address(u32 address, const EncodedLine &line) {
    return address + 4 + u32(line.bytes.size());
}

bool Assembler::check_size(std::span<const EncodedLine> lines, u16 load_address, ListingError &err) {
    u32 address = load_address;
    for (const auto &line : lines) {
        address = next_line_address(address, line);
        if (address > MAX_ADDRESS) {
            err = ListingError {
                .kind = ErrorKind::PROGRAM_SIZE,
                .line_number = line.number,
                .offending_number = line.number,
            };
            return false;
        }
    }
    return true;
}

std::vector<u8> Assembler::assemble(std::span<const EncodedLine> lines, u16 load_address) {
    std::size_t total = 2 + 2;
    for (const auto &line : lines) total += 4 + line.bytes.size();

    auto image = std::vector<u8>{};
    image.reserve(total);

    push_word(image, load_address);

    // Address of the current line's link field
    u32 address = load_address;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto &line = lines[i];

        if (i > 0 && !(lines[i - 1].number < line.number)) {
            throw std::invalid_argument("line numbers of an assembled program must be strictly increasing");
        }

        const u32 next_address = next_line_address(address, line);
        if (next_address > MAX_ADDRESS) {
            throw std::invalid_argument("program runs past the end of memory");
        }

        push_word(image, next_address);
        push_word(image, line.number);
        image.insert(image.end(), line.bytes.begin(), line.bytes.end());

        address = next_address;
    }

    push_word(image, 0);
    return image;
}
