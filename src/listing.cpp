#include "listing.hpp"

#include <fstream>
#include <utility>

#include "strings.hpp"

std::vector<std::string> to_listing(std::string_view str) {
    auto lines = std::vector<std::string>{};

    while (!str.empty()) {
        std::string_view line{};
        if (auto idx = str.find_first_of('\n'); idx != str.npos) {
            line = substring(str, 0, idx);
            str = substring(str, idx + 1);
        } else {
            line = str;
            str = substring(str, str.length());
        }

        trim_end(line);

        // Leading whitespace stays, the sequencer skips it
        auto rest = line;
        skip_spaces(rest);
        if (rest.empty()) continue;

        lines.push_back(ascii_lower(line));
    }

    return lines;
}

static bool read_file(const char *filename, std::string &out) {
    std::ifstream stream(filename, std::ios::in | std::ios::binary);
    if (!stream) return false;

    auto buf = std::string();
    stream.seekg(0, std::ios::end);
    const auto size = stream.tellg();
    if (size < 0) return false;

    buf.resize(std::size_t(size));
    stream.seekg(0, std::ios::beg);
    stream.read(&buf[0], std::streamsize(buf.size()));
    if (!stream) return false;

    out = std::move(buf);
    return true;
}

bool read_listing(const char *filename, std::vector<std::string> &out) {
    auto text = std::string{};
    if (!read_file(filename, text)) return false;

    out = to_listing(text);
    return true;
}
