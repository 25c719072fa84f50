#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "output.hpp"

using Records = std::vector<ChecksumRecord>;

static const Records ELEVEN_LINES = {
    { 10, "HE" }, { 20, "PH" }, { 30, "IM" }, { 40, "CD" }, { 50, "OB" }, { 60, "OF" },
    { 70, "OG" }, { 80, "NI" }, { 90, "DG" }, { 100, "IC" }, { 64000, "KK" },
};

static std::string read_all(const std::filesystem::path &path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

TEST(Output, ChecksumFile) {
    const auto text = checksum_file_text(ELEVEN_LINES);

    EXPECT_EQ(text.rfind("10 HE\n20 PH\n", 0), 0u);
    EXPECT_NE(text.find("\n64000 KK\n\nLines: 11\n"), std::string::npos);
    EXPECT_EQ(checksum_file_text(Records{ { 10, "AB" } }), "10 AB\n\nLines: 1\n");
}

TEST(Output, GridIsColumnMajor) {
    EXPECT_EQ(checksum_grid(ELEVEN_LINES, 44),
        "    10 HE       50 OB       90 DG   \n"
        "    20 PH       60 OF      100 IC   \n"
        "    30 IM       70 OG    64000 KK   \n"
        "    40 CD       80 NI   \n"
        "\nLines: 11\n\n");
}

TEST(Output, GridNarrowTerminal) {
    EXPECT_EQ(checksum_grid(Records{ { 11110, "AP" } }, 31), " 11110 AP   \n\nLines: 1\n\n");
    EXPECT_EQ(checksum_grid(Records{ { 1, "AA" }, { 2, "BB" } }, 5),
        "     1 AA   \n     2 BB   \n\nLines: 2\n\n");
}

TEST(Output, ConfirmOverwrite) {
    auto yes = std::istringstream("y\n");
    EXPECT_TRUE(confirm_overwrite("game.prg", yes));

    auto upper = std::istringstream("Y\n");
    EXPECT_TRUE(confirm_overwrite("game.prg", upper));

    auto no = std::istringstream("yes\n");
    EXPECT_FALSE(confirm_overwrite("game.prg", no));

    auto eof = std::istringstream("");
    EXPECT_FALSE(confirm_overwrite("game.prg", eof));
}

TEST(Output, WriteBinaryAsksBeforeReplacing) {
    const auto path = std::filesystem::temp_directory_path() / "retrotype_output_test.prg";
    std::filesystem::remove(path);

    const auto first = std::vector<u8>{ 1, 8, 0, 0 };
    const auto second = std::vector<u8>{ 1, 16, 0, 0 };

    auto no_input = std::istringstream("");
    ASSERT_TRUE(write_binary(path.string(), first, no_input));
    EXPECT_EQ(read_all(path), std::string("\x01\x08\x00\x00", 4));

    auto decline = std::istringstream("n\n");
    ASSERT_TRUE(write_binary(path.string(), second, decline));
    EXPECT_EQ(read_all(path), std::string("\x01\x08\x00\x00", 4));

    auto accept = std::istringstream("y\n");
    ASSERT_TRUE(write_binary(path.string(), second, accept));
    EXPECT_EQ(read_all(path), std::string("\x01\x10\x00\x00", 4));

    std::filesystem::remove(path);
}

TEST(Output, WriteChecksums) {
    const auto path = std::filesystem::temp_directory_path() / "retrotype_output_test.chk";

    ASSERT_TRUE(write_checksums(path.string(), ELEVEN_LINES));
    EXPECT_EQ(read_all(path), checksum_file_text(ELEVEN_LINES));

    std::filesystem::remove(path);
}
