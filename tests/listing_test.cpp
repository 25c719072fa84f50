#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "listing.hpp"

using Lines = std::vector<std::string>;

TEST(Listing, DropsBlankLinesAndLowerCases) {
    const auto lines = to_listing("10 PRINT\"HELLO!\"\r\n\n   \t\n20 GOTO10   \n");
    EXPECT_EQ(lines, (Lines{ "10 print\"hello!\"", "20 goto10" }));
}

TEST(Listing, LastLineWithoutNewline) {
    EXPECT_EQ(to_listing("10 END"), (Lines{ "10 end" }));
    EXPECT_TRUE(to_listing("").empty());
    EXPECT_TRUE(to_listing("\n\n").empty());
}

TEST(Listing, ReadsFile) {
    const auto path = std::filesystem::temp_directory_path() / "retrotype_listing_test.txt";
    {
        std::ofstream file(path);
        file << "10 print\"hello!\"\n20 goto10\n";
    }

    auto lines = Lines{};
    ASSERT_TRUE(read_listing(path.c_str(), lines));
    EXPECT_EQ(lines, (Lines{ "10 print\"hello!\"", "20 goto10" }));

    std::filesystem::remove(path);
}

TEST(Listing, MissingFile) {
    auto lines = Lines{ "untouched" };
    EXPECT_FALSE(read_listing("/nonexistent/retrotype/listing.txt", lines));
    EXPECT_EQ(lines, (Lines{ "untouched" }));
}
