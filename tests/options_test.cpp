#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "options.hpp"

// parse_options() wants a mutable argv
struct Argv {
    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        storage.insert(storage.begin(), "retrotype");
        for (auto &arg : storage) pointers.push_back(arg.data());
        pointers.push_back(nullptr);
    }

    int argc() const { return int(storage.size()); }
    char **argv() { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

TEST(Options, Defaults) {
    auto args = Argv({ "game.txt" });
    auto opts = Options{};

    ASSERT_TRUE(parse_options(args.argc(), args.argv(), opts));
    EXPECT_STREQ(opts.filename, "game.txt");
    EXPECT_EQ(opts.load_address, 0x0801);
    EXPECT_EQ(opts.variant, SourceVariant::AHOY2);
    EXPECT_FALSE(opts.dry_run);
}

TEST(Options, ShortForms) {
    auto args = Argv({ "-s", "ahoy1", "-l", "1001", "-d", "game.txt" });
    auto opts = Options{};

    ASSERT_TRUE(parse_options(args.argc(), args.argv(), opts));
    EXPECT_STREQ(opts.filename, "game.txt");
    EXPECT_EQ(opts.load_address, 0x1001);
    EXPECT_EQ(opts.variant, SourceVariant::AHOY1);
    EXPECT_TRUE(opts.dry_run);
}

TEST(Options, LongForms) {
    auto args = Argv({ "game.txt", "--source=ahoy3", "--loadaddr", "0x0401", "--dry" });
    auto opts = Options{};

    ASSERT_TRUE(parse_options(args.argc(), args.argv(), opts));
    EXPECT_EQ(opts.load_address, 0x0401);
    EXPECT_EQ(opts.variant, SourceVariant::AHOY3);
    EXPECT_TRUE(opts.dry_run);
}

TEST(Options, UnsupportedFormat) {
    auto args = Argv({ "-s", "ahoy4", "game.txt" });
    auto opts = Options{};

    EXPECT_FALSE(parse_options(args.argc(), args.argv(), opts));
}

TEST(Options, NeedsExactlyOneFile) {
    auto none = Argv({ "-d" });
    auto opts = Options{};
    EXPECT_FALSE(parse_options(none.argc(), none.argv(), opts));

    auto two = Argv({ "a.txt", "b.txt" });
    EXPECT_FALSE(parse_options(two.argc(), two.argv(), opts));
}

TEST(Options, UnknownOptionsAreIgnored) {
    auto args = Argv({ "--fast", "game.txt" });
    auto opts = Options{};

    ASSERT_TRUE(parse_options(args.argc(), args.argv(), opts));
    EXPECT_STREQ(opts.filename, "game.txt");
}

TEST(Options, BadLoadAddress) {
    auto opts = Options{};

    auto too_large = Argv({ "-l", "10000", "game.txt" });
    EXPECT_FALSE(parse_options(too_large.argc(), too_large.argv(), opts));

    auto not_hex = Argv({ "--loadaddr=0x08g1", "game.txt" });
    EXPECT_FALSE(parse_options(not_hex.argc(), not_hex.argv(), opts));

    auto missing = Argv({ "game.txt", "-l" });
    EXPECT_FALSE(parse_options(missing.argc(), missing.argv(), opts));
}

TEST(Options, EverythingAfterDoubleDashIsAFile) {
    auto args = Argv({ "-d", "--", "-game.txt" });
    auto opts = Options{};

    ASSERT_TRUE(parse_options(args.argc(), args.argv(), opts));
    EXPECT_STREQ(opts.filename, "-game.txt");
    EXPECT_TRUE(opts.dry_run);
}
