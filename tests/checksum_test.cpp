#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "checksum.hpp"

using Bytes = std::vector<u8>;

static const Bytes HELLO_WORLD = { 153, 34, 72, 69, 76, 76, 79, 32, 87, 79, 82, 76, 68, 34, 0 };
static const Bytes HI_W = { 153, 34, 72, 73, 32, 87, 34, 0 };
static const Bytes HELLO_WORLD_SPACED = { 153, 32, 34, 72, 69, 76, 76, 79, 32, 87, 79, 82, 76, 68, 34, 0 };

TEST(Checksum, Variants) {
    auto variant = SourceVariant{};

    ASSERT_TRUE(Checksum::parse_variant("ahoy1", variant));
    EXPECT_EQ(variant, SourceVariant::AHOY1);
    ASSERT_TRUE(Checksum::parse_variant("ahoy3", variant));
    EXPECT_EQ(variant, SourceVariant::AHOY3);

    EXPECT_FALSE(Checksum::parse_variant("ahoy4", variant));
    EXPECT_FALSE(Checksum::parse_variant("AHOY1", variant));
    EXPECT_EQ(variant, SourceVariant::AHOY3);

    EXPECT_EQ(Checksum::variant_name(SourceVariant::AHOY2), "ahoy2");
    EXPECT_EQ(Checksum::DEFAULT_VARIANT, SourceVariant::AHOY2);
}

TEST(Checksum, ToCode) {
    EXPECT_EQ(Checksum::to_code(0x00), "AA");
    EXPECT_EQ(Checksum::to_code(0xA5), "KF");
    EXPECT_EQ(Checksum::to_code(0xFF), "PP");
}

TEST(Checksum, Ahoy1) {
    using Checksum::line_checksum;
    constexpr auto V = SourceVariant::AHOY1;

    EXPECT_EQ(line_checksum(V, 10, Bytes{ 71, 90, 0 }), "KA");
    EXPECT_EQ(line_checksum(V, 30, Bytes{ 71, 32, 90, 0 }), "KA");
    EXPECT_EQ(line_checksum(V, 40, HELLO_WORLD), "OI");
    EXPECT_EQ(line_checksum(V, 50, HELLO_WORLD_SPACED), "OI");
    EXPECT_EQ(line_checksum(V, 60, Bytes{ 65, 65, 49, 0 }), "NM");

    // PRINT"HI W": the space inside the quotes is skipped as well
    EXPECT_EQ(line_checksum(V, 10, HI_W), "NA");
    EXPECT_EQ(line_checksum(V, 10, Bytes{ 153, 34, 72, 73, 87, 34, 0 }), "NA");
}

TEST(Checksum, Ahoy2) {
    using Checksum::line_checksum;
    constexpr auto V = SourceVariant::AHOY2;

    EXPECT_EQ(line_checksum(V, 10, Bytes{ 71, 90, 0 }), "KF");
    EXPECT_EQ(line_checksum(V, 30, Bytes{ 71, 32, 90, 0 }), "KF");
    EXPECT_EQ(line_checksum(V, 40, HELLO_WORLD), "PE");
    EXPECT_EQ(line_checksum(V, 50, HELLO_WORLD_SPACED), "PE");
    EXPECT_EQ(line_checksum(V, 70, Bytes{ 65, 65, 50, 0 }), "LN");
    EXPECT_EQ(line_checksum(V, 80, Bytes{ 34, 71, 34, 0 }), "IM");
    EXPECT_EQ(line_checksum(V, 10, HI_W), "PN");

    // 11006 printtab(12)"{down}mike buhidar jr."
    const auto line = Bytes {
        153, 163, 49, 50, 41, 34, 17, 77, 73, 75, 69, 32, 66,
        85, 72, 73, 68, 65, 82, 32, 74, 82, 46, 34, 0,
    };
    EXPECT_EQ(line_checksum(V, 11006, line), "EI");
}

TEST(Checksum, Ahoy3IncludesLineNumber) {
    using Checksum::line_checksum;
    constexpr auto V = SourceVariant::AHOY3;
    const auto gosub325 = Bytes{ 141, 51, 50, 53, 0 };

    EXPECT_EQ(line_checksum(V, 25, gosub325), "EH");
    EXPECT_EQ(line_checksum(V, 256, gosub325), "CP");
    EXPECT_EQ(line_checksum(V, 23456, gosub325), "BN");
    EXPECT_EQ(line_checksum(V, 30, Bytes{ 141, 52, 50, 53, 0 }), "EP");
    EXPECT_EQ(line_checksum(V, 485, Bytes{ 142, 0 }), "HE");
}

TEST(Checksum, Ahoy3CountsSpacesInsideQuotes) {
    using Checksum::line_checksum;
    constexpr auto V = SourceVariant::AHOY3;

    // 20 PRINT"[8"[DOWN]"]"TAB(7)"PLEASE WAIT[4"."]READING DATA"
    const auto line = Bytes {
        153, 34, 17, 17, 17, 17, 17, 17, 17, 17, 34, 163, 55, 41, 34,
        80, 76, 69, 65, 83, 69, 32, 87, 65, 73, 84, 46, 46, 46, 46,
        82, 69, 65, 68, 73, 78, 71, 32, 68, 65, 84, 65, 34, 0,
    };
    EXPECT_EQ(line_checksum(V, 20, line), "LE");

    // The same line with the quoted spaces dropped no longer matches
    auto without_spaces = Bytes{};
    for (u8 byte : line) {
        if (byte != 32) without_spaces.push_back(byte);
    }
    EXPECT_NE(line_checksum(V, 20, without_spaces), "LE");
}

TEST(Checksum, UnknownVariantThrows) {
    EXPECT_THROW(Checksum::line_checksum(SourceVariant(7), 10, Bytes{ 0 }), std::invalid_argument);
}

TEST(Checksum, ListingChecksums) {
    const auto lines = std::vector<EncodedLine> {
        { 10, { 153, 34, 72, 69, 76, 76, 79, 34, 0 } },
        { 20, { 137, 49, 48, 0 } },
    };

    using Records = std::vector<ChecksumRecord>;
    EXPECT_EQ(Checksum::listing_checksums(SourceVariant::AHOY1, lines), (Records{ { 10, "IA" }, { 20, "NI" } }));
    EXPECT_EQ(Checksum::listing_checksums(SourceVariant::AHOY2, lines), (Records{ { 10, "EO" }, { 20, "PH" } }));
    EXPECT_EQ(Checksum::listing_checksums(SourceVariant::AHOY3, lines), (Records{ { 10, "GC" }, { 20, "PP" } }));
}

TEST(Checksum, CodesUseLettersAToP) {
    for (int value = 0; value < 256; ++value) {
        const auto code = Checksum::to_code(u8(value));
        ASSERT_EQ(code.size(), 2u);
        EXPECT_GE(code[0], 'A');
        EXPECT_LE(code[0], 'P');
        EXPECT_GE(code[1], 'A');
        EXPECT_LE(code[1], 'P');
    }
}
