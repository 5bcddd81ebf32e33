#include <string>
#include <gtest/gtest.h>
#include <peek/content/hex_dump.h>

#include "../../support/temp_dir_scope.hpp"

using peek::content::HexDump;
using peek::test_support::toBytes;

TEST(HexDumpTest, ShortRowIsPadded) {
    auto bytes = toBytes(std::string("\x41\x00\xFF", 3));
    const std::string expected =
        "00000000  41 00 ff" + std::string(16 * 3 - 8, ' ') + "  |A..|";
    EXPECT_EQ(HexDump::formatRow(bytes, 0), expected);
}

TEST(HexDumpTest, FullRow) {
    auto bytes = toBytes("0123456789abcdef");
    EXPECT_EQ(HexDump::formatRow(bytes, 0x20),
              "00000020  30 31 32 33 34 35 36 37 38 39 61 62 63 64 65 66   |0123456789abcdef|");
}

TEST(HexDumpTest, RowsCarryOffsets) {
    auto bytes = toBytes("ABCDEFGHIJ");
    auto rows = HexDump::rows(bytes, 0x100, 4);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].substr(0, 8), "00000100");
    EXPECT_EQ(rows[1].substr(0, 8), "00000104");
    EXPECT_EQ(rows[2].substr(0, 8), "00000108");
    EXPECT_EQ(rows[2], "00000108  49 4a" + std::string(4 * 3 - 5, ' ') + "  |IJ|");
}

TEST(HexDumpTest, FormatJoinsRows) {
    auto bytes = toBytes("ABCDEFGH");
    EXPECT_EQ(HexDump::format(bytes, 4), HexDump::formatRow(toBytes("ABCD"), 0, 4) + "\n" +
                                             HexDump::formatRow(toBytes("EFGH"), 4, 4));
    EXPECT_EQ(HexDump::format({}), "");
}

TEST(HexDumpTest, PrintableRange) {
    EXPECT_TRUE(HexDump::isPrintable(std::byte{' '}));
    EXPECT_TRUE(HexDump::isPrintable(std::byte{'~'}));
    EXPECT_FALSE(HexDump::isPrintable(std::byte{0x1f}));
    EXPECT_FALSE(HexDump::isPrintable(std::byte{0x7f}));
}
