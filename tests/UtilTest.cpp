/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

#include "Util.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace UpdateKit {

TEST(UtilTest, TrimRemovesSurroundingWhitespace) {
    std::string s = " \t foo bar \r\n";
    Util::trim(s);
    EXPECT_EQ(s, "foo bar");

    std::string left = "  x ";
    Util::ltrim(left);
    EXPECT_EQ(left, "x ");
}

TEST(UtilTest, JoinAndSplit) {
    EXPECT_EQ(Util::join({"winget", "list", "--upgrade-available"}, " "), "winget list --upgrade-available");
    EXPECT_EQ(Util::join({}, " "), "");

    auto lines = Util::splitLines("a\nb\n\nc");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "c");
}

TEST(UtilTest, VisibleTextDropsRedrawnFrames) {
    EXPECT_EQ(Util::visibleText("   - \r   \\ \rName  Id"), "Name  Id");
    EXPECT_EQ(Util::visibleText("Foo App  Foo.App\r"), "Foo App  Foo.App");
    EXPECT_EQ(Util::visibleText("plain"), "plain");
}

TEST(UtilTest, CleanTextStripsGlyphsAndCollapsesWhitespace) {
    EXPECT_EQ(Util::cleanText("  Microsoft Visual C++ 2015\xE2\x80\xA6   "), "Microsoft Visual C++ 2015");
    EXPECT_EQ(Util::cleanText("\xC2\xABquoted\xC2\xBB"), "quoted");
    EXPECT_EQ(Util::cleanText("zero\xE2\x80\x8Bwidth"), "zerowidth");
    EXPECT_EQ(Util::cleanText("\xEF\xBB\xBFName"), "Name");
    EXPECT_EQ(Util::cleanText("a\xC2\xA0\xC2\xA0 b\t\tc"), "a b c");
    EXPECT_EQ(Util::cleanText(" \xE2\x80\xA6 "), "");
}

TEST(UtilTest, CodepointOffsets) {
    // "Aé€😀"
    std::string s = "A\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";
    auto offsets = Util::codepointOffsets(s);
    std::vector<size_t> expected{0, 1, 3, 6, 10};
    EXPECT_EQ(offsets, expected);
    EXPECT_EQ(Util::codepointLength(s), 4u);
    EXPECT_EQ(Util::codepointLength(""), 0u);
}

TEST(UtilTest, CodepointOffsetsRejectInvalidUtf8) {
    EXPECT_THROW(Util::codepointOffsets("abc\xFF"), std::invalid_argument);
    EXPECT_THROW(Util::codepointOffsets("\xC3"), std::invalid_argument);
    EXPECT_THROW(Util::codepointOffsets("\xE2\x28\xA1"), std::invalid_argument);
    EXPECT_EQ(Util::codepointLength("\xFF"), std::string::npos);
}

} // namespace UpdateKit
