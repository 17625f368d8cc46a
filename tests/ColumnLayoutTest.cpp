/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

#include "ColumnLayout.hpp"
#include "Exceptions.hpp"
#include <gtest/gtest.h>

namespace UpdateKit {

namespace {

const std::vector<Column> upgradeColumns = {Column::Name, Column::Id, Column::Version, Column::Available};

} // anonymous namespace

TEST(ColumnLayoutTest, LocatesTitlesInTableOrder) {
    auto layout = ColumnLayout::locate("Name      Id        Version   Available Source", upgradeColumns, {Column::Source});
    ASSERT_TRUE(layout.has_value());
    EXPECT_EQ(layout->offset(Column::Name), 0u);
    EXPECT_EQ(layout->offset(Column::Id), 10u);
    EXPECT_EQ(layout->offset(Column::Version), 20u);
    EXPECT_EQ(layout->offset(Column::Available), 30u);
    EXPECT_EQ(layout->offset(Column::Source), 40u);
}

TEST(ColumnLayoutTest, RejectsLinesWithoutAllRequiredTitles) {
    EXPECT_FALSE(ColumnLayout::locate("Name      Id        Version", upgradeColumns).has_value());
    EXPECT_FALSE(ColumnLayout::locate("Foo App   Foo.App   1.0   2.0", upgradeColumns).has_value());
    // Titles in the wrong order do not form a header
    EXPECT_FALSE(ColumnLayout::locate("Available Version Id Name", upgradeColumns).has_value());
}

TEST(ColumnLayoutTest, OptionalColumnMayBeMissing) {
    auto layout = ColumnLayout::locate("Name   Id   Version   Available", upgradeColumns, {Column::Source});
    ASSERT_TRUE(layout.has_value());
    EXPECT_FALSE(layout->has(Column::Source));
    EXPECT_THROW(layout->offset(Column::Source), std::invalid_argument);

    TableRow row = layout->slice("Foo    Foo  1.0       2.0");
    EXPECT_EQ(row.count(Column::Source), 0u);
    EXPECT_EQ(row[Column::Available], "2.0");
}

TEST(ColumnLayoutTest, HeaderAfterSpinnerFrames) {
    auto layout = ColumnLayout::locate("  - \r  \\ \rName   Id   Version   Available", upgradeColumns);
    ASSERT_TRUE(layout.has_value());
    EXPECT_EQ(layout->offset(Column::Id), 7u);
}

TEST(ColumnLayoutTest, SliceCleansFieldsAndTolerateShortLines) {
    auto layout = ColumnLayout::locate("Name      Id        Version   Available Source", upgradeColumns, {Column::Source});
    ASSERT_TRUE(layout.has_value());

    TableRow row = layout->slice("Foo App   Foo.App   1.0       2.0       winget");
    EXPECT_EQ(row[Column::Name], "Foo App");
    EXPECT_EQ(row[Column::Id], "Foo.App");
    EXPECT_EQ(row[Column::Version], "1.0");
    EXPECT_EQ(row[Column::Available], "2.0");
    EXPECT_EQ(row[Column::Source], "winget");

    TableRow shortRow = layout->slice("Bar Tool  Bar.Tool  1.0");
    EXPECT_EQ(shortRow[Column::Version], "1.0");
    EXPECT_EQ(shortRow[Column::Available], "");
    EXPECT_EQ(shortRow[Column::Source], "");
}

TEST(ColumnLayoutTest, SliceCountsCodePoints) {
    auto layout = ColumnLayout::locate("Name      Id        Version   Available", upgradeColumns);
    ASSERT_TRUE(layout.has_value());

    // "Café Büro" uses two-byte characters, the columns still line up by character
    TableRow row = layout->slice("Caf\xC3\xA9 B\xC3\xBCro Cafe.Buro 1.0       2.0");
    EXPECT_EQ(row[Column::Name], "Caf\xC3\xA9 B\xC3\xBCro");
    EXPECT_EQ(row[Column::Id], "Cafe.Buro");
    EXPECT_EQ(row[Column::Version], "1.0");
    EXPECT_EQ(row[Column::Available], "2.0");

    TableRow truncated = layout->slice("Long Name\xE2\x80\xA6 Long.Id   1.0       2.0");
    EXPECT_EQ(truncated[Column::Name], "Long Name");
}

TEST(ColumnLayoutTest, SliceRejectsInvalidUtf8) {
    auto layout = ColumnLayout::locate("Name   Id   Version   Available", upgradeColumns);
    ASSERT_TRUE(layout.has_value());
    try {
        layout->slice("Bad\xFF   Bad  1.0       2.0");
        FAIL() << "RowParseError expected";
    } catch (const RowParseError &e) {
        EXPECT_EQ(e.line, "Bad\xFF   Bad  1.0       2.0");
    }
}

} // namespace UpdateKit
