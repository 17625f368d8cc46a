/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

#include "Exceptions.hpp"
#include "ExportReader.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

namespace UpdateKit {

namespace {

const std::string exportDocument = R"({
    "$schema": "https://aka.ms/winget-packages.schema.2.0.json",
    "CreationDate": "2024-05-02T10:11:12.000-00:00",
    "Sources": [
        {
            "Packages": [
                { "PackageIdentifier": "Foo.App", "Version": "1.0" },
                { "PackageIdentifier": "Bar.Tool" }
            ],
            "SourceDetails": {
                "Argument": "https://cdn.winget.microsoft.com/cache",
                "Identifier": "Microsoft.Winget.Source_8wekyb3d8bbwe",
                "Name": "winget",
                "Type": "Microsoft.PreIndexed.Package"
            }
        },
        {
            "Packages": [
                { "PackageIdentifier": "9NBLGGH4NNS1", "Version": "1.22.1" }
            ],
            "SourceDetails": { "Name": "msstore" }
        }
    ],
    "WinGetVersion": "1.7.10861"
})";

} // anonymous namespace

TEST(ExportReaderTest, ReadsPackagesOfAllSources) {
    std::vector<Package> packages = ExportReader::parse(exportDocument);

    ASSERT_EQ(packages.size(), 3u);
    EXPECT_EQ(packages[0], Package("Foo.App", "Foo.App", "1.0", "winget"));
    EXPECT_EQ(packages[1].getVersion(), "Unknown");
    EXPECT_EQ(packages[2].getSource(), "msstore");
}

TEST(ExportReaderTest, ReadsFile) {
    std::filesystem::path file = std::filesystem::temp_directory_path() /
        ("upkit-export-test-" + std::to_string(getpid()) + ".json");
    {
        std::ofstream out(file);
        out << exportDocument;
    }

    std::vector<Package> packages = ExportReader::read(file);
    std::filesystem::remove(file);

    EXPECT_EQ(packages.size(), 3u);
}

TEST(ExportReaderTest, MissingFileThrows) {
    EXPECT_THROW(ExportReader::read("/nonexistent/upkit/export.json"), ParseError);
}

TEST(ExportReaderTest, MalformedDocumentsThrow) {
    EXPECT_THROW(ExportReader::parse("{ not json"), ParseError);
    EXPECT_THROW(ExportReader::parse(R"({"WinGetVersion": "1.7"})"), ParseError);
    EXPECT_THROW(ExportReader::parse(R"({"Sources": [{"Packages": [{"Version": "1.0"}]}]})"), ParseError);
}

TEST(ExportReaderTest, SourceWithoutPackages) {
    EXPECT_TRUE(ExportReader::parse(R"({"Sources": [{"SourceDetails": {"Name": "winget"}}]})").empty());
}

} // namespace UpdateKit
