/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

#include "Exceptions.hpp"
#include "Fakes.hpp"
#include "Inventory.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>

namespace UpdateKit {

namespace {

const std::vector<std::string> installedTable = {
    "Name     Id           Version  Source",
    "-------------------------------------",
    "Alpha    Vendor.Alpha 1.0      winget",
    "Local    ARP\\Local    2.0",
};

// Writes the export document to the path given after "-o", like the real manager does
void writeExport(const std::vector<std::string> &argv, const std::string &document) {
    for (size_t i = 0; i + 1 < argv.size(); i++) {
        if (argv[i] == "-o") {
            std::ofstream out(argv[i + 1]);
            out << document;
        }
    }
}

} // anonymous namespace

class InventoryTest : public ::testing::Test {
protected:
    RecordingLauncher launcher;
    RecordingSink log;
    PackageManager manager{"winget", launcher, log};
    TableParser parser{log};
};

TEST_F(InventoryTest, TableSource) {
    launcher.enqueue({installedTable});

    auto source = InventoryFactory::get("table", manager, parser, log);
    std::vector<Package> packages = source->listInstalled();

    ASSERT_EQ(packages.size(), 2u);
    EXPECT_EQ(packages[0].getId(), "Vendor.Alpha");
    EXPECT_EQ(packages[1].getSource(), "");
}

TEST_F(InventoryTest, ExportSourceReadsAndRemovesTheDocument) {
    std::string exportFile;
    launcher.onLaunch = [&exportFile](const std::vector<std::string> &argv) {
        writeExport(argv, R"({"Sources": [{"Packages": [{"PackageIdentifier": "Foo.App", "Version": "1.0"}],
                              "SourceDetails": {"Name": "winget"}}]})");
        exportFile = argv[3];
    };
    launcher.enqueue({});

    auto source = InventoryFactory::get("export", manager, parser, log);
    std::vector<Package> packages = source->listInstalled();

    ASSERT_EQ(packages.size(), 1u);
    EXPECT_EQ(packages[0], Package("Foo.App", "Foo.App", "1.0", "winget"));
    ASSERT_FALSE(exportFile.empty());
    EXPECT_FALSE(std::filesystem::exists(exportFile));
}

TEST_F(InventoryTest, ExportSourceWithoutFallbackPropagates) {
    Script failing;
    failing.exitCode = 1;
    launcher.enqueue(failing);

    auto source = InventoryFactory::get("export", manager, parser, log);
    EXPECT_THROW(source->listInstalled(), CommandError);
}

TEST_F(InventoryTest, AutoFallsBackToTable) {
    launcher.onLaunch = [](const std::vector<std::string> &argv) {
        writeExport(argv, "not a document");
    };
    launcher.enqueue({});
    launcher.enqueue({installedTable});

    auto source = InventoryFactory::get("auto", manager, parser, log);
    std::vector<Package> packages = source->listInstalled();

    ASSERT_EQ(launcher.invocations.size(), 2u);
    EXPECT_EQ(launcher.invocations[1], (std::vector<std::string>{"winget", "list"}));
    EXPECT_EQ(packages.size(), 2u);
    EXPECT_GE(log.count(LogLevel::Error), 1u);
}

TEST_F(InventoryTest, UnknownModeThrows) {
    EXPECT_THROW(InventoryFactory::get("json", manager, parser, log), std::invalid_argument);
}

} // namespace UpdateKit
