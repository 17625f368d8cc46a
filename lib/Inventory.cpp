/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Sources for the list of installed packages
 */

#include "Inventory.hpp"
#include "Exceptions.hpp"
#include "ExportReader.hpp"
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <unistd.h>

namespace UpdateKit {

namespace fs = std::filesystem;

TableInventory::TableInventory(PackageManager &manager, const TableParser &parser)
    : manager{manager}, parser{parser} {
}

std::vector<Package> TableInventory::listInstalled() {
    return parser.parseInstalled(manager.listInstalled());
}

ExportInventory::ExportInventory(PackageManager &manager, DiagnosticSink &log, std::unique_ptr<InventorySource> fallback)
    : manager{manager}, log{log}, fallback{std::move(fallback)} {
}

std::vector<Package> ExportInventory::readExport() {
    auto stamp = std::chrono::system_clock::now().time_since_epoch().count();
    fs::path file = fs::temp_directory_path() / ("upkit-export-" + std::to_string(getpid()) + "-" + std::to_string(stamp) + ".json");

    std::vector<Package> packages;
    try {
        manager.exportPackages(file);
        packages = ExportReader::read(file);
    } catch (...) {
        std::error_code ec;
        fs::remove(file, ec);
        throw;
    }
    std::error_code ec;
    fs::remove(file, ec);
    if (ec)
        log.info("Could not remove export file ", file, ": ", ec.message());
    return packages;
}

std::vector<Package> ExportInventory::listInstalled() {
    if (!fallback)
        return readExport();
    try {
        return readExport();
    } catch (const CommandError &e) {
        log.error("Exporting installed packages failed, falling back to the package table: ", e.what());
    } catch (const ParseError &e) {
        log.error("Reading the package export failed, falling back to the package table: ", e.what());
    }
    return fallback->listInstalled();
}

std::unique_ptr<InventorySource> InventoryFactory::get(const std::string &mode, PackageManager &manager,
                                                       const TableParser &parser, DiagnosticSink &log) {
    if (mode == "table")
        return std::make_unique<TableInventory>(manager, parser);
    if (mode == "export")
        return std::make_unique<ExportInventory>(manager, log);
    if (mode == "auto")
        return std::make_unique<ExportInventory>(manager, log, std::make_unique<TableInventory>(manager, parser));
    throw std::invalid_argument{"Unknown inventory mode '" + mode + "'."};
}

} // namespace UpdateKit
