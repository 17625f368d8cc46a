/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Sources for the list of installed packages. The manager's structured
  export is preferred where configured; the fixed-width table parser is the
  fallback and the default.
 */

#ifndef U_K_INVENTORY_H
#define U_K_INVENTORY_H

#include "Log.hpp"
#include "Package.hpp"
#include "PackageManager.hpp"
#include "TableParser.hpp"
#include <memory>
#include <string>
#include <vector>

namespace UpdateKit {

/**
 * @brief Abstract source of installed packages; to get the configured implementation call
 * @example: std::unique_ptr<UpdateKit::InventorySource> source = UpdateKit::InventoryFactory::get("auto", manager, parser, log);
 */
class InventorySource {
public:
    virtual ~InventorySource() = default;
    virtual std::vector<Package> listInstalled() = 0;
};

class TableInventory : public InventorySource {
public:
    TableInventory(PackageManager &manager, const TableParser &parser);
    std::vector<Package> listInstalled() override;
private:
    PackageManager &manager;
    const TableParser &parser;
};

class ExportInventory : public InventorySource {
public:
    /**
     * @param fallback used if exporting or reading the export fails; may be empty
     */
    ExportInventory(PackageManager &manager, DiagnosticSink &log, std::unique_ptr<InventorySource> fallback = nullptr);
    std::vector<Package> listInstalled() override;
private:
    std::vector<Package> readExport();

    PackageManager &manager;
    DiagnosticSink &log;
    std::unique_ptr<InventorySource> fallback;
};

class InventoryFactory {
public:
    /**
     * @brief Create the inventory source for the given mode
     * @param mode "table", "export" or "auto" (export with table fallback)
     */
    static std::unique_ptr<InventorySource> get(const std::string &mode, PackageManager &manager,
                                                const TableParser &parser, DiagnosticSink &log);
};

} // namespace UpdateKit

#endif // U_K_INVENTORY_H
