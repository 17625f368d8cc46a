/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Turns the fixed-width listings of the package manager into typed records.
 */

#ifndef U_K_TABLEPARSER_H
#define U_K_TABLEPARSER_H

#include "ColumnLayout.hpp"
#include "Log.hpp"
#include "Package.hpp"
#include <optional>
#include <string>
#include <vector>

namespace UpdateKit {

class TableParser {
public:
    TableParser(DiagnosticSink &log, UnknownVersionRule unknownVersionRule = {});
    virtual ~TableParser() = default;

    /**
     * @brief Parse the output of `list`
     * @param text complete standard output of the command
     * @return installed packages in listing order
     *
     * Throws ParseError if no header line with the Name, Id and Version titles is found.
     */
    std::vector<Package> parseInstalled(const std::string &text) const;

    /**
     * @brief Parse the output of `list --upgrade-available`
     * @param text complete standard output of the command
     * @return pending updates, partitioned into regular, explicit and unknown-version updates
     *
     * The regular table runs from the main header to the first blank line or the explicit
     * targeting notice. The explicit table follows that notice with a header of its own and
     * ends at a blank line or the note about undeterminable versions. Regular rows matching
     * the unknown-version rule are moved into their own category; rows of the explicit table
     * are always explicit updates.
     *
     * Throws ParseError if no header line with the Name, Id, Version and Available titles is
     * found.
     */
    UpgradeListing parseUpgrades(const std::string &text) const;

private:
    std::optional<TableRow> readRow(const std::string &line, const ColumnLayout &layout,
                                    const std::vector<Column> &required) const;
    PackageUpdate toUpdate(TableRow &row, UpdateCategory category) const;

    DiagnosticSink &log;
    UnknownVersionRule unknownVersionRule;
};

} // namespace UpdateKit

#endif // U_K_TABLEPARSER_H
