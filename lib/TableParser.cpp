/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Turns the fixed-width listings of the package manager into typed records.
 */

#include "TableParser.hpp"
#include "Exceptions.hpp"
#include "Util.hpp"
#include <algorithm>
#include <utility>

namespace UpdateKit {

using namespace std;

namespace {

const string explicitTargetingNotice = "require explicit targeting";
const string undeterminableVersionsNotice = "version numbers that cannot be determined";

const vector<Column> installedColumns = {Column::Name, Column::Id, Column::Version};
const vector<Column> upgradeColumns = {Column::Name, Column::Id, Column::Version, Column::Available};

bool isBlank(const string &line) {
    string s = Util::visibleText(line);
    Util::trim(s);
    return s.empty();
}

bool isSeparator(const string &line) {
    string s = Util::visibleText(line);
    Util::trim(s);
    return !s.empty() && all_of(s.begin(), s.end(), [](char c) { return c == '-'; });
}

bool isSummary(const string &name) {
    return Util::contains(name, "upgrades available") || Util::contains(name, "upgrade available");
}

string firstContentLine(const vector<string> &lines) {
    for (auto &line: lines) {
        string s = Util::cleanText(Util::visibleText(line));
        if (!s.empty())
            return s;
    }
    return "";
}

ParseError headerNotFound(const vector<string> &lines) {
    string first = firstContentLine(lines);
    if (first.empty())
        return ParseError{"Could not find header line: no output."};
    return ParseError{"Could not find header line in output starting with '" + first + "'."};
}

} // anonymous namespace

TableParser::TableParser(DiagnosticSink &log, UnknownVersionRule unknownVersionRule)
    : log{log}, unknownVersionRule{std::move(unknownVersionRule)} {
}

optional<TableRow> TableParser::readRow(const string &line, const ColumnLayout &layout,
                                        const vector<Column> &required) const {
    if (isBlank(line) || isSeparator(line))
        return nullopt;

    TableRow row;
    try {
        row = layout.slice(line);
    } catch (const RowParseError &e) {
        log.error("Error processing line '", e.line, "': ", e.what());
        return nullopt;
    }

    if (all_of(row.begin(), row.end(), [](const auto &field) { return field.second.empty(); }))
        return nullopt;
    if (isSummary(row[Column::Name])) {
        log.debug("Skipping summary line '", row[Column::Name], "'");
        return nullopt;
    }
    for (auto column: required) {
        if (row[column].empty()) {
            log.info("Skipping line without ", title(column), ": '", Util::visibleText(line), "'");
            return nullopt;
        }
    }
    return row;
}

PackageUpdate TableParser::toUpdate(TableRow &row, UpdateCategory category) const {
    Package package{row[Column::Name], row[Column::Id], row[Column::Version], row[Column::Source]};
    return PackageUpdate{std::move(package), row[Column::Available], category};
}

vector<Package> TableParser::parseInstalled(const string &text) const {
    vector<string> lines = Util::splitLines(text);

    size_t headerIndex = 0;
    optional<ColumnLayout> layout;
    for (; headerIndex < lines.size(); headerIndex++) {
        // A trailing Available column must not end up in the version
        layout = ColumnLayout::locate(lines[headerIndex], installedColumns, {Column::Available, Column::Source});
        if (layout)
            break;
    }
    if (!layout)
        throw headerNotFound(lines);

    vector<Package> packages;
    for (size_t i = headerIndex + 1; i < lines.size(); i++) {
        optional<TableRow> row = readRow(lines[i], *layout, installedColumns);
        if (!row)
            continue;
        TableRow &fields = *row;
        packages.emplace_back(fields[Column::Name], fields[Column::Id], fields[Column::Version], fields[Column::Source]);
        log.debug("Added package: ", packages.back());
    }

    log.info("Found ", packages.size(), " installed packages");
    return packages;
}

UpgradeListing TableParser::parseUpgrades(const string &text) const {
    vector<string> lines = Util::splitLines(text);
    UpgradeListing listing;

    auto notice = find_if(lines.begin(), lines.end(),
            [](const string &line) { return Util::contains(line, explicitTargetingNotice); });

    // The main header has to precede the explicit targeting notice; if all updates need
    // explicit targeting the manager prints the notice first
    auto header = lines.begin();
    optional<ColumnLayout> layout;
    for (; header != notice; ++header) {
        layout = ColumnLayout::locate(*header, upgradeColumns, {Column::Source});
        if (layout)
            break;
    }
    if (!layout && notice == lines.end())
        throw headerNotFound(lines);

    // Regular section, unknown-version rows are split off in the same pass
    if (layout) {
        log.debug("Column positions: Id=", layout->offset(Column::Id), " Version=", layout->offset(Column::Version),
                  " Available=", layout->offset(Column::Available));
        for (auto it = header + 1; it != notice; ++it) {
            if (isBlank(*it) || Util::contains(*it, undeterminableVersionsNotice))
                break;
            optional<TableRow> row = readRow(*it, *layout, upgradeColumns);
            if (!row)
                continue;
            if (unknownVersionRule.matches((*row)[Column::Version])) {
                listing.unknownVersion.push_back(toUpdate(*row, UpdateCategory::UnknownVersion));
                log.debug("Added package with unknown version: ", listing.unknownVersion.back());
            } else {
                listing.regular.push_back(toUpdate(*row, UpdateCategory::Regular));
                log.debug("Added package: ", listing.regular.back());
            }
        }
    }

    // Explicit targeting section with its own header and alignment
    if (notice != lines.end()) {
        optional<ColumnLayout> explicitLayout;
        for (auto it = notice + 1; it != lines.end(); ++it) {
            if (!explicitLayout) {
                explicitLayout = ColumnLayout::locate(*it, upgradeColumns, {Column::Source});
                continue;
            }
            if (isBlank(*it) || Util::contains(*it, undeterminableVersionsNotice))
                break;
            optional<TableRow> row = readRow(*it, *explicitLayout, upgradeColumns);
            if (!row)
                continue;
            if (unknownVersionRule.matches((*row)[Column::Version]))
                log.debug("Explicit targeting takes precedence over unknown version for '", (*row)[Column::Id], "'");
            listing.explicitTargeting.push_back(toUpdate(*row, UpdateCategory::Explicit));
            log.debug("Added explicit package: ", listing.explicitTargeting.back());
        }
        if (!explicitLayout) {
            if (!layout)
                throw headerNotFound(lines);
            log.info("Explicit targeting notice found, but no table header following it");
        }
    }

    log.info("Found ", listing.regular.size(), " regular upgrades");
    log.info("Found ", listing.explicitTargeting.size(), " explicit upgrades");
    log.info("Found ", listing.unknownVersion.size(), " packages with unknown versions");
    return listing;
}

} // namespace UpdateKit
