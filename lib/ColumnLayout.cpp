/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Column positions of a fixed-width table
 */

#include "ColumnLayout.hpp"
#include "Exceptions.hpp"
#include "Util.hpp"
#include <algorithm>
#include <stdexcept>

namespace UpdateKit {

using namespace std;

string title(Column column) {
    switch (column) {
    case Column::Name:
        return "Name";
    case Column::Id:
        return "Id";
    case Column::Version:
        return "Version";
    case Column::Available:
        return "Available";
    case Column::Source:
        return "Source";
    }
    return "";
}

optional<ColumnLayout> ColumnLayout::locate(const string &header, const vector<Column> &required,
                                            const vector<Column> &optional) {
    string line = Util::visibleText(header);
    for (auto column: required) {
        if (!Util::contains(line, title(column)))
            return nullopt;
    }
    if (Util::codepointLength(line) == string::npos)
        return nullopt;

    // Search order is the table order, independent of how the caller listed the titles
    const vector<Column> tableOrder = {Column::Name, Column::Id, Column::Version, Column::Available, Column::Source};
    ColumnLayout layout;
    size_t cursor = 0;
    for (auto column: tableOrder) {
        bool isRequired = find(required.begin(), required.end(), column) != required.end();
        bool isOptional = find(optional.begin(), optional.end(), column) != optional.end();
        if (!isRequired && !isOptional)
            continue;

        size_t pos = line.find(title(column), cursor);
        if (pos == string::npos) {
            if (isRequired)
                return nullopt;
            continue;
        }
        cursor = pos + title(column).length();
        size_t start = (column == Column::Name) ? 0 : Util::codepointLength(line.substr(0, pos));
        layout.positions.push_back({column, start});
    }
    if (layout.positions.empty() || layout.positions.front().column != Column::Name)
        return nullopt;
    return layout;
}

TableRow ColumnLayout::slice(const string &line) const {
    string text = Util::visibleText(line);
    vector<size_t> offsets;
    try {
        offsets = Util::codepointOffsets(text);
    } catch (const invalid_argument &e) {
        throw RowParseError{e.what(), line};
    }
    size_t length = offsets.size() - 1;

    TableRow row;
    for (size_t i = 0; i < positions.size(); i++) {
        size_t start = min(positions[i].start, length);
        size_t end = (i + 1 < positions.size()) ? min(positions[i + 1].start, length) : length;
        string field;
        if (end > start)
            field = text.substr(offsets[start], offsets[end] - offsets[start]);
        row[positions[i].column] = Util::cleanText(field);
    }
    return row;
}

bool ColumnLayout::has(Column column) const {
    return any_of(positions.begin(), positions.end(),
            [column](const Position &p) { return p.column == column; });
}

size_t ColumnLayout::offset(Column column) const {
    for (auto &p: positions) {
        if (p.column == column)
            return p.start;
    }
    throw invalid_argument{"Column '" + title(column) + "' is not part of the layout."};
}

} // namespace UpdateKit
