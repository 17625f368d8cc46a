/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Column positions of a fixed-width table, derived from the titles in its
  header line. This is the only place knowing about the manager's table
  rendering; everything above works with the sliced fields.
 */

#ifndef U_K_COLUMNLAYOUT_H
#define U_K_COLUMNLAYOUT_H

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace UpdateKit {

enum class Column {
    Name, Id, Version, Available, Source
};

std::string title(Column column);

using TableRow = std::map<Column, std::string>;

class ColumnLayout {
public:
    /**
     * @brief Derive the column positions from a header line
     * @param header raw header line
     * @param required titles which all have to be present, Column::Name first
     * @param optional titles which will be located if present
     * @return std::nullopt if the line is not a header
     *
     * Titles are searched left to right, each one after the previous title. The Name column
     * always starts at offset 0, the last located column runs to the end of the line.
     */
    static std::optional<ColumnLayout> locate(const std::string &header, const std::vector<Column> &required,
                                              const std::vector<Column> &optional = {});

    /**
     * @brief Cut a data line at the column positions and clean every field
     * @return one cleaned field per located column
     *
     * Throws RowParseError if the line is not valid UTF-8.
     */
    TableRow slice(const std::string &line) const;

    bool has(Column column) const;
    // Start offset of the column in code points
    size_t offset(Column column) const;
private:
    struct Position {
        Column column;
        size_t start;
    };
    std::vector<Position> positions;
};

} // namespace UpdateKit

#endif // U_K_COLUMNLAYOUT_H
