/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Reader for the JSON document written by the manager's export command
 */

#ifndef U_K_EXPORTREADER_H
#define U_K_EXPORTREADER_H

#include "Package.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace UpdateKit {

struct ExportReader {
    /**
     * @brief Read the packages of an export document
     * @param path JSON file written by `export -o <path> --include-versions`
     *
     * The document only carries identifiers, so the identifier doubles as the name. Packages
     * without a version are reported as "Unknown".
     * Throws ParseError if the file cannot be read or is not an export document.
     */
    static std::vector<Package> read(const std::filesystem::path &path);
    static std::vector<Package> parse(const std::string &document);
};

} // namespace UpdateKit

#endif // U_K_EXPORTREADER_H
