/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Reader for the JSON document written by the manager's export command
 */

#include "ExportReader.hpp"
#include "Exceptions.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace UpdateKit {

using json = nlohmann::json;

std::vector<Package> ExportReader::read(const std::filesystem::path &path) {
    std::ifstream input(path);
    if (!input)
        throw ParseError{"Could not open export file " + path.string() + "."};
    std::stringstream content;
    content << input.rdbuf();
    return parse(content.str());
}

std::vector<Package> ExportReader::parse(const std::string &document) {
    json data;
    try {
        data = json::parse(document);
    } catch (const json::parse_error &e) {
        throw ParseError{"Invalid export document: " + std::string(e.what())};
    }
    if (!data.is_object() || !data.contains("Sources") || !data["Sources"].is_array())
        throw ParseError{"Export document has no 'Sources' list."};

    std::vector<Package> packages;
    try {
        for (auto &source: data["Sources"]) {
            std::string sourceName = source.value(json::json_pointer("/SourceDetails/Name"), std::string());
            if (!source.contains("Packages"))
                continue;
            for (auto &package: source["Packages"]) {
                std::string id = package.at("PackageIdentifier").get<std::string>();
                std::string version = package.value("Version", std::string("Unknown"));
                packages.emplace_back(id, id, version, sourceName);
            }
        }
    } catch (const json::exception &e) {
        throw ParseError{"Malformed export document: " + std::string(e.what())};
    }
    return packages;
}

} // namespace UpdateKit
