/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Records built from the package manager's listings
 */

#include "Package.hpp"
#include "Util.hpp"
#include <stdexcept>
#include <utility>

namespace UpdateKit {

Package::Package(std::string name, std::string id, std::string version, std::string source)
    : name{std::move(name)}, id{std::move(id)}, version{std::move(version)}, source{std::move(source)} {
    if (this->name.empty() && this->id.empty() && this->version.empty())
        throw std::invalid_argument{"A package needs at least a name, an id or a version."};
}

bool Package::operator==(const Package &other) const {
    return name == other.name && id == other.id && version == other.version && source == other.source;
}

PackageUpdate::PackageUpdate(Package package, std::string availableVersion, UpdateCategory category)
    : Package{std::move(package)}, availableVersion{std::move(availableVersion)}, category{category} {
}

bool PackageUpdate::operator==(const PackageUpdate &other) const {
    return Package::operator==(other) && availableVersion == other.availableVersion && category == other.category;
}

bool UnknownVersionRule::matches(const std::string &version) const {
    for (auto &marker: markers) {
        if (!marker.empty() && Util::contains(version, marker))
            return true;
    }
    return false;
}

size_t UpgradeListing::size() const {
    return regular.size() + explicitTargeting.size() + unknownVersion.size();
}

std::vector<PackageUpdate> UpgradeListing::all() const {
    std::vector<PackageUpdate> result;
    result.reserve(size());
    result.insert(result.end(), regular.begin(), regular.end());
    result.insert(result.end(), explicitTargeting.begin(), explicitTargeting.end());
    result.insert(result.end(), unknownVersion.begin(), unknownVersion.end());
    return result;
}

const PackageUpdate* UpgradeListing::findById(const std::string &id) const {
    std::string wanted = Util::toLower(id);
    for (auto list: {&regular, &explicitTargeting, &unknownVersion}) {
        for (auto &update: *list) {
            if (Util::toLower(update.getId()) == wanted)
                return &update;
        }
    }
    return nullptr;
}

Inventory splitByAttribution(const std::vector<Package> &packages) {
    Inventory inventory;
    for (auto &package: packages) {
        if (package.isAttributable())
            inventory.attributable.push_back(package);
        else
            inventory.unattributable.push_back(package);
    }
    return inventory;
}

std::string toString(UpdateCategory category) {
    switch (category) {
    case UpdateCategory::Regular:
        return "regular";
    case UpdateCategory::Explicit:
        return "explicit";
    case UpdateCategory::UnknownVersion:
        return "unknown-version";
    }
    return "";
}

std::ostream& operator<<(std::ostream &os, const Package &package) {
    return os << package.getName() << " (" << package.getId() << ") " << package.getVersion()
              << " [" << package.getSource() << "]";
}

std::ostream& operator<<(std::ostream &os, const PackageUpdate &update) {
    return os << update.getName() << " (" << update.getId() << ") " << update.getVersion()
              << " -> " << update.getAvailableVersion() << " [" << update.getSource() << ", "
              << toString(update.getCategory()) << "]";
}

} // namespace UpdateKit
