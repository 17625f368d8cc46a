/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Records built from the package manager's listings: installed packages and
  pending updates, the latter tagged with exactly one update category.
 */

#ifndef U_K_PACKAGE_H
#define U_K_PACKAGE_H

#include <ostream>
#include <string>
#include <vector>

namespace UpdateKit {

class Package {
public:
    Package(std::string name, std::string id, std::string version, std::string source);
    virtual ~Package() = default;

    const std::string& getName() const { return name; }
    const std::string& getId() const { return id; }
    const std::string& getVersion() const { return version; }
    /**
     * @brief Catalog the package originates from
     * @return empty if no catalog can update the package
     */
    const std::string& getSource() const { return source; }
    bool isAttributable() const { return !source.empty(); }

    bool operator==(const Package &other) const;
    bool operator!=(const Package &other) const { return !(*this == other); }
private:
    std::string name;
    std::string id;
    std::string version;
    std::string source;
};

enum class UpdateCategory {
    Regular, Explicit, UnknownVersion
};

class PackageUpdate : public Package {
public:
    PackageUpdate(Package package, std::string availableVersion, UpdateCategory category);

    const std::string& getAvailableVersion() const { return availableVersion; }
    UpdateCategory getCategory() const { return category; }
    bool isUnknownVersion() const { return category == UpdateCategory::UnknownVersion; }
    bool requiresExplicitUpgrade() const { return category == UpdateCategory::Explicit; }

    bool operator==(const PackageUpdate &other) const;
    bool operator!=(const PackageUpdate &other) const { return !(*this == other); }
private:
    std::string availableVersion;
    UpdateCategory category;
};

/**
 * @brief Decides whether an installed version string is only an approximation
 *
 * The markers are artifacts of the manager's output format ("< 1.2", "Unknown"), so they are
 * configurable (UNKNOWN_VERSION_MARKERS).
 */
struct UnknownVersionRule {
    std::vector<std::string> markers{"<", "Unknown"};
    bool matches(const std::string &version) const;
};

struct UpgradeListing {
    std::vector<PackageUpdate> regular;
    std::vector<PackageUpdate> explicitTargeting;
    std::vector<PackageUpdate> unknownVersion;

    size_t size() const;
    bool empty() const { return size() == 0; }
    // Regular, explicit and unknown-version updates in this order
    std::vector<PackageUpdate> all() const;
    /**
     * @brief Case-insensitive lookup of an update by package identifier
     * @return nullptr if no category contains the identifier
     */
    const PackageUpdate* findById(const std::string &id) const;
};

struct Inventory {
    std::vector<Package> attributable;
    std::vector<Package> unattributable;
};

/**
 * @brief Separate packages a catalog can update from those it cannot (no source)
 */
Inventory splitByAttribution(const std::vector<Package> &packages);

std::string toString(UpdateCategory category);
std::ostream& operator<<(std::ostream &os, const Package &package);
std::ostream& operator<<(std::ostream &os, const PackageUpdate &update);

} // namespace UpdateKit

#endif // U_K_PACKAGE_H
