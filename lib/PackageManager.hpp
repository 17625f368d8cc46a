/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Wrapper around the package manager's command line interface. All
  interaction with the manager goes through its commands and their textual
  output, never through any internal API.
 */

#ifndef U_K_PACKAGEMANAGER_H
#define U_K_PACKAGEMANAGER_H

#include "Log.hpp"
#include "Package.hpp"
#include "Process.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace UpdateKit {

class PackageManager {
public:
    /**
     * @param executable name or path of the package manager, e.g. "winget"
     * @param launcher used for every invocation
     * @param log diagnostic sink
     */
    PackageManager(std::string executable, ProcessLauncher &launcher, DiagnosticSink &log);
    virtual ~PackageManager() = default;

    /**
     * @brief Run a query command and return its complete standard output
     *
     * Throws CommandError carrying the standard error text if the command cannot be started
     * or exits with a non-zero status.
     */
    std::string run(const std::vector<std::string> &args);

    // `--version`
    std::string getVersion();
    // `list`
    std::string listInstalled();
    // `list --upgrade-available`
    std::string listUpgrades();

    /**
     * @brief Export the installed packages to a JSON document (`export -o <path> --include-versions`)
     * @return names of installed packages the manager reports as not available from any source
     */
    std::vector<std::string> exportPackages(const std::filesystem::path &path);

    /**
     * @brief Arguments for installing one update
     *
     * Updates with a known installed version are pinned to their available version; for
     * unknown-version updates the manager resolves the version itself.
     */
    std::vector<std::string> upgradeArguments(const PackageUpdate &update, bool silent) const;

    /**
     * @brief Start the installation of one update
     *
     * Throws CommandError if the process cannot be started.
     */
    std::unique_ptr<Process> startUpgrade(const PackageUpdate &update, bool silent);

    /**
     * @brief Arguments appended to every install command (UPGRADE_ARGS)
     */
    void setExtraUpgradeArguments(std::vector<std::string> args);

    const std::string& getExecutable() const { return executable; }
private:
    std::string executable;
    ProcessLauncher &launcher;
    DiagnosticSink &log;
    std::vector<std::string> extraUpgradeArguments;
};

} // namespace UpdateKit

#endif // U_K_PACKAGEMANAGER_H
