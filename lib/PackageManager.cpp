/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Wrapper around the package manager's command line interface
 */

#include "PackageManager.hpp"
#include "Exceptions.hpp"
#include "Util.hpp"
#include <utility>

namespace UpdateKit {

using namespace std;

namespace {

const string unavailableNotice = "Installed package is not available from any source:";

} // anonymous namespace

PackageManager::PackageManager(string executable, ProcessLauncher &launcher, DiagnosticSink &log)
    : executable{std::move(executable)}, launcher{launcher}, log{log} {
}

string PackageManager::run(const vector<string> &args) {
    vector<string> argv{executable};
    argv.insert(argv.end(), args.begin(), args.end());
    string cmdline = Util::join(argv, " ");
    log.debug("Executing `", cmdline, "`:");

    unique_ptr<Process> process = launcher.launch(argv);
    string output;
    string line;
    while (process->readLine(line)) {
        output.append(line);
        output.append("\n");
    }
    int rc = process->wait();
    string errors = process->errorOutput();

    log.debug("◸", output, "◿");
    if (rc != 0) {
        log.error("`", cmdline, "` returned with error code ", rc);
        if (!errors.empty())
            log.error("stderr: ", errors);
        throw CommandError{"`" + cmdline + "` returned with error code " + to_string(rc) + ".", rc, errors};
    }
    return output;
}

string PackageManager::getVersion() {
    string version = run({"--version"});
    Util::trim(version);
    return version;
}

string PackageManager::listInstalled() {
    return run({"list"});
}

string PackageManager::listUpgrades() {
    return run({"list", "--upgrade-available"});
}

vector<string> PackageManager::exportPackages(const filesystem::path &path) {
    vector<string> args{"export", "-o", path.string(), "--include-versions"};
    vector<string> argv{executable};
    argv.insert(argv.end(), args.begin(), args.end());
    string cmdline = Util::join(argv, " ");
    log.debug("Executing `", cmdline, "`:");

    // The notices may show up on either stream, so both are collected here instead of run()
    unique_ptr<Process> process = launcher.launch(argv);
    vector<string> lines;
    string line;
    while (process->readLine(line))
        lines.push_back(line);
    int rc = process->wait();
    string errors = process->errorOutput();
    if (rc != 0)
        throw CommandError{"`" + cmdline + "` returned with error code " + to_string(rc) + ".", rc, errors};

    for (auto &errorLine: Util::splitLines(errors))
        lines.push_back(errorLine);

    vector<string> unavailable;
    for (auto &l: lines) {
        size_t pos = l.find(unavailableNotice);
        if (pos == string::npos)
            continue;
        string name = Util::cleanText(l.substr(pos + unavailableNotice.length()));
        if (!name.empty())
            unavailable.push_back(name);
    }
    log.info("Exported installed packages to ", path, ", ", unavailable.size(), " not available from any source");
    return unavailable;
}

vector<string> PackageManager::upgradeArguments(const PackageUpdate &update, bool silent) const {
    vector<string> args{"upgrade", "--id", update.getId()};
    if (!update.isUnknownVersion()) {
        args.push_back("--version");
        args.push_back(update.getAvailableVersion());
    }
    if (silent)
        args.push_back("--silent");
    args.insert(args.end(), extraUpgradeArguments.begin(), extraUpgradeArguments.end());
    return args;
}

unique_ptr<Process> PackageManager::startUpgrade(const PackageUpdate &update, bool silent) {
    vector<string> argv{executable};
    vector<string> args = upgradeArguments(update, silent);
    argv.insert(argv.end(), args.begin(), args.end());
    log.info("Running update command: ", Util::join(argv, " "));
    return launcher.launch(argv);
}

void PackageManager::setExtraUpgradeArguments(vector<string> args) {
    extraUpgradeArguments = std::move(args);
}

} // namespace UpdateKit
