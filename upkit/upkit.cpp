/* SPDX-License-Identifier: GPL-2.0-or-later */
/* SPDX-FileCopyrightText: 2020 SUSE LLC */

/*
  upkit - list and install pending package manager updates
 */

#include "upkit.hpp"
#include "Configuration.hpp"
#include "Exceptions.hpp"
#include "Inventory.hpp"
#include "Package.hpp"
#include "PackageManager.hpp"
#include "Process.hpp"
#include "SignalCancellation.hpp"
#include "TableParser.hpp"
#include "UpdateOrchestrator.hpp"
#include <getopt.h>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace std;
using namespace UpdateKit;

namespace {

void printPackages(const vector<Package> &packages) {
    for (auto &package: packages) {
        cout << package.getName() << "\t" << package.getId() << "\t" << package.getVersion() << "\t"
             << package.getSource() << "\n";
    }
}

void printUpdates(const string &heading, const vector<PackageUpdate> &updates) {
    cout << heading << " (" << updates.size() << "):\n";
    for (auto &update: updates) {
        cout << "  " << update.getName() << "\t" << update.getId() << "\t" << update.getVersion() << " -> "
             << update.getAvailableVersion() << "\t" << update.getSource() << "\n";
    }
}

// Progress lines are redrawn in place, everything else is appended
class ProgressPrinter {
public:
    void operator()(const ProgressEvent &event) {
        if (event.type == ProgressEvent::Type::Progress) {
            cout << "\r\033[K" << event.text << flush;
            progressOpen = true;
            return;
        }
        if (progressOpen) {
            cout << "\n";
            progressOpen = false;
        }
        switch (event.type) {
        case ProgressEvent::Type::Started:
            cout << "==> " << event.text << endl;
            break;
        case ProgressEvent::Type::Output:
            cout << "    " << event.text << endl;
            break;
        case ProgressEvent::Type::Failed:
        case ProgressEvent::Type::CriticalError:
            cerr << event.text << endl;
            break;
        case ProgressEvent::Type::Summary:
            cout << "\n" << event.text << endl;
            break;
        default:
            cout << event.text << endl;
        }
    }
private:
    bool progressOpen = false;
};

} // anonymous namespace

void UpKit::displayHelp() {
    cout << "Syntax: upkit [option...] command\n";
    cout << "\n";
    cout << "List and install updates offered by the package manager\n";
    cout << "\n";
    cout << "Query Commands:\n";
    cout << "list\n";
    cout << "\tPrints the installed packages; packages which are not available from any\n";
    cout << "\tsource are listed separately\n";
    cout << "upgrades\n";
    cout << "\tPrints the pending updates: regular updates, updates requiring explicit\n";
    cout << "\ttargeting and updates of packages with an unknown installed version\n";
    cout << "export <file>\n";
    cout << "\tWrites a JSON snapshot of the installed packages to <file>\n";
    cout << "check\n";
    cout << "\tPrints the version of the package manager\n";
    cout << "\n";
    cout << "Install Commands:\n";
    cout << "install [ID...]\n";
    cout << "\tInstalls the updates of the given package IDs one after another; without IDs\n";
    cout << "\tthe updates of the selected categories are installed (Default: regular)\n";
    cout << "\n";
    cout << "Install Options:\n";
    cout << "--regular, -r                Select regular updates\n";
    cout << "--explicit, -e               Select updates requiring explicit targeting\n";
    cout << "--unknown, -u                Select updates of packages with unknown version\n";
    cout << "--all, -a                    Select all pending updates\n";
    cout << "--silent, -s                 Request a non-interactive installation\n";
    cout << "\n";
    cout << "Generic Options:\n";
    cout << "--log=<console,syslog>       Log outputs (Default: LOG_OUTPUT setting)\n";
    cout << "--help, -h                   Display this help and exit\n";
    cout << "--quiet, -q                  Decrease verbosity\n";
    cout << "--verbose, -v                Increase verbosity (may be given twice)\n";
    cout << "--version, -V                Display version and exit\n" << endl;
}

int UpKit::parseOptions(int argc, char *argv[]) {
    static const char optstring[] = "+aehqrsuvV";
    static const struct option longopts[] = {
        { "all", no_argument, nullptr, 'a' },
        { "explicit", no_argument, nullptr, 'e' },
        { "help", no_argument, nullptr, 'h' },
        { "log", required_argument, nullptr, 'l' },
        { "quiet", no_argument, nullptr, 'q' },
        { "regular", no_argument, nullptr, 'r' },
        { "silent", no_argument, nullptr, 's' },
        { "unknown", no_argument, nullptr, 'u' },
        { "verbose", no_argument, nullptr, 'v' },
        { "version", no_argument, nullptr, 'V' },
        { 0, 0, 0, 0 }
    };

    int c;
    int lopt_idx;

    while ((c = getopt_long(argc, argv, optstring, longopts, &lopt_idx)) != -1) {
        switch (c) {
        case 'a':
            selectRegular = selectExplicit = selectUnknown = true;
            break;
        case 'e':
            selectExplicit = true;
            break;
        case 'h':
            displayHelp();
            return 0;
        case 'l':
            logOutput = optarg;
            break;
        case 'q':
            log.level = LogLevel::None;
            break;
        case 'r':
            selectRegular = true;
            break;
        case 's':
            silent = true;
            break;
        case 'u':
            selectUnknown = true;
            break;
        case 'v':
            log.level = (log.level < LogLevel::Info) ? LogLevel::Info : LogLevel::Debug;
            break;
        case 'V':
            cout << VERSION << endl;
            return 0;
        case '?':
            displayHelp();
            return -1;
        }
    }

    return optind;
}

int UpKit::processCommand(char *argv[]) {
    if (argv[0] == nullptr) {
        throw invalid_argument{"Missing command. See --help for usage information."};
    }
    string arg = argv[0];

    Configuration config{};
    log.setLogOutput(logOutput.empty() ? config.get("LOG_OUTPUT") : logOutput);

    PosixProcessLauncher launcher;
    PackageManager manager{config.get("PACKAGE_MANAGER"), launcher, log};
    manager.setExtraUpgradeArguments(config.getArray("UPGRADE_ARGS"));
    UnknownVersionRule rule{config.getArray("UNKNOWN_VERSION_MARKERS")};
    TableParser parser{log, rule};

    if (arg == "list") {
        unique_ptr<InventorySource> source = InventoryFactory::get(config.get("INVENTORY"), manager, parser, log);
        Inventory inventory = splitByAttribution(source->listInstalled());
        printPackages(inventory.attributable);
        if (!inventory.unattributable.empty()) {
            cout << "\nNot available from any source (" << inventory.unattributable.size() << "):\n";
            printPackages(inventory.unattributable);
        }
        return 0;
    }
    else if (arg == "upgrades") {
        UpgradeListing listing = parser.parseUpgrades(manager.listUpgrades());
        printUpdates("Regular updates", listing.regular);
        printUpdates("Updates requiring explicit targeting", listing.explicitTargeting);
        printUpdates("Updates of packages with unknown version", listing.unknownVersion);
        return 0;
    }
    else if (arg == "install") {
        UpgradeListing listing = parser.parseUpgrades(manager.listUpgrades());
        vector<PackageUpdate> selection;
        if (argv[1] != nullptr) {
            for (int i = 1; argv[i] != nullptr; i++) {
                const PackageUpdate *update = listing.findById(argv[i]);
                if (update == nullptr)
                    throw invalid_argument{"No pending update for '" + string(argv[i]) + "'."};
                selection.push_back(*update);
            }
        } else {
            if (!selectExplicit && !selectUnknown)
                selectRegular = true;
            if (selectRegular)
                selection.insert(selection.end(), listing.regular.begin(), listing.regular.end());
            if (selectExplicit)
                selection.insert(selection.end(), listing.explicitTargeting.begin(), listing.explicitTargeting.end());
            if (selectUnknown)
                selection.insert(selection.end(), listing.unknownVersion.begin(), listing.unknownVersion.end());
        }

        UpdateOrchestrator orchestrator{manager, log};
        ProgressPrinter printer;
        // Interrupts terminate the running installer; no further package is started
        CancellationToken cancellation;
        SignalCancellation signalGuard{cancellation};
        BatchReport report = orchestrator.install(selection, silent || config.getBool("SILENT"),
                                                  printer, &cancellation);
        if (report.outcome == BatchOutcome::NothingSelected)
            cout << report.summary() << endl;
        return report.ok() ? 0 : 1;
    }
    else if (arg == "export") {
        if (argv[1] == nullptr) {
            displayHelp();
            throw invalid_argument{"Missing argument for 'export'"};
        }
        vector<string> unavailable = manager.exportPackages(argv[1]);
        cout << "Exported installed packages to " << argv[1] << endl;
        if (!unavailable.empty()) {
            cout << "Not available from any source (" << unavailable.size() << "):\n";
            for (auto &name: unavailable)
                cout << "  " << name << "\n";
        }
        return 0;
    }
    else if (arg == "check") {
        cout << manager.getExecutable() << " " << manager.getVersion() << endl;
        return 0;
    }
    else {
        displayHelp();
        throw invalid_argument{"Unknown command or option '" + arg + "'."};
    }
}

UpKit::UpKit(int argc, char *argv[]) {
    log.level = LogLevel::Error;

    int ret = parseOptions(argc, argv);
    if (ret <= 0) {
        throw ret;
    }

    log.debug("upkit ", VERSION, " started");

    string optionsline = "Options: ";
    for(int i = 1; i < argc; ++i)
        optionsline.append(argv[i]).append(" ");
    log.debug(optionsline);

    ret = processCommand(&argv[ret]);
    if (ret != 0) {
        throw ret;
    }

    log.debug("upkit finished.");
}
