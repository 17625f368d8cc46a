/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Sequential installation of a batch of updates
 */

#include "UpdateOrchestrator.hpp"
#include "Exceptions.hpp"
#include "OutputFilter.hpp"
#include "Util.hpp"
#include <memory>
#include <sstream>

namespace UpdateKit {

using namespace std;

namespace {

string displayName(const PackageUpdate &update) {
    return update.getName().empty() ? update.getId() : update.getName();
}

// How long to wait for installer output before checking for cancellation again
const int cancellationCheckInterval = 200;

string plural(size_t count) {
    return count == 1 ? "update" : "updates";
}

void listFailures(stringstream &ss, const vector<InstallFailure> &failures) {
    for (auto &failure: failures)
        ss << "\n  " << failure.name << " (" << failure.id << "): " << failure.diagnostic;
}

} // anonymous namespace

string toString(BatchOutcome outcome) {
    switch (outcome) {
    case BatchOutcome::NothingSelected:
        return "nothing selected";
    case BatchOutcome::AllSucceeded:
        return "all succeeded";
    case BatchOutcome::PartialSuccess:
        return "partial success";
    case BatchOutcome::AllFailed:
        return "all failed";
    case BatchOutcome::Aborted:
        return "aborted";
    case BatchOutcome::Cancelled:
        return "cancelled";
    }
    return "";
}

string BatchReport::summary() const {
    stringstream ss;
    switch (outcome) {
    case BatchOutcome::NothingSelected:
        ss << "No updates selected.";
        break;
    case BatchOutcome::AllSucceeded:
        ss << "All " << selected << " " << plural(selected) << " installed successfully.";
        break;
    case BatchOutcome::PartialSuccess:
        ss << succeeded << " of " << selected << " " << plural(selected) << " installed successfully. Failed "
           << plural(failures.size()) << ":";
        listFailures(ss, failures);
        break;
    case BatchOutcome::AllFailed:
        ss << "All " << selected << " " << plural(selected) << " failed:";
        listFailures(ss, failures);
        break;
    case BatchOutcome::Aborted:
        ss << "Update run aborted after " << succeeded << " of " << selected << " " << plural(selected)
           << " installed successfully: " << criticalError;
        listFailures(ss, failures);
        break;
    case BatchOutcome::Cancelled:
        ss << "Update run cancelled after " << succeeded << " of " << selected << " " << plural(selected)
           << " installed successfully.";
        listFailures(ss, failures);
        break;
    }
    return ss.str();
}

UpdateOrchestrator::UpdateOrchestrator(PackageManager &manager, DiagnosticSink &log)
    : manager{manager}, log{log} {
}

bool UpdateOrchestrator::installOne(const PackageUpdate &update, bool silent, const ProgressCallback &progress,
                                    const CancellationToken *cancel, BatchReport &report) {
    const string name = displayName(update);
    report.attempted++;
    progress({ProgressEvent::Type::Started, name, "Installing " + name + " (" + update.getId() + ")..."});

    unique_ptr<Process> process;
    try {
        process = manager.startUpgrade(update, silent);
    } catch (const exception &e) {
        // Failing to start one package's command must not stop the batch
        log.error("Could not start the update of ", update.getId(), ": ", e.what());
        report.failures.push_back({name, update.getId(), e.what()});
        progress({ProgressEvent::Type::Failed, name, "Failed to install " + name + ": " + e.what()});
        return true;
    }

    auto cancelled = [&]() {
        return cancel != nullptr && cancel->isCancelled();
    };

    int rc;
    string lastText;
    try {
        string line;
        string lastProgress;
        while (true) {
            if (cancelled()) {
                log.info("Cancelling the update of ", update.getId());
                process->terminate();
                process->wait();
                progress({ProgressEvent::Type::Cancelled, name, "Installation of " + name + " cancelled."});
                return false;
            }
            Process::ReadStatus status = process->readLine(line, cancel != nullptr ? cancellationCheckInterval : -1);
            if (status == Process::ReadStatus::Closed)
                break;
            if (status == Process::ReadStatus::Timeout)
                continue;
            string text = Util::visibleText(line);
            Util::trim(text);
            switch (OutputFilter::classify(text)) {
            case LineKind::Blank:
            case LineKind::Spinner:
                break;
            case LineKind::ByteProgress:
                if (text != lastProgress) {
                    lastProgress = text;
                    progress({ProgressEvent::Type::Progress, name, text});
                }
                break;
            case LineKind::Text:
                lastText = text;
                log.debug(update.getId(), ": ", text);
                progress({ProgressEvent::Type::Output, name, text});
                break;
            }
        }
        rc = process->wait();
    } catch (const exception &e) {
        throw CriticalBatchError{"Installing " + name + " failed unexpectedly: " + e.what()};
    }

    // A cancel request which arrived after the last output line; the result is not trusted
    if (cancelled()) {
        log.info("Update of ", update.getId(), " finished with exit status ", rc, " after cancellation was requested");
        progress({ProgressEvent::Type::Cancelled, name, "Installation of " + name + " cancelled."});
        return false;
    }

    if (rc == 0) {
        report.succeeded++;
        log.info("Update of ", update.getId(), " installed successfully");
        progress({ProgressEvent::Type::Succeeded, name, "Successfully installed " + name + "."});
        return true;
    }

    string diagnostic = process->errorOutput();
    Util::trim(diagnostic);
    if (diagnostic.empty()) {
        diagnostic = "exit status " + to_string(rc);
        if (!lastText.empty())
            diagnostic = lastText + " (" + diagnostic + ")";
    }
    log.error("Update of ", update.getId(), " failed with exit status ", rc, ": ", diagnostic);
    report.failures.push_back({name, update.getId(), diagnostic});
    progress({ProgressEvent::Type::Failed, name, "Failed to install " + name + ": " + diagnostic});
    return true;
}

BatchReport UpdateOrchestrator::install(const vector<PackageUpdate> &selection, bool silent,
                                        const ProgressCallback &progress, const CancellationToken *cancel) {
    BatchReport report;
    report.selected = selection.size();
    if (selection.empty()) {
        log.info("No packages to update");
        report.outcome = BatchOutcome::NothingSelected;
        return report;
    }

    log.info("Installing ", selection.size(), " ", plural(selection.size()), silent ? " silently" : "");
    bool cancelled = false;
    try {
        for (auto &update: selection) {
            if (cancel != nullptr && cancel->isCancelled()) {
                progress({ProgressEvent::Type::Cancelled, displayName(update),
                          "Installation cancelled before " + displayName(update) + "."});
                cancelled = true;
                break;
            }
            if (!installOne(update, silent, progress, cancel, report)) {
                cancelled = true;
                break;
            }
        }
    } catch (const exception &e) {
        report.criticalError = e.what();
        log.error("Critical error, aborting the update run: ", e.what());
        try {
            progress({ProgressEvent::Type::CriticalError, "", string("Critical error: ") + e.what()});
        } catch (const exception &inner) {
            log.error("Reporting the critical error failed: ", inner.what());
        }
    }

    if (!report.criticalError.empty())
        report.outcome = BatchOutcome::Aborted;
    else if (cancelled)
        report.outcome = BatchOutcome::Cancelled;
    else if (report.failures.empty())
        report.outcome = BatchOutcome::AllSucceeded;
    else if (report.succeeded == 0)
        report.outcome = BatchOutcome::AllFailed;
    else
        report.outcome = BatchOutcome::PartialSuccess;

    log.info("Update run finished: ", toString(report.outcome));
    try {
        progress({ProgressEvent::Type::Summary, "", report.summary()});
    } catch (const exception &e) {
        log.error("Reporting the update summary failed: ", e.what());
    }
    return report;
}

} // namespace UpdateKit
