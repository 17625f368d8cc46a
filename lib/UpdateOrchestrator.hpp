/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  The UpdateOrchestrator installs a selection of updates one after another,
  streaming the manager's output as progress events and collecting the
  outcome of every package into a BatchReport.
 */

#ifndef U_K_UPDATEORCHESTRATOR_H
#define U_K_UPDATEORCHESTRATOR_H

#include "Log.hpp"
#include "Package.hpp"
#include "PackageManager.hpp"
#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace UpdateKit {

struct ProgressEvent {
    enum class Type {
        Started,        // installation of a package begins
        Output,         // a line of the manager's output
        Progress,       // replaces the previous Progress line of the same package
        Succeeded,
        Failed,
        Summary,        // last event of every non-empty batch
        CriticalError,  // the batch has been aborted
        Cancelled
    };
    Type type;
    std::string package;
    std::string text;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

// May be set from a signal handler
class CancellationToken {
public:
    void cancel() { cancelled.store(true); }
    bool isCancelled() const { return cancelled.load(); }
private:
    std::atomic<bool> cancelled{false};
};

struct InstallFailure {
    std::string name;
    std::string id;
    std::string diagnostic;
};

enum class BatchOutcome {
    NothingSelected, AllSucceeded, PartialSuccess, AllFailed, Aborted, Cancelled
};

struct BatchReport {
    BatchOutcome outcome = BatchOutcome::NothingSelected;
    size_t selected = 0;
    size_t attempted = 0;
    size_t succeeded = 0;
    std::vector<InstallFailure> failures;
    std::string criticalError;

    bool ok() const {
        return outcome == BatchOutcome::AllSucceeded || outcome == BatchOutcome::NothingSelected;
    }
    std::string summary() const;
};

class UpdateOrchestrator {
public:
    UpdateOrchestrator(PackageManager &manager, DiagnosticSink &log);
    virtual ~UpdateOrchestrator() = default;

    /**
     * @brief Install the selected updates strictly one after another
     * @param selection updates in installation order
     * @param silent ask the manager for a non-interactive installation
     * @param progress invoked once per event, in order
     * @param cancel checked while waiting for output, after each installer exits and between
     * packages; may be nullptr
     * @return outcome of the whole batch
     *
     * The manager is not safe for concurrent invocation, so there is never more than one
     * child process. A failing package does not stop the batch; only errors which are not
     * attributable to a single package abort it, reported as a CriticalError event. An empty
     * selection returns NothingSelected without emitting any event.
     */
    BatchReport install(const std::vector<PackageUpdate> &selection, bool silent,
                        const ProgressCallback &progress, const CancellationToken *cancel = nullptr);
private:
    // Returns false if the batch has been cancelled while the package was installing
    bool installOne(const PackageUpdate &update, bool silent, const ProgressCallback &progress,
                    const CancellationToken *cancel, BatchReport &report);

    PackageManager &manager;
    DiagnosticSink &log;
};

std::string toString(BatchOutcome outcome);

} // namespace UpdateKit

#endif // U_K_UPDATEORCHESTRATOR_H
