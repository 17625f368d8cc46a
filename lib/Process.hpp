/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Execution of external commands with line-wise access to their output
 */

#ifndef U_K_PROCESS_H
#define U_K_PROCESS_H

#include <memory>
#include <string>
#include <vector>

namespace UpdateKit {

/**
 * @brief A running child process
 */
class Process {
public:
    enum class ReadStatus {
        Line, Timeout, Closed
    };

    virtual ~Process() = default;

    /**
     * @brief Wait for the next line of standard output
     * @param line receives the line without its terminator
     * @param timeoutMs maximum time to wait for output, -1 to wait without limit
     * @return Timeout if no complete line arrived in time, Closed once standard output is closed
     *
     * Both newline and carriage return terminate a line, so in-place redraws (spinners,
     * progress bars) are returned as individual lines. A signal interrupting the wait also
     * counts as Timeout unless timeoutMs is -1.
     */
    virtual ReadStatus readLine(std::string &line, int timeoutMs) = 0;

    // Blocking variant, false once standard output is closed
    bool readLine(std::string &line) {
        return readLine(line, -1) == ReadStatus::Line;
    }

    /**
     * @brief Wait for the process to exit
     * @return exit status, or the signal number if the process was terminated by a signal
     */
    virtual int wait() = 0;

    /**
     * @brief Standard error collected so far; complete after wait()
     */
    virtual std::string errorOutput() = 0;

    /**
     * @brief Ask the process to terminate (SIGTERM); no-op if it has exited already
     */
    virtual void terminate() = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;
    /**
     * @brief Start argv[0] (looked up in PATH) with the given arguments
     *
     * Throws CommandError if the process cannot be started.
     */
    virtual std::unique_ptr<Process> launch(const std::vector<std::string> &argv) = 0;
};

class PosixProcessLauncher : public ProcessLauncher {
public:
    std::unique_ptr<Process> launch(const std::vector<std::string> &argv) override;
};

} // namespace UpdateKit

#endif // U_K_PROCESS_H
