/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Execution of external commands with line-wise access to their output
 */

#include "Process.hpp"
#include "Exceptions.hpp"
#include "Util.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace UpdateKit {

namespace {

class PosixProcess : public Process {
public:
    PosixProcess(pid_t pid, int outFd, int errFd) : pid{pid}, outFd{outFd}, errFd{errFd} {
    }
    ~PosixProcess() override;

    using Process::readLine;
    ReadStatus readLine(std::string &line, int timeoutMs) override;
    int wait() override;
    std::string errorOutput() override {
        return errBuffer;
    }
    void terminate() override;
private:
    bool extractLine(std::string &line);
    bool pump(int timeoutMs);
    static void closeFd(int &fd);

    pid_t pid;
    int outFd;
    int errFd;
    bool exited = false;
    int status = 0;
    std::string outBuffer;
    std::string errBuffer;
};

PosixProcess::~PosixProcess() {
    closeFd(outFd);
    closeFd(errFd);
    if (!exited) {
        kill(pid, SIGTERM);
        int ignored;
        while (waitpid(pid, &ignored, 0) < 0 && errno == EINTR) {
        }
    }
}

void PosixProcess::closeFd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Wait for data on any of the open pipes and append it to the corresponding buffer; returns
// false if nothing arrived within timeoutMs or the wait was interrupted by a signal
bool PosixProcess::pump(int timeoutMs) {
    struct pollfd pfds[2];
    nfds_t count = 0;
    if (outFd >= 0)
        pfds[count++] = {outFd, POLLIN, 0};
    if (errFd >= 0)
        pfds[count++] = {errFd, POLLIN, 0};
    if (count == 0)
        return true;

    int ret = poll(pfds, count, timeoutMs);
    if (ret < 0) {
        if (errno == EINTR)
            return false;
        throw std::runtime_error{"Polling process output failed: " + std::string(strerror(errno))};
    }
    if (ret == 0)
        return false;

    char buffer[2048];
    for (nfds_t i = 0; i < count; i++) {
        if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR)))
            continue;
        ssize_t len = read(pfds[i].fd, buffer, sizeof(buffer));
        if (len < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            throw std::runtime_error{"Reading process output failed: " + std::string(strerror(errno))};
        }
        bool isOut = pfds[i].fd == outFd;
        if (len == 0) {
            closeFd(isOut ? outFd : errFd);
            continue;
        }
        (isOut ? outBuffer : errBuffer).append(buffer, len);
    }
    return true;
}

bool PosixProcess::extractLine(std::string &line) {
    size_t pos = outBuffer.find_first_of("\r\n");
    if (pos == std::string::npos)
        return false;
    // A carriage return at the end of the buffer may be the first half of CRLF
    if (outBuffer[pos] == '\r' && pos + 1 == outBuffer.size() && outFd >= 0)
        return false;
    line = outBuffer.substr(0, pos);
    size_t skip = 1;
    if (outBuffer[pos] == '\r' && pos + 1 < outBuffer.size() && outBuffer[pos + 1] == '\n')
        skip = 2;
    outBuffer.erase(0, pos + skip);
    return true;
}

Process::ReadStatus PosixProcess::readLine(std::string &line, int timeoutMs) {
    while (true) {
        if (extractLine(line))
            return ReadStatus::Line;
        if (outFd < 0) {
            if (outBuffer.empty())
                return ReadStatus::Closed;
            line = outBuffer;
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            outBuffer.clear();
            return ReadStatus::Line;
        }
        if (!pump(timeoutMs) && timeoutMs >= 0)
            return ReadStatus::Timeout;
    }
}

int PosixProcess::wait() {
    if (exited)
        return status;

    // Drain both pipes, the child may block on a full one otherwise
    while (outFd >= 0 || errFd >= 0)
        pump(-1);

    int wstatus;
    int ret;
    while ((ret = waitpid(pid, &wstatus, 0)) < 0 && errno == EINTR) {
    }
    if (ret < 0)
        throw std::runtime_error{"waitpid() failed: " + std::string(strerror(errno))};
    exited = true;
    if (WIFEXITED(wstatus))
        status = WEXITSTATUS(wstatus);
    else if (WIFSIGNALED(wstatus))
        status = WTERMSIG(wstatus);
    return status;
}

void PosixProcess::terminate() {
    if (exited)
        return;
    if (kill(pid, SIGTERM) < 0 && errno != ESRCH) {
        throw std::runtime_error{"Could not send signal " + std::to_string(SIGTERM) + " to process " + std::to_string(pid) + ": " + std::string(strerror(errno))};
    }
}

} // anonymous namespace

std::unique_ptr<Process> PosixProcessLauncher::launch(const std::vector<std::string> &argv) {
    if (argv.empty())
        throw CommandError{"No command given.", -1, ""};

    std::string cmdline = Util::join(argv, " ");
    std::vector<char*> args;
    for (auto &arg: argv)
        args.push_back(const_cast<char*>(arg.c_str()));
    args.push_back(nullptr);

    int outPipe[2], errPipe[2], execPipe[2];
    if (pipe(outPipe) < 0)
        throw CommandError{"Error opening pipe for command output: " + std::string(strerror(errno)), -1, ""};
    if (pipe(errPipe) < 0) {
        int err = errno;
        close(outPipe[0]);
        close(outPipe[1]);
        throw CommandError{"Error opening pipe for command errors: " + std::string(strerror(err)), -1, ""};
    }
    // Reports a failing execvp() back to the parent; closed automatically on success
    if (pipe2(execPipe, O_CLOEXEC) < 0) {
        int err = errno;
        for (int fd: {outPipe[0], outPipe[1], errPipe[0], errPipe[1]})
            close(fd);
        throw CommandError{"Error opening status pipe: " + std::string(strerror(err)), -1, ""};
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int fd: {outPipe[0], outPipe[1], errPipe[0], errPipe[1], execPipe[0], execPipe[1]})
            close(fd);
        throw CommandError{"fork() failed: " + std::string(strerror(err)), -1, ""};
    } else if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0 || dup2(outPipe[1], STDOUT_FILENO) < 0
                || dup2(errPipe[1], STDERR_FILENO) < 0) {
            int err = errno;
            (void)!write(execPipe[1], &err, sizeof(err));
            _exit(127);
        }
        for (int fd: {outPipe[0], outPipe[1], errPipe[0], errPipe[1], execPipe[0]})
            close(fd);
        execvp(args[0], args.data());
        int err = errno;
        (void)!write(execPipe[1], &err, sizeof(err));
        _exit(127);
    }

    close(outPipe[1]);
    close(errPipe[1]);
    close(execPipe[1]);

    int childErrno = 0;
    ssize_t len;
    while ((len = read(execPipe[0], &childErrno, sizeof(childErrno))) < 0 && errno == EINTR) {
    }
    close(execPipe[0]);
    if (len > 0) {
        close(outPipe[0]);
        close(errPipe[0]);
        int ignored;
        while (waitpid(pid, &ignored, 0) < 0 && errno == EINTR) {
        }
        throw CommandError{"Calling `" + cmdline + "` failed: " + std::string(strerror(childErrno)), -1, strerror(childErrno)};
    }

    return std::make_unique<PosixProcess>(pid, outPipe[0], errPipe[0]);
}

} // namespace UpdateKit
