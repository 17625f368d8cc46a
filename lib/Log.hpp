/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Diagnostic sink passed into the library components, and the console /
  syslog implementation used by the command line front end
 */

#ifndef U_K_LOG_H
#define U_K_LOG_H

#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <syslog.h>

namespace UpdateKit {

enum class LogLevel {
    None=0, Error, Info, Debug
};

/**
 * @brief Receiver for diagnostic events of the parser, the package manager wrapper and the
 * orchestrator.
 *
 * Implementations only have to provide record(); the variadic helpers assemble the message
 * and drop events above the configured level.
 */
class DiagnosticSink {
public:
    LogLevel level = LogLevel::Error;

    virtual ~DiagnosticSink() = default;

    virtual void record(LogLevel severity, const std::string& message) = 0;

    template<typename... T> void error(const T&... args) {
        dispatch(LogLevel::Error, args...);
    }
    template<typename... T> void info(const T&... args) {
        dispatch(LogLevel::Info, args...);
    }
    template<typename... T> void debug(const T&... args) {
        dispatch(LogLevel::Debug, args...);
    }

protected:
    template<typename... T> void dispatch(LogLevel severity, const T&... args) {
        if (!accepts(severity))
            return;
        std::stringstream ss;
        ((ss << args),...);
        record(severity, ss.str());
    }
    virtual bool accepts(LogLevel severity) const {
        return level >= severity;
    }
};

struct UKLogOutput {
    bool console = true;
    bool syslog = false;
};

// There's no threading in this application, so no locking is implemented
class UKLog : public DiagnosticSink {
public:
    UKLogOutput output{};

    void record(LogLevel severity, const std::string& message) override {
        if (level >= severity)
            print_to_output(severity, message);
        if (severity != LogLevel::Debug || level >= LogLevel::Debug)
            print_to_syslog(severity, message);
    }

    void setLogOutput(std::string outputs) {
        output.console = false;
        output.syslog = false;
        std::string field;
        std::stringstream ss(outputs);
        while (getline(ss, field, ',')) {
            if (field == "console") {
                output.console = true;
                continue;
            }
            if (field == "syslog") {
                output.syslog = true;
                continue;
            }
            throw std::invalid_argument{"Invalid log output '" + field + "'."};
        }
    }

protected:
    // Errors and infos go to syslog even if the console is quiet
    bool accepts(LogLevel severity) const override {
        return level >= severity || (output.syslog && severity != LogLevel::Debug);
    }

private:
    void print_to_output(LogLevel severity, const std::string& message) {
        if (!output.console)
            return;
        if (severity <= LogLevel::Error) {
            std::cerr << message << std::endl;
        } else {
            std::cout << message << std::endl;
        }
    }
    void print_to_syslog(LogLevel severity, const std::string& message) {
        if (!output.syslog)
            return;
        int priority = LOG_INFO;
        if (severity == LogLevel::Error)
            priority = LOG_ERR;
        else if (severity == LogLevel::Debug)
            priority = LOG_DEBUG;
        syslog(priority, "%s", message.c_str());
    }
};

} // namespace UpdateKit

#endif // U_K_LOG_H
