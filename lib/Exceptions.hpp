/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Custom exception classes
 */

#ifndef U_K_EXCEPTIONS_H
#define U_K_EXCEPTIONS_H

#include <exception>
#include <string>

namespace UpdateKit {

// The package manager could not be launched or a query returned non-zero
class CommandError : public std::exception
{
public:
    CommandError(const std::string& reason, const int returncode, const std::string& errorOutput)
        : reason{reason}, returncode{returncode}, errorOutput{errorOutput} {
    }
    const char* what() const noexcept override {
        return reason.c_str();
    }
    const std::string reason;
    const int returncode;
    const std::string errorOutput;
};

class ParseError : public std::exception
{
public:
    ParseError(const std::string& reason) : reason{reason} {
    }
    const char* what() const noexcept override {
        return reason.c_str();
    }
private:
    const std::string reason;
};

// Only ever raised and caught inside the table parser
class RowParseError : public std::exception
{
public:
    RowParseError(const std::string& reason, const std::string& line) : reason{reason}, line{line} {
    }
    const char* what() const noexcept override {
        return reason.c_str();
    }
    const std::string reason;
    const std::string line;
};

class CriticalBatchError : public std::exception
{
public:
    CriticalBatchError(const std::string& reason) : reason{reason} {
    }
    const char* what() const noexcept override {
        return reason.c_str();
    }
private:
    const std::string reason;
};

} // namespace UpdateKit

#endif // U_K_EXCEPTIONS_H
