/* SPDX-License-Identifier: GPL-2.0-or-later */
/* SPDX-FileCopyrightText: 2020 SUSE LLC */

/*
  upkit - list and install pending package manager updates
 */

#ifndef UPKIT_H
#define UPKIT_H

#include "Log.hpp"
#include <string>

class UpKit {
public:
    UpKit(int argc, char *argv[]);
    virtual ~UpKit() = default;

    void displayHelp();
    int parseOptions(int argc, char *argv[]);
    int processCommand(char *argv[]);
private:
    UpdateKit::UKLog log;
    std::string logOutput;
    bool silent = false;
    bool selectRegular = false;
    bool selectExplicit = false;
    bool selectUnknown = false;
};

#endif /* UPKIT_H */
