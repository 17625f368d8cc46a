/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

#include "SignalCancellation.hpp"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

using namespace std;

namespace UpdateKit {

namespace {

atomic<CancellationToken*> active{nullptr};

void interrupt(int) {
    CancellationToken *token = active.load();
    if (token != nullptr)
        token->cancel();
}

} // anonymous namespace

const int SignalCancellation::signals[3] = {SIGINT, SIGHUP, SIGTERM};

SignalCancellation::SignalCancellation(CancellationToken &token) {
    CancellationToken *expected = nullptr;
    if (!active.compare_exchange_strong(expected, &token))
        throw logic_error{"Signal cancellation is already active"};

    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = interrupt;
    sigemptyset(&action.sa_mask);
    for (size_t i = 0; i < 3; i++) {
        if (sigaction(signals[i], &action, &previous[i]) != 0) {
            int err = errno;
            while (i-- > 0)
                sigaction(signals[i], &previous[i], nullptr);
            active.store(nullptr);
            throw runtime_error{"Installing signal handler failed: " + string(strerror(err))};
        }
    }
}

SignalCancellation::~SignalCancellation() {
    for (size_t i = 0; i < 3; i++)
        sigaction(signals[i], &previous[i], nullptr);
    active.store(nullptr);
}

} // namespace UpdateKit
